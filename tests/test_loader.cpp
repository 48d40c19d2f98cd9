/**
 * @file test_loader.cpp
 * @brief Tests for migration directory discovery (GoogleTest)
 *
 * Tests cover:
 * - Patch documents (.json) and step manifests (.step)
 * - Skipping of private, unprefixed and unrelated files
 * - Manifest resolution order: "migrate", stem, "patch"
 * - Structural errors and duplicate detection at load time
 */

#include <gtest/gtest.h>
#include "fluxconf/Loader.hpp"
#include "fluxconf/Migration.hpp"
#include "fluxconf/Errors.hpp"

#include "test_helpers.hpp"

using namespace fluxconf;
using fluxconf_test::TempDir;

namespace {

TransformTable sample_table() {
    TransformTable table;
    table.add("set_name", [](Document d) {
        d["name"] = "from_transform";
        return d;
    });
    table.add("2_split_host", [](Document d) {
        std::string host = d.value("host", "localhost:80");
        auto colon = host.find(':');
        d["host"] = host.substr(0, colon);
        d["port"] = std::stoi(host.substr(colon + 1));
        return d;
    });
    return table;
}

constexpr const char* kAddFlagPatch = R"([{"op": "add", "path": "/flag", "value": true}])";

} // anonymous namespace

// ============================================================================
// TransformTable
// ============================================================================

TEST(TransformTableTest, AddAndFind) {
    TransformTable table = sample_table();
    EXPECT_EQ(table.size(), 2u);
    EXPECT_TRUE(table.contains("set_name"));
    EXPECT_EQ(table.find("missing"), nullptr);
    EXPECT_EQ(table.names(), (std::vector<std::string>{"2_split_host", "set_name"}));
}

TEST(TransformTableTest, DuplicateNameRejected) {
    TransformTable table = sample_table();
    EXPECT_THROW(table.add("set_name", [](Document d) { return d; }), DuplicateKeyError);
}

TEST(TransformTableTest, EmptyFunctionRejected) {
    TransformTable table;
    EXPECT_THROW(table.add("x", TransformFn{}), ConfigError);
}

// ============================================================================
// Discovery
// ============================================================================

class LoadMigrationsTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(LoadMigrationsTest, EmptyDirectoryGivesNoSteps) {
    EXPECT_TRUE(load_migrations_from_dir<IntegerKey>(dir.path()).empty());
}

TEST_F(LoadMigrationsTest, MissingDirectoryFails) {
    EXPECT_THROW(load_migrations_from_dir<IntegerKey>(dir.path() / "nope"), StructuralLoadError);
}

TEST_F(LoadMigrationsTest, FileInsteadOfDirectoryFails) {
    std::string file = dir.create_file("1_a.json", "[]");
    EXPECT_THROW(load_migrations_from_dir<IntegerKey>(file), StructuralLoadError);
}

TEST_F(LoadMigrationsTest, UnreadableEntryIsStructuralError) {
    // A link to itself cannot be stat'ed (ELOOP)
    std::filesystem::create_symlink("1_loop.json", dir.path() / "1_loop.json");
    try {
        load_migrations_from_dir<IntegerKey>(dir.path());
        FAIL() << "Expected StructuralLoadError";
    } catch (const StructuralLoadError& e) {
        EXPECT_EQ(e.path(), dir.file("1_loop.json"));
    }
}

TEST_F(LoadMigrationsTest, DanglingLinkIsSkipped) {
    dir.create_file("1_real.json", "[]");
    std::filesystem::create_symlink("missing.json", dir.path() / "2_gone.json");

    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path());
    ASSERT_EQ(migrations.size(), 1u);
    EXPECT_EQ(migrations.count("1_real"), 1u);
}

TEST_F(LoadMigrationsTest, LoadsPatchDocument) {
    dir.create_file("1_add_flag.json", kAddFlagPatch);

    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path());
    ASSERT_EQ(migrations.size(), 1u);
    ASSERT_EQ(migrations.count("1_add_flag"), 1u);
    EXPECT_TRUE(migrations.at("1_add_flag").is_patch());
}

TEST_F(LoadMigrationsTest, DiscoversMultipleFiles) {
    dir.create_file("1_a.json", kAddFlagPatch);
    dir.create_file("2_b.json", "[]");
    dir.create_file("10_c.json", "[]");

    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path());
    EXPECT_EQ(migrations.size(), 3u);
    EXPECT_EQ(migrations.count("10_c"), 1u);
}

TEST_F(LoadMigrationsTest, SkipsPrivateUnprefixedAndForeignFiles) {
    dir.create_file("1_real.json", kAddFlagPatch);
    dir.create_file("_2_private.json", kAddFlagPatch);
    dir.create_file("helpers.json", kAddFlagPatch);
    dir.create_file("v3_named.json", kAddFlagPatch);
    dir.create_file("4.json", kAddFlagPatch);
    dir.create_file("5_notes.txt", "not a step");
    dir.create_file("6_script.py", "def migrate(d): return d");
    fluxconf_test::fs::create_directories(dir.path() / "7_subdir.json");

    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path());
    ASSERT_EQ(migrations.size(), 1u);
    EXPECT_EQ(migrations.begin()->first, "1_real");
}

TEST_F(LoadMigrationsTest, SemVerSchemeSkipsIntegerPrefixes) {
    dir.create_file("1.2.0_add.json", kAddFlagPatch);
    dir.create_file("3_integer.json", kAddFlagPatch);

    Migrations migrations = load_migrations_from_dir<SemVerKey>(dir.path());
    ASSERT_EQ(migrations.size(), 1u);
    EXPECT_EQ(migrations.count("1.2.0_add"), 1u);
}

TEST_F(LoadMigrationsTest, PatchDocumentMustBeArray) {
    dir.create_file("1_bad.json", R"({"op": "add", "path": "/x", "value": 1})");
    try {
        load_migrations_from_dir<IntegerKey>(dir.path());
        FAIL() << "Expected StructuralLoadError";
    } catch (const StructuralLoadError& e) {
        EXPECT_NE(e.details().find("JSON array"), std::string::npos);
        EXPECT_NE(e.path().find("1_bad.json"), std::string::npos);
    }
}

TEST_F(LoadMigrationsTest, MalformedPatchDocumentFails) {
    dir.create_file("1_bad.json", R"([{"op": "explode", "path": "/x"}])");
    EXPECT_THROW(load_migrations_from_dir<IntegerKey>(dir.path()), StructuralLoadError);
}

TEST_F(LoadMigrationsTest, InvalidJsonFails) {
    dir.create_file("1_bad.json", "[{");
    EXPECT_THROW(load_migrations_from_dir<IntegerKey>(dir.path()), StructuralLoadError);
}

TEST_F(LoadMigrationsTest, SameStemDifferentKindsIsDuplicate) {
    dir.create_file("1_real.step", R"({"patch": []})");
    dir.create_file("1_real.json", kAddFlagPatch);

    EXPECT_THROW(load_migrations_from_dir<IntegerKey>(dir.path()), DuplicateKeyError);
}

TEST_F(LoadMigrationsTest, SameKeyDifferentStemsIsDuplicate) {
    dir.create_file("1_first.json", "[]");
    dir.create_file("1_second.json", "[]");

    try {
        load_migrations_from_dir<IntegerKey>(dir.path());
        FAIL() << "Expected DuplicateKeyError";
    } catch (const DuplicateKeyError& e) {
        EXPECT_EQ(e.names(), (std::vector<std::string>{"1_first", "1_second"}));
    }
}

TEST_F(LoadMigrationsTest, EndToEndWithRunMigrations) {
    dir.create_file("1_add_flag.json", kAddFlagPatch);
    dir.create_file("2_rename.json",
                    R"([{"op": "move", "from": "/flag", "path": "/enabled"}])");

    MigrationRegistry<IntegerKey> registry(load_migrations_from_dir<IntegerKey>(dir.path()));
    Document result = run_migrations(Document::object(), registry);
    EXPECT_EQ(result, Value::parse(R"({"enabled": true, "version": 2})"));
}

// ============================================================================
// Step manifests
// ============================================================================

TEST_F(LoadMigrationsTest, ManifestNamesTransform) {
    dir.create_file("1_name.step", R"({"migrate": "set_name"})");

    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path(), sample_table());
    ASSERT_EQ(migrations.size(), 1u);
    const MigrationStep& step = migrations.at("1_name");
    EXPECT_TRUE(step.is_transform());
    EXPECT_EQ(step.apply(Document::object())["name"], "from_transform");
}

TEST_F(LoadMigrationsTest, EmptyManifestUsesTransformNamedAfterStem) {
    dir.create_file("2_split_host.step", "");

    MigrationRegistry<IntegerKey> registry(
        load_migrations_from_dir<IntegerKey>(dir.path(), sample_table()));
    Document result = run_migrations(Value::parse(R"({"host": "db:5432", "version": 1})"),
                                     registry);
    EXPECT_EQ(result, Value::parse(R"({"host": "db", "port": 5432, "version": 2})"));
}

TEST_F(LoadMigrationsTest, ManifestWithPatch) {
    dir.create_file("1_flag.step", R"({"patch": [{"op": "add", "path": "/flag", "value": 1}]})");

    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path());
    ASSERT_EQ(migrations.size(), 1u);
    EXPECT_TRUE(migrations.at("1_flag").is_patch());
}

TEST_F(LoadMigrationsTest, TransformTakesPrecedenceOverPatch) {
    dir.create_file("1_both.step",
                    R"({"migrate": "set_name",
                        "patch": [{"op": "add", "path": "/flag", "value": 1}]})");

    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path(), sample_table());
    Document result = migrations.at("1_both").apply(Document::object());
    EXPECT_EQ(result, Value::parse(R"({"name": "from_transform"})"));
}

TEST_F(LoadMigrationsTest, UnknownTransformIsNotCallable) {
    dir.create_file("1_x.step", R"({"migrate": "does_not_exist"})");
    try {
        load_migrations_from_dir<IntegerKey>(dir.path(), sample_table());
        FAIL() << "Expected StructuralLoadError";
    } catch (const StructuralLoadError& e) {
        EXPECT_NE(e.details().find("not callable"), std::string::npos);
    }
}

TEST_F(LoadMigrationsTest, NonStringMigrateIsNotCallable) {
    dir.create_file("1_x.step", R"({"migrate": 42})");
    EXPECT_THROW(load_migrations_from_dir<IntegerKey>(dir.path(), sample_table()),
                 StructuralLoadError);
}

TEST_F(LoadMigrationsTest, NonListPatchFails) {
    dir.create_file("1_x.step", R"({"patch": {"op": "add"}})");
    try {
        load_migrations_from_dir<IntegerKey>(dir.path());
        FAIL() << "Expected StructuralLoadError";
    } catch (const StructuralLoadError& e) {
        EXPECT_NE(e.details().find("not a list"), std::string::npos);
    }
}

TEST_F(LoadMigrationsTest, ManifestDefiningNothingFails) {
    dir.create_file("1_x.step", R"({"description": "forgot the body"})");
    try {
        load_migrations_from_dir<IntegerKey>(dir.path());
        FAIL() << "Expected StructuralLoadError";
    } catch (const StructuralLoadError& e) {
        EXPECT_NE(e.details().find("defines neither"), std::string::npos);
    }
}

TEST_F(LoadMigrationsTest, ManifestMustBeObject) {
    dir.create_file("1_x.step", "[]");
    EXPECT_THROW(load_migrations_from_dir<IntegerKey>(dir.path()), StructuralLoadError);
}

TEST_F(LoadMigrationsTest, MixedManifestsAndPatchDocuments) {
    dir.create_file("1_name.step", R"({"migrate": "set_name"})");
    dir.create_file("2_flag.json", kAddFlagPatch);
    dir.create_file("3_more.step", R"({"patch": [{"op": "add", "path": "/more", "value": 3}]})");

    MigrationRegistry<IntegerKey> registry(
        load_migrations_from_dir<IntegerKey>(dir.path(), sample_table()));
    Document result = run_migrations(Document::object(), registry);
    EXPECT_EQ(result, Value::parse(
        R"({"name": "from_transform", "flag": true, "more": 3, "version": 3})"));
}

// ============================================================================
// Custom resolvers
// ============================================================================

namespace {

/**
 * @brief Treats every ".noop" file as an identity transform
 */
class NoopResolver : public StepResolver {
public:
    bool accepts(const std::filesystem::path& file) const override {
        return file.extension() == ".noop";
    }

    MigrationStep resolve(const std::filesystem::path&) const override {
        return MigrationStep([](Document d) { return d; });
    }
};

} // anonymous namespace

TEST_F(LoadMigrationsTest, CustomResolverList) {
    dir.create_file("1_keep.noop", "");
    dir.create_file("2_ignored.json", kAddFlagPatch);

    ResolverList resolvers{std::make_shared<NoopResolver>()};
    Migrations migrations = load_migrations_from_dir<IntegerKey>(dir.path(), resolvers);
    ASSERT_EQ(migrations.size(), 1u);
    EXPECT_TRUE(migrations.at("1_keep").is_transform());
}
