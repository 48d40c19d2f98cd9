/**
 * @file test_registry.cpp
 * @brief Unit tests for MigrationStep and MigrationRegistry (GoogleTest)
 */

#include <gtest/gtest.h>
#include "fluxconf/Registry.hpp"
#include "fluxconf/Errors.hpp"

using namespace fluxconf;

namespace {

Document identity(Document d) {
    return d;
}

MigrationStep set_patch(const std::string& key) {
    Value patch = Value::array();
    patch.push_back({{"op", "add"}, {"path", "/" + key}, {"value", true}});
    return MigrationStep::from_document(patch);
}

std::vector<std::string> names_of(const MigrationRegistry<IntegerKey>& registry) {
    std::vector<std::string> names;
    for (const auto& entry : registry.entries()) {
        names.push_back(entry.name);
    }
    return names;
}

} // anonymous namespace

// ============================================================================
// MigrationStep
// ============================================================================

TEST(MigrationStepTest, TransformKind) {
    MigrationStep step([](Document d) {
        d["touched"] = true;
        return d;
    });
    EXPECT_TRUE(step.is_transform());
    EXPECT_EQ(step.patch(), nullptr);
    EXPECT_EQ(to_string(step.kind()), "transform");
    EXPECT_EQ(step.apply(Document::object())["touched"], true);
}

TEST(MigrationStepTest, PatchKind) {
    MigrationStep step = set_patch("flag");
    EXPECT_TRUE(step.is_patch());
    ASSERT_NE(step.patch(), nullptr);
    EXPECT_EQ(step.patch()->size(), 1u);
    EXPECT_EQ(to_string(step.kind()), "patch");
    EXPECT_EQ(step.apply(Document::object()), Value::parse(R"({"flag": true})"));
}

TEST(MigrationStepTest, EmptyFunctionRejected) {
    EXPECT_THROW((void)MigrationStep(TransformFn{}), ConfigError);
}

TEST(MigrationStepTest, InvalidPatchDocumentRejected) {
    EXPECT_THROW(MigrationStep::from_document(Value::parse(R"({"op": "add"})")), PatchError);
}

// ============================================================================
// Construction and ordering
// ============================================================================

TEST(MigrationRegistryTest, EmptyRegistry) {
    MigrationRegistry<IntegerKey> registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_FALSE(registry.latest().has_value());
}

TEST(MigrationRegistryTest, EntriesSortedByKeyNotDeclaration) {
    MigrationRegistry<IntegerKey> registry(Migrations{
        {"10_last", identity},
        {"2_second", identity},
        {"1_first", identity},
    });

    std::vector<std::string> expected{"1_first", "2_second", "10_last"};
    EXPECT_EQ(names_of(registry), expected);
    EXPECT_EQ(registry.latest(), std::optional<IntegerKey>(IntegerKey(10)));
    EXPECT_EQ(registry.size(), 3u);
}

TEST(MigrationRegistryTest, FindByKey) {
    MigrationRegistry<IntegerKey> registry(Migrations{{"1_a", identity}, {"3_c", set_patch("c")}});

    const auto* entry = registry.find(IntegerKey(3));
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->name, "3_c");
    EXPECT_TRUE(entry->step.is_patch());
    EXPECT_TRUE(registry.contains(IntegerKey(1)));
    EXPECT_FALSE(registry.contains(IntegerKey(2)));
}

TEST(MigrationRegistryTest, InvalidPrefixRejected) {
    EXPECT_THROW((void)MigrationRegistry<IntegerKey>(Migrations{{"first_step", identity}}),
                 VersionFormatError);
    EXPECT_THROW((void)MigrationRegistry<SemVerKey>(Migrations{{"1_step", identity}}),
                 VersionFormatError);
}

TEST(MigrationRegistryTest, SameKeyDifferentNamesRejected) {
    try {
        (void)MigrationRegistry<IntegerKey>(
            Migrations{{"1_b", identity}, {"1_a", identity}, {"2_c", identity}});
        FAIL() << "Expected DuplicateKeyError";
    } catch (const DuplicateKeyError& e) {
        std::vector<std::string> expected{"1_a", "1_b"};
        EXPECT_EQ(e.names(), expected);
        EXPECT_NE(std::string(e.what()).find("'1_a'"), std::string::npos);
    }
}

TEST(MigrationRegistryTest, ZeroPaddedPrefixCollides) {
    EXPECT_THROW((void)MigrationRegistry<IntegerKey>(
                     Migrations{{"1_a", identity}, {"01_a", identity}}),
                 DuplicateKeyError);
}

TEST(MigrationRegistryTest, MergeRejectsNameDeclaredTwice) {
    Migrations inline_steps{{"1_setup", identity}};
    Migrations discovered{{"1_setup", set_patch("x")}, {"2_more", identity}};

    try {
        (void)MigrationRegistry<IntegerKey>::merge({inline_steps, discovered});
        FAIL() << "Expected DuplicateKeyError";
    } catch (const DuplicateKeyError& e) {
        std::vector<std::string> expected{"1_setup"};
        EXPECT_EQ(e.names(), expected);
    }
}

TEST(MigrationRegistryTest, MergeCombinesSources) {
    auto registry = MigrationRegistry<IntegerKey>::merge({
        Migrations{{"2_b", identity}},
        Migrations{{"1_a", identity}, {"3_c", identity}},
    });
    std::vector<std::string> expected{"1_a", "2_b", "3_c"};
    EXPECT_EQ(names_of(registry), expected);
}

TEST(MigrationRegistryTest, MergeRejectsKeyCollisionAcrossSources) {
    EXPECT_THROW(MigrationRegistry<IntegerKey>::merge({
                     Migrations{{"2_inline", identity}},
                     Migrations{{"2_from_dir", identity}},
                 }),
                 DuplicateKeyError);
}

// ============================================================================
// pending
// ============================================================================

TEST(MigrationRegistryTest, PendingIsHalfOpenInterval) {
    MigrationRegistry<IntegerKey> registry(Migrations{
        {"1_a", identity}, {"2_b", identity}, {"3_c", identity}, {"4_d", identity},
    });

    auto pending = registry.pending(IntegerKey(1), IntegerKey(3));
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0]->name, "2_b");
    EXPECT_EQ(pending[1]->name, "3_c");

    EXPECT_TRUE(registry.pending(IntegerKey(4), IntegerKey(4)).empty());
    EXPECT_EQ(registry.pending(IntegerKey(0), IntegerKey(10)).size(), 4u);
}

TEST(MigrationRegistryTest, SemVerOrdering) {
    MigrationRegistry<SemVerKey> registry(Migrations{
        {"1.10.0_late", identity},
        {"1.2.0_early", identity},
        {"0.9.1_first", identity},
    });

    ASSERT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.entries()[0].name, "0.9.1_first");
    EXPECT_EQ(registry.entries()[1].name, "1.2.0_early");
    EXPECT_EQ(registry.entries()[2].name, "1.10.0_late");
    EXPECT_EQ(registry.latest(), std::optional<SemVerKey>(SemVerKey(1, 10, 0)));

    auto pending = registry.pending(SemVerKey(1, 0, 0), SemVerKey(2, 0, 0));
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0]->name, "1.2.0_early");
}
