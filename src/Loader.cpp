/**
 * @file Loader.cpp
 * @brief Directory discovery and the built-in step resolvers
 */

#include "fluxconf/Loader.hpp"
#include "fluxconf/Errors.hpp"
#include "fluxconf/FileIO.hpp"
#include "fluxconf/Logger.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace fluxconf {

namespace {

Logger& loader_logger() {
    static Logger logger = create_logger("Loader");
    return logger;
}

bool has_extension(const fs::path& file, const char* extension) {
    return get_file_extension(file.string()) == extension;
}

Value read_json(const fs::path& file) {
    try {
        return load_json_file(file.string());
    } catch (const FileNotFoundError& e) {
        throw StructuralLoadError(file.string(), e.what());
    } catch (const ConfigParseError& e) {
        throw StructuralLoadError(file.string(), "invalid JSON: " + e.details());
    }
}

MigrationStep patch_step(const fs::path& file, const Value& document) {
    try {
        return MigrationStep::from_document(document);
    } catch (const PatchError& e) {
        throw StructuralLoadError(file.string(), e.what());
    }
}

} // anonymous namespace

// ============================================================================
// TransformTable
// ============================================================================

TransformTable& TransformTable::add(const std::string& name, TransformFn fn) {
    if (!fn) {
        throw ConfigError("Transform '" + name + "' must be callable");
    }
    if (!transforms_.emplace(name, std::move(fn)).second) {
        throw DuplicateKeyError({name});
    }
    return *this;
}

const TransformFn* TransformTable::find(const std::string& name) const {
    auto it = transforms_.find(name);
    return it == transforms_.end() ? nullptr : &it->second;
}

std::vector<std::string> TransformTable::names() const {
    std::vector<std::string> out;
    out.reserve(transforms_.size());
    for (const auto& [name, fn] : transforms_) {
        out.push_back(name);
    }
    return out;
}

// ============================================================================
// Resolvers
// ============================================================================

bool PatchFileResolver::accepts(const fs::path& file) const {
    return has_extension(file, ".json");
}

MigrationStep PatchFileResolver::resolve(const fs::path& file) const {
    Value document = read_json(file);
    if (!document.is_array()) {
        throw StructuralLoadError(file.string(),
                                  "must contain a JSON array of patch operations, got " +
                                  type_name(document));
    }
    return patch_step(file, document);
}

ModuleFileResolver::ModuleFileResolver(TransformTable table)
    : table_(std::move(table))
{}

bool ModuleFileResolver::accepts(const fs::path& file) const {
    return has_extension(file, ".step");
}

MigrationStep ModuleFileResolver::resolve(const fs::path& file) const {
    Value manifest = read_json(file);
    if (!manifest.is_object()) {
        throw StructuralLoadError(file.string(),
                                  "manifest must be a JSON object, got " + type_name(manifest));
    }

    auto migrate = manifest.find("migrate");
    if (migrate != manifest.end()) {
        if (!migrate->is_string()) {
            throw StructuralLoadError(file.string(), "'migrate' is not callable");
        }
        const std::string name = migrate->get<std::string>();
        const TransformFn* fn = table_.find(name);
        if (fn == nullptr) {
            throw StructuralLoadError(file.string(),
                                      "'migrate' is not callable: no transform named '" +
                                      name + "'");
        }
        return MigrationStep(*fn);
    }

    if (const TransformFn* fn = table_.find(file.stem().string())) {
        return MigrationStep(*fn);
    }

    auto patch = manifest.find("patch");
    if (patch != manifest.end()) {
        if (!patch->is_array()) {
            throw StructuralLoadError(file.string(), "'patch' is not a list");
        }
        return patch_step(file, *patch);
    }

    throw StructuralLoadError(file.string(), "defines neither 'migrate' nor 'patch'");
}

ResolverList default_resolvers(const TransformTable& table) {
    return {
        std::make_shared<PatchFileResolver>(),
        std::make_shared<ModuleFileResolver>(table),
    };
}

// ============================================================================
// Discovery
// ============================================================================

template <typename Key>
Migrations load_migrations_from_dir(const fs::path& directory, const ResolverList& resolvers) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw StructuralLoadError(directory.string(), "not a directory");
    }

    std::vector<fs::path> files;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        // A dangling link reports not_found and is skipped like any non-file
        const fs::file_status status = it->status(ec);
        if (ec && fs::status_known(status)) {
            ec.clear();
        }
        if (ec) {
            throw StructuralLoadError(it->path().string(), ec.message());
        }
        if (fs::is_regular_file(status)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw StructuralLoadError(directory.string(), ec.message());
    }
    std::sort(files.begin(), files.end());

    Migrations migrations;
    std::map<Key, std::string> stem_by_key;

    for (const auto& file : files) {
        const std::string stem = file.stem().string();

        auto resolver = std::find_if(resolvers.begin(), resolvers.end(),
                                     [&file](const auto& r) { return r->accepts(file); });
        if (resolver == resolvers.end()) {
            loader_logger()->debug("Skipping {}: no resolver for this extension", file.string());
            continue;
        }
        if (stem.empty() || stem.front() == '_') {
            loader_logger()->debug("Skipping {}: private file", file.string());
            continue;
        }
        if (stem.find(kNameSeparator) == std::string::npos) {
            loader_logger()->debug("Skipping {}: name has no version prefix", file.string());
            continue;
        }
        auto key = Key::try_from_name(stem);
        if (!key) {
            loader_logger()->debug("Skipping {}: '{}' is not a valid {} version",
                                   file.string(), name_prefix(stem), Key::scheme_name);
            continue;
        }

        if (migrations.count(stem) > 0) {
            throw DuplicateKeyError({stem});
        }
        auto existing = stem_by_key.find(*key);
        if (existing != stem_by_key.end()) {
            std::vector<std::string> names{existing->second, stem};
            std::sort(names.begin(), names.end());
            throw DuplicateKeyError(std::move(names));
        }

        loader_logger()->debug("Loading migration '{}' from {}", stem, file.string());
        migrations.emplace(stem, (*resolver)->resolve(file));
        stem_by_key.emplace(*key, stem);
    }

    loader_logger()->info("Discovered {} migration(s) in {}", migrations.size(),
                          directory.string());
    return migrations;
}

template Migrations load_migrations_from_dir<IntegerKey>(const fs::path&, const ResolverList&);
template Migrations load_migrations_from_dir<SemVerKey>(const fs::path&, const ResolverList&);

} // namespace fluxconf
