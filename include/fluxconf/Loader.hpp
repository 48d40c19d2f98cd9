/**
 * @file Loader.hpp
 * @brief Discovery of migration steps from a directory
 *
 * Each file in a migrations directory named "<prefix>_<description>.<ext>"
 * becomes one step keyed by its stem. The extension selects the
 * StepResolver that turns the file into a step:
 *
 * - .json: a JSON Patch document (PatchFileResolver)
 * - .step: a manifest naming a compiled-in transformation, or carrying an
 *   inline patch (ModuleFileResolver)
 *
 * Files whose stem starts with '_', has no '_', or whose prefix does not
 * parse as a version key are skipped.
 */

#ifndef FLUXCONF_LOADER_HPP
#define FLUXCONF_LOADER_HPP

#include "fluxconf/MigrationStep.hpp"
#include "fluxconf/VersionKey.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fluxconf {

/**
 * @brief Turns one file into a migration step
 */
class StepResolver {
public:
    virtual ~StepResolver() = default;

    /**
     * @brief Whether this resolver handles the file (by extension)
     */
    virtual bool accepts(const std::filesystem::path& file) const = 0;

    /**
     * @throws StructuralLoadError if the file cannot be turned into a step
     */
    virtual MigrationStep resolve(const std::filesystem::path& file) const = 0;
};

using ResolverList = std::vector<std::shared_ptr<const StepResolver>>;

/**
 * @brief Named transformations linked into the host program
 *
 * Module files refer to transformations by name; this table is where those
 * names are looked up.
 *
 * Example:
 * ```cpp
 * TransformTable table;
 * table.add("2_split_name", [](Document d) {
 *     ...
 *     return d;
 * });
 * ```
 */
class TransformTable {
public:
    /**
     * @throws DuplicateKeyError if name is already registered
     * @throws ConfigError if fn is empty
     */
    TransformTable& add(const std::string& name, TransformFn fn);

    /**
     * @brief The transformation registered under name, or nullptr
     */
    const TransformFn* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }
    std::size_t size() const noexcept { return transforms_.size(); }

    /**
     * @brief Registered names in sorted order
     */
    std::vector<std::string> names() const;

private:
    std::map<std::string, TransformFn> transforms_;
};

/**
 * @brief Resolves ".json" files holding a JSON array of patch operations
 */
class PatchFileResolver : public StepResolver {
public:
    bool accepts(const std::filesystem::path& file) const override;
    MigrationStep resolve(const std::filesystem::path& file) const override;
};

/**
 * @brief Resolves ".step" manifest files
 *
 * A manifest is a JSON object. The step is, in order of preference:
 * 1. the transformation named by "migrate"
 * 2. a transformation registered under the file stem
 * 3. the patch operations in "patch"
 *
 * An empty file is an empty manifest.
 */
class ModuleFileResolver : public StepResolver {
public:
    explicit ModuleFileResolver(TransformTable table = {});

    bool accepts(const std::filesystem::path& file) const override;
    MigrationStep resolve(const std::filesystem::path& file) const override;

    const TransformTable& table() const noexcept { return table_; }

private:
    TransformTable table_;
};

/**
 * @brief Patch files plus module files resolved against table
 */
ResolverList default_resolvers(const TransformTable& table = {});

/**
 * @brief Discover steps in a directory
 *
 * @param directory Directory to scan (not recursive)
 * @param resolvers Resolvers tried in order; the first that accepts a file
 *        resolves it
 * @return Steps keyed by file stem
 * @throws StructuralLoadError if the directory is missing or a step file
 *         is invalid
 * @throws DuplicateKeyError if two files share a stem or a version key
 */
template <typename Key>
Migrations load_migrations_from_dir(const std::filesystem::path& directory,
                                    const ResolverList& resolvers);

/**
 * @brief Discover steps using default_resolvers(table)
 */
template <typename Key>
Migrations load_migrations_from_dir(const std::filesystem::path& directory,
                                    const TransformTable& table = {}) {
    return load_migrations_from_dir<Key>(directory, default_resolvers(table));
}

extern template Migrations load_migrations_from_dir<IntegerKey>(const std::filesystem::path&,
                                                                const ResolverList&);
extern template Migrations load_migrations_from_dir<SemVerKey>(const std::filesystem::path&,
                                                               const ResolverList&);

} // namespace fluxconf

#endif // FLUXCONF_LOADER_HPP
