/**
 * @file Registry.hpp
 * @brief Immutable mapping from version key to migration step
 *
 * A registry is built once from one or more Migrations declarations
 * (inline, directory-discovered, ...) and is read-only afterwards, so a
 * single registry can serve concurrent run_migrations() calls.
 *
 * Construction rules:
 * - Every step name must carry a version prefix valid for Key
 *   (VersionFormatError otherwise)
 * - A step name declared by two sources is a DuplicateKeyError
 * - Two names with the same version key ("1_a", "1_b") are a
 *   DuplicateKeyError
 *
 * Entries are kept sorted by key, independent of declaration order.
 */

#ifndef FLUXCONF_REGISTRY_HPP
#define FLUXCONF_REGISTRY_HPP

#include "fluxconf/MigrationStep.hpp"
#include "fluxconf/VersionKey.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fluxconf {

template <typename Key>
class MigrationRegistry {
public:
    using key_type = Key;

    struct Entry {
        Key key;
        std::string name;
        MigrationStep step;
    };

    /**
     * @brief Empty registry
     */
    MigrationRegistry() = default;

    /**
     * @brief Build from a single declaration
     * @throws VersionFormatError, DuplicateKeyError
     */
    explicit MigrationRegistry(const Migrations& migrations);

    /**
     * @brief Build from several declarations, checking collisions across
     *        all of them
     *
     * Example:
     * ```cpp
     * auto registry = MigrationRegistry<IntegerKey>::merge({
     *     inline_migrations,
     *     load_migrations_from_dir<IntegerKey>("migrations"),
     * });
     * ```
     *
     * @throws VersionFormatError, DuplicateKeyError
     */
    static MigrationRegistry merge(const std::vector<Migrations>& sources);

    /**
     * @brief All entries in ascending key order
     */
    const std::vector<Entry>& entries() const noexcept { return entries_; }

    /**
     * @brief Highest key, or nullopt if the registry is empty
     */
    std::optional<Key> latest() const;

    /**
     * @brief Entry with exactly this key, or nullptr
     */
    const Entry* find(const Key& key) const;

    bool contains(const Key& key) const { return find(key) != nullptr; }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Entries with stored < key <= target, in ascending key order
     */
    std::vector<const Entry*> pending(const Key& stored, const Key& target) const;

private:
    std::vector<Entry> entries_;
};

extern template class MigrationRegistry<IntegerKey>;
extern template class MigrationRegistry<SemVerKey>;

} // namespace fluxconf

#endif // FLUXCONF_REGISTRY_HPP
