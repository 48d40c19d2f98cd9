/**
 * @file Migration.hpp
 * @brief Versioned migration executor
 *
 * run_migrations() evolves a document from its stored version to a target
 * version:
 *
 * 1. The input document is copied; the caller's value is never modified.
 * 2. stored = document[version_field], or Key::zero() if absent (or null).
 * 3. target = the explicit target, else registry.latest(), else zero.
 * 4. stored > target throws VersionAheadError before any step runs.
 * 5. Steps with stored < key <= target run one at a time in ascending key
 *    order, each receiving the previous step's output.
 * 6. A failing step stops the run with StepExecutionError carrying the
 *    failing step, the last key that completed (or stored), and the cause.
 * 7. Only when every step succeeded is version_field set to target.
 *
 * Steps at or below the stored version are never invoked, so running the
 * same document twice is a no-op the second time.
 */

#ifndef FLUXCONF_MIGRATION_HPP
#define FLUXCONF_MIGRATION_HPP

#include "fluxconf/Registry.hpp"
#include "fluxconf/Value.hpp"
#include "fluxconf/VersionKey.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fluxconf {

/**
 * @brief Default name of the document field holding the version key
 */
constexpr const char* kDefaultVersionField = "version";

/**
 * @brief Read the stored version of a document
 *
 * @return Key::zero() when the field is absent or null
 * @throws TypeError if the document is neither an object nor null
 * @throws VersionFormatError if the field does not parse under Key
 */
template <typename Key>
Key stored_version(const Document& document,
                   const std::string& version_field = kDefaultVersionField);

/**
 * @brief Run all applicable migrations on a copy of a document
 *
 * @param document Raw document; null is treated as an empty object
 * @param registry Steps to choose from
 * @param target_version Version to migrate up to (inclusive); defaults to
 *        the highest registry key
 * @param version_field Document field holding the version
 * @return The migrated document, with version_field set to the target
 * @throws TypeError if the document is neither an object nor null
 * @throws VersionFormatError if the stored version does not parse
 * @throws VersionAheadError if stored > target
 * @throws StepExecutionError if a step fails
 *
 * Example:
 * ```cpp
 * MigrationRegistry<IntegerKey> registry(Migrations{
 *     {"1_add_roles", add_roles},
 *     {"2_rename", MigrationStep::from_document(rename_patch)},
 * });
 * Document migrated = run_migrations(raw, registry);
 * // migrated["version"] == 2
 * ```
 */
template <typename Key>
Document run_migrations(const Document& document,
                        const MigrationRegistry<Key>& registry,
                        const std::optional<typename MigrationRegistry<Key>::key_type>&
                            target_version = std::nullopt,
                        const std::string& version_field = kDefaultVersionField);

/**
 * @brief Names of the steps run_migrations() would apply, in order
 *
 * Performs the same version checks as run_migrations() without running
 * any step.
 *
 * @throws TypeError, VersionFormatError, VersionAheadError
 */
template <typename Key>
std::vector<std::string> pending_migrations(const Document& document,
                                            const MigrationRegistry<Key>& registry,
                                            const std::optional<typename MigrationRegistry<Key>::key_type>&
                                                target_version = std::nullopt,
                                            const std::string& version_field = kDefaultVersionField);

extern template IntegerKey stored_version<IntegerKey>(const Document&, const std::string&);
extern template SemVerKey stored_version<SemVerKey>(const Document&, const std::string&);

extern template Document run_migrations<IntegerKey>(const Document&,
                                                    const MigrationRegistry<IntegerKey>&,
                                                    const std::optional<IntegerKey>&,
                                                    const std::string&);
extern template Document run_migrations<SemVerKey>(const Document&,
                                                   const MigrationRegistry<SemVerKey>&,
                                                   const std::optional<SemVerKey>&,
                                                   const std::string&);

extern template std::vector<std::string> pending_migrations<IntegerKey>(
    const Document&, const MigrationRegistry<IntegerKey>&,
    const std::optional<IntegerKey>&, const std::string&);
extern template std::vector<std::string> pending_migrations<SemVerKey>(
    const Document&, const MigrationRegistry<SemVerKey>&,
    const std::optional<SemVerKey>&, const std::string&);

} // namespace fluxconf

#endif // FLUXCONF_MIGRATION_HPP
