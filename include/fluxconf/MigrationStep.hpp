/**
 * @file MigrationStep.hpp
 * @brief A single migration: either a transformation or a declarative patch
 */

#ifndef FLUXCONF_MIGRATIONSTEP_HPP
#define FLUXCONF_MIGRATIONSTEP_HPP

#include "fluxconf/Value.hpp"
#include "fluxconf/Patch.hpp"

#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace fluxconf {

/**
 * @brief Transformation from an old document to a new one
 *
 * Receives its own copy of the document and may modify and return it, or
 * build a new one. Throwing any std::exception fails the migration.
 */
using TransformFn = std::function<Document(Document)>;

/**
 * @brief Tagged union of the two step representations
 *
 * Steps are immutable once built. Both kinds are run through apply(), so
 * the executor never inspects which kind it holds.
 *
 * Example:
 * ```cpp
 * MigrationStep rename([](Document d) {
 *     d["enabled"] = d["active"];
 *     d.erase("active");
 *     return d;
 * });
 * MigrationStep add_field = MigrationStep::from_document(
 *     Value::parse(R"([{"op": "add", "path": "/x", "value": 1}])"));
 * ```
 */
class MigrationStep {
public:
    enum class Kind {
        Transform,
        Patch
    };

    /**
     * @throws ConfigError if fn is empty
     */
    MigrationStep(TransformFn fn);

    /**
     * @brief Wrap any callable taking and returning a Document
     */
    template <typename Fn,
              typename = std::enable_if_t<
                  !std::is_same<std::decay_t<Fn>, MigrationStep>::value &&
                  !std::is_same<std::decay_t<Fn>, TransformFn>::value &&
                  std::is_invocable_r<Document, Fn&, Document>::value>>
    MigrationStep(Fn fn)
        : MigrationStep(TransformFn(std::move(fn)))
    {}

    MigrationStep(Patch patch);

    /**
     * @brief Build a patch step from a patch document (JSON array)
     * @throws PatchError if the document is not a valid patch
     */
    static MigrationStep from_document(const Value& patch_document);

    Kind kind() const noexcept;

    bool is_transform() const noexcept { return kind() == Kind::Transform; }
    bool is_patch() const noexcept { return kind() == Kind::Patch; }

    /**
     * @brief The operations of a patch step, or nullptr for a transform
     */
    const Patch* patch() const noexcept;

    /**
     * @brief Run the step on a document
     *
     * @param document Input document, owned by the step for the call
     * @return The migrated document
     * @throws whatever the transformation throws, or PatchError
     */
    Document apply(Document document) const;

private:
    std::variant<TransformFn, Patch> body_;
};

/**
 * @brief Name of a step kind ("transform" or "patch")
 */
std::string to_string(MigrationStep::Kind kind);

/**
 * @brief A declaration of steps keyed by name ("3_add_roles" -> step)
 *
 * This is the inline form of a registry source, and what the directory
 * loader produces.
 */
using Migrations = std::map<std::string, MigrationStep>;

} // namespace fluxconf

#endif // FLUXCONF_MIGRATIONSTEP_HPP
