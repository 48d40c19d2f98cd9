/**
 * @file Patch.hpp
 * @brief RFC 6902 JSON patch operations for declarative migrations
 *
 * A Patch is an ordered list of operations applied as one unit: if any
 * operation fails, apply_patch() throws and the caller's document is left
 * untouched. Pointers and operations are evaluated by nlohmann::json's
 * json_pointer and json::patch(); this layer adds the typed operation model
 * and per-operation error reporting.
 *
 * Operation semantics:
 * - add:     insert at path; creates or overwrites an object member, or
 *            inserts into an array before the index ("-" appends). The
 *            parent must exist.
 * - remove:  delete the value at path; fails if absent.
 * - replace: remove + add at the same path; fails if absent.
 * - move:    read from, remove it, add at path; fails if from is absent or
 *            path lies inside from.
 * - copy:    read from, add a duplicate at path.
 * - test:    deep-compare the value at path with value; mismatch fails.
 *
 * Patch document format:
 * ```json
 * [
 *   {"op": "add", "path": "/x", "value": 1},
 *   {"op": "move", "from": "/old", "path": "/new"}
 * ]
 * ```
 */

#ifndef FLUXCONF_PATCH_HPP
#define FLUXCONF_PATCH_HPP

#include "fluxconf/Value.hpp"
#include "fluxconf/Errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fluxconf {

enum class PatchOp {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test
};

/**
 * @brief Name of an operation as it appears in patch documents ("add", ...)
 */
std::string to_string(PatchOp op);

/**
 * @brief Parse an operation name
 * @return The operation, or nullopt for an unknown name
 */
std::optional<PatchOp> patch_op_from_string(const std::string& name);

/**
 * @brief One patch instruction
 *
 * `value` is used by add/replace/test, `from` by move/copy.
 */
struct PatchOperation {
    PatchOp op = PatchOp::Add;
    std::string path;
    std::string from;
    Value value;
};

using Patch = std::vector<PatchOperation>;

/**
 * @brief Convert a patch document into a Patch
 *
 * @param document JSON array of operation objects
 * @return Parsed operations in document order
 * @throws PatchError (index -1 for a non-array document, the operation's
 *         index otherwise) for an unknown op, a missing or non-string
 *         path/from, a missing value, or a malformed pointer
 */
Patch parse_patch(const Value& document);

/**
 * @brief Render a Patch back into its document form
 */
Value patch_to_value(const Patch& patch);

/**
 * @brief Apply a whole patch to a copy of a document
 *
 * @param document Input document (not modified)
 * @param patch Operations to apply in order
 * @return The patched document
 * @throws PatchError naming the first failing operation, with the
 *         library's diagnostic as the reason
 */
Document apply_patch(const Document& document, const Patch& patch);

} // namespace fluxconf

#endif // FLUXCONF_PATCH_HPP
