/**
 * @file Patch.cpp
 * @brief Implementation of RFC 6902 patch parsing and application
 */

#include "fluxconf/Patch.hpp"

#include <cstddef>
#include <utility>

namespace fluxconf {

std::string to_string(PatchOp op) {
    switch (op) {
        case PatchOp::Add: return "add";
        case PatchOp::Remove: return "remove";
        case PatchOp::Replace: return "replace";
        case PatchOp::Move: return "move";
        case PatchOp::Copy: return "copy";
        case PatchOp::Test: return "test";
    }
    return "unknown";
}

std::optional<PatchOp> patch_op_from_string(const std::string& name) {
    if (name == "add") return PatchOp::Add;
    if (name == "remove") return PatchOp::Remove;
    if (name == "replace") return PatchOp::Replace;
    if (name == "move") return PatchOp::Move;
    if (name == "copy") return PatchOp::Copy;
    if (name == "test") return PatchOp::Test;
    return std::nullopt;
}

namespace {

bool uses_value(PatchOp op) {
    return op == PatchOp::Add || op == PatchOp::Replace || op == PatchOp::Test;
}

bool uses_from(PatchOp op) {
    return op == PatchOp::Move || op == PatchOp::Copy;
}

Value operation_to_value(const PatchOperation& operation) {
    Value entry = Value::object();
    entry["op"] = to_string(operation.op);
    if (uses_from(operation.op)) {
        entry["from"] = operation.from;
    }
    entry["path"] = operation.path;
    if (uses_value(operation.op)) {
        entry["value"] = operation.value;
    }
    return entry;
}

/**
 * @brief Reject a malformed RFC 6901 pointer before any operation runs
 */
void check_pointer(const std::string& pointer, int index, const std::string& op_name,
                   const std::string& path) {
    try {
        Value::json_pointer parsed(pointer);
        (void)parsed;
    } catch (const nlohmann::json::exception& e) {
        throw PatchError(index, op_name, path,
                         "invalid JSON pointer '" + pointer + "': " + e.what());
    }
}

} // anonymous namespace

Document apply_patch(const Document& document, const Patch& patch) {
    Document result = document;

    // Applied per operation so a failure reports its index
    for (size_t i = 0; i < patch.size(); ++i) {
        const auto& operation = patch[i];
        try {
            result = result.patch(Value::array({operation_to_value(operation)}));
        } catch (const nlohmann::json::exception& e) {
            throw PatchError(static_cast<int>(i), to_string(operation.op),
                             operation.path, e.what());
        }
    }

    return result;
}

Patch parse_patch(const Value& document) {
    if (!document.is_array()) {
        throw PatchError(-1, "", "", "patch must be a JSON array, got " + type_name(document));
    }

    Patch patch;
    patch.reserve(document.size());

    for (size_t i = 0; i < document.size(); ++i) {
        const Value& entry = document[i];
        const int index = static_cast<int>(i);

        if (!entry.is_object()) {
            throw PatchError(index, "", "", "operation must be an object, got " + type_name(entry));
        }

        auto op_it = entry.find("op");
        if (op_it == entry.end() || !op_it->is_string()) {
            throw PatchError(index, "", "", "missing string member 'op'");
        }
        const std::string op_name = op_it->get<std::string>();
        auto op = patch_op_from_string(op_name);
        if (!op) {
            throw PatchError(index, op_name, "", "unknown operation '" + op_name + "'");
        }

        PatchOperation operation;
        operation.op = *op;

        auto path_it = entry.find("path");
        if (path_it == entry.end() || !path_it->is_string()) {
            throw PatchError(index, op_name, "", "missing string member 'path'");
        }
        operation.path = path_it->get<std::string>();

        check_pointer(operation.path, index, op_name, operation.path);

        if (uses_value(*op)) {
            auto value_it = entry.find("value");
            if (value_it == entry.end()) {
                throw PatchError(index, op_name, operation.path, "missing member 'value'");
            }
            operation.value = *value_it;
        }

        if (uses_from(*op)) {
            auto from_it = entry.find("from");
            if (from_it == entry.end() || !from_it->is_string()) {
                throw PatchError(index, op_name, operation.path, "missing string member 'from'");
            }
            operation.from = from_it->get<std::string>();
            check_pointer(operation.from, index, op_name, operation.path);
        }

        patch.push_back(std::move(operation));
    }

    return patch;
}

Value patch_to_value(const Patch& patch) {
    Value result = Value::array();
    for (const auto& operation : patch) {
        result.push_back(operation_to_value(operation));
    }
    return result;
}

} // namespace fluxconf
