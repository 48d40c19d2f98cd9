/**
 * @file FileIO.cpp
 * @brief JSON and TOML document reading and writing
 */

#include "fluxconf/FileIO.hpp"
#include "fluxconf/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>
#include <utility>

namespace fs = std::filesystem;

namespace fluxconf {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// ---- TOML -> JSON ----------------------------------------------------------

Value toml_to_value(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using node_t = std::decay_t<decltype(n)>;
        if constexpr (toml::is_table<node_t>) {
            Value obj = Value::object();
            for (const auto& [key, child] : n) {
                obj.emplace(std::string(key.str()), toml_to_value(child));
            }
            return obj;
        } else if constexpr (toml::is_array<node_t>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(toml_to_value(child));
            }
            return arr;
        } else if constexpr (toml::is_date<node_t> || toml::is_time<node_t> ||
                             toml::is_date_time<node_t>) {
            // No JSON counterpart; kept as TOML text
            std::ostringstream ss;
            ss << *n;
            return Value(ss.str());
        } else {
            return Value(*n);
        }
    });
}

// ---- JSON -> TOML ----------------------------------------------------------

toml::array make_array(const Value& a);
toml::table make_table(const Value& o);

/**
 * @brief Convert one value and hand it to emit (array push or table insert)
 *
 * TOML has no null, so null becomes "". Unsigned values beyond int64 are
 * written as floats.
 */
template <typename Emit>
void emit_value(const Value& v, Emit&& emit) {
    switch (v.type()) {
        case Value::value_t::object:
            emit(make_table(v));
            break;
        case Value::value_t::array:
            emit(make_array(v));
            break;
        case Value::value_t::string:
            emit(v.get<std::string>());
            break;
        case Value::value_t::boolean:
            emit(v.get<bool>());
            break;
        case Value::value_t::number_integer:
            emit(v.get<std::int64_t>());
            break;
        case Value::value_t::number_unsigned: {
            const auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                emit(static_cast<double>(u));
            } else {
                emit(static_cast<std::int64_t>(u));
            }
            break;
        }
        case Value::value_t::number_float:
            emit(v.get<double>());
            break;
        case Value::value_t::null:
            emit(std::string{});
            break;
        default:
            emit(v.dump());
            break;
    }
}

toml::array make_array(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        emit_value(elem, [&out](auto&& converted) {
            out.push_back(std::forward<decltype(converted)>(converted));
        });
    }
    return out;
}

toml::table make_table(const Value& o) {
    toml::table out;
    for (const auto& item : o.items()) {
        const std::string& key = item.key();
        emit_value(item.value(), [&out, &key](auto&& converted) {
            out.insert_or_assign(key, std::forward<decltype(converted)>(converted));
        });
    }
    return out;
}

toml::table json_to_toml(const Value& j) {
    // TOML requires a table at the root
    if (j.is_object()) {
        return make_table(j);
    }
    return make_table(Value{{"value", j}});
}

} // anonymous namespace

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') return path;
    return std::string(home) + path.substr(1);
}

std::string read_text_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Value load_json_file(const std::string& path) {
    std::string content = read_text_file(path);
    if (is_blank(content)) {
        return Value::object();
    }

    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, 0, 0, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_to_value(table);
}

Value load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError("Unsupported config file type: " + ext + " (expected .json or .toml)");
}

std::string to_json_string(const Value& value, int indent) {
    return value.dump(indent);
}

std::string to_toml_string(const Value& value, const std::string& schema_url) {
    std::ostringstream oss;
    if (!schema_url.empty()) {
        oss << "#:schema " << schema_url << "\n";
    }
    oss << json_to_toml(value) << "\n";
    return oss.str();
}

std::string serialise_document(const std::string& path, const Value& value,
                               const std::string& schema_url) {
    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return to_json_string(value, 2) + "\n";
    }
    if (ext == ".toml") {
        return to_toml_string(value, schema_url);
    }
    throw ConfigError("Unsupported config file type: " + ext + " (expected .json or .toml)");
}

void write_document(const std::string& path, const Value& value,
                    const std::string& schema_url) {
    std::string content = serialise_document(path, value, schema_url);

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw ConfigError("Failed to create directory '" + parent.string() + "': " +
                              ec.message());
        }
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw ConfigError("Failed to open for write: " + path);
    }
    ofs << content;
    if (!ofs) {
        throw ConfigError("Failed to write: " + path);
    }
}

} // namespace fluxconf
