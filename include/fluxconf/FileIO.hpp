/**
 * @file FileIO.hpp
 * @brief Reading and writing configuration documents on disk
 *
 * Supported formats, chosen by file extension:
 * - .json (nlohmann::json)
 * - .toml (toml++). TOML has no null: nulls are written as empty strings.
 *
 * A file that is empty or only whitespace loads as an empty object.
 */

#ifndef FLUXCONF_FILEIO_HPP
#define FLUXCONF_FILEIO_HPP

#include "fluxconf/Value.hpp"
#include <string>

namespace fluxconf {

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Replace a leading "~" with $HOME
 *
 * "~" and "~/..." are expanded; "~user" forms and other paths are returned
 * unchanged, as is everything when HOME is not set.
 */
std::string expand_user(const std::string& path);

/**
 * @brief Read an entire file into a string
 * @throws FileNotFoundError if the file does not exist
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file, converting tables to objects
 *
 * Dates and times are converted to their string form.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, auto-detecting the format by extension
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if the file has syntax errors
 * @throws ConfigError if the extension is not .json or .toml
 */
Value load_document(const std::string& path);

/**
 * @brief Render a value as JSON text
 */
std::string to_json_string(const Value& value, int indent = 2);

/**
 * @brief Render a value as TOML text
 *
 * A non-object root is wrapped under the key "value". If schema_url is not
 * empty, the output starts with a "#:schema <url>" line.
 */
std::string to_toml_string(const Value& value, const std::string& schema_url = "");

/**
 * @brief Render a document in the format implied by path's extension
 * @throws ConfigError if the extension is not .json or .toml
 */
std::string serialise_document(const std::string& path, const Value& value,
                               const std::string& schema_url = "");

/**
 * @brief Write a document, creating parent directories as needed
 *
 * The schema URL is only emitted for TOML, which supports comments.
 *
 * @throws ConfigError if the extension is unsupported or the file cannot
 *         be written
 */
void write_document(const std::string& path, const Value& value,
                    const std::string& schema_url = "");

} // namespace fluxconf

#endif // FLUXCONF_FILEIO_HPP
