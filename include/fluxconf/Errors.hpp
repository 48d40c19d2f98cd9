/**
 * @file Errors.hpp
 * @brief Exception types for fluxconf configuration and migration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 *   - FileNotFoundError: Config file not found
 *   - ConfigParseError: JSON/TOML syntax errors
 *   - ValidationError: Document does not convert into the typed model
 *   - TypeError: Document root is not an object
 *   - PatchError: A patch operation is malformed or failed
 *   - MigrationError: Base for migration engine failures
 *     - StructuralLoadError: Step directory or step file is malformed
 *     - DuplicateKeyError: Two sources claim the same migration key
 *     - VersionFormatError: A version token does not parse
 *     - VersionAheadError: Stored version is beyond the target
 *     - StepExecutionError: A step failed while running
 */

#ifndef FLUXCONF_ERRORS_HPP
#define FLUXCONF_ERRORS_HPP

#include "fluxconf/Value.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace fluxconf {

/**
 * @brief Base class for all fluxconf exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line 1-based line, or 0 if unknown
     * @param column 1-based column, or 0 if unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Document could not be converted into the typed configuration model
 */
class ValidationError : public ConfigError {
public:
    ValidationError(std::string file, std::string details)
        : ConfigError("Failed to parse " + file + ": " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief A document or step result has the wrong JSON type
 *
 * Raised when a document root, or the value a step returns, is not an
 * object.
 */
class TypeError : public ConfigError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Expected " + expected + " at '" + path +
                      "', got " + actual)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A patch operation is malformed or could not be applied
 *
 * index() is the position of the operation inside its patch, or -1 when
 * the patch document itself is malformed.
 */
class PatchError : public ConfigError {
public:
    PatchError(int index, std::string op, std::string path, std::string reason)
        : ConfigError(format_message(index, op, path, reason))
        , index_(index)
        , op_(std::move(op))
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    int index() const noexcept {
        return index_;
    }

    const std::string& op() const noexcept {
        return op_;
    }

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    int index_;
    std::string op_;
    std::string path_;
    std::string reason_;

    static std::string format_message(int index, const std::string& op,
                                      const std::string& path, const std::string& reason) {
        std::ostringstream oss;
        if (index < 0) {
            oss << "Invalid patch: " << reason;
            return oss.str();
        }
        oss << "Patch operation " << index;
        if (!op.empty()) oss << " (" << op << " '" << path << "')";
        oss << " failed: " << reason;
        return oss.str();
    }
};

/**
 * @brief Base class for migration engine failures
 */
class MigrationError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/**
 * @brief A step directory or step file could not be turned into a step
 *
 * Raised while building a registry; no document has been touched.
 */
class StructuralLoadError : public MigrationError {
public:
    StructuralLoadError(std::string path, std::string details)
        : MigrationError("Cannot load migration '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Two sources assign the same migration name or version key
 *
 * Contains every colliding step name.
 */
class DuplicateKeyError : public MigrationError {
public:
    explicit DuplicateKeyError(std::vector<std::string> names)
        : MigrationError(format_message(names))
        , names_(std::move(names))
    {}

    const std::vector<std::string>& names() const noexcept {
        return names_;
    }

private:
    std::vector<std::string> names_;

    static std::string format_message(const std::vector<std::string>& names) {
        std::ostringstream oss;
        oss << "Duplicate migration key: [";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << names[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief A version token does not parse under the active key scheme
 */
class VersionFormatError : public MigrationError {
public:
    VersionFormatError(std::string token, std::string scheme)
        : MigrationError("Invalid " + scheme + " version key: '" + token + "'")
        , token_(std::move(token))
        , scheme_(std::move(scheme))
    {}

    const std::string& token() const noexcept {
        return token_;
    }

    const std::string& scheme() const noexcept {
        return scheme_;
    }

private:
    std::string token_;
    std::string scheme_;
};

/**
 * @brief The stored document version is newer than the migration target
 *
 * The document was most likely written by a newer release that knows
 * migrations this registry does not.
 */
class VersionAheadError : public MigrationError {
public:
    VersionAheadError(std::string stored, std::string target)
        : MigrationError("Stored version " + stored +
                         " is ahead of the latest known migration " + target +
                         ". The config file may have been written by a newer"
                         " version of the software.")
        , stored_(std::move(stored))
        , target_(std::move(target))
    {}

    const std::string& stored() const noexcept {
        return stored_;
    }

    const std::string& target() const noexcept {
        return target_;
    }

private:
    std::string stored_;
    std::string target_;
};

/**
 * @brief A migration step threw while running
 *
 * Keys are carried in their document form (the value that would be
 * written to the version field), so callers can compare them directly
 * with document contents or convert them back with Key::from_value().
 */
class StepExecutionError : public MigrationError {
public:
    /**
     * @param step Name of the failing step (e.g., "2_rename_field")
     * @param failed_key Version key of the failing step
     * @param last_successful Key of the last step that completed, or the
     *        stored version if the first selected step failed
     * @param cause The exception thrown by the step
     * @param cause_message what() of the cause
     */
    StepExecutionError(std::string step, Value failed_key, Value last_successful,
                       std::exception_ptr cause, std::string cause_message)
        : MigrationError("Migration '" + step + "' failed: " + cause_message)
        , step_(std::move(step))
        , failed_key_(std::move(failed_key))
        , last_successful_(std::move(last_successful))
        , cause_(std::move(cause))
        , cause_message_(std::move(cause_message))
    {}

    const std::string& step() const noexcept {
        return step_;
    }

    const Value& failed_key() const noexcept {
        return failed_key_;
    }

    const Value& last_successful() const noexcept {
        return last_successful_;
    }

    const std::exception_ptr& cause() const noexcept {
        return cause_;
    }

    const std::string& cause_message() const noexcept {
        return cause_message_;
    }

    /**
     * @brief Rethrow the original exception thrown by the step
     */
    [[noreturn]] void rethrow_cause() const {
        std::rethrow_exception(cause_);
    }

private:
    std::string step_;
    Value failed_key_;
    Value last_successful_;
    std::exception_ptr cause_;
    std::string cause_message_;
};

} // namespace fluxconf

#endif // FLUXCONF_ERRORS_HPP
