/**
 * @file VersionKey.hpp
 * @brief Totally ordered migration version keys
 *
 * Two key schemes are provided. Both expose the same static and member
 * interface, which is what MigrationRegistry, run_migrations() and the
 * directory loader are written against:
 *
 * - Key::scheme_name                 human-readable scheme name
 * - Key::zero()                      value of a document without version
 * - Key::try_parse(token)            parse a bare token, nullopt on failure
 * - Key::parse(token)                same, throws VersionFormatError
 * - Key::try_from_name(name)         parse the prefix of "<prefix>_<description>"
 * - Key::from_name(name)             same, throws VersionFormatError
 * - Key::from_value(value)           read the document's version field
 * - key.to_value()                   value written to the version field
 * - key.to_string()                  display form
 * - ==, !=, <, <=, >, >=
 *
 * Key naming examples:
 * ```cpp
 * IntegerKey::from_name("3_add_roles");      // 3
 * SemVerKey::from_name("1.2.0_add_roles");   // 1.2.0
 * IntegerKey::from_value(Value(2));          // 2
 * SemVerKey::from_value(Value("1.0.0"));     // 1.0.0
 * ```
 */

#ifndef FLUXCONF_VERSIONKEY_HPP
#define FLUXCONF_VERSIONKEY_HPP

#include "fluxconf/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace fluxconf {

/**
 * @brief Separator between the version prefix and the description of a
 *        step name
 */
constexpr char kNameSeparator = '_';

/**
 * @brief Return the part of a step name before the first separator
 *
 * Examples:
 * - "3_add_roles" -> "3"
 * - "1.2.0_rename" -> "1.2.0"
 * - "7" -> "7"
 */
std::string name_prefix(const std::string& name);

/**
 * @brief Integer-prefixed version key ("3_add_roles" -> 3)
 *
 * Stored in documents as a JSON integer. Zero value is 0.
 */
class IntegerKey {
public:
    static constexpr const char* scheme_name = "integer";

    constexpr IntegerKey() noexcept = default;
    constexpr explicit IntegerKey(std::uint64_t value) noexcept : value_(value) {}

    static IntegerKey zero() noexcept { return IntegerKey(); }

    static std::optional<IntegerKey> try_parse(const std::string& token);
    static IntegerKey parse(const std::string& token);

    static std::optional<IntegerKey> try_from_name(const std::string& name);
    static IntegerKey from_name(const std::string& name);

    /**
     * @brief Read a version field value
     * @throws VersionFormatError unless the value is a non-negative integer
     */
    static IntegerKey from_value(const Value& value);

    Value to_value() const;
    std::string to_string() const;

    std::uint64_t value() const noexcept { return value_; }

    friend bool operator==(const IntegerKey& a, const IntegerKey& b) noexcept {
        return a.value_ == b.value_;
    }
    friend bool operator!=(const IntegerKey& a, const IntegerKey& b) noexcept {
        return !(a == b);
    }
    friend bool operator<(const IntegerKey& a, const IntegerKey& b) noexcept {
        return a.value_ < b.value_;
    }
    friend bool operator>(const IntegerKey& a, const IntegerKey& b) noexcept {
        return b < a;
    }
    friend bool operator<=(const IntegerKey& a, const IntegerKey& b) noexcept {
        return !(b < a);
    }
    friend bool operator>=(const IntegerKey& a, const IntegerKey& b) noexcept {
        return !(a < b);
    }

private:
    std::uint64_t value_ = 0;
};

/**
 * @brief Semantic-version key ("1.2.0_add_roles" -> 1.2.0)
 *
 * Only MAJOR.MINOR.PATCH is accepted; pre-release and build suffixes are
 * rejected. Stored in documents as the string "1.2.0". Zero value is 0.0.0.
 */
class SemVerKey {
public:
    static constexpr const char* scheme_name = "semver";

    constexpr SemVerKey() noexcept = default;
    constexpr SemVerKey(std::uint64_t major_number, std::uint64_t minor_number,
                        std::uint64_t patch_number) noexcept
        : major_(major_number), minor_(minor_number), patch_(patch_number) {}

    static SemVerKey zero() noexcept { return SemVerKey(); }

    static std::optional<SemVerKey> try_parse(const std::string& token);
    static SemVerKey parse(const std::string& token);

    static std::optional<SemVerKey> try_from_name(const std::string& name);
    static SemVerKey from_name(const std::string& name);

    /**
     * @brief Read a version field value
     * @throws VersionFormatError unless the value is a "X.Y.Z" string
     */
    static SemVerKey from_value(const Value& value);

    Value to_value() const;
    std::string to_string() const;

    std::uint64_t major_number() const noexcept { return major_; }
    std::uint64_t minor_number() const noexcept { return minor_; }
    std::uint64_t patch_number() const noexcept { return patch_; }

    friend bool operator==(const SemVerKey& a, const SemVerKey& b) noexcept {
        return a.tie() == b.tie();
    }
    friend bool operator!=(const SemVerKey& a, const SemVerKey& b) noexcept {
        return !(a == b);
    }
    friend bool operator<(const SemVerKey& a, const SemVerKey& b) noexcept {
        return a.tie() < b.tie();
    }
    friend bool operator>(const SemVerKey& a, const SemVerKey& b) noexcept {
        return b < a;
    }
    friend bool operator<=(const SemVerKey& a, const SemVerKey& b) noexcept {
        return !(b < a);
    }
    friend bool operator>=(const SemVerKey& a, const SemVerKey& b) noexcept {
        return !(a < b);
    }

private:
    std::uint64_t major_ = 0;
    std::uint64_t minor_ = 0;
    std::uint64_t patch_ = 0;

    std::tuple<std::uint64_t, std::uint64_t, std::uint64_t> tie() const noexcept {
        return std::make_tuple(major_, minor_, patch_);
    }
};

} // namespace fluxconf

#endif // FLUXCONF_VERSIONKEY_HPP
