/**
 * @file VersionKey.cpp
 * @brief Parsing and rendering of integer and semantic-version keys
 */

#include "fluxconf/VersionKey.hpp"
#include "fluxconf/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace fluxconf {

namespace {

bool is_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<std::uint64_t> parse_unsigned(const std::string& s) {
    if (!is_digits(s)) return std::nullopt;
    try {
        return static_cast<std::uint64_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // anonymous namespace

std::string name_prefix(const std::string& name) {
    auto pos = name.find(kNameSeparator);
    if (pos == std::string::npos) return name;
    return name.substr(0, pos);
}

// ============================================================================
// IntegerKey
// ============================================================================

std::optional<IntegerKey> IntegerKey::try_parse(const std::string& token) {
    auto parsed = parse_unsigned(token);
    if (!parsed) return std::nullopt;
    return IntegerKey(*parsed);
}

IntegerKey IntegerKey::parse(const std::string& token) {
    auto key = try_parse(token);
    if (!key) throw VersionFormatError(token, scheme_name);
    return *key;
}

std::optional<IntegerKey> IntegerKey::try_from_name(const std::string& name) {
    return try_parse(name_prefix(name));
}

IntegerKey IntegerKey::from_name(const std::string& name) {
    auto key = try_from_name(name);
    if (!key) throw VersionFormatError(name, scheme_name);
    return *key;
}

IntegerKey IntegerKey::from_value(const Value& value) {
    if (value.is_number_unsigned()) {
        return IntegerKey(value.get<std::uint64_t>());
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return IntegerKey(static_cast<std::uint64_t>(value.get<std::int64_t>()));
    }
    throw VersionFormatError(value.dump(), scheme_name);
}

Value IntegerKey::to_value() const {
    return Value(value_);
}

std::string IntegerKey::to_string() const {
    return std::to_string(value_);
}

// ============================================================================
// SemVerKey
// ============================================================================

std::optional<SemVerKey> SemVerKey::try_parse(const std::string& token) {
    static const std::regex version_regex(R"((\d+)\.(\d+)\.(\d+))");
    std::smatch matches;
    if (!std::regex_match(token, matches, version_regex)) {
        return std::nullopt;
    }

    auto major_number = parse_unsigned(matches[1].str());
    auto minor_number = parse_unsigned(matches[2].str());
    auto patch_number = parse_unsigned(matches[3].str());
    if (!major_number || !minor_number || !patch_number) return std::nullopt;

    return SemVerKey(*major_number, *minor_number, *patch_number);
}

SemVerKey SemVerKey::parse(const std::string& token) {
    auto key = try_parse(token);
    if (!key) throw VersionFormatError(token, scheme_name);
    return *key;
}

std::optional<SemVerKey> SemVerKey::try_from_name(const std::string& name) {
    return try_parse(name_prefix(name));
}

SemVerKey SemVerKey::from_name(const std::string& name) {
    auto key = try_from_name(name);
    if (!key) throw VersionFormatError(name, scheme_name);
    return *key;
}

SemVerKey SemVerKey::from_value(const Value& value) {
    if (!value.is_string()) {
        throw VersionFormatError(value.dump(), scheme_name);
    }
    return parse(value.get<std::string>());
}

Value SemVerKey::to_value() const {
    return Value(to_string());
}

std::string SemVerKey::to_string() const {
    return std::to_string(major_) + "." + std::to_string(minor_) + "." +
           std::to_string(patch_);
}

} // namespace fluxconf
