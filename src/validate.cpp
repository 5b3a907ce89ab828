#include "pydust/validate.hpp"

#include "pydust/utility.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <toml.hpp>

namespace pydust {

namespace {

std::string repr(const toml::value &value) {
    if (value.is_empty()) {
        return "<absent>";
    }
    // Arrays of tables cannot be rendered without their key.
    try {
        return toml::format(value);
    } catch (const toml::exception &) {
        return std::format("<{}>", toml::to_string(value.type()));
    }
}

} // namespace

Error type_mismatch(std::string_view field, const toml::value &value, std::string_view shape) {
    return Error{ErrorKind::TypeMismatch,
                 std::format("Input of {}={} is not a valid \"{}\".", field, repr(value), shape)};
}

template <>
Result<std::string> validate_input_type<std::string>(std::string_view field, const toml::value &value) {
    if (!value.is_string()) {
        return std::unexpected(type_mismatch(field, value, Shape<std::string>::name));
    }
    return value.as_string();
}

template <>
Result<bool> validate_input_type<bool>(std::string_view field, const toml::value &value) {
    if (!value.is_boolean()) {
        return std::unexpected(type_mismatch(field, value, Shape<bool>::name));
    }
    return value.as_boolean();
}

template <>
Result<std::filesystem::path> validate_input_type<std::filesystem::path>(std::string_view field,
                                                                         const toml::value &value) {
    // Paths are written as TOML strings; an empty string is not a path.
    if (!value.is_string() || value.as_string().empty()) {
        return std::unexpected(type_mismatch(field, value, Shape<std::filesystem::path>::name));
    }
    return std::filesystem::path(value.as_string());
}

template <>
Result<std::optional<std::filesystem::path>>
validate_input_type<std::optional<std::filesystem::path>>(std::string_view field, const toml::value &value) {
    if (value.is_empty()) {
        return std::optional<std::filesystem::path>{};
    }
    if (!value.is_string() || value.as_string().empty()) {
        return std::unexpected(type_mismatch(field, value, Shape<std::optional<std::filesystem::path>>::name));
    }
    return std::optional<std::filesystem::path>{value.as_string()};
}

template <>
Result<toml::array> validate_input_type<toml::array>(std::string_view field, const toml::value &value) {
    if (!value.is_array()) {
        return std::unexpected(type_mismatch(field, value, Shape<toml::array>::name));
    }
    return value.as_array();
}

template <>
Result<toml::table> validate_input_type<toml::table>(std::string_view field, const toml::value &value) {
    if (!value.is_table()) {
        return std::unexpected(type_mismatch(field, value, Shape<toml::table>::name));
    }
    return value.as_table();
}

const toml::value &field_or_absent(const toml::table &table, const std::string &key) {
    static const toml::value absent;
    if (auto it = table.find(key); it != table.end()) {
        return it->second;
    }
    return absent;
}

Result<void> reject_unknown_keys(const toml::table &table, std::initializer_list<std::string_view> known,
                                 std::string_view prefix) {
    std::vector<std::string> unknown;
    for (const auto &[key, _] : table) {
        if (std::ranges::find(known, key) == known.end()) {
            unknown.push_back(prefix.empty() ? key : std::format("{}.{}", prefix, key));
        }
    }
    if (unknown.empty()) {
        return {};
    }
    std::ranges::sort(unknown);

    std::string joined;
    for (const auto &key : unknown) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += key;
    }
    return make_error(ErrorKind::InvalidConfiguration, std::format("Unknown configuration key(s): {}", joined));
}

} // namespace pydust
