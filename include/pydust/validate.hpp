#pragma once

#include "pydust/utility.hpp"

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include <toml.hpp>

namespace pydust {

/**
 * @brief Human-readable shape descriptor for each type a manifest field may take.
 */
template <typename T>
struct Shape;

template <>
struct Shape<std::string> {
    static constexpr std::string_view name = "string";
};

template <>
struct Shape<bool> {
    static constexpr std::string_view name = "boolean";
};

template <>
struct Shape<std::filesystem::path> {
    static constexpr std::string_view name = "path";
};

template <>
struct Shape<std::optional<std::filesystem::path>> {
    static constexpr std::string_view name = "path or absent";
};

template <>
struct Shape<toml::array> {
    static constexpr std::string_view name = "array";
};

template <>
struct Shape<toml::table> {
    static constexpr std::string_view name = "table";
};

/**
 * @brief Builds the uniform type-mismatch error for a manifest field.
 *
 * The message names the field, the TOML rendering of the offending value
 * and the expected shape.
 */
Error type_mismatch(std::string_view field, const toml::value &value, std::string_view shape);

/**
 * @brief Checks that a parsed manifest value conforms to the shape of `T`.
 *
 * An empty `toml::value` stands for an absent key and is only accepted by
 * `std::optional` shapes.
 *
 * @param field Field name used in diagnostics (e.g. "ext_module[0].root").
 * @param value The untyped value taken from the manifest.
 * @return The converted value, or a `TypeMismatch` error.
 */
template <typename T>
Result<T> validate_input_type(std::string_view field, const toml::value &value);

template <>
Result<std::string> validate_input_type<std::string>(std::string_view field, const toml::value &value);
template <>
Result<bool> validate_input_type<bool>(std::string_view field, const toml::value &value);
template <>
Result<std::filesystem::path> validate_input_type<std::filesystem::path>(std::string_view field,
                                                                         const toml::value &value);
template <>
Result<std::optional<std::filesystem::path>>
validate_input_type<std::optional<std::filesystem::path>>(std::string_view field, const toml::value &value);
template <>
Result<toml::array> validate_input_type<toml::array>(std::string_view field, const toml::value &value);
template <>
Result<toml::table> validate_input_type<toml::table>(std::string_view field, const toml::value &value);

/**
 * @brief Returns the value stored under `key`, or an empty value when absent.
 */
const toml::value &field_or_absent(const toml::table &table, const std::string &key);

/**
 * @brief Fails with `InvalidConfiguration` if `table` holds keys outside `known`.
 *
 * All unknown keys are reported, sorted, each qualified with `prefix`.
 */
Result<void> reject_unknown_keys(const toml::table &table, std::initializer_list<std::string_view> known,
                                 std::string_view prefix);

} // namespace pydust
