#include "pydust/project_config.hpp"

#include "pydust/module_spec.hpp"
#include "pydust/utility.hpp"
#include "pydust/validate.hpp"

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <toml.hpp>

namespace pydust {

namespace {

// Assigns `out` only when the key is present, leaving the default otherwise.
template <typename T>
Result<void> extract(const toml::table &table, const std::string &key, T &out) {
    const toml::value &value = field_or_absent(table, key);
    if (value.is_empty()) {
        return {};
    }
    auto res = validate_input_type<T>(key, value);
    if (!res) {
        return std::unexpected(res.error());
    }
    out = std::move(*res);
    return {};
}

Result<std::optional<std::vector<ModuleSpec>>> extract_modules(const toml::table &table) {
    const toml::value &value = field_or_absent(table, "ext_module");
    if (value.is_empty()) {
        return std::optional<std::vector<ModuleSpec>>{};
    }

    auto entries = validate_input_type<toml::array>("ext_module", value);
    if (!entries) {
        return std::unexpected(entries.error());
    }

    std::vector<ModuleSpec> modules;
    modules.reserve(entries->size());
    for (size_t i = 0; i < entries->size(); ++i) {
        const std::string prefix = std::format("ext_module[{}]", i);
        auto entry = validate_input_type<toml::table>(prefix, (*entries)[i]);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        auto module = ModuleSpec::from_table(*entry, prefix);
        if (!module) {
            return std::unexpected(module.error());
        }
        modules.push_back(std::move(*module));
    }
    return modules;
}

} // namespace

Result<ProjectConfig> ProjectConfig::create(ProjectSettings settings) {
    // Modules listed in pyproject.toml are only used to generate build.zig.
    if (settings.self_managed && settings.ext_module && !settings.ext_module->empty()) {
        return make_error(ErrorKind::InvalidConfiguration,
                          "ext_modules cannot be defined when using Pydust in self-managed mode.");
    }
    return ProjectConfig(std::move(settings));
}

Result<ProjectConfig> ProjectConfig::from_table(const toml::table &table) {
    if (auto res =
            reject_unknown_keys(table, {"zig_exe", "build_zig", "zig_tests", "self_managed", "ext_module"},
                                "tool.pydust");
        !res) {
        return std::unexpected(res.error());
    }

    ProjectSettings settings;
    if (auto res = validate_input_type<std::optional<std::filesystem::path>>("zig_exe",
                                                                             field_or_absent(table, "zig_exe"));
        !res) {
        return std::unexpected(res.error());
    } else {
        settings.zig_exe = std::move(*res);
    }
    if (auto res = extract(table, "build_zig", settings.build_zig); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = extract(table, "zig_tests", settings.zig_tests); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = extract(table, "self_managed", settings.self_managed); !res) {
        return std::unexpected(res.error());
    }

    auto modules = extract_modules(table);
    if (!modules) {
        return std::unexpected(modules.error());
    }
    settings.ext_module = std::move(*modules);

    return create(std::move(settings));
}

} // namespace pydust
