#pragma once

#include "pydust/module_spec.hpp"
#include "pydust/utility.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <toml.hpp>

namespace pydust {

inline constexpr std::string_view kDefaultBuildZig = "build.zig";
inline constexpr std::string_view kPydustBuildZig = "pydust.build.zig";

/**
 * @brief Typed input for `ProjectConfig::create`.
 *
 * Defaults match an empty `[tool.pydust]` section.
 */
struct ProjectSettings {
    std::optional<std::filesystem::path> zig_exe = std::nullopt;
    std::filesystem::path build_zig = kDefaultBuildZig;
    bool zig_tests = true;
    bool self_managed = false;
    std::optional<std::vector<ModuleSpec>> ext_module = std::nullopt;
};

/**
 * @brief Model of the `[tool.pydust]` section of pyproject.toml.
 *
 * Constructed once per process by the config loader and never modified
 * afterwards.
 */
class ProjectConfig {
public:
    /**
     * @brief Validates cross-field constraints and builds the configuration.
     * @return The configuration, or `InvalidConfiguration` when modules are
     *         declared in self-managed mode.
     */
    static Result<ProjectConfig> create(ProjectSettings settings);

    /**
     * @brief Extracts the configuration from the `[tool.pydust]` table.
     *
     * Every key is validated individually; `ext_module` entries are built
     * with `ModuleSpec::from_table` in declaration order.
     */
    static Result<ProjectConfig> from_table(const toml::table &table);

    /** @brief Explicit Zig executable, if the user overrides the default lookup. */
    const std::optional<std::filesystem::path> &zig_exe() const {
        return zig_exe_;
    }
    const std::filesystem::path &build_zig() const {
        return build_zig_;
    }
    /** @brief Whether Zig tests are collected alongside the Python tests. */
    bool zig_tests() const {
        return zig_tests_;
    }
    /**
     * @brief Whether the user writes build.zig by hand.
     *
     * When false, `ext_modules()` drives generation of the build file.
     */
    bool self_managed() const {
        return self_managed_;
    }
    const std::vector<ModuleSpec> &ext_modules() const {
        return ext_modules_;
    }

    /** @brief pydust.build.zig, next to build.zig. */
    std::filesystem::path pydust_build_zig() const {
        return build_zig_.parent_path() / kPydustBuildZig;
    }

private:
    explicit ProjectConfig(ProjectSettings &&settings)
        : zig_exe_(std::move(settings.zig_exe)), build_zig_(std::move(settings.build_zig)),
          zig_tests_(settings.zig_tests), self_managed_(settings.self_managed),
          ext_modules_(settings.ext_module ? std::move(*settings.ext_module) : std::vector<ModuleSpec>{}) {
    }

    std::optional<std::filesystem::path> zig_exe_;
    std::filesystem::path build_zig_;
    bool zig_tests_;
    bool self_managed_;
    std::vector<ModuleSpec> ext_modules_;
};

} // namespace pydust
