#pragma once

#include "pydust/project_config.hpp"
#include "pydust/utility.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

#include <toml.hpp>

namespace pydust {

inline constexpr std::string_view kManifestPath = "pyproject.toml";
inline constexpr std::string_view kToolName = "ziggy-pydust";
// Version reported by local development installs; never pinned in manifests.
inline constexpr std::string_view kDevelopmentVersion = "0.1.0";

/** @brief Version of this tool, baked in at build time. */
std::string_view tool_version();

/**
 * @brief Ensures build-system.requires pins the running version of the tool.
 *
 * Skipped entirely when `version` is the development version.
 *
 * @param manifest The parsed pyproject.toml.
 * @param version The running tool version.
 * @return Success, or `InvalidConfiguration` naming the expected requirement.
 */
Result<void> check_version(const toml::value &manifest, std::string_view version);

/**
 * @brief Reads, version-checks and validates a manifest without caching.
 * @param manifest_path Path to pyproject.toml.
 * @param version The running tool version.
 */
Result<ProjectConfig> load_config(const std::filesystem::path &manifest_path, std::string_view version);

/**
 * @brief Returns the project configuration for the current working directory.
 *
 * The first successful call reads pyproject.toml; every later call returns
 * the same instance without touching the file. Failures are not cached.
 */
Result<std::shared_ptr<const ProjectConfig>> load();

namespace testing {

/** @brief Drops the cached configuration so the next `load()` reads the manifest again. */
void reset_config_cache();

} // namespace testing

} // namespace pydust
