#include "pydust/loader.hpp"

#include "pydust/project_config.hpp"
#include "pydust/utility.hpp"
#include "pydust/validate.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <toml.hpp>

namespace pydust {

namespace {

std::mutex cache_mtx;
std::shared_ptr<const ProjectConfig> cached_config;

Result<toml::value> parse_manifest(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return make_error(ErrorKind::ManifestError,
                              std::format("Cannot access manifest {}: {}", path.string(), ec.message()));
        }
        return make_error(ErrorKind::ManifestError, std::format("Manifest {} does not exist.", path.string()));
    }
    try {
        return toml::parse(path);
    } catch (const std::exception &err) {
        return make_error(ErrorKind::ManifestError, err.what());
    }
}

// Looks up a nested table, treating an absent key as an empty table.
Result<toml::table> subtable(const toml::table &parent, const std::string &key, std::string_view field) {
    const toml::value &value = field_or_absent(parent, key);
    if (value.is_empty()) {
        return toml::table{};
    }
    return validate_input_type<toml::table>(field, value);
}

} // namespace

std::string_view tool_version() {
    return PYDUST_PROJ_VER;
}

Result<void> check_version(const toml::value &manifest, std::string_view version) {
    if (version == kDevelopmentVersion) {
        return {};
    }

    auto root = validate_input_type<toml::table>("pyproject.toml", manifest);
    if (!root) {
        return std::unexpected(root.error());
    }
    auto build_system = subtable(*root, "build-system", "build-system");
    if (!build_system) {
        return std::unexpected(build_system.error());
    }
    const toml::value &requires_value = field_or_absent(*build_system, "requires");
    if (requires_value.is_empty()) {
        return {};
    }
    auto requirements = validate_input_type<toml::array>("build-system.requires", requires_value);
    if (!requirements) {
        return std::unexpected(requirements.error());
    }

    // Build requirements are not locked by the packaging frontend, so they
    // can drift away from the installed tool.
    const std::string expected = std::format("{}=={}", kToolName, version);
    for (size_t i = 0; i < requirements->size(); ++i) {
        auto req = validate_input_type<std::string>(std::format("build-system.requires[{}]", i), (*requirements)[i]);
        if (!req) {
            return std::unexpected(req.error());
        }
        if (!req->starts_with(kToolName)) {
            continue;
        }
        if (*req != expected) {
            return make_error(ErrorKind::InvalidConfiguration,
                              std::format("Detected misconfigured {}. You must include \"{}\" in "
                                          "build-system.requires in pyproject.toml",
                                          kToolName, expected));
        }
    }
    return {};
}

Result<ProjectConfig> load_config(const std::filesystem::path &manifest_path, std::string_view version) {
    auto manifest = parse_manifest(manifest_path);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    if (auto res = check_version(*manifest, version); !res) {
        return std::unexpected(res.error());
    }

    auto root = validate_input_type<toml::table>("pyproject.toml", *manifest);
    if (!root) {
        return std::unexpected(root.error());
    }
    auto tool = subtable(*root, "tool", "tool");
    if (!tool) {
        return std::unexpected(tool.error());
    }
    auto section = subtable(*tool, "pydust", "tool.pydust");
    if (!section) {
        return std::unexpected(section.error());
    }
    return ProjectConfig::from_table(*section);
}

Result<std::shared_ptr<const ProjectConfig>> load() {
    std::lock_guard lock(cache_mtx);
    if (cached_config) {
        return cached_config;
    }

    auto config = load_config(kManifestPath, tool_version());
    if (!config) {
        return std::unexpected(config.error());
    }
    cached_config = std::make_shared<const ProjectConfig>(std::move(*config));
    return cached_config;
}

namespace testing {

void reset_config_cache() {
    std::lock_guard lock(cache_mtx);
    cached_config.reset();
}

} // namespace testing

} // namespace pydust
