#pragma once

#include "pydust/project_config.hpp"

#include <nlohmann/json.hpp>

namespace pydust {

/**
 * @brief Serializes the configuration, including derived paths, for other tools.
 *
 * Paths use generic separators. A module whose install path is unsupported
 * gets a null `install_path`.
 */
nlohmann::json to_json(const ProjectConfig &config);

} // namespace pydust
