#include "pydust/emit.hpp"

#include "pydust/module_spec.hpp"
#include "pydust/project_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace pydust {

namespace {

nlohmann::json module_to_json(const ModuleSpec &module) {
    using json = nlohmann::json;
    json entry;
    entry["name"] = module.name();
    entry["root"] = module.root().generic_string();
    entry["limited_api"] = module.limited_api();
    entry["libname"] = std::string(module.libname());
    if (auto path = module.install_path(); path) {
        entry["install_path"] = path->generic_string();
    } else {
        entry["install_path"] = nullptr;
    }
    entry["test_bin"] = module.test_bin().generic_string();
    return entry;
}

} // namespace

nlohmann::json to_json(const ProjectConfig &config) {
    using json = nlohmann::json;
    json out;
    if (config.zig_exe()) {
        out["zig_exe"] = config.zig_exe()->generic_string();
    } else {
        out["zig_exe"] = nullptr;
    }
    out["build_zig"] = config.build_zig().generic_string();
    out["pydust_build_zig"] = config.pydust_build_zig().generic_string();
    out["zig_tests"] = config.zig_tests();
    out["self_managed"] = config.self_managed();

    json modules = json::array();
    for (const auto &module : config.ext_modules()) {
        modules.push_back(module_to_json(module));
    }
    out["ext_modules"] = modules;
    return out;
}

} // namespace pydust
