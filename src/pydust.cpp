#include "pydust/emit.hpp"
#include "pydust/loader.hpp"
#include "pydust/project_config.hpp"

#include <filesystem>
#include <iostream>
#include <print>
#include <string>
#include <string_view>
#include <system_error>

void print_help() {
    std::println("Usage: pydust-config [options]");
    std::println("Options:");
    std::println("  -h, --help       Show this help message");
    std::println("  -v, --version    Show version");
    std::println("  -d <dir>         Change working directory before doing anything");
    std::println("  --json           Print the resolved configuration as JSON");
}

void print_version() {
    std::println("pydust-config {}", pydust::tool_version());
}

void print_summary(const pydust::ProjectConfig &config) {
    std::println("zig_exe:          {}", config.zig_exe() ? config.zig_exe()->string() : std::string("<default>"));
    std::println("build_zig:        {}", config.build_zig().string());
    std::println("pydust_build_zig: {}", config.pydust_build_zig().string());
    std::println("zig_tests:        {}", config.zig_tests());
    std::println("self_managed:     {}", config.self_managed());
    std::println("ext_modules:      {}", config.ext_modules().size());

    for (const auto &module : config.ext_modules()) {
        std::println("  {} (root: {}, limited_api: {})", module.name(), module.root().string(), module.limited_api());
        if (auto path = module.install_path(); path) {
            std::println("    install: {}", path->string());
        } else {
            std::println("    install: {}", path.error().message);
        }
        std::println("    test:    {}", module.test_bin().string());
    }
}

int main(const int argc, const char *const *argv) {
    bool json = false;
    std::filesystem::path work_dir = ".";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            if (i + 1 < argc) {
                work_dir = argv[i + 1];
                i++;
            } else {
                std::println(std::cerr, "Missing argument for -d");
                return 1;
            }
        } else if (arg == "--json") {
            json = true;
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    auto config = pydust::load();
    if (!config) {
        std::println(std::cerr, "Failed to load configuration: {}", config.error());
        return 1;
    }

    if (json) {
        std::println("{}", pydust::to_json(**config).dump(4));
    } else {
        print_summary(**config);
    }
    return 0;
}
