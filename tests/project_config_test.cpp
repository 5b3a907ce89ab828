#include "pydust/module_spec.hpp"
#include "pydust/project_config.hpp"
#include "pydust/utility.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <toml.hpp>

using namespace pydust;
namespace fs = std::filesystem;

namespace {

toml::table parse_table(const std::string &text) {
    return toml::parse_str(text).as_table();
}

} // namespace

TEST(ProjectConfig, Defaults) {
    auto config = ProjectConfig::create({});
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->zig_exe().has_value());
    EXPECT_EQ(config->build_zig(), fs::path("build.zig"));
    EXPECT_TRUE(config->zig_tests());
    EXPECT_FALSE(config->self_managed());
    EXPECT_TRUE(config->ext_modules().empty());
}

TEST(ProjectConfig, PydustBuildZigSitsNextToBuildZig) {
    EXPECT_EQ(ProjectConfig::create({})->pydust_build_zig(), fs::path("pydust.build.zig"));

    auto nested = ProjectConfig::create({.build_zig = fs::path("native") / "build.zig"});
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->pydust_build_zig(), fs::path("native") / "pydust.build.zig");
}

TEST(ProjectConfig, SelfManagedRejectsModules) {
    std::vector<ModuleSpec> modules{*ModuleSpec::create("pkg.fastmod", "src/fastmod")};
    auto config = ProjectConfig::create({.self_managed = true, .ext_module = std::move(modules)});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(config.error().message, "ext_modules cannot be defined when using Pydust in self-managed mode.");
}

TEST(ProjectConfig, SelfManagedWithoutModules) {
    auto absent = ProjectConfig::create({.self_managed = true});
    ASSERT_TRUE(absent.has_value());
    EXPECT_TRUE(absent->self_managed());

    auto empty = ProjectConfig::create({.self_managed = true, .ext_module = std::vector<ModuleSpec>{}});
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->ext_modules().empty());
}

TEST(ProjectConfigFromTable, EmptyTableGivesDefaults) {
    auto config = ProjectConfig::from_table(toml::table{});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->build_zig(), fs::path("build.zig"));
    EXPECT_TRUE(config->zig_tests());
}

TEST(ProjectConfigFromTable, ReadsScalarsAndModulesInOrder) {
    auto table = parse_table(R"(
zig_exe = "/opt/zig/zig"
build_zig = "native/build.zig"
zig_tests = false

[[ext_module]]
name = "pkg.zeta"
root = "src/zeta"

[[ext_module]]
name = "pkg.alpha"
root = "src/alpha"
limited_api = false
)");
    auto config = ProjectConfig::from_table(table);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    ASSERT_TRUE(config->zig_exe().has_value());
    EXPECT_EQ(*config->zig_exe(), fs::path("/opt/zig/zig"));
    EXPECT_EQ(config->build_zig(), fs::path("native/build.zig"));
    EXPECT_FALSE(config->zig_tests());
    EXPECT_FALSE(config->self_managed());

    ASSERT_EQ(config->ext_modules().size(), 2u);
    EXPECT_EQ(config->ext_modules()[0].name(), "pkg.zeta");
    EXPECT_TRUE(config->ext_modules()[0].limited_api());
    EXPECT_EQ(config->ext_modules()[1].name(), "pkg.alpha");
    EXPECT_FALSE(config->ext_modules()[1].limited_api());
}

TEST(ProjectConfigFromTable, SelfManagedWithModulesFails) {
    auto table = parse_table(R"(
self_managed = true
ext_module = [{ name = "pkg.fastmod", root = "src/fastmod" }]
)");
    auto config = ProjectConfig::from_table(table);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfiguration);
}

TEST(ProjectConfigFromTable, MistypedScalarIsTypeMismatch) {
    auto config = ProjectConfig::from_table(parse_table("zig_tests = \"yes\"\n"));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, ErrorKind::TypeMismatch);
    EXPECT_NE(config.error().message.find("zig_tests"), std::string::npos) << config.error().message;

    auto zig_exe = ProjectConfig::from_table(parse_table("zig_exe = 1\n"));
    ASSERT_FALSE(zig_exe.has_value());
    EXPECT_EQ(zig_exe.error().kind, ErrorKind::TypeMismatch);
}

TEST(ProjectConfigFromTable, ExtModuleMustBeArrayOfTables) {
    auto not_array = ProjectConfig::from_table(parse_table("ext_module = \"pkg.fastmod\"\n"));
    ASSERT_FALSE(not_array.has_value());
    EXPECT_EQ(not_array.error().kind, ErrorKind::TypeMismatch);

    auto not_tables = ProjectConfig::from_table(parse_table("ext_module = [\"pkg.fastmod\"]\n"));
    ASSERT_FALSE(not_tables.has_value());
    EXPECT_EQ(not_tables.error().kind, ErrorKind::TypeMismatch);
    EXPECT_NE(not_tables.error().message.find("ext_module[0]"), std::string::npos) << not_tables.error().message;
}

TEST(ProjectConfigFromTable, UnknownKeyIsRejected) {
    auto config = ProjectConfig::from_table(parse_table("zig_test = false\n"));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfiguration);
    EXPECT_NE(config.error().message.find("tool.pydust.zig_test"), std::string::npos) << config.error().message;
}
