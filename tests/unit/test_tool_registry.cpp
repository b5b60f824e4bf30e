#include <memory>
#include <gtest/gtest.h>
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"
#include "test_support.hpp"

namespace {

using planloop::core::errors::ErrorCategory;
using planloop::core::errors::get_error;
using planloop::core::errors::is_error;
using planloop::testing::FakeTool;
using planloop::tools::ToolRegistry;

TEST(ToolRegistryTest, LookupReturnsRegisteredSpec) {
    ToolRegistry registry;
    auto status = registry.register_tool(
        std::make_shared<FakeTool>("write_file", std::set<std::string>{"path", "content"}));
    ASSERT_FALSE(is_error(status));

    auto spec = registry.lookup("write_file");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->name, "write_file");
    EXPECT_EQ(spec->required_inputs, (std::set<std::string>{"content", "path"}));
    EXPECT_NE(registry.find("write_file"), nullptr);
}

TEST(ToolRegistryTest, LookupOfUnknownNameIsAbsent) {
    ToolRegistry registry;
    EXPECT_FALSE(registry.lookup("deploy").has_value());
    EXPECT_EQ(registry.find("deploy"), nullptr);
}

TEST(ToolRegistryTest, DuplicateRegistrationFailsAndKeepsFirst) {
    ToolRegistry registry;
    auto first = std::make_shared<FakeTool>("echo", std::set<std::string>{"text"});
    ASSERT_FALSE(is_error(registry.register_tool(first)));

    auto second = registry.register_tool(
        std::make_shared<FakeTool>("echo", std::set<std::string>{}));
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).category, ErrorCategory::Registry);
    EXPECT_EQ(get_error(second).code, "duplicate_tool");

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("echo"), first);
    EXPECT_EQ(registry.lookup("echo")->required_inputs, std::set<std::string>{"text"});
}

TEST(ToolRegistryTest, RejectsNullAndNamelessTools) {
    ToolRegistry registry;
    auto null_status = registry.register_tool(nullptr);
    ASSERT_TRUE(is_error(null_status));
    EXPECT_EQ(get_error(null_status).code, "invalid_tool");

    auto nameless = registry.register_tool(
        std::make_shared<FakeTool>("", std::set<std::string>{}));
    ASSERT_TRUE(is_error(nameless));
    EXPECT_EQ(get_error(nameless).code, "invalid_tool");
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistryTest, AllPreservesRegistrationOrder) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(
        std::make_shared<FakeTool>("zeta", std::set<std::string>{}))));
    ASSERT_FALSE(is_error(registry.register_tool(
        std::make_shared<FakeTool>("alpha", std::set<std::string>{}))));

    const auto specs = registry.all();
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_EQ(specs[0].name, "zeta");
    EXPECT_EQ(specs[1].name, "alpha");
}

TEST(ToolRegistryTest, BuiltinToolsRegisterOnce) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(planloop::tools::register_builtin_tools(registry)));
    EXPECT_EQ(registry.size(), 6u);
    for (const char* name :
         {"git_status", "run_command", "read_file", "write_file", "apply_patch", "echo"}) {
        EXPECT_TRUE(registry.lookup(name).has_value()) << name;
    }

    auto again = planloop::tools::register_builtin_tools(registry);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "duplicate_tool");
}

}  // namespace
