#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "simulation/simulator.hpp"
#include "tools/tool_registry.hpp"
#include "validation/plan_validator.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using planloop::core::errors::get_error;
using planloop::core::errors::get_value;
using planloop::core::errors::is_error;
using planloop::protocol::PlanProvenance;
using planloop::simulation::Simulator;
using planloop::testing::CallLog;
using planloop::testing::FakeTool;
using planloop::tools::ToolRegistry;
using planloop::validation::PlanValidator;

class SimulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<CallLog>();
        status_ = std::make_shared<FakeTool>("git_status", std::set<std::string>{}, log_);
        status_->set_read_only(true);
        writer_ = std::make_shared<FakeTool>("write_file",
                                             std::set<std::string>{"path", "content"}, log_);
        ASSERT_FALSE(is_error(registry_.register_tool(status_)));
        ASSERT_FALSE(is_error(registry_.register_tool(writer_)));
    }

    std::shared_ptr<CallLog> log_;
    std::shared_ptr<FakeTool> status_;
    std::shared_ptr<FakeTool> writer_;
    ToolRegistry registry_;
};

TEST_F(SimulatorTest, PredictsEachToolStepInOrder) {
    PlanValidator validator(registry_);
    auto report = validator.validate(json::parse(R"({"plan": [
        {"type": "tool", "tool": "git_status", "inputs": {}},
        {"type": "info", "text": "note"},
        {"type": "tool", "tool": "write_file", "inputs": {"path": "a.txt", "content": "hi"}}
    ]})"), PlanProvenance{});
    ASSERT_TRUE(report.executable());

    Simulator simulator(registry_);
    auto simulated = simulator.simulate(report);
    ASSERT_FALSE(is_error(simulated));
    const auto& results = get_value(simulated);
    ASSERT_EQ(results.size(), 2u);

    EXPECT_EQ(results[0].step_index, 0u);
    EXPECT_TRUE(results[0].read_only);
    EXPECT_FALSE(results[0].risk_flag);
    EXPECT_EQ(results[0].predicted_effect, "read-only call to git_status");

    EXPECT_EQ(results[1].step_index, 2u);
    EXPECT_FALSE(results[1].read_only);
    EXPECT_EQ(results[1].predicted_effect,
              "state-changing call to write_file with content=\"hi\", path=\"a.txt\"");

    EXPECT_EQ(log_->calls, (std::vector<std::string>{"predict:git_status", "predict:write_file"}));
    EXPECT_EQ(status_->execute_count(), 0u);
    EXPECT_EQ(writer_->execute_count(), 0u);
}

TEST_F(SimulatorTest, RefusesPlansWithBlockingDiagnostics) {
    PlanValidator validator(registry_);
    auto report = validator.validate(json::parse(R"({"plan": [
        {"type": "tool", "tool": "git_status", "inputs": {}},
        {"type": "tool", "tool": "write_file", "inputs": {"path": "<file>", "content": "x"}}
    ]})"), PlanProvenance{});
    ASSERT_FALSE(report.executable());

    Simulator simulator(registry_);
    auto simulated = simulator.simulate(report);
    ASSERT_TRUE(is_error(simulated));
    EXPECT_EQ(get_error(simulated).code, "plan_not_executable");
    EXPECT_TRUE(log_->calls.empty());
}

TEST_F(SimulatorTest, FlagsToolsThatCannotBePredicted) {
    planloop::validation::ValidationReport report;
    planloop::protocol::ToolStep missing;
    missing.tool_name = "gone";
    planloop::protocol::ToolStep incomplete;
    incomplete.tool_name = "write_file";
    incomplete.inputs = {{"path", "a.txt"}};
    report.plan.steps.push_back(planloop::protocol::PlanStep{0, missing});
    report.plan.steps.push_back(planloop::protocol::PlanStep{1, incomplete});

    Simulator simulator(registry_);
    auto simulated = simulator.simulate(report);
    ASSERT_FALSE(is_error(simulated));
    const auto& results = get_value(simulated);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].risk_flag);
    EXPECT_EQ(results[0].risk_reason, "tool is not registered");
    EXPECT_TRUE(results[1].risk_flag);
    EXPECT_NE(results[1].risk_reason.find("content"), std::string::npos);
}

}  // namespace
