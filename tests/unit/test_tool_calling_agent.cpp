#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "agent/tool_calling_agent.hpp"
#include "llm/scripted_model_client.hpp"
#include "runtime/interpreter_profile.hpp"
#include "runtime/isolation_executor.hpp"
#include "session/report_store.hpp"
#include "test_support.hpp"

namespace {

using simlab::agent::AgentContext;
using simlab::agent::AgentOptions;
using simlab::agent::ToolCallingAgent;
using simlab::core::errors::ErrorCategory;
using simlab::core::errors::get_value;
using simlab::core::errors::is_error;
using simlab::core::errors::LabError;
using simlab::data::Dataset;
using simlab::llm::ScriptedModelClient;
using simlab::protocol::AgentState;
using simlab::protocol::ModelResponse;
using simlab::protocol::Role;
using simlab::protocol::ToolCall;
using simlab::session::ReportStore;
using simlab::testing::FakeExecutor;
using simlab::testing::ok_result;
using simlab::testing::TempWorkspace;
using simlab::testing::text_reply;
using simlab::testing::write_file;

ModelResponse tool_turn(const std::string& id, const std::string& code) {
    ModelResponse response;
    response.tool_call = ToolCall{id, "python_exec", nlohmann::json{{"code", code}}.dump()};
    return response;
}

std::vector<ScriptedModelClient::Turn> repeated_tool_turns(std::size_t count) {
    std::vector<ScriptedModelClient::Turn> turns;
    for (std::size_t i = 0; i < count; ++i) {
        turns.emplace_back(text_reply("{\"tool\": \"python_exec\", \"args\": {\"code\": \"print(1)\"}}"));
    }
    return turns;
}

class ToolCallingAgentTest : public ::testing::Test {
protected:
    ToolCallingAgentTest() : reports(workspace.root() / "reports.jsonl") {
        dataset.columns = {"L", "period"};
        dataset.rows = {{"1.0", "2.0"}, {"2.0", "2.83"}};
        context.model_id = "simple-pendulum";
        context.dataset = &dataset;
        context.system_prompt = "You analyse pendulum data.";
    }

    std::size_t stored_reports() const {
        auto listed = reports.list();
        return is_error(listed) ? 0 : get_value(listed).size();
    }

    TempWorkspace workspace{"agent"};
    ReportStore reports;
    FakeExecutor executor;
    Dataset dataset;
    AgentContext context;
};

TEST_F(ToolCallingAgentTest, ToolCallThenAnswerIsPersisted) {
    ScriptedModelClient model(
        {tool_turn("c1", "print(df['period'].max())"), text_reply("{\"answer\": \"42.0\"}")});
    executor.queue(ok_result("2.83\n"));

    ToolCallingAgent agent(model, executor, reports);
    const auto result = agent.ask(context, "What is the longest period?");

    EXPECT_EQ(result.state, AgentState::ModelReturnedAnswer);
    EXPECT_EQ(result.answer, "42.0");
    EXPECT_EQ(result.steps, 2u);
    EXPECT_EQ(result.tool_invocations, 1u);
    EXPECT_TRUE(result.artifacts.empty());
    EXPECT_TRUE(result.persisted);

    ASSERT_EQ(executor.snippets().size(), 1u);
    EXPECT_EQ(executor.snippets()[0].code, "print(df['period'].max())");
    EXPECT_EQ(executor.snippets()[0].dataset, &dataset);
    EXPECT_EQ(executor.snippets()[0].timeout_ms, 30000u);

    // The second request carries the call and its result.
    ASSERT_EQ(model.requests().size(), 2u);
    const auto& second = model.requests()[1];
    EXPECT_EQ(second.system, "You analyse pendulum data.");
    ASSERT_EQ(second.messages.size(), 3u);
    EXPECT_EQ(second.messages[0].role, Role::User);
    EXPECT_EQ(second.messages[0].content, "What is the longest period?");
    ASSERT_TRUE(second.messages[1].tool_call.has_value());
    EXPECT_EQ(second.messages[1].tool_call->id, "c1");
    EXPECT_EQ(second.messages[2].role, Role::Tool);
    EXPECT_EQ(second.messages[2].tool_call_id.value(), "c1");
    EXPECT_EQ(nlohmann::json::parse(second.messages[2].content).at("stdout"), "2.83\n");
    ASSERT_EQ(second.tools.size(), 1u);
    EXPECT_EQ(second.tools[0].name, "python_exec");

    auto listed = reports.list("simple-pendulum");
    ASSERT_FALSE(is_error(listed));
    ASSERT_EQ(get_value(listed).size(), 1u);
    EXPECT_EQ(get_value(listed)[0].question, "What is the longest period?");
    EXPECT_EQ(get_value(listed)[0].answer, "42.0");

    ASSERT_EQ(result.transcript.size(), 5u);
    EXPECT_EQ(result.transcript[0].role, Role::System);
    EXPECT_EQ(result.transcript.back().role, Role::Assistant);
}

TEST_F(ToolCallingAgentTest, StopsExactlyAtStepBudget) {
    ScriptedModelClient model(repeated_tool_turns(10));
    AgentOptions options;
    options.step_budget = 3;

    ToolCallingAgent agent(model, executor, reports, options);
    const auto result = agent.ask(context, "Keep going");

    EXPECT_EQ(result.state, AgentState::BudgetExhausted);
    EXPECT_EQ(result.answer, "(no answer)");
    EXPECT_EQ(result.steps, 3u);
    EXPECT_EQ(model.calls(), 3u);
    EXPECT_EQ(result.tool_invocations, 3u);
    EXPECT_FALSE(result.persisted);
    EXPECT_EQ(stored_reports(), 0u);
}

TEST_F(ToolCallingAgentTest, ProtocolViolationsAloneExhaustTheBudget) {
    std::vector<ScriptedModelClient::Turn> turns;
    for (int i = 0; i < 10; ++i) {
        turns.emplace_back(text_reply("{\"note\": \"thinking\"}"));
    }
    ScriptedModelClient model(turns);
    AgentOptions options;
    options.step_budget = 4;

    ToolCallingAgent agent(model, executor, reports, options);
    const auto result = agent.ask(context, "Anything?");

    EXPECT_EQ(result.state, AgentState::BudgetExhausted);
    EXPECT_EQ(result.answer, "(no answer)");
    EXPECT_EQ(result.steps, 4u);
    EXPECT_EQ(model.calls(), 4u);
    EXPECT_EQ(executor.calls(), 0u);
    EXPECT_TRUE(result.artifacts.empty());
    EXPECT_EQ(stored_reports(), 0u);
}

TEST_F(ToolCallingAgentTest, CancellationBeforeFirstTurnDoesNothing) {
    ScriptedModelClient model({text_reply("{\"answer\": \"never\"}")});

    ToolCallingAgent agent(model, executor, reports);
    const auto result = agent.ask(context, "Anything?", [] { return true; });

    EXPECT_EQ(result.state, AgentState::Cancelled);
    EXPECT_EQ(result.answer, "(cancelled)");
    EXPECT_EQ(result.steps, 0u);
    EXPECT_EQ(model.calls(), 0u);
    EXPECT_EQ(executor.calls(), 0u);
    EXPECT_FALSE(result.persisted);
    EXPECT_EQ(stored_reports(), 0u);
}

TEST_F(ToolCallingAgentTest, CancellationIsPolledBetweenTurns) {
    ScriptedModelClient model(repeated_tool_turns(5));
    int polls = 0;

    ToolCallingAgent agent(model, executor, reports);
    const auto result = agent.ask(context, "Anything?", [&polls] { return ++polls > 1; });

    EXPECT_EQ(result.state, AgentState::Cancelled);
    EXPECT_EQ(result.steps, 1u);
    EXPECT_EQ(result.tool_invocations, 1u);
    EXPECT_EQ(model.calls(), 1u);
}

TEST_F(ToolCallingAgentTest, PlainTextIsTakenAsAnswer) {
    ScriptedModelClient model({text_reply("The period scales with sqrt(L).")});

    ToolCallingAgent agent(model, executor, reports);
    const auto result = agent.ask(context, "How does the period scale?");

    EXPECT_EQ(result.state, AgentState::ModelReturnedAnswer);
    EXPECT_EQ(result.answer, "The period scales with sqrt(L).");
    EXPECT_EQ(result.steps, 1u);
    EXPECT_TRUE(result.persisted);
}

TEST_F(ToolCallingAgentTest, ProtocolFaultGetsCorrectiveTurn) {
    ScriptedModelClient model({text_reply("{\"tool\": \"bash\", \"args\": {\"code\": \"ls\"}}"),
                               text_reply("{\"answer\": \"done\"}")});

    ToolCallingAgent agent(model, executor, reports);
    const auto result = agent.ask(context, "List files");

    EXPECT_EQ(result.state, AgentState::ModelReturnedAnswer);
    EXPECT_EQ(result.steps, 2u);
    EXPECT_EQ(executor.calls(), 0u);

    const auto& retry = model.requests()[1].messages;
    ASSERT_EQ(retry.size(), 3u);
    EXPECT_EQ(retry[2].role, Role::User);
    EXPECT_NE(retry[2].content.find("Protocol violation: unknown tool 'bash'"), std::string::npos);
}

TEST_F(ToolCallingAgentTest, ProviderErrorConsumesAStep) {
    ScriptedModelClient model(
        {LabError{ErrorCategory::Provider, "rate limited", "model_command_failed"},
         text_reply("{\"answer\": \"ok\"}")});

    ToolCallingAgent agent(model, executor, reports);
    const auto result = agent.ask(context, "Anything?");

    EXPECT_EQ(result.state, AgentState::ModelReturnedAnswer);
    EXPECT_EQ(result.steps, 2u);
    EXPECT_EQ(model.requests()[1].messages.size(), 1u);
}

TEST_F(ToolCallingAgentTest, HistoryWindowKeepsRecentTurnsWithoutOrphanToolResults) {
    auto turns = repeated_tool_turns(3);
    turns.emplace_back(text_reply("{\"answer\": \"done\"}"));
    ScriptedModelClient model(turns);
    AgentOptions options;
    options.history_window = 3;

    ToolCallingAgent agent(model, executor, reports, options);
    const auto result = agent.ask(context, "Loop");
    ASSERT_EQ(result.state, AgentState::ModelReturnedAnswer);

    // Six history messages; the last three start with a tool result, which is dropped.
    const auto& last = model.requests()[3].messages;
    ASSERT_EQ(last.size(), 3u);
    EXPECT_EQ(last[0].role, Role::User);
    EXPECT_EQ(last[0].content, "Loop");
    EXPECT_EQ(last[1].role, Role::Assistant);
    EXPECT_EQ(last[2].role, Role::Tool);
    EXPECT_EQ(last[2].tool_call_id.value(), "call-3");
}

TEST_F(ToolCallingAgentTest, TinyHistoryWindowStillShowsLatestExchange) {
    auto turns = repeated_tool_turns(2);
    turns.emplace_back(text_reply("{\"answer\": \"done\"}"));
    ScriptedModelClient model(turns);
    AgentOptions options;
    options.history_window = 1;

    ToolCallingAgent agent(model, executor, reports, options);
    const auto result = agent.ask(context, "Loop");
    ASSERT_EQ(result.state, AgentState::ModelReturnedAnswer);

    const auto& last = model.requests()[2].messages;
    ASSERT_EQ(last.size(), 3u);
    EXPECT_EQ(last[1].role, Role::Assistant);
    ASSERT_TRUE(last[1].tool_call.has_value());
    EXPECT_EQ(last[1].tool_call->id, "call-2");
    EXPECT_EQ(last[2].role, Role::Tool);
    EXPECT_EQ(last[2].tool_call_id.value(), "call-2");
}

TEST_F(ToolCallingAgentTest, ArtifactsAccumulateIntoReport) {
    ScriptedModelClient model({tool_turn("a", "plt.show()"), tool_turn("b", "plt.show()"),
                               text_reply("{\"answer\": \"two plots\"}")});
    auto first = ok_result();
    first.artifacts = {"aaaa.png"};
    auto second = ok_result();
    second.artifacts = {"bbbb.png"};
    executor.queue(first);
    executor.queue(second);

    ToolCallingAgent agent(model, executor, reports);
    const auto result = agent.ask(context, "Plot it twice");

    EXPECT_EQ(result.artifacts, (std::vector<std::string>{"aaaa.png", "bbbb.png"}));
    auto listed = reports.list();
    ASSERT_FALSE(is_error(listed));
    ASSERT_EQ(get_value(listed).size(), 1u);
    EXPECT_EQ(get_value(listed)[0].artifacts, result.artifacts);
}

TEST_F(ToolCallingAgentTest, StorageFailureLeavesAnswerUnpersisted) {
    write_file(workspace.root() / "blocker", "not a directory");
    ReportStore broken(workspace.root() / "blocker" / "reports.jsonl");
    ScriptedModelClient model({text_reply("{\"answer\": \"fine\"}")});

    ToolCallingAgent agent(model, executor, broken);
    const auto result = agent.ask(context, "Anything?");

    EXPECT_EQ(result.state, AgentState::ModelReturnedAnswer);
    EXPECT_EQ(result.answer, "fine");
    EXPECT_FALSE(result.persisted);
}

TEST_F(ToolCallingAgentTest, NonUtf8ToolOutputReachesTheModelReplaced) {
    simlab::runtime::ExecutorOptions options;
    options.scratch_root = workspace.root() / "scratch";
    options.artifact_store = workspace.root() / "artifacts";
    simlab::runtime::IsolationExecutor shell(simlab::runtime::shell_profile(), options);
    ScriptedModelClient model({tool_turn("c1", "printf '\\377'"), text_reply("{\"answer\": \"x\"}")});

    ToolCallingAgent agent(model, shell, reports);
    simlab::protocol::AgentResult result;
    EXPECT_NO_THROW(result = agent.ask(context, "Print a raw byte"));

    EXPECT_EQ(result.state, AgentState::ModelReturnedAnswer);
    EXPECT_TRUE(result.persisted);
    ASSERT_EQ(model.requests().size(), 2u);
    const auto& tool_message = model.requests()[1].messages.back();
    ASSERT_EQ(tool_message.role, Role::Tool);
    const auto payload = nlohmann::json::parse(tool_message.content);
    EXPECT_TRUE(payload.at("ok").get<bool>());
    EXPECT_EQ(payload.at("stdout"), "\xEF\xBF\xBD");
}

TEST_F(ToolCallingAgentTest, NonUtf8QuestionIsStillPersisted) {
    ScriptedModelClient model({text_reply("{\"answer\": \"fine\"}")});

    ToolCallingAgent agent(model, executor, reports);
    simlab::protocol::AgentResult result;
    EXPECT_NO_THROW(result = agent.ask(context, "bad \xFF byte"));

    EXPECT_TRUE(result.persisted);
    auto listed = reports.list();
    ASSERT_FALSE(is_error(listed));
    ASSERT_EQ(get_value(listed).size(), 1u);
    EXPECT_EQ(get_value(listed)[0].question, "bad \xEF\xBF\xBD byte");
}

}  // namespace
