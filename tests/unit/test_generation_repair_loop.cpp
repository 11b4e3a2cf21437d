#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "generation/candidate_store.hpp"
#include "generation/generation_repair_loop.hpp"
#include "llm/scripted_model_client.hpp"
#include "test_support.hpp"

namespace {

using simlab::core::errors::ErrorCategory;
using simlab::core::errors::get_error;
using simlab::core::errors::get_value;
using simlab::core::errors::is_error;
using simlab::core::errors::LabError;
using simlab::generation::CandidateStore;
using simlab::generation::GenerationRepairLoop;
using simlab::llm::ScriptedModelClient;
using simlab::protocol::DiagnosticKind;
using simlab::protocol::ExperimentMetadata;
using simlab::protocol::Role;
using simlab::testing::FakeExecutor;
using simlab::testing::TempWorkspace;
using simlab::testing::failed_result;
using simlab::testing::ok_result;
using simlab::testing::text_reply;

const char* kGoodCandidate =
    "import math\n"
    "\n"
    "def simulate(**params):\n"
    "    L = params.get('L', 1.0)\n"
    "    return {\"period\": 2.0}\n";

const char* kBrokenQuote =
    "import math\n"
    "def simulate(**params):\n"
    "    label = 'pendulum\n"
    "    return {\"period\": 2.0}\n";

ExperimentMetadata pendulum_metadata() {
    ExperimentMetadata metadata;
    metadata.model_name = "Simple Pendulum";
    metadata.parameters = {{"L", "length"}};
    return metadata;
}

simlab::protocol::ExecutionResult verified_run() {
    auto result = ok_result();
    result.record = nlohmann::json{{"period", 2.0}};
    return result;
}

class GenerationRepairLoopTest : public ::testing::Test {
protected:
    GenerationRepairLoopTest() : store(workspace.root() / "models") {}

    TempWorkspace workspace{"generation"};
    CandidateStore store;
    FakeExecutor executor;
};

TEST_F(GenerationRepairLoopTest, PersistsFirstVerifiedCandidate) {
    ScriptedModelClient model({text_reply(kGoodCandidate)});
    executor.queue(verified_run());

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 3);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& handle = get_value(result);
    EXPECT_EQ(handle.model_id, "simple-pendulum");
    EXPECT_EQ(handle.attempt, 1u);
    EXPECT_TRUE(std::filesystem::exists(handle.script_path));
    EXPECT_EQ(model.calls(), 1u);

    ASSERT_EQ(executor.entry_calls().size(), 1u);
    EXPECT_EQ(executor.entry_calls()[0].entry_point, "simulate");
    EXPECT_EQ(executor.entry_calls()[0].params, nlohmann::json::object());
    EXPECT_EQ(executor.entry_calls()[0].timeout_ms, 30000u);

    ASSERT_EQ(loop.attempt_log().size(), 1u);
    EXPECT_EQ(loop.attempt_log()[0].outcome, "verified");

    const auto& first_request = model.requests()[0];
    EXPECT_NE(first_request.system.find("simulate"), std::string::npos);
    EXPECT_NE(first_request.system.find("length"), std::string::npos);
    ASSERT_EQ(first_request.messages.size(), 1u);
    EXPECT_EQ(first_request.messages[0].role, Role::User);
}

TEST_F(GenerationRepairLoopTest, StoredSourceIsByteIdenticalToVerifiedCandidate) {
    ScriptedModelClient model({text_reply(kGoodCandidate)});
    executor.queue(verified_run());

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 1);
    ASSERT_FALSE(is_error(result));

    auto loaded = store.load(get_value(result).model_id);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).source, kGoodCandidate);
    EXPECT_EQ(executor.entry_calls()[0].source, kGoodCandidate);
}

TEST_F(GenerationRepairLoopTest, SyntaxErrorIsFedBackWithContext) {
    ScriptedModelClient model({text_reply(kBrokenQuote), text_reply(kGoodCandidate)});
    executor.queue(verified_run());

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 3);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(get_value(result).attempt, 2u);

    // The broken candidate never reached the executor.
    EXPECT_EQ(executor.calls(), 1u);

    ASSERT_EQ(model.requests().size(), 2u);
    const auto& retry = model.requests()[1];
    ASSERT_EQ(retry.messages.size(), 3u);
    EXPECT_EQ(retry.messages[1].role, Role::Assistant);
    EXPECT_EQ(retry.messages[1].content, kBrokenQuote);
    EXPECT_EQ(retry.messages[2].role, Role::User);
    const std::string& feedback = retry.messages[2].content;
    EXPECT_NE(feedback.find("Attempt 1: SyntaxError"), std::string::npos);
    EXPECT_NE(feedback.find("at line 3"), std::string::npos);
    EXPECT_NE(feedback.find("→    3:     label = 'pendulum"), std::string::npos);

    ASSERT_EQ(loop.attempt_log().size(), 2u);
    EXPECT_EQ(loop.attempt_log()[0].outcome, "syntax_error");
}

TEST_F(GenerationRepairLoopTest, SmokeRunFailureIsFedBack) {
    ScriptedModelClient model({text_reply(kGoodCandidate), text_reply(kGoodCandidate)});
    executor.queue(failed_result(DiagnosticKind::RuntimeError,
                                 "Traceback (most recent call last):\nKeyError: 'L'"));
    executor.queue(verified_run());

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 2);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).attempt, 2u);

    const auto& feedback = model.requests()[1].messages.back().content;
    EXPECT_NE(feedback.find("runtime_error `KeyError: 'L'`"), std::string::npos);
    EXPECT_EQ(loop.attempt_log()[0].outcome, "runtime_error");
}

TEST_F(GenerationRepairLoopTest, ExhaustedAttemptsPersistNothing) {
    ScriptedModelClient model(
        {text_reply(kBrokenQuote), text_reply(kBrokenQuote), text_reply("def run():\n    return 1\n")});

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 3);
    ASSERT_TRUE(is_error(result));

    const auto& err = get_error(result);
    EXPECT_EQ(err.category, ErrorCategory::Execution);
    EXPECT_EQ(err.code, "exhausted_attempts");
    EXPECT_EQ(err.message, "No verified candidate after 3 attempts");
    EXPECT_NE(err.hint.find("missing_entry_point"), std::string::npos);

    EXPECT_EQ(model.calls(), 3u);
    EXPECT_EQ(executor.calls(), 0u);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "models" / "simple-pendulum"));
    auto listed = store.list();
    ASSERT_FALSE(is_error(listed));
    EXPECT_TRUE(get_value(listed).empty());
}

TEST_F(GenerationRepairLoopTest, ProviderErrorConsumesAnAttempt) {
    ScriptedModelClient model(
        {LabError{ErrorCategory::Provider, "model command timed out", "model_timeout"},
         text_reply(kGoodCandidate)});
    executor.queue(verified_run());

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 2);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).attempt, 2u);
    EXPECT_EQ(loop.attempt_log()[0].outcome, "provider_error");

    // Nothing was added to the conversation for the failed call.
    EXPECT_EQ(model.requests()[1].messages.size(), 1u);
}

TEST_F(GenerationRepairLoopTest, ProviderErrorsAloneExhaustTheBudget) {
    ScriptedModelClient model(std::vector<ScriptedModelClient::Turn>{});

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 2);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "exhausted_attempts");
    EXPECT_EQ(model.calls(), 2u);
}

TEST_F(GenerationRepairLoopTest, RejectsZeroAttempts) {
    ScriptedModelClient model({text_reply(kGoodCandidate)});

    GenerationRepairLoop loop(model, executor, store);
    auto result = loop.generate_verified(pendulum_metadata(), 0);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_max_attempts");
    EXPECT_EQ(model.calls(), 0u);
}

TEST_F(GenerationRepairLoopTest, CustomEntryPointIsValidatedAndInvoked) {
    ScriptedModelClient model({text_reply("def run_model(**kw):\n    return {'x': 1}\n")});
    executor.queue(verified_run());

    simlab::generation::GenerationOptions options;
    options.entry_point = "run_model";
    options.smoke_timeout_ms = 5000;
    GenerationRepairLoop loop(model, executor, store, options);
    auto result = loop.generate_verified(pendulum_metadata(), 1);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(executor.entry_calls()[0].entry_point, "run_model");
    EXPECT_EQ(executor.entry_calls()[0].timeout_ms, 5000u);
}

}  // namespace
