#include <string>
#include <gtest/gtest.h>
#include "session/session_manager.hpp"

namespace {

using simlab::core::errors::ErrorCategory;
using simlab::core::errors::get_error;
using simlab::core::errors::get_value;
using simlab::core::errors::is_error;
using simlab::protocol::AgentState;
using simlab::session::SessionManager;
using simlab::session::SessionState;

TEST(SessionManagerTest, StartSessionMovesToRunning) {
    SessionManager manager;
    auto start = manager.start_session("pendulum", "Longest period?");
    ASSERT_FALSE(is_error(start));

    const std::string session_id = get_value(start);
    EXPECT_EQ(session_id.rfind("ask-", 0), 0u);
    auto state = manager.get_state(session_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), SessionState::Running);
    EXPECT_EQ(manager.session_count(), 1u);
}

TEST(SessionManagerTest, SessionIdsAreUnique) {
    SessionManager manager;
    auto first = manager.start_session("m", "q");
    auto second = manager.start_session("m", "q");
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_NE(get_value(first), get_value(second));
}

TEST(SessionManagerTest, CancelRequestOnlyRaisesToken) {
    SessionManager manager;
    auto start = manager.start_session("pendulum", "q");
    ASSERT_FALSE(is_error(start));
    const std::string session_id = get_value(start);

    auto token_result = manager.get_cancel_token(session_id);
    ASSERT_FALSE(is_error(token_result));
    auto token = get_value(token_result);
    ASSERT_TRUE(token != nullptr);
    EXPECT_FALSE(token->load());

    auto cancel = manager.request_cancel(session_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), SessionState::Running);
    EXPECT_TRUE(token->load());

    auto finished = manager.finish(session_id, AgentState::Cancelled);
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished), SessionState::Cancelled);
}

TEST(SessionManagerTest, FinishMapsAgentOutcomes) {
    SessionManager manager;
    const std::string answered = get_value(manager.start_session("m", "q"));
    const std::string exhausted = get_value(manager.start_session("m", "q"));

    EXPECT_EQ(get_value(manager.finish(answered, AgentState::ModelReturnedAnswer)),
              SessionState::Answered);
    EXPECT_EQ(get_value(manager.finish(exhausted, AgentState::BudgetExhausted)),
              SessionState::BudgetExhausted);
    EXPECT_TRUE(SessionManager::is_terminal(get_value(manager.get_state(answered))));
}

TEST(SessionManagerTest, FinishRejectsNonTerminalAgentState) {
    SessionManager manager;
    const std::string session_id = get_value(manager.start_session("m", "q"));

    auto result = manager.finish(session_id, AgentState::ModelRequestedTool);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "invalid_state_transition");
    EXPECT_EQ(get_value(manager.get_state(session_id)), SessionState::Running);
}

TEST(SessionManagerTest, TerminalSessionsRejectFurtherTransitions) {
    SessionManager manager;
    const std::string session_id = get_value(manager.start_session("m", "q"));
    ASSERT_FALSE(is_error(manager.mark_failed(session_id, "storage unavailable")));

    auto cancel = manager.request_cancel(session_id);
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");

    auto finish = manager.finish(session_id, AgentState::ModelReturnedAnswer);
    ASSERT_TRUE(is_error(finish));
    EXPECT_EQ(get_error(finish).code, "invalid_state_transition");
    EXPECT_EQ(get_value(manager.get_state(session_id)), SessionState::Failed);
}

TEST(SessionManagerTest, UnknownSessionIsReported) {
    SessionManager manager;
    EXPECT_EQ(get_error(manager.request_cancel("ask-missing")).code, "session_not_found");
    EXPECT_EQ(get_error(manager.get_state("ask-missing")).code, "session_not_found");
    EXPECT_EQ(get_error(manager.get_cancel_token("ask-missing")).code, "session_not_found");
}

TEST(SessionManagerTest, StartSessionRejectsMissingInputs) {
    SessionManager manager;
    auto no_model = manager.start_session("", "q");
    ASSERT_TRUE(is_error(no_model));
    EXPECT_EQ(get_error(no_model).code, "invalid_session");

    auto blank_question = manager.start_session("m", "  \n");
    ASSERT_TRUE(is_error(blank_question));
    EXPECT_EQ(get_error(blank_question).code, "invalid_session");
    EXPECT_EQ(manager.session_count(), 0u);
}

}  // namespace
