#pragma once

#include <cstddef>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/lab_errors.hpp"
#include "protocol/agent_contract.hpp"

namespace simlab::session {

enum class SessionState {
    Created,
    Running,
    Answered,
    Cancelled,
    BudgetExhausted,
    Failed
};

struct SessionRecord {
    std::string session_id;
    std::string model_id;
    std::string question;
    SessionState state = SessionState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Book-keeping for agent sessions. Cancellation is cooperative: a request
// only raises the session's token, and the session becomes Cancelled once
// the agent reports back.
class SessionManager {
public:
    core::errors::Result<std::string> start_session(const std::string& model_id,
                                                    const std::string& question);
    core::errors::Result<SessionState> request_cancel(const std::string& session_id);
    core::errors::Result<SessionState> get_state(const std::string& session_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& session_id) const;

    // Maps the agent's terminal state onto the session.
    core::errors::Result<SessionState> finish(const std::string& session_id,
                                              protocol::AgentState outcome);
    core::errors::Result<SessionState> mark_failed(const std::string& session_id,
                                                   const std::string& reason);

    std::size_t session_count() const;

    static bool is_terminal(SessionState state);
    static std::string to_string(SessionState state);

private:
    core::errors::Result<SessionState> transition_to_terminal(
        const std::string& session_id, SessionState next_state,
        const std::optional<std::string>& failure_reason);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

}  // namespace simlab::session
