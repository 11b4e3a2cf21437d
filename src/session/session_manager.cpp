#include "session/session_manager.hpp"
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace simlab::session {

using core::errors::ErrorCategory;
using core::errors::LabError;

namespace {

LabError session_not_found(const std::string& session_id) {
    return LabError{ErrorCategory::Input, "Session ID not found: " + session_id,
                    "session_not_found"};
}

}  // namespace

bool SessionManager::is_terminal(const SessionState state) {
    return state == SessionState::Answered || state == SessionState::Cancelled ||
           state == SessionState::BudgetExhausted || state == SessionState::Failed;
}

std::string SessionManager::to_string(const SessionState state) {
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::Running:
            return "running";
        case SessionState::Answered:
            return "answered";
        case SessionState::Cancelled:
            return "cancelled";
        case SessionState::BudgetExhausted:
            return "budget_exhausted";
        case SessionState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

core::errors::Result<std::string> SessionManager::start_session(const std::string& model_id,
                                                                const std::string& question) {
    if (model_id.empty()) {
        return LabError{ErrorCategory::Input, "Session needs a model id.", "invalid_session"};
    }
    if (question.find_first_not_of(" \t\r\n") == std::string::npos) {
        return LabError{ErrorCategory::Input, "Session needs a non-empty question.",
                        "invalid_session"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string session_id = core::config::generate_session_id();
        if (sessions_.find(session_id) != sessions_.end()) {
            continue;
        }

        SessionRecord record;
        record.session_id = session_id;
        record.model_id = model_id;
        record.question = question;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        sessions_.emplace(session_id, std::move(record));
        LOG_INFO("SessionManager: session " + session_id + " transition created -> running");
        sessions_[session_id].state = SessionState::Running;
        return session_id;
    }

    return LabError{ErrorCategory::Internal, "Unable to allocate unique session ID.",
                    "session_id_generation_failed"};
}

core::errors::Result<SessionState> SessionManager::request_cancel(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return session_not_found(session_id);
    }
    if (is_terminal(it->second.state)) {
        return LabError{ErrorCategory::Input,
                        "Session is already terminal: " + to_string(it->second.state),
                        "invalid_state_transition"};
    }
    it->second.cancel_token->store(true);
    LOG_INFO("SessionManager: cancellation requested for " + session_id);
    return it->second.state;
}

core::errors::Result<SessionState> SessionManager::finish(const std::string& session_id,
                                                          const protocol::AgentState outcome) {
    switch (outcome) {
        case protocol::AgentState::ModelReturnedAnswer:
            return transition_to_terminal(session_id, SessionState::Answered, std::nullopt);
        case protocol::AgentState::Cancelled:
            return transition_to_terminal(session_id, SessionState::Cancelled, std::nullopt);
        case protocol::AgentState::BudgetExhausted:
            return transition_to_terminal(session_id, SessionState::BudgetExhausted, std::nullopt);
        default:
            return LabError{ErrorCategory::Internal,
                            "Agent reported a non-terminal state: " + protocol::to_string(outcome),
                            "invalid_state_transition"};
    }
}

core::errors::Result<SessionState> SessionManager::mark_failed(const std::string& session_id,
                                                               const std::string& reason) {
    return transition_to_terminal(session_id, SessionState::Failed, reason);
}

core::errors::Result<SessionState> SessionManager::transition_to_terminal(
    const std::string& session_id, const SessionState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return session_not_found(session_id);
    }

    if (is_terminal(it->second.state)) {
        return LabError{ErrorCategory::Input,
                        "Session is already terminal: " + to_string(it->second.state),
                        "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    LOG_INFO("SessionManager: session " + session_id + " transition " + prev + " -> " +
             to_string(next_state));
    return it->second.state;
}

core::errors::Result<SessionState> SessionManager::get_state(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return session_not_found(session_id);
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> SessionManager::get_cancel_token(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return session_not_found(session_id);
    }
    return it->second.cancel_token;
}

std::size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace simlab::session
