#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "message_contract.hpp"

namespace simlab::protocol {

enum class AgentState {
    AwaitingModel,
    ModelRequestedTool,
    ModelReturnedAnswer,
    ProtocolViolation,
    Cancelled,
    BudgetExhausted
};

inline constexpr const char* kCancelledAnswer = "(cancelled)";
inline constexpr const char* kNoAnswer = "(no answer)";

struct FinalAnswer {
    std::string text;
    std::vector<std::string> artifacts;
};

struct AgentResult {
    AgentState state = AgentState::AwaitingModel;
    std::string answer;
    std::vector<std::string> artifacts;
    std::vector<Message> transcript;
    std::uint32_t steps = 0;
    std::size_t tool_invocations = 0;
    bool persisted = false;
};

struct StoredReport {
    std::string model_id;
    std::string question;
    std::string answer;
    std::vector<std::string> artifacts;
    std::string created_at;  // ISO 8601, UTC
};

inline bool is_terminal(const AgentState state) {
    return state == AgentState::ModelReturnedAnswer ||
           state == AgentState::Cancelled ||
           state == AgentState::BudgetExhausted;
}

inline std::string to_string(const AgentState state) {
    switch (state) {
        case AgentState::AwaitingModel:
            return "awaiting_model";
        case AgentState::ModelRequestedTool:
            return "model_requested_tool";
        case AgentState::ModelReturnedAnswer:
            return "model_returned_answer";
        case AgentState::ProtocolViolation:
            return "protocol_violation";
        case AgentState::Cancelled:
            return "cancelled";
        case AgentState::BudgetExhausted:
            return "budget_exhausted";
        default:
            return "unknown";
    }
}

}  // namespace simlab::protocol
