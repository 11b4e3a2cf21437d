#pragma once
#include <string>
#include <optional>
#include "tool_contract.hpp"

namespace simlab::protocol {

    enum class Role {
        System,
        User,
        Assistant,
        Tool
    };

    struct Message {
        Role role;
        std::string content;

        // Set on assistant turns that requested a tool. At most one call is
        // honoured per turn.
        std::optional<ToolCall> tool_call;

        // Set on Role::Tool turns: the id of the call this result answers.
        std::optional<std::string> tool_call_id;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::System:    return "system";
            case Role::User:      return "user";
            case Role::Assistant: return "assistant";
            case Role::Tool:      return "tool";
            default: return "unknown";
        }
    }

} // namespace simlab::protocol
