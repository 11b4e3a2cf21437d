#pragma once
#include <optional>
#include <string>
#include <vector>
#include "message_contract.hpp"
#include "tool_contract.hpp"

namespace simlab::protocol {

    // One blocking call across the language-model boundary
    struct ModelRequest {
        std::string system;
        std::vector<Message> messages;
        std::vector<ToolDeclaration> tools;
    };

    struct ModelResponse {
        std::string content;
        std::optional<ToolCall> tool_call;
    };

} // namespace simlab::protocol
