#pragma once

#include <string>
#include <variant>
#include "protocol/agent_contract.hpp"
#include "protocol/model_contract.hpp"

namespace simlab::agent {

// A python_exec request that passed protocol checks.
struct ToolRequest {
    std::string call_id;
    std::string code;
};

// Reply that is not JSON at all; taken verbatim as the final answer.
struct PlainTextReply {
    std::string text;
};

// JSON that matches no action shape, an unknown tool, a missing code
// payload or an empty message.
struct ProtocolFault {
    std::string reason;
};

using ParsedAction = std::variant<ToolRequest, protocol::FinalAnswer, PlainTextReply, ProtocolFault>;

// Schema-first reading of one model turn. Accepted tool shapes, in order:
// a native tool_call, {"function_call": {"name", "arguments"}},
// {"tool", "args": {"code"}} and {"code"}. A final answer is {"answer"}.
// Markdown fences around a JSON body are ignored. Nothing is patched: text
// that fails to parse as JSON is plain text.
ParsedAction parse_action(const protocol::ModelResponse& response);

}  // namespace simlab::agent
