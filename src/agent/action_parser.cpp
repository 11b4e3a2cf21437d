#include "agent/action_parser.hpp"

#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace simlab::agent {

using nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// "```json\n{...}\n```" -> "{...}"; anything else is returned unchanged.
std::string strip_fence(const std::string& text) {
    if (text.rfind("```", 0) != 0 || text.size() < 6 ||
        text.compare(text.size() - 3, 3, "```") != 0) {
        return text;
    }
    const auto body_start = text.find('\n');
    if (body_start == std::string::npos || body_start >= text.size() - 3) {
        return text;
    }
    return trim(text.substr(body_start + 1, text.size() - 3 - body_start - 1));
}

ParsedAction tool_from_arguments(const std::string& name, const json& arguments,
                                 const std::string& call_id) {
    if (name != protocol::kPythonExecTool) {
        return ProtocolFault{"unknown tool '" + name + "'; the only tool is " +
                             std::string(protocol::kPythonExecTool)};
    }
    json args = arguments;
    if (args.is_string()) {
        args = json::parse(args.get<std::string>(), nullptr, false);
    }
    if (!args.is_object() || !args.contains("code") || !args.at("code").is_string() ||
        trim(args.at("code").get<std::string>()).empty()) {
        return ProtocolFault{"tool call is missing a non-empty string 'code' argument"};
    }
    return ToolRequest{call_id, args.at("code").get<std::string>()};
}

}  // namespace

ParsedAction parse_action(const protocol::ModelResponse& response) {
    if (response.tool_call.has_value()) {
        const auto& call = response.tool_call.value();
        return tool_from_arguments(call.name, json(call.arguments), call.id);
    }

    const std::string content = trim(response.content);
    if (content.empty()) {
        return ProtocolFault{"empty message"};
    }

    const json doc = json::parse(strip_fence(content), nullptr, false);
    if (doc.is_discarded()) {
        return PlainTextReply{content};
    }
    if (!doc.is_object()) {
        return ProtocolFault{"expected one JSON object with either a tool call or an answer"};
    }

    if (doc.contains("function_call") && !doc.at("function_call").is_null()) {
        const auto& call = doc.at("function_call");
        if (!call.is_object() || !call.contains("name") || !call.at("name").is_string()) {
            return ProtocolFault{"function_call must carry a string 'name'"};
        }
        return tool_from_arguments(call.at("name").get<std::string>(),
                                   call.contains("arguments") ? call.at("arguments") : json(),
                                   "");
    }
    if (doc.contains("tool") && !doc.at("tool").is_null()) {
        if (!doc.at("tool").is_string()) {
            return ProtocolFault{"'tool' must be a string"};
        }
        return tool_from_arguments(doc.at("tool").get<std::string>(),
                                   doc.contains("args") ? doc.at("args") : json(), "");
    }
    if (doc.contains("code") && !doc.at("code").is_null()) {
        return tool_from_arguments(protocol::kPythonExecTool, json{{"code", doc.at("code")}}, "");
    }

    if (doc.contains("answer") && !doc.at("answer").is_null()) {
        const auto& answer = doc.at("answer");
        std::string text = answer.is_string() ? answer.get<std::string>() : answer.dump();
        if (trim(text).empty()) {
            return ProtocolFault{"empty answer"};
        }
        return protocol::FinalAnswer{text, {}};
    }

    return ProtocolFault{"JSON object has neither a tool call nor an answer"};
}

}  // namespace simlab::agent
