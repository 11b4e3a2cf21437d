#include "agent/tool_calling_agent.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>
#include "agent/action_parser.hpp"
#include "core/logging/logger.hpp"
#include "generation/prompts.hpp"
#include "protocol/serialization.hpp"

namespace simlab::agent {

using protocol::AgentResult;
using protocol::AgentState;
using protocol::Message;
using protocol::Role;

namespace {

std::string corrective_instruction(const std::string& reason) {
    return "Protocol violation: " + reason +
           ". Reply with exactly one JSON object, either {\"tool\": \"" +
           protocol::kPythonExecTool +
           "\", \"args\": {\"code\": \"<python>\"}} or {\"answer\": \"<text>\"}.";
}

}  // namespace

ToolCallingAgent::ToolCallingAgent(llm::ModelClient& model,
                                   const runtime::CodeExecutor& executor,
                                   const session::ReportStore& reports, AgentOptions options)
    : model_(model), executor_(executor), reports_(reports), options_(std::move(options)) {}

protocol::ToolDeclaration ToolCallingAgent::python_exec_declaration() {
    return protocol::ToolDeclaration{
        protocol::kPythonExecTool,
        "Run Python against the experiment DataFrame `df`; returns stdout, stderr and saved plots.",
        generation::python_exec_parameters_schema()};
}

protocol::ModelRequest ToolCallingAgent::build_request(
    const AgentContext& context, const std::string& question,
    const std::vector<Message>& history) const {
    protocol::ModelRequest request;
    request.system = context.system_prompt;
    request.messages.push_back(Message{Role::User, question, std::nullopt, std::nullopt});

    // Below two messages the newest tool result would lose its call.
    const std::size_t window = std::max<std::size_t>(options_.history_window, 2);
    std::size_t first = history.size() > window ? history.size() - window : 0;
    // A tool result without the call that produced it confuses providers.
    while (first < history.size() && history[first].role == Role::Tool) {
        ++first;
    }
    for (std::size_t i = first; i < history.size(); ++i) {
        request.messages.push_back(history[i]);
    }
    request.tools.push_back(python_exec_declaration());
    return request;
}

protocol::ExecutionResult ToolCallingAgent::run_tool(
    const AgentContext& context, const protocol::ToolInvocation& invocation) const {
    LOG_INFO("ToolCallingAgent: executing " + std::string(protocol::kPythonExecTool) +
             " for turn " + std::to_string(invocation.turn_index));
    runtime::SnippetRequest request;
    request.code = invocation.code;
    request.dataset = context.dataset;
    request.timeout_ms = options_.tool_timeout_ms;
    return executor_.execute_snippet(request);
}

AgentResult ToolCallingAgent::ask(const AgentContext& context, const std::string& question,
                                  const CancellationPredicate& cancelled) {
    AgentResult result;
    std::vector<Message> history;

    while (true) {
        if (cancelled && cancelled()) {
            LOG_INFO("ToolCallingAgent: cancelled after " + std::to_string(result.steps) +
                     " steps");
            result.state = AgentState::Cancelled;
            result.answer = protocol::kCancelledAnswer;
            break;
        }
        if (result.steps >= options_.step_budget) {
            LOG_WARN("ToolCallingAgent: step budget of " + std::to_string(options_.step_budget) +
                     " exhausted");
            result.state = AgentState::BudgetExhausted;
            result.answer = protocol::kNoAnswer;
            break;
        }

        result.state = AgentState::AwaitingModel;
        const auto request = build_request(context, question, history);
        ++result.steps;
        LOG_DEBUG("ToolCallingAgent: step " + std::to_string(result.steps) + "/" +
                  std::to_string(options_.step_budget));

        auto reply = model_.complete(request);
        if (core::errors::is_error(reply)) {
            LOG_WARN("ToolCallingAgent: provider error on step " + std::to_string(result.steps) +
                     ": " + core::errors::get_error(reply).message);
            continue;
        }
        const auto& response = core::errors::get_value(reply);

        bool done = false;
        std::visit(
            [&](const auto& action) {
                using T = std::decay_t<decltype(action)>;
                if constexpr (std::is_same_v<T, ToolRequest>) {
                    result.state = AgentState::ModelRequestedTool;
                    protocol::ToolCall call{
                        action.call_id.empty() ? "call-" + std::to_string(result.steps)
                                               : action.call_id,
                        protocol::kPythonExecTool,
                        protocol::to_wire_text(nlohmann::json{{"code", action.code}})};
                    history.push_back(Message{Role::Assistant, response.content, call, std::nullopt});

                    const auto executed =
                        run_tool(context, protocol::ToolInvocation{action.code, result.steps});
                    ++result.tool_invocations;
                    result.artifacts.insert(result.artifacts.end(), executed.artifacts.begin(),
                                            executed.artifacts.end());
                    auto payload =
                        protocol::to_wire_text(protocol::execution_result_to_json(executed));
                    history.push_back(
                        Message{Role::Tool, std::move(payload), std::nullopt, call.id});
                } else if constexpr (std::is_same_v<T, ProtocolFault>) {
                    LOG_WARN("ToolCallingAgent: protocol violation on step " +
                             std::to_string(result.steps) + ": " + action.reason);
                    result.state = AgentState::ProtocolViolation;
                    history.push_back(
                        Message{Role::Assistant, response.content, std::nullopt, std::nullopt});
                    history.push_back(Message{Role::User, corrective_instruction(action.reason),
                                              std::nullopt, std::nullopt});
                } else {
                    // protocol::FinalAnswer or PlainTextReply
                    result.state = AgentState::ModelReturnedAnswer;
                    result.answer = action.text;
                    history.push_back(
                        Message{Role::Assistant, response.content, std::nullopt, std::nullopt});
                    done = true;
                }
            },
            parse_action(response));

        if (done) {
            break;
        }
    }

    if (result.state == AgentState::ModelReturnedAnswer) {
        const protocol::FinalAnswer final_answer{result.answer, result.artifacts};
        auto stored = reports_.record(context.model_id, question, final_answer.text,
                                      final_answer.artifacts);
        if (core::errors::is_error(stored)) {
            LOG_ERROR("ToolCallingAgent: answer not persisted: " +
                      core::errors::get_error(stored).message);
        } else {
            result.persisted = true;
        }
    }

    result.transcript.reserve(history.size() + 2);
    result.transcript.push_back(Message{Role::System, context.system_prompt, std::nullopt, std::nullopt});
    result.transcript.push_back(Message{Role::User, question, std::nullopt, std::nullopt});
    result.transcript.insert(result.transcript.end(), history.begin(), history.end());

    LOG_INFO("ToolCallingAgent: finished in state " + protocol::to_string(result.state) +
             " after " + std::to_string(result.steps) + " steps, " +
             std::to_string(result.tool_invocations) + " tool calls");
    return result;
}

}  // namespace simlab::agent
