#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "data/dataset.hpp"
#include "llm/model_client.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/isolation_executor.hpp"
#include "session/report_store.hpp"

namespace simlab::agent {

struct AgentOptions {
    std::uint32_t step_budget = 20;
    std::uint32_t history_window = 12;
    std::uint32_t tool_timeout_ms = 30000;
};

struct AgentContext {
    std::string model_id;
    const data::Dataset* dataset = nullptr;
    std::string system_prompt;
};

// Polled once per turn, before anything else happens in that turn.
using CancellationPredicate = std::function<bool()>;

// Bounded question/answer conversation in which the model may run
// python_exec against the bound dataset. Every model turn costs one step,
// failed ones included; the loop ends with an answer, on cancellation, or
// when the step budget is spent.
class ToolCallingAgent {
public:
    ToolCallingAgent(llm::ModelClient& model, const runtime::CodeExecutor& executor,
                     const session::ReportStore& reports, AgentOptions options = {});

    protocol::AgentResult ask(const AgentContext& context, const std::string& question,
                              const CancellationPredicate& cancelled = {});

    static protocol::ToolDeclaration python_exec_declaration();

private:
    protocol::ModelRequest build_request(const AgentContext& context,
                                         const std::string& question,
                                         const std::vector<protocol::Message>& history) const;

    protocol::ExecutionResult run_tool(const AgentContext& context,
                                       const protocol::ToolInvocation& invocation) const;

    llm::ModelClient& model_;
    const runtime::CodeExecutor& executor_;
    const session::ReportStore& reports_;
    AgentOptions options_;
};

}  // namespace simlab::agent
