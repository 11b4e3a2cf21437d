#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/lab_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/candidate_contract.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/model_contract.hpp"

namespace simlab::protocol {

// dump() that substitutes U+FFFD for invalid UTF-8 instead of throwing. Use it
// for every document that carries captured output or caller-supplied text.
std::string to_wire_text(const nlohmann::json& doc, int indent = -1);

// {"ok", "stdout", "stderr", "artifacts", "diagnostic"}: the payload handed
// back to the model after a tool call.
nlohmann::json execution_result_to_json(const ExecutionResult& result);

nlohmann::json message_to_json(const Message& message);

// Wire shape of the language-model boundary:
//   request  {"system", "messages": [...], "tools": [{"name", "description", "parameters"}]}
//   response {"content", "tool_call": {"id", "name", "arguments"} | null}
// `arguments` may arrive as a JSON object or as its serialized text.
nlohmann::json model_request_to_json(const ModelRequest& request);
core::errors::Result<ModelResponse> model_response_from_json(const nlohmann::json& doc);

nlohmann::json metadata_to_json(const ExperimentMetadata& metadata);
core::errors::Result<ExperimentMetadata> metadata_from_json(const nlohmann::json& doc);

nlohmann::json report_to_json(const StoredReport& report);
core::errors::Result<StoredReport> report_from_json(const nlohmann::json& doc);

}  // namespace simlab::protocol
