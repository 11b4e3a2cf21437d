#include "protocol/serialization.hpp"

#include <string>
#include <utility>

namespace simlab::protocol {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

namespace {

LabError metadata_error(const std::string& message) {
    return LabError{ErrorCategory::Input, message, "invalid_metadata",
                    "Metadata must be a JSON object with at least a \"parameters\" map."};
}

// Accepts either a single string or an array of strings.
bool read_string_list(const json& value, std::vector<std::string>& out) {
    if (value.is_string()) {
        out.push_back(value.get<std::string>());
        return true;
    }
    if (!value.is_array()) {
        return false;
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

}  // namespace

std::string to_wire_text(const json& doc, const int indent) {
    return doc.dump(indent, ' ', false, json::error_handler_t::replace);
}

json execution_result_to_json(const ExecutionResult& result) {
    json payload;
    payload["ok"] = result.ok;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["artifacts"] = result.artifacts;
    if (result.diagnostic.has_value()) {
        payload["diagnostic"] = {{"kind", to_string(result.diagnostic->kind)},
                                 {"message", result.diagnostic->message}};
    } else {
        payload["diagnostic"] = nullptr;
    }
    if (result.record.has_value()) {
        payload["record"] = result.record.value();
    }
    return payload;
}

json message_to_json(const Message& message) {
    json payload;
    payload["role"] = to_string(message.role);
    payload["content"] = message.content;
    if (message.tool_call.has_value()) {
        payload["tool_call"] = {{"id", message.tool_call->id},
                                {"name", message.tool_call->name},
                                {"arguments", message.tool_call->arguments}};
    }
    if (message.tool_call_id.has_value()) {
        payload["tool_call_id"] = message.tool_call_id.value();
    }
    return payload;
}

json model_request_to_json(const ModelRequest& request) {
    json payload;
    payload["system"] = request.system;
    payload["messages"] = json::array();
    for (const auto& message : request.messages) {
        payload["messages"].push_back(message_to_json(message));
    }
    payload["tools"] = json::array();
    for (const auto& tool : request.tools) {
        json parameters = json::parse(tool.parameters_schema, nullptr, false);
        if (parameters.is_discarded()) {
            parameters = json::object();
        }
        payload["tools"].push_back({{"name", tool.name},
                                    {"description", tool.description},
                                    {"parameters", parameters}});
    }
    return payload;
}

core::errors::Result<ModelResponse> model_response_from_json(const json& doc) {
    if (!doc.is_object()) {
        return LabError{ErrorCategory::Provider, "Model response must be a JSON object.",
                        "invalid_model_response"};
    }

    ModelResponse response;
    if (doc.contains("content") && !doc.at("content").is_null()) {
        if (!doc.at("content").is_string()) {
            return LabError{ErrorCategory::Provider,
                            "Model response field 'content' must be a string.",
                            "invalid_model_response"};
        }
        response.content = doc.at("content").get<std::string>();
    }

    if (doc.contains("tool_call") && !doc.at("tool_call").is_null()) {
        const auto& call = doc.at("tool_call");
        if (!call.is_object() || !call.contains("name") || !call.at("name").is_string()) {
            return LabError{ErrorCategory::Provider,
                            "Model response 'tool_call' must carry a string 'name'.",
                            "invalid_model_response"};
        }
        ToolCall tool_call;
        tool_call.name = call.at("name").get<std::string>();
        if (call.contains("id") && call.at("id").is_string()) {
            tool_call.id = call.at("id").get<std::string>();
        }
        if (call.contains("arguments")) {
            const auto& arguments = call.at("arguments");
            tool_call.arguments =
                arguments.is_string() ? arguments.get<std::string>() : arguments.dump();
        }
        response.tool_call = std::move(tool_call);
    }
    return response;
}

json metadata_to_json(const ExperimentMetadata& metadata) {
    json payload;
    payload["model_name"] = metadata.model_name;
    payload["description"] = metadata.description;
    payload["equations"] = metadata.equations;
    payload["initial_conditions"] = metadata.initial_conditions;
    payload["parameters"] = metadata.parameters;
    payload["vary_variable"] = metadata.vary_variables;
    payload["objective"] = metadata.objective;
    return payload;
}

core::errors::Result<ExperimentMetadata> metadata_from_json(const json& doc) {
    if (!doc.is_object()) {
        return metadata_error("Metadata root must be a JSON object.");
    }

    ExperimentMetadata metadata;
    const std::pair<const char*, std::string*> text_fields[] = {
        {"model_name", &metadata.model_name},
        {"description", &metadata.description},
        {"equations", &metadata.equations},
        {"objective", &metadata.objective}};
    for (const auto& [key, target] : text_fields) {
        if (!doc.contains(key) || doc.at(key).is_null()) {
            continue;
        }
        if (!doc.at(key).is_string()) {
            return metadata_error(std::string("Metadata field '") + key +
                                  "' must be a string.");
        }
        *target = doc.at(key).get<std::string>();
    }

    if (doc.contains("initial_conditions") &&
        !read_string_list(doc.at("initial_conditions"), metadata.initial_conditions)) {
        return metadata_error("Metadata field 'initial_conditions' must be a string list.");
    }

    for (const char* key : {"vary_variable", "vary_variables"}) {
        if (doc.contains(key) && !read_string_list(doc.at(key), metadata.vary_variables)) {
            return metadata_error(std::string("Metadata field '") + key +
                                  "' must be a string or string list.");
        }
    }

    if (!doc.contains("parameters") || !doc.at("parameters").is_object()) {
        return metadata_error("Metadata field 'parameters' must be an object.");
    }
    for (const auto& [name, description] : doc.at("parameters").items()) {
        metadata.parameters[name] =
            description.is_string() ? description.get<std::string>() : description.dump();
    }

    if (metadata.model_name.empty()) {
        metadata.model_name = "unnamed_model";
    }
    return metadata;
}

json report_to_json(const StoredReport& report) {
    json payload;
    payload["model_id"] = report.model_id;
    payload["question"] = report.question;
    payload["answer"] = report.answer;
    payload["artifacts"] = report.artifacts;
    payload["created_at"] = report.created_at;
    return payload;
}

core::errors::Result<StoredReport> report_from_json(const json& doc) {
    if (!doc.is_object()) {
        return LabError{ErrorCategory::Storage, "Report line is not a JSON object.",
                        "corrupt_report"};
    }
    try {
        StoredReport report;
        report.model_id = doc.at("model_id").get<std::string>();
        report.question = doc.at("question").get<std::string>();
        report.answer = doc.at("answer").get<std::string>();
        report.artifacts = doc.at("artifacts").get<std::vector<std::string>>();
        report.created_at = doc.at("created_at").get<std::string>();
        return report;
    } catch (const json::exception& e) {
        return LabError{ErrorCategory::Storage,
                        "Report line is missing fields: " + std::string(e.what()),
                        "corrupt_report"};
    }
}

}  // namespace simlab::protocol
