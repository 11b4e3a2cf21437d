#include "llm/scripted_model_client.hpp"

#include <fstream>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/serialization.hpp"

namespace simlab::llm {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

ScriptedModelClient::ScriptedModelClient(std::vector<Turn> turns) : turns_(std::move(turns)) {}

core::errors::Result<ScriptedModelClient> ScriptedModelClient::from_file(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return LabError{ErrorCategory::Input, "Unable to open model script: " + path.string(),
                        "model_script_not_found"};
    }

    std::vector<Turn> turns;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        const json doc = json::parse(line, nullptr, false);
        if (doc.is_discarded()) {
            return LabError{ErrorCategory::Input,
                            "Model script line " + std::to_string(line_number) +
                                " is not valid JSON.",
                            "invalid_model_script"};
        }
        auto response = protocol::model_response_from_json(doc);
        if (core::errors::is_error(response)) {
            auto err = core::errors::get_error(response);
            err.category = ErrorCategory::Input;
            err.message = "Model script line " + std::to_string(line_number) + ": " + err.message;
            return err;
        }
        turns.emplace_back(core::errors::get_value(response));
    }
    return ScriptedModelClient(std::move(turns));
}

core::errors::Result<protocol::ModelResponse> ScriptedModelClient::complete(
    const protocol::ModelRequest& request) {
    requests_.push_back(request);
    if (calls_ >= turns_.size()) {
        ++calls_;
        return LabError{ErrorCategory::Provider, "Scripted model has no responses left.",
                        "script_exhausted"};
    }
    const Turn& turn = turns_[calls_++];
    if (std::holds_alternative<LabError>(turn)) {
        return std::get<LabError>(turn);
    }
    return std::get<protocol::ModelResponse>(turn);
}

}  // namespace simlab::llm
