#include "llm/command_model_client.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "protocol/serialization.hpp"
#include "runtime/process_runner.hpp"

namespace simlab::llm {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

namespace {

// Removes the request file however complete() returns.
class RequestFile {
public:
    explicit RequestFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~RequestFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    RequestFile(const RequestFile&) = delete;
    RequestFile& operator=(const RequestFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

LabError provider_error(const std::string& message, const std::string& code) {
    return LabError{ErrorCategory::Provider, message, code,
                    "Check --model-command; it must print one JSON object per call."};
}

}  // namespace

CommandModelClient::CommandModelClient(CommandModelOptions options)
    : options_(std::move(options)) {}

core::errors::Result<protocol::ModelResponse> CommandModelClient::complete(
    const protocol::ModelRequest& request) {
    if (options_.command.empty()) {
        return LabError{ErrorCategory::Input, "No model command configured.",
                        "model_not_configured",
                        "Pass --model-command or set \"model_command\" in the config file."};
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.scratch_root, ec);
    if (ec) {
        return LabError{ErrorCategory::Storage,
                        "Unable to create scratch directory: " + options_.scratch_root.string(),
                        "scratch_create_failed"};
    }

    RequestFile request_file(options_.scratch_root /
                             ("model-request-" + core::config::generate_unique_hex() + ".json"));
    {
        std::ofstream out(request_file.path());
        out << protocol::to_wire_text(protocol::model_request_to_json(request));
        if (!out.good()) {
            return LabError{ErrorCategory::Storage,
                            "Unable to write model request: " + request_file.path().string(),
                            "model_request_write_failed"};
        }
    }

    runtime::ProcessRequest process;
    process.argv = options_.command;
    process.working_directory = options_.scratch_root;
    process.environment.emplace_back("SIMLAB_MODEL_NAME", options_.model_name);
    process.stdin_file = request_file.path();
    process.timeout_ms = options_.timeout_ms;

    LOG_DEBUG("CommandModelClient: invoking " + options_.command.front() + " with " +
              std::to_string(request.messages.size()) + " messages");
    auto capture_result = runtime::run_process(process);
    if (core::errors::is_error(capture_result)) {
        const auto& err = core::errors::get_error(capture_result);
        return provider_error("Model command could not be started: " + err.message,
                              "model_command_failed");
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        return provider_error("Model command timed out after " +
                                  std::to_string(options_.timeout_ms) + " ms",
                              "model_timeout");
    }
    if (capture.exit_code != 0) {
        return provider_error("Model command exited with code " +
                                  std::to_string(capture.exit_code) + ": " + capture.stderr_text,
                              "model_command_failed");
    }

    const json doc = json::parse(capture.stdout_text, nullptr, false);
    if (doc.is_discarded()) {
        return provider_error("Model command did not print valid JSON.",
                              "invalid_model_response");
    }
    return protocol::model_response_from_json(doc);
}

}  // namespace simlab::llm
