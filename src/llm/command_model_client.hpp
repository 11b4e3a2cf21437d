#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "llm/model_client.hpp"

namespace simlab::llm {

struct CommandModelOptions {
    std::vector<std::string> command;
    std::string model_name = "default";
    std::filesystem::path scratch_root;
    std::uint32_t timeout_ms = 120000;
};

// Talks to a provider through an external command: the request JSON is
// fed on stdin, a single response JSON object is expected on stdout.
// SIMLAB_MODEL_NAME is exported so one adapter script can serve several
// models.
class CommandModelClient : public ModelClient {
public:
    explicit CommandModelClient(CommandModelOptions options);

    core::errors::Result<protocol::ModelResponse> complete(
        const protocol::ModelRequest& request) override;

private:
    CommandModelOptions options_;
};

}  // namespace simlab::llm
