#pragma once

#include <cstddef>
#include <filesystem>
#include <variant>
#include <vector>
#include "llm/model_client.hpp"

namespace simlab::llm {

// Replays a fixed sequence of turns. An entry holding a LabError is
// returned as a provider failure for that turn. Once the script runs out
// every further call fails with "script_exhausted".
class ScriptedModelClient : public ModelClient {
public:
    using Turn = std::variant<protocol::ModelResponse, core::errors::LabError>;

    explicit ScriptedModelClient(std::vector<Turn> turns);

    // One response object per line, in the model_response_from_json shape.
    static core::errors::Result<ScriptedModelClient> from_file(const std::filesystem::path& path);

    core::errors::Result<protocol::ModelResponse> complete(
        const protocol::ModelRequest& request) override;

    std::size_t calls() const { return calls_; }
    const std::vector<protocol::ModelRequest>& requests() const { return requests_; }

private:
    std::vector<Turn> turns_;
    std::size_t calls_ = 0;
    std::vector<protocol::ModelRequest> requests_;
};

}  // namespace simlab::llm
