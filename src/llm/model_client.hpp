#pragma once

#include "core/errors/lab_errors.hpp"
#include "protocol/model_contract.hpp"

namespace simlab::llm {

// The language-model boundary. One blocking call per turn; provider
// failures come back as ErrorCategory::Provider errors, never exceptions.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual core::errors::Result<protocol::ModelResponse> complete(
        const protocol::ModelRequest& request) = 0;
};

}  // namespace simlab::llm
