#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/lab_errors.hpp"
#include "generation/candidate_store.hpp"
#include "llm/model_client.hpp"
#include "protocol/candidate_contract.hpp"
#include "runtime/isolation_executor.hpp"
#include "validation/candidate_validator.hpp"

namespace simlab::generation {

struct GenerationOptions {
    std::string entry_point = "simulate";
    std::uint32_t smoke_timeout_ms = 30000;
    validation::ParseCheckOptions parse_check;
};

// What happened to one attempt. `outcome` is "verified", "provider_error",
// a validation error code, or an execution diagnostic kind.
struct AttemptRecord {
    std::uint32_t attempt = 0;
    std::string outcome;
    std::string detail;
};

// Asks the model for a candidate until one passes static validation and a
// no-argument smoke run, feeding each failure back as the next user turn.
// Only a verified candidate is handed to the CandidateStore.
class GenerationRepairLoop {
public:
    GenerationRepairLoop(llm::ModelClient& model, const runtime::CodeExecutor& executor,
                         const CandidateStore& store, GenerationOptions options = {});

    core::errors::Result<protocol::CandidateHandle> generate_verified(
        const protocol::ExperimentMetadata& metadata, std::uint32_t max_attempts);

    const std::vector<AttemptRecord>& attempt_log() const { return attempt_log_; }

private:
    llm::ModelClient& model_;
    const runtime::CodeExecutor& executor_;
    const CandidateStore& store_;
    GenerationOptions options_;
    validation::CandidateValidator validator_;
    std::vector<AttemptRecord> attempt_log_;
};

}  // namespace simlab::generation
