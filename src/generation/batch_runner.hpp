#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/lab_errors.hpp"
#include "data/dataset.hpp"
#include "protocol/candidate_contract.hpp"
#include "runtime/isolation_executor.hpp"

namespace simlab::generation {

// Validates a parameter grid document: a non-empty JSON array of objects.
core::errors::Result<std::vector<nlohmann::json>> parse_param_sets(const nlohmann::json& doc);

// Runs a verified candidate once per parameter set, each in its own
// isolated execution, and tabulates parameters and outputs. Columns appear
// in first-seen order; failed runs fill an "error" column instead. An output
// key that matches a parameter name or the error column is stored as
// "out_<key>"; a parameter named "error" moves the error column to
// "run_error".
class BatchRunner {
public:
    BatchRunner(const runtime::CodeExecutor& executor, std::string entry_point = "simulate",
                std::uint32_t timeout_ms = 30000);

    core::errors::Result<data::Dataset> run(const protocol::CandidateHandle& handle,
                                            const std::vector<nlohmann::json>& param_sets) const;

    core::errors::Result<data::Dataset> run_source(
        const std::string& source, const std::vector<nlohmann::json>& param_sets) const;

private:
    const runtime::CodeExecutor& executor_;
    std::string entry_point_;
    std::uint32_t timeout_ms_;
};

}  // namespace simlab::generation
