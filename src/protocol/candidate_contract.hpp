#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace simlab::protocol {

enum class ValidationStatus {
    Unvalidated,
    StructurallyValid,
    ExecutionVerified
};

struct CandidateProgram {
    std::string source;
    ValidationStatus status = ValidationStatus::Unvalidated;
    std::uint32_t attempt = 0;
};

// Identifies a persisted, execution-verified candidate.
struct CandidateHandle {
    std::string model_id;
    std::filesystem::path script_path;
    std::uint32_t attempt = 0;
};

// Structured description of the experiment, produced upstream from the
// user's natural-language request.
struct ExperimentMetadata {
    std::string model_name;
    std::string description;
    std::string equations;
    std::vector<std::string> initial_conditions;
    std::map<std::string, std::string> parameters;
    std::vector<std::string> vary_variables;
    std::string objective;
};

inline std::string to_string(const ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Unvalidated:
            return "unvalidated";
        case ValidationStatus::StructurallyValid:
            return "structurally_valid";
        case ValidationStatus::ExecutionVerified:
            return "execution_verified";
        default:
            return "unknown";
    }
}

}  // namespace simlab::protocol
