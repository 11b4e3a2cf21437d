#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace simlab::protocol {

enum class DiagnosticKind {
    RuntimeError,
    Timeout,
    SchemaViolation,
    LaunchFailure,
    Internal
};

struct Diagnostic {
    DiagnosticKind kind;
    std::string message;
};

// Outcome of one isolated execution. Built once by the executor and never
// mutated afterwards.
struct ExecutionResult {
    bool ok = false;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> artifacts;
    std::optional<Diagnostic> diagnostic;
    double duration_ms = 0.0;

    // Entry-point runs only: the schema-checked return record.
    std::optional<nlohmann::json> record;
};

inline std::string to_string(const DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::RuntimeError:
            return "runtime_error";
        case DiagnosticKind::Timeout:
            return "timeout";
        case DiagnosticKind::SchemaViolation:
            return "schema_violation";
        case DiagnosticKind::LaunchFailure:
            return "launch_failure";
        case DiagnosticKind::Internal:
            return "internal";
        default:
            return "unknown";
    }
}

}  // namespace simlab::protocol
