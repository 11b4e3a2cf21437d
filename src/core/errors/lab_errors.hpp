#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace simlab::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,       // E.g., a missing CLI flag or unreadable metadata file
        Validation,  // E.g., a candidate program that does not parse
        Execution,   // E.g., the generation loop ran out of attempts
        Provider,    // E.g., the language-model command failed or timed out
        Protocol,    // E.g., a model turn that is not a valid action
        Storage,     // E.g., the report file could not be appended
        Internal     // E.g., fork() failed
    };

    // 1-based position inside a source text
    struct SourceLocation {
        std::size_t line = 0;
        std::size_t column = 0;
    };

    // The standardized error payload
    struct LabError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<SourceLocation> location = std::nullopt;
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a LabError.
    template <typename T>
    using Result = std::variant<T, LabError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LabError>(result);
    }

    template <typename T>
    const LabError& get_error(const Result<T>& result) {
        return std::get<LabError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Execution:  return "execution";
            case ErrorCategory::Provider:   return "provider";
            case ErrorCategory::Protocol:   return "protocol";
            case ErrorCategory::Storage:    return "storage";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace simlab::core::errors
