#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "core/errors/lab_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace simlab::generation {

inline constexpr std::size_t kSyntaxContextRadius = 2;
inline constexpr std::size_t kRuntimeTailLines = 25;

// Numbered excerpt of `source` around 1-based `line`, the failing line
// marked with an arrow:
//   "    1: import math"
//   "→   3: x = 'oops"
std::string syntax_context(const std::string& source, std::size_t line,
                           std::size_t radius = kSyntaxContextRadius);

// User turn sent back to the model after static validation failed.
std::string validation_feedback(std::uint32_t attempt, const std::string& source,
                                const core::errors::LabError& error);

// User turn sent back after the smoke run failed.
std::string runtime_feedback(std::uint32_t attempt, const protocol::ExecutionResult& result);

}  // namespace simlab::generation
