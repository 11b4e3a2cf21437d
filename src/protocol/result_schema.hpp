#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include "core/errors/lab_errors.hpp"

namespace simlab::protocol {

// Contract every entry point's return value must satisfy before anything
// downstream trusts it.
inline constexpr const char* kResultSchemaVersion = "simlab.result.v1";
inline constexpr std::size_t kMaxResultKeys = 256;
inline constexpr std::size_t kMaxListLength = 10000;

// Accepts a JSON object of 1..kMaxResultKeys entries whose values are finite
// numbers, strings, booleans, null, or flat lists of those.
core::errors::Result<nlohmann::json> validate_result_record(const nlohmann::json& record);

}  // namespace simlab::protocol
