#include "protocol/result_schema.hpp"

#include <cmath>
#include <string>

namespace simlab::protocol {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

namespace {

bool is_scalar(const json& value) {
    if (value.is_number_float()) {
        return std::isfinite(value.get<double>());
    }
    return value.is_number() || value.is_string() || value.is_boolean() ||
           value.is_null();
}

LabError violation(const std::string& message) {
    return LabError{ErrorCategory::Validation,
                    message + " (" + kResultSchemaVersion + ")",
                    "schema_violation"};
}

}  // namespace

core::errors::Result<json> validate_result_record(const json& record) {
    if (!record.is_object()) {
        return violation(std::string("Entry point must return a record, got ") +
                         record.type_name());
    }
    if (record.empty()) {
        return violation("Entry point returned an empty record");
    }
    if (record.size() > kMaxResultKeys) {
        return violation("Entry point returned " + std::to_string(record.size()) +
                         " keys, limit is " + std::to_string(kMaxResultKeys));
    }

    for (const auto& [key, value] : record.items()) {
        if (key.empty()) {
            return violation("Record keys must be non-empty");
        }
        if (is_scalar(value)) {
            continue;
        }
        if (!value.is_array()) {
            return violation("Field '" + key + "' must be a scalar or a flat list, got " +
                             value.type_name());
        }
        if (value.size() > kMaxListLength) {
            return violation("Field '" + key + "' holds " + std::to_string(value.size()) +
                             " items, limit is " + std::to_string(kMaxListLength));
        }
        for (const auto& item : value) {
            if (!is_scalar(item)) {
                return violation("Field '" + key + "' must contain only finite scalars");
            }
        }
    }
    return record;
}

}  // namespace simlab::protocol
