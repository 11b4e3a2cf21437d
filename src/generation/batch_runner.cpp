#include "generation/batch_runner.hpp"

#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"

namespace simlab::generation {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

namespace {

constexpr const char* kErrorColumn = "error";

std::string cell_text(const json& value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string first_line(const std::string& text) {
    const auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

std::string last_line(const std::string& text) {
    const auto last = text.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) {
        return "";
    }
    const auto start = text.rfind('\n', last);
    return text.substr(start == std::string::npos ? 0 : start + 1,
                       last - (start == std::string::npos ? 0 : start + 1) + 1);
}

}  // namespace

core::errors::Result<std::vector<json>> parse_param_sets(const json& doc) {
    if (!doc.is_array() || doc.empty()) {
        return LabError{ErrorCategory::Input, "Parameter grid must be a non-empty JSON array.",
                        "invalid_parameter_grid",
                        "Example: [{\"L\": 1.0}, {\"L\": 2.0}]"};
    }
    std::vector<json> sets;
    for (std::size_t i = 0; i < doc.size(); ++i) {
        if (!doc[i].is_object()) {
            return LabError{ErrorCategory::Input,
                            "Parameter set #" + std::to_string(i) + " is not a JSON object.",
                            "invalid_parameter_grid"};
        }
        sets.push_back(doc[i]);
    }
    return sets;
}

BatchRunner::BatchRunner(const runtime::CodeExecutor& executor, std::string entry_point,
                         const std::uint32_t timeout_ms)
    : executor_(executor), entry_point_(std::move(entry_point)), timeout_ms_(timeout_ms) {}

core::errors::Result<data::Dataset> BatchRunner::run(const protocol::CandidateHandle& handle,
                                                     const std::vector<json>& param_sets) const {
    std::ifstream in(handle.script_path, std::ios::binary);
    if (!in.is_open()) {
        return LabError{ErrorCategory::Input,
                        "Unable to read candidate script: " + handle.script_path.string(),
                        "model_not_found"};
    }
    const std::string source((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
    return run_source(source, param_sets);
}

core::errors::Result<data::Dataset> BatchRunner::run_source(
    const std::string& source, const std::vector<json>& param_sets) const {
    if (param_sets.empty()) {
        return LabError{ErrorCategory::Input, "Parameter grid is empty.",
                        "invalid_parameter_grid"};
    }

    data::Dataset dataset;
    std::map<std::string, std::size_t> column_of;
    auto ensure_column = [&](const std::string& name) {
        auto it = column_of.find(name);
        if (it != column_of.end()) {
            return it->second;
        }
        dataset.columns.push_back(name);
        column_of.emplace(name, dataset.columns.size() - 1);
        return dataset.columns.size() - 1;
    };

    std::set<std::string> parameter_names;
    for (std::size_t i = 0; i < param_sets.size(); ++i) {
        if (!param_sets[i].is_object()) {
            return LabError{ErrorCategory::Input,
                            "Parameter set #" + std::to_string(i) + " is not a JSON object.",
                            "invalid_parameter_grid"};
        }
        for (const auto& item : param_sets[i].items()) {
            parameter_names.insert(item.key());
        }
    }

    // Inputs own their column names; outputs and the error column yield.
    std::string error_column = kErrorColumn;
    while (parameter_names.count(error_column) != 0) {
        error_column = "run_" + error_column;
    }
    std::map<std::string, std::string> output_names;
    auto output_column = [&](const std::string& key) {
        auto it = output_names.find(key);
        if (it != output_names.end()) {
            return it->second;
        }
        std::string name = key;
        while (parameter_names.count(name) != 0 || name == error_column) {
            name = "out_" + name;
        }
        if (name != key) {
            LOG_WARN("BatchRunner: output '" + key + "' collides with an input column, stored as '" +
                     name + "'");
        }
        output_names.emplace(key, name);
        return name;
    };

    std::vector<std::map<std::size_t, std::string>> sparse_rows;
    std::size_t failures = 0;
    for (std::size_t i = 0; i < param_sets.size(); ++i) {
        const json& params = param_sets[i];
        std::map<std::size_t, std::string> row;
        for (const auto& [key, value] : params.items()) {
            row[ensure_column(key)] = cell_text(value);
        }

        runtime::EntryPointRequest request;
        request.source = source;
        request.entry_point = entry_point_;
        request.params = params;
        request.timeout_ms = timeout_ms_;
        const auto result = executor_.invoke_entry_point(request);

        if (result.ok && result.record.has_value()) {
            for (const auto& [key, value] : result.record->items()) {
                row[ensure_column(output_column(key))] = cell_text(value);
            }
        } else {
            ++failures;
            std::string message = "unknown failure";
            if (result.diagnostic.has_value()) {
                const std::string tail = last_line(result.diagnostic->message);
                message = protocol::to_string(result.diagnostic->kind) +
                          (tail.empty() ? "" : ": " + first_line(tail));
            }
            row[ensure_column(error_column)] = message;
            LOG_WARN("BatchRunner: run #" + std::to_string(i) + " failed: " + message);
        }
        sparse_rows.push_back(std::move(row));
    }

    for (const auto& sparse : sparse_rows) {
        std::vector<std::string> row(dataset.columns.size());
        for (const auto& [index, text] : sparse) {
            row[index] = text;
        }
        dataset.rows.push_back(std::move(row));
    }

    LOG_INFO("BatchRunner: " + std::to_string(param_sets.size()) + " runs, " +
             std::to_string(failures) + " failed, " + std::to_string(dataset.columns.size()) +
             " columns");
    return dataset;
}

}  // namespace simlab::generation
