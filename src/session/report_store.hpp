#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/lab_errors.hpp"
#include "protocol/agent_contract.hpp"

namespace simlab::session {

// Append-only JSON-lines file of answered questions. There is no update
// or delete.
class ReportStore {
public:
    explicit ReportStore(std::filesystem::path reports_file);

    core::errors::Result<protocol::StoredReport> record(
        const std::string& model_id, const std::string& question, const std::string& answer,
        const std::vector<std::string>& artifacts) const;

    // Reports for `model_id` in insertion order; all reports when empty.
    core::errors::Result<std::vector<protocol::StoredReport>> list(
        const std::string& model_id = "") const;

    const std::filesystem::path& path() const { return reports_file_; }

private:
    core::errors::Result<std::filesystem::path> append_line(const std::string& line) const;

    std::filesystem::path reports_file_;
};

// Current UTC time as "2025-01-31T12:00:00.123Z".
std::string utc_timestamp();

}  // namespace simlab::session
