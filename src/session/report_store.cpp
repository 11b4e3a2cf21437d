#include "session/report_store.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/serialization.hpp"

namespace simlab::session {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms << 'Z';
    return out.str();
}

ReportStore::ReportStore(std::filesystem::path reports_file)
    : reports_file_(std::move(reports_file)) {}

core::errors::Result<std::filesystem::path> ReportStore::append_line(
    const std::string& line) const {
    std::error_code ec;
    const auto parent = reports_file_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return LabError{ErrorCategory::Storage,
                            "Unable to create reports directory: " + parent.string(),
                            "report_dir_create_failed"};
        }
    }

    std::ofstream out(reports_file_, std::ios::app);
    if (!out.is_open()) {
        return LabError{ErrorCategory::Storage,
                        "Unable to open reports file: " + reports_file_.string(),
                        "report_open_failed"};
    }

    out << line << "\n";
    if (!out.good()) {
        return LabError{ErrorCategory::Storage,
                        "Unable to write report: " + reports_file_.string(),
                        "report_write_failed"};
    }
    return reports_file_;
}

core::errors::Result<protocol::StoredReport> ReportStore::record(
    const std::string& model_id, const std::string& question, const std::string& answer,
    const std::vector<std::string>& artifacts) const {
    if (model_id.empty()) {
        return LabError{ErrorCategory::Input, "Report model id cannot be empty.",
                        "invalid_model_id"};
    }

    protocol::StoredReport report{model_id, question, answer, artifacts, utc_timestamp()};
    auto written = append_line(protocol::to_wire_text(protocol::report_to_json(report)));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    LOG_INFO("ReportStore: recorded answer for " + model_id + " (" +
             std::to_string(artifacts.size()) + " artifacts)");
    return report;
}

core::errors::Result<std::vector<protocol::StoredReport>> ReportStore::list(
    const std::string& model_id) const {
    std::vector<protocol::StoredReport> reports;
    std::error_code ec;
    if (!std::filesystem::exists(reports_file_, ec)) {
        return reports;
    }

    std::ifstream in(reports_file_);
    if (!in.is_open()) {
        return LabError{ErrorCategory::Storage,
                        "Unable to open reports file: " + reports_file_.string(),
                        "report_open_failed"};
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        const json doc = json::parse(line, nullptr, false);
        if (doc.is_discarded()) {
            return LabError{ErrorCategory::Storage,
                            "Report line " + std::to_string(line_number) + " is not valid JSON.",
                            "corrupt_report"};
        }
        auto report = protocol::report_from_json(doc);
        if (core::errors::is_error(report)) {
            return core::errors::get_error(report);
        }
        if (model_id.empty() || core::errors::get_value(report).model_id == model_id) {
            reports.push_back(core::errors::get_value(report));
        }
    }
    return reports;
}

}  // namespace simlab::session
