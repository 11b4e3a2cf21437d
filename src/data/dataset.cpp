#include "data/dataset.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace simlab::data {

using core::errors::ErrorCategory;
using core::errors::LabError;

namespace {

bool needs_quoting(const std::string& cell) {
    return cell.find_first_of(",\"\r\n") != std::string::npos;
}

void append_cell(std::string& out, const std::string& cell) {
    if (!needs_quoting(cell)) {
        out += cell;
        return;
    }
    out.push_back('"');
    for (const char c : cell) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
}

void append_row(std::string& out, const std::vector<std::string>& row) {
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        append_cell(out, row[i]);
    }
    out.push_back('\n');
}

}  // namespace

std::optional<std::size_t> Dataset::column_index(const std::string& name) const {
    const auto it = std::find(columns.begin(), columns.end(), name);
    if (it == columns.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(columns.begin(), it));
}

std::string to_csv(const Dataset& dataset) {
    std::string out;
    append_row(out, dataset.columns);
    for (const auto& row : dataset.rows) {
        append_row(out, row);
    }
    return out;
}

core::errors::Result<Dataset> parse_csv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string cell;
    bool in_quotes = false;
    bool cell_started = false;
    std::size_t line = 1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                cell.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!cell.empty()) {
                    return LabError{ErrorCategory::Input,
                                    "Unexpected quote inside unquoted CSV cell at line " +
                                        std::to_string(line),
                                    "invalid_csv"};
                }
                in_quotes = true;
                cell_started = true;
                break;
            case ',':
                record.push_back(std::move(cell));
                cell.clear();
                cell_started = true;
                break;
            case '\r':
                break;
            case '\n':
                if (cell_started || !cell.empty() || !record.empty()) {
                    record.push_back(std::move(cell));
                    records.push_back(std::move(record));
                }
                cell.clear();
                record.clear();
                cell_started = false;
                ++line;
                break;
            default:
                cell.push_back(c);
                cell_started = true;
                break;
        }
    }

    if (in_quotes) {
        return LabError{ErrorCategory::Input, "Unterminated quoted CSV cell.",
                        "invalid_csv"};
    }
    if (cell_started || !cell.empty() || !record.empty()) {
        record.push_back(std::move(cell));
        records.push_back(std::move(record));
    }

    if (records.empty()) {
        return LabError{ErrorCategory::Input, "CSV input has no header row.",
                        "invalid_csv"};
    }

    Dataset dataset;
    dataset.columns = std::move(records.front());
    for (std::size_t i = 1; i < records.size(); ++i) {
        if (records[i].size() != dataset.columns.size()) {
            return LabError{ErrorCategory::Input,
                            "CSV row " + std::to_string(i + 1) + " has " +
                                std::to_string(records[i].size()) + " cells, expected " +
                                std::to_string(dataset.columns.size()),
                            "invalid_csv"};
        }
        dataset.rows.push_back(std::move(records[i]));
    }
    return dataset;
}

core::errors::Result<Dataset> read_csv(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return LabError{ErrorCategory::Input, "Unable to open dataset: " + path.string(),
                        "dataset_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_csv(buffer.str());
}

core::errors::Result<std::filesystem::path> write_csv(const Dataset& dataset,
                                                      const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return LabError{ErrorCategory::Storage,
                            "Unable to create dataset directory: " +
                                path.parent_path().string(),
                            "dataset_dir_create_failed"};
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return LabError{ErrorCategory::Storage, "Unable to open dataset for writing: " +
                                                    path.string(),
                        "dataset_open_failed"};
    }
    out << to_csv(dataset);
    if (!out.good()) {
        return LabError{ErrorCategory::Storage, "Unable to write dataset: " + path.string(),
                        "dataset_write_failed"};
    }
    return path;
}

}  // namespace simlab::data
