#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/lab_errors.hpp"

namespace simlab::data {

// Tabular experiment results: named columns, rows of text cells.
struct Dataset {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    std::optional<std::size_t> column_index(const std::string& name) const;
    std::size_t row_count() const { return rows.size(); }
};

// RFC 4180 style: cells containing a comma, quote or newline are quoted and
// embedded quotes doubled.
std::string to_csv(const Dataset& dataset);

core::errors::Result<Dataset> parse_csv(const std::string& text);

core::errors::Result<Dataset> read_csv(const std::filesystem::path& path);

core::errors::Result<std::filesystem::path> write_csv(const Dataset& dataset,
                                                      const std::filesystem::path& path);

}  // namespace simlab::data
