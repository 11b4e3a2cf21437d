#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/lab_errors.hpp"

namespace simlab::core::config {

struct LabConfig {
    std::filesystem::path workspace = std::filesystem::current_path();
    std::filesystem::path models_dir = "models";
    std::filesystem::path artifacts_dir = "artifacts";
    std::filesystem::path scratch_dir = ".simlab_scratch";
    std::filesystem::path reports_file = "reports/reports.jsonl";

    std::string interpreter = "python3";
    std::string entry_point = "simulate";

    std::uint32_t max_attempts = 4;
    std::uint32_t smoke_timeout_ms = 30000;
    std::uint32_t tool_timeout_ms = 30000;
    std::uint32_t model_timeout_ms = 120000;
    std::uint32_t step_budget = 20;
    std::uint32_t history_window = 12;
    std::uint32_t memory_limit_mb = 1024;
    std::size_t max_output_bytes = 16 * 1024 * 1024;

    std::vector<std::string> model_command;
    std::string model_name = "default";

    // Joins a configured path onto the workspace unless it is absolute.
    std::filesystem::path resolve(const std::filesystem::path& path) const;
};

// Reads a JSON config file. Keys that are absent keep their defaults.
core::errors::Result<LabConfig> load_config(const std::filesystem::path& path,
                                            LabConfig base = {});

core::errors::Result<LabConfig> validate_config(LabConfig config);

}  // namespace simlab::core::config
