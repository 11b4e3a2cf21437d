#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/lab_errors.hpp"

namespace simlab::app::cli {

    enum class Command {
        Generate,
        Run,
        Ask,
        Reports
    };

    // Normalized command line. Optional overrides stay unset when the flag
    // was not given, so they can be layered over the config file.
    struct CliRequest {
        Command command = Command::Generate;

        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> workspace;

        std::optional<std::filesystem::path> metadata_file;
        std::optional<std::filesystem::path> grid_file;
        std::optional<std::filesystem::path> out_file;
        std::optional<std::filesystem::path> dataset_file;
        std::optional<std::filesystem::path> model_script;
        std::optional<std::string> model_id;
        std::optional<std::string> question;
        std::vector<std::string> model_command;

        std::optional<std::uint32_t> max_steps;
        std::optional<std::uint32_t> max_attempts;
        bool verbose = false;
    };

    simlab::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string to_string(Command command);

    std::string usage();

} // namespace simlab::app::cli
