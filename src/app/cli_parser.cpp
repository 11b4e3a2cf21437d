#include "cli_parser.hpp"
#include <charconv>
#include <sstream>
#include <system_error>
#include <utility>

namespace simlab::app::cli {

    using namespace simlab::core::errors;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> config;
            std::optional<std::string> workspace;
            std::optional<std::string> metadata;
            std::optional<std::string> grid;
            std::optional<std::string> out;
            std::optional<std::string> dataset;
            std::optional<std::string> model;
            std::optional<std::string> question;
            std::optional<std::string> model_command;
            std::optional<std::string> model_script;
            std::optional<std::string> max_steps;
            std::optional<std::string> max_attempts;
            bool verbose = false;
        };

        LabError missing_flag(const std::string& flag, Command command) {
            return LabError{ErrorCategory::Input,
                            "Command '" + to_string(command) + "' requires " + flag,
                            "missing_required_flag", usage()};
        }

        // Exception-free integer parsing
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t max_value) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return LabError{ErrorCategory::Input, "Invalid number for " + flag,
                                "invalid_integer", "Provide a positive integer."};
            }
            if (value == 0 || value > max_value) {
                return LabError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                "Must be between 1 and " + std::to_string(max_value) + "."};
            }
            return value;
        }

        std::vector<std::string> split_command(const std::string& text) {
            std::vector<std::string> parts;
            std::istringstream in(text);
            std::string part;
            while (in >> part) {
                parts.push_back(part);
            }
            return parts;
        }

    } // namespace

    std::string to_string(const Command command) {
        switch (command) {
            case Command::Generate: return "generate";
            case Command::Run:      return "run";
            case Command::Ask:      return "ask";
            case Command::Reports:  return "reports";
            default: return "unknown";
        }
    }

    std::string usage() {
        return "Usage: simlab generate --metadata <file.json>\n"
               "       simlab run --model <id> --grid <params.json> --out <data.csv>\n"
               "       simlab ask --model <id> --dataset <data.csv> --question <text>\n"
               "       simlab reports [--model <id>]\n"
               "Common flags: --config <file> --workspace <dir> --model-command <cmd>\n"
               "              --model-script <responses.jsonl> --max-steps <n>\n"
               "              --max-attempts <n> --verbose";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return LabError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliRequest req;
        const std::string command = argv[1];
        if (command == "generate") {
            req.command = Command::Generate;
        } else if (command == "run") {
            req.command = Command::Run;
        } else if (command == "ask") {
            req.command = Command::Ask;
        } else if (command == "reports") {
            req.command = Command::Reports;
        } else {
            return LabError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::pair<const char*, std::optional<std::string>*> valued_flags[] = {
            {"--config", &raw.config},
            {"--workspace", &raw.workspace},
            {"--metadata", &raw.metadata},
            {"--grid", &raw.grid},
            {"--out", &raw.out},
            {"--dataset", &raw.dataset},
            {"--model", &raw.model},
            {"--question", &raw.question},
            {"--model-command", &raw.model_command},
            {"--model-script", &raw.model_script},
            {"--max-steps", &raw.max_steps},
            {"--max-attempts", &raw.max_attempts}};

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            bool matched = false;
            for (const auto& [flag, target] : valued_flags) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return LabError{ErrorCategory::Input, std::string("Missing value for ") + flag, "missing_value"};
                }
                *target = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return LabError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        switch (req.command) {
            case Command::Generate:
                if (!raw.metadata) return missing_flag("--metadata", req.command);
                break;
            case Command::Run:
                if (!raw.model) return missing_flag("--model", req.command);
                if (!raw.grid) return missing_flag("--grid", req.command);
                if (!raw.out) return missing_flag("--out", req.command);
                break;
            case Command::Ask:
                if (!raw.model) return missing_flag("--model", req.command);
                if (!raw.dataset) return missing_flag("--dataset", req.command);
                if (!raw.question) return missing_flag("--question", req.command);
                if (raw.question->find_first_not_of(" \t\r\n") == std::string::npos) {
                    return LabError{ErrorCategory::Input, "--question cannot be empty", "invalid_question"};
                }
                break;
            case Command::Reports:
                break;
        }

        if (raw.model_command && raw.model_script) {
            return LabError{ErrorCategory::Input, "Cannot provide both --model-command and --model-script", "conflicting_flags"};
        }

        if (raw.config) req.config_file = std::filesystem::path(raw.config.value());
        if (raw.metadata) req.metadata_file = std::filesystem::path(raw.metadata.value());
        if (raw.grid) req.grid_file = std::filesystem::path(raw.grid.value());
        if (raw.out) req.out_file = std::filesystem::path(raw.out.value());
        if (raw.dataset) req.dataset_file = std::filesystem::path(raw.dataset.value());
        if (raw.model_script) req.model_script = std::filesystem::path(raw.model_script.value());
        if (raw.model) req.model_id = raw.model.value();
        if (raw.question) req.question = raw.question.value();

        if (raw.model_command) {
            req.model_command = split_command(raw.model_command.value());
            if (req.model_command.empty()) {
                return LabError{ErrorCategory::Input, "--model-command cannot be empty", "missing_value"};
            }
        }

        if (raw.max_steps) {
            auto steps = parse_bounded("--max-steps", raw.max_steps.value(), 1000);
            if (is_error(steps)) return get_error(steps);
            req.max_steps = get_value(steps);
        }
        if (raw.max_attempts) {
            auto attempts = parse_bounded("--max-attempts", raw.max_attempts.value(), 50);
            if (is_error(attempts)) return get_error(attempts);
            req.max_attempts = get_value(attempts);
        }

        // Path validation
        if (raw.workspace) {
            std::filesystem::path p(raw.workspace.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return LabError{ErrorCategory::Input, "Workspace does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return LabError{ErrorCategory::Input, "Failed to canonicalize workspace", "invalid_path"};
            }
            req.workspace = std::move(canonical_path);
        }

        return req;
    }

} // namespace simlab::app::cli
