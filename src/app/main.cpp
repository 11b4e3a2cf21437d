#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/tool_calling_agent.hpp"
#include "app/cli_parser.hpp"
#include "core/config/ids.hpp"
#include "core/config/lab_config.hpp"
#include "core/errors/lab_errors.hpp"
#include "core/logging/logger.hpp"
#include "data/dataset.hpp"
#include "generation/batch_runner.hpp"
#include "generation/candidate_store.hpp"
#include "generation/generation_repair_loop.hpp"
#include "generation/prompts.hpp"
#include "llm/command_model_client.hpp"
#include "llm/scripted_model_client.hpp"
#include "protocol/serialization.hpp"
#include "runtime/interpreter_profile.hpp"
#include "runtime/isolation_executor.hpp"
#include "session/report_store.hpp"
#include "session/session_manager.hpp"

namespace {

using simlab::core::config::LabConfig;
using simlab::core::errors::ErrorCategory;
using simlab::core::errors::LabError;
using simlab::core::errors::Result;
using simlab::core::errors::get_error;
using simlab::core::errors::get_value;
using simlab::core::errors::is_error;

constexpr const char* kDefaultConfigFile = "simlab.json";

std::atomic_bool g_interrupted{false};

void handle_sigint(int) {
    g_interrupted.store(true);
}

int exit_code_for(const LabError& err) {
    switch (err.category) {
        case ErrorCategory::Input:
            return 2;
        case ErrorCategory::Validation:
            return 3;
        case ErrorCategory::Execution:
            return err.code == "exhausted_attempts" ? 3 : 1;
        case ErrorCategory::Provider:
            return 4;
        case ErrorCategory::Storage:
            return 5;
        default:
            return 1;
    }
}

int report_failure(const std::string& what, const LabError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

Result<nlohmann::json> read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return LabError{ErrorCategory::Input, "Unable to open " + path.string(), "file_not_found"};
    }
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return LabError{ErrorCategory::Input, path.string() + " is not valid JSON", "invalid_json"};
    }
    return doc;
}

// Defaults, then the config file, then command-line overrides.
Result<LabConfig> resolve_config(const simlab::app::cli::CliRequest& req) {
    LabConfig config;
    if (req.workspace) {
        config.workspace = req.workspace.value();
    }

    std::filesystem::path config_path;
    if (req.config_file) {
        config_path = req.config_file.value();
    } else {
        std::error_code ec;
        const auto candidate = config.workspace / kDefaultConfigFile;
        if (std::filesystem::exists(candidate, ec)) {
            config_path = candidate;
        }
    }
    if (!config_path.empty()) {
        auto loaded = simlab::core::config::load_config(config_path, config);
        if (is_error(loaded)) {
            return get_error(loaded);
        }
        config = get_value(loaded);
        LOG_DEBUG("Loaded config from " + config_path.string());
    }

    if (req.workspace) config.workspace = req.workspace.value();
    if (req.max_steps) config.step_budget = req.max_steps.value();
    if (req.max_attempts) config.max_attempts = req.max_attempts.value();
    if (!req.model_command.empty()) config.model_command = req.model_command;

    return simlab::core::config::validate_config(config);
}

Result<std::unique_ptr<simlab::llm::ModelClient>> make_model_client(
    const simlab::app::cli::CliRequest& req, const LabConfig& config) {
    if (req.model_script) {
        auto scripted = simlab::llm::ScriptedModelClient::from_file(req.model_script.value());
        if (is_error(scripted)) {
            return get_error(scripted);
        }
        LOG_INFO("Using scripted model responses from " + req.model_script->string());
        return std::unique_ptr<simlab::llm::ModelClient>(
            std::make_unique<simlab::llm::ScriptedModelClient>(get_value(scripted)));
    }

    simlab::llm::CommandModelOptions options;
    options.command = config.model_command;
    options.model_name = config.model_name;
    options.scratch_root = config.resolve(config.scratch_dir);
    options.timeout_ms = config.model_timeout_ms;
    return std::unique_ptr<simlab::llm::ModelClient>(
        std::make_unique<simlab::llm::CommandModelClient>(options));
}

simlab::runtime::IsolationExecutor make_executor(const LabConfig& config) {
    simlab::runtime::ExecutorOptions options;
    options.scratch_root = config.resolve(config.scratch_dir);
    options.artifact_store = config.resolve(config.artifacts_dir);
    options.memory_limit_bytes = static_cast<std::uint64_t>(config.memory_limit_mb) * 1024 * 1024;
    options.max_output_bytes = config.max_output_bytes;
    return simlab::runtime::IsolationExecutor(
        simlab::runtime::python_profile(config.interpreter), options);
}

int run_generate(const simlab::app::cli::CliRequest& req, const LabConfig& config) {
    auto doc = read_json_file(req.metadata_file.value());
    if (is_error(doc)) {
        return report_failure("Failed to read metadata", get_error(doc));
    }
    auto metadata = simlab::protocol::metadata_from_json(get_value(doc));
    if (is_error(metadata)) {
        return report_failure("Invalid metadata", get_error(metadata));
    }

    auto model = make_model_client(req, config);
    if (is_error(model)) {
        return report_failure("Failed to set up model client", get_error(model));
    }

    const auto executor = make_executor(config);
    const simlab::generation::CandidateStore store(config.resolve(config.models_dir));
    simlab::generation::GenerationOptions options;
    options.entry_point = config.entry_point;
    options.smoke_timeout_ms = config.smoke_timeout_ms;
    options.parse_check.interpreter = {config.interpreter};
    options.parse_check.scratch_root = config.resolve(config.scratch_dir);
    simlab::generation::GenerationRepairLoop loop(*get_value(model), executor, store, options);

    auto handle = loop.generate_verified(get_value(metadata), config.max_attempts);
    for (const auto& record : loop.attempt_log()) {
        LOG_DEBUG("Attempt " + std::to_string(record.attempt) + ": " + record.outcome);
    }
    if (is_error(handle)) {
        return report_failure("Generation failed", get_error(handle));
    }

    const auto& verified = get_value(handle);
    LOG_INFO("Verified candidate on attempt " + std::to_string(verified.attempt) + ": " +
             verified.script_path.string());
    std::cout << verified.model_id << std::endl;
    return 0;
}

int run_batch(const simlab::app::cli::CliRequest& req, const LabConfig& config) {
    const simlab::generation::CandidateStore store(config.resolve(config.models_dir));
    auto handle = store.handle_for(req.model_id.value());
    if (is_error(handle)) {
        return report_failure("Unknown model", get_error(handle));
    }

    auto doc = read_json_file(req.grid_file.value());
    if (is_error(doc)) {
        return report_failure("Failed to read parameter grid", get_error(doc));
    }
    auto param_sets = simlab::generation::parse_param_sets(get_value(doc));
    if (is_error(param_sets)) {
        return report_failure("Invalid parameter grid", get_error(param_sets));
    }

    const auto executor = make_executor(config);
    const simlab::generation::BatchRunner runner(executor, config.entry_point,
                                                 config.smoke_timeout_ms);
    auto dataset = runner.run(get_value(handle), get_value(param_sets));
    if (is_error(dataset)) {
        return report_failure("Batch run failed", get_error(dataset));
    }

    auto written = simlab::data::write_csv(get_value(dataset), req.out_file.value());
    if (is_error(written)) {
        return report_failure("Failed to write dataset", get_error(written));
    }
    std::cout << get_value(written).string() << std::endl;
    return 0;
}

int run_ask(const simlab::app::cli::CliRequest& req, const LabConfig& config) {
    const std::string& model_id = req.model_id.value();
    const simlab::generation::CandidateStore store(config.resolve(config.models_dir));
    auto program = store.load(model_id);
    if (is_error(program)) {
        return report_failure("Unknown model", get_error(program));
    }
    auto metadata = store.load_metadata(model_id);
    if (is_error(metadata)) {
        return report_failure("Unreadable model metadata", get_error(metadata));
    }
    auto dataset = simlab::data::read_csv(req.dataset_file.value());
    if (is_error(dataset)) {
        return report_failure("Failed to read dataset", get_error(dataset));
    }

    auto model = make_model_client(req, config);
    if (is_error(model)) {
        return report_failure("Failed to set up model client", get_error(model));
    }

    simlab::session::SessionManager sessions;
    auto started = sessions.start_session(model_id, req.question.value());
    if (is_error(started)) {
        return report_failure("Failed to start session", get_error(started));
    }
    const std::string session_id = get_value(started);
    simlab::core::logging::Logger::get().set_session_id(session_id);

    auto token_result = sessions.get_cancel_token(session_id);
    if (is_error(token_result)) {
        return report_failure("Failed to get cancellation token", get_error(token_result));
    }
    const auto cancel_token = get_value(token_result);

    std::signal(SIGINT, handle_sigint);
    const auto cancelled = [&]() {
        if (g_interrupted.load() && !cancel_token->load()) {
            auto requested = sessions.request_cancel(session_id);
            if (is_error(requested)) {
                LOG_WARN("Cancellation request rejected: " + get_error(requested).message);
            }
        }
        return cancel_token->load();
    };

    const auto executor = make_executor(config);
    const simlab::session::ReportStore reports(config.resolve(config.reports_file));
    simlab::agent::AgentOptions options;
    options.step_budget = config.step_budget;
    options.history_window = config.history_window;
    options.tool_timeout_ms = config.tool_timeout_ms;
    simlab::agent::ToolCallingAgent agent(*get_value(model), executor, reports, options);

    simlab::agent::AgentContext context;
    context.model_id = model_id;
    context.dataset = &get_value(dataset);
    context.system_prompt = simlab::generation::analysis_system_prompt(
        get_value(program).source, get_value(dataset).columns, get_value(metadata));

    const auto result = agent.ask(context, req.question.value(), cancelled);
    std::signal(SIGINT, SIG_DFL);

    auto finished = sessions.finish(session_id, result.state);
    if (is_error(finished)) {
        return report_failure("Failed to close session", get_error(finished));
    }
    LOG_INFO("Session state: " +
             simlab::session::SessionManager::to_string(get_value(finished)));

    std::cout << result.answer << std::endl;
    for (const auto& artifact : result.artifacts) {
        std::cout << "artifact: " << (config.resolve(config.artifacts_dir) / artifact).string()
                  << std::endl;
    }
    if (result.state == simlab::protocol::AgentState::ModelReturnedAnswer && !result.persisted) {
        return 5;
    }
    return result.state == simlab::protocol::AgentState::ModelReturnedAnswer ? 0 : 1;
}

int run_reports(const simlab::app::cli::CliRequest& req, const LabConfig& config) {
    const simlab::session::ReportStore reports(config.resolve(config.reports_file));
    auto listed = reports.list(req.model_id.value_or(""));
    if (is_error(listed)) {
        return report_failure("Failed to read reports", get_error(listed));
    }
    for (const auto& report : get_value(listed)) {
        std::cout << simlab::protocol::to_wire_text(simlab::protocol::report_to_json(report))
                  << std::endl;
    }
    LOG_INFO(std::to_string(get_value(listed).size()) + " reports");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag early log lines with a bootstrap id until a session exists
    simlab::core::logging::Logger::get().set_session_id(
        simlab::core::config::generate_session_id("simlab"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = simlab::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        return report_failure("Input error", get_error(parsed));
    }
    const auto& req = get_value(parsed);
    if (req.verbose) {
        simlab::core::logging::Logger::get().set_min_level(
            simlab::core::logging::LogLevel::DEBUG);
    }

    // 3. Layer the configuration
    auto config = resolve_config(req);
    if (is_error(config)) {
        return report_failure("Configuration error", get_error(config));
    }
    const auto& cfg = get_value(config);
    LOG_DEBUG("Workspace: " + cfg.workspace.string() + ", command: " +
              simlab::app::cli::to_string(req.command));

    // 4. Dispatch
    switch (req.command) {
        case simlab::app::cli::Command::Generate:
            return run_generate(req, cfg);
        case simlab::app::cli::Command::Run:
            return run_batch(req, cfg);
        case simlab::app::cli::Command::Ask:
            return run_ask(req, cfg);
        case simlab::app::cli::Command::Reports:
            return run_reports(req, cfg);
    }
    return 1;
}
