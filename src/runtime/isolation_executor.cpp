#include "runtime/isolation_executor.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "protocol/result_schema.hpp"

namespace simlab::runtime {

using protocol::Diagnostic;
using protocol::DiagnosticKind;
using protocol::ExecutionResult;

struct IsolationExecutor::Launch {
    const char* mode;
    std::string code;
    std::string runner;
    const data::Dataset* dataset = nullptr;
    std::string entry_point;
    nlohmann::json params;
    std::uint32_t timeout_ms = 0;
};

namespace {

constexpr const char* kExecFailedPrefix = "simlab: exec failed";

ExecutionResult failure(const DiagnosticKind kind, std::string message) {
    ExecutionResult result;
    result.ok = false;
    result.diagnostic = Diagnostic{kind, std::move(message)};
    return result;
}

bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << text;
    return out.good();
}

std::set<std::string> snapshot(const std::filesystem::path& dir) {
    std::set<std::string> names;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && !ec) {
            names.insert(entry.path().filename().string());
        }
    }
    return names;
}

// Moves every file created since `before` into the store under a fresh name.
std::vector<std::string> collect_artifacts(const std::filesystem::path& staging,
                                           const std::set<std::string>& before,
                                           const std::filesystem::path& store) {
    std::vector<std::string> collected;
    const auto after = snapshot(staging);
    std::error_code ec;
    for (const auto& name : after) {
        if (before.count(name) != 0) {
            continue;
        }
        const std::filesystem::path source = staging / name;
        const std::string id =
            core::config::generate_unique_hex() + source.extension().string();
        const std::filesystem::path target = store / id;

        std::filesystem::rename(source, target, ec);
        if (ec) {
            ec.clear();
            std::filesystem::copy_file(source, target, ec);
            if (ec) {
                LOG_WARN("IsolationExecutor: dropping artifact " + name + ": " +
                         ec.message());
                ec.clear();
                continue;
            }
        }
        collected.push_back(id);
    }
    return collected;
}

std::string describe_exit(const ProcessCapture& capture) {
    if (capture.term_signal != 0) {
        return "Process killed by signal " + std::to_string(capture.term_signal);
    }
    return "Process exited with code " + std::to_string(capture.exit_code);
}

class ScratchDir {
public:
    explicit ScratchDir(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

std::string tail_lines(const std::string& text, const std::size_t max_lines) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    while (!lines.empty() && lines.back().find_first_not_of(" \t\r") == std::string::npos) {
        lines.pop_back();
    }
    if (lines.empty()) {
        return "<no diagnostic output captured>";
    }

    const std::size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
    std::string out;
    for (std::size_t i = first; i < lines.size(); ++i) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

IsolationExecutor::IsolationExecutor(InterpreterProfile profile, ExecutorOptions options)
    : profile_(std::move(profile)), options_(std::move(options)) {}

ExecutionResult IsolationExecutor::execute_snippet(const SnippetRequest& request) const {
    Launch launch;
    launch.mode = "snippet";
    launch.code = request.code;
    launch.runner = profile_.snippet_runner;
    launch.dataset = request.dataset;
    launch.timeout_ms = request.timeout_ms;
    return run_guarded(launch);
}

ExecutionResult IsolationExecutor::invoke_entry_point(
    const EntryPointRequest& request) const {
    if (request.entry_point.empty()) {
        return failure(DiagnosticKind::LaunchFailure, "Entry-point name cannot be empty.");
    }
    Launch launch;
    launch.mode = "entry_point";
    launch.code = request.source;
    launch.runner = profile_.entry_point_runner;
    launch.entry_point = request.entry_point;
    launch.params = request.params.is_null() ? nlohmann::json::object() : request.params;
    launch.timeout_ms = request.timeout_ms;
    return run_guarded(launch);
}

ExecutionResult IsolationExecutor::run_guarded(const Launch& launch) const {
    try {
        return run(launch);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("IsolationExecutor: internal failure: ") + e.what());
        return failure(DiagnosticKind::Internal,
                       std::string("Executor internal failure: ") + e.what());
    }
}

ExecutionResult IsolationExecutor::run(const Launch& launch) const {
    const bool entry_mode = !launch.entry_point.empty();
    std::error_code ec;

    std::filesystem::create_directories(options_.artifact_store, ec);
    if (ec) {
        return failure(DiagnosticKind::Internal, "Unable to create artifact store: " +
                                                     options_.artifact_store.string());
    }

    ScratchDir scratch(options_.scratch_root / ("exec-" + core::config::generate_unique_hex()));
    const auto artifact_dir = scratch.path() / "artifacts";
    std::filesystem::create_directories(artifact_dir, ec);
    if (ec) {
        return failure(DiagnosticKind::Internal,
                       "Unable to create scratch directory: " + scratch.path().string());
    }

    const auto code_file = scratch.path() / ("code" + profile_.script_extension);
    const auto runner_file = scratch.path() / ("runner" + profile_.script_extension);
    const auto params_file = scratch.path() / "params.json";
    const auto result_file = scratch.path() / "result.json";
    const auto dataset_file = scratch.path() / "dataset.csv";

    if (!write_text(code_file, launch.code) || !write_text(runner_file, launch.runner)) {
        return failure(DiagnosticKind::Internal, "Unable to stage code in scratch directory.");
    }

    ProcessRequest process;
    process.argv = profile_.command;
    process.argv.push_back(runner_file.string());
    process.working_directory = artifact_dir;
    process.timeout_ms = launch.timeout_ms;
    process.max_output_bytes = options_.max_output_bytes;
    process.limits.cpu_seconds = launch.timeout_ms / 1000 + 2;
    process.limits.address_space_bytes = options_.memory_limit_bytes;
    process.limits.max_file_bytes = options_.max_file_bytes;
    process.environment = {{"SIMLAB_CODE_FILE", code_file.string()},
                           {"SIMLAB_ARTIFACT_DIR", artifact_dir.string()},
                           {"MPLBACKEND", "Agg"}};

    if (launch.dataset != nullptr) {
        if (!write_text(dataset_file, data::to_csv(*launch.dataset))) {
            return failure(DiagnosticKind::Internal, "Unable to stage dataset.");
        }
        std::filesystem::permissions(dataset_file,
                                     std::filesystem::perms::owner_read |
                                         std::filesystem::perms::group_read |
                                         std::filesystem::perms::others_read,
                                     std::filesystem::perm_options::replace, ec);
        process.environment.emplace_back("SIMLAB_DATASET", dataset_file.string());
    } else {
        process.environment.emplace_back("SIMLAB_DATASET", "");
    }
    if (entry_mode) {
        if (!write_text(params_file, launch.params.dump())) {
            return failure(DiagnosticKind::Internal, "Unable to stage parameters.");
        }
        process.environment.emplace_back("SIMLAB_ENTRY_POINT", launch.entry_point);
        process.environment.emplace_back("SIMLAB_PARAMS_FILE", params_file.string());
        process.environment.emplace_back("SIMLAB_RESULT_FILE", result_file.string());
    }

    const auto before = snapshot(artifact_dir);
    LOG_DEBUG(std::string("IsolationExecutor: launching ") + launch.mode + " (" +
              profile_.name + ", timeout " + std::to_string(launch.timeout_ms) + " ms)");

    auto capture_result = run_process(process);
    if (core::errors::is_error(capture_result)) {
        const auto& err = core::errors::get_error(capture_result);
        return failure(DiagnosticKind::LaunchFailure, err.message);
    }
    auto capture = core::errors::get_value(capture_result);
    capture.stdout_text = to_valid_utf8(capture.stdout_text);
    capture.stderr_text = to_valid_utf8(capture.stderr_text);

    ExecutionResult result;
    result.stdout_text = capture.stdout_text;
    result.stderr_text = capture.stderr_text;
    result.duration_ms = capture.duration_ms;
    result.artifacts = collect_artifacts(artifact_dir, before, options_.artifact_store);

    if (capture.timed_out) {
        result.diagnostic = Diagnostic{
            DiagnosticKind::Timeout,
            "Execution exceeded " + std::to_string(launch.timeout_ms) + " ms and was killed."};
    } else if (capture.exit_code == 127 &&
               capture.stderr_text.rfind(kExecFailedPrefix, 0) == 0) {
        result.diagnostic = Diagnostic{DiagnosticKind::LaunchFailure,
                                       tail_lines(capture.stderr_text, 1)};
    } else if (entry_mode && capture.exit_code == kUnserializableResultExit) {
        result.diagnostic = Diagnostic{
            DiagnosticKind::SchemaViolation,
            tail_lines(capture.stderr_text, options_.diagnostic_tail_lines)};
    } else if (capture.exit_code != 0) {
        std::string message = tail_lines(capture.stderr_text, options_.diagnostic_tail_lines);
        if (capture.stderr_text.find_first_not_of(" \t\r\n") == std::string::npos) {
            message = describe_exit(capture);
        }
        result.diagnostic = Diagnostic{DiagnosticKind::RuntimeError, message};
    } else if (entry_mode) {
        std::ifstream in(result_file, std::ios::binary);
        if (!in.is_open()) {
            result.diagnostic = Diagnostic{DiagnosticKind::SchemaViolation,
                                           "Entry point produced no return record."};
        } else {
            nlohmann::json record;
            try {
                in >> record;
            } catch (const nlohmann::json::parse_error& e) {
                record = nlohmann::json();
                result.diagnostic = Diagnostic{
                    DiagnosticKind::SchemaViolation,
                    std::string("Return record is not valid JSON: ") + e.what()};
            }
            if (!result.diagnostic.has_value()) {
                auto checked = protocol::validate_result_record(record);
                if (core::errors::is_error(checked)) {
                    result.diagnostic = Diagnostic{DiagnosticKind::SchemaViolation,
                                                   core::errors::get_error(checked).message};
                } else {
                    result.record = core::errors::get_value(checked);
                }
            }
        }
    }

    if (capture.output_truncated) {
        LOG_WARN("IsolationExecutor: output exceeded " +
                 std::to_string(options_.max_output_bytes) + " bytes and was truncated");
    }

    result.ok = !result.diagnostic.has_value();
    LOG_DEBUG(std::string("IsolationExecutor: ") + launch.mode + " finished " +
              (result.ok ? "ok" : "with " + protocol::to_string(result.diagnostic->kind)) +
              " in " + std::to_string(static_cast<long>(result.duration_ms)) + " ms, " +
              std::to_string(result.artifacts.size()) + " artifact(s)");
    return result;
}

}  // namespace simlab::runtime
