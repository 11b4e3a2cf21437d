#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "data/dataset.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/interpreter_profile.hpp"
#include "runtime/process_runner.hpp"

namespace simlab::runtime {

struct SnippetRequest {
    std::string code;
    const data::Dataset* dataset = nullptr;
    std::uint32_t timeout_ms = 30000;
};

struct EntryPointRequest {
    std::string source;
    std::string entry_point = "simulate";
    nlohmann::json params = nlohmann::json::object();
    std::uint32_t timeout_ms = 30000;
};

// Runs untrusted code and always answers with an ExecutionResult; no
// implementation may throw to its caller.
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;

    virtual protocol::ExecutionResult execute_snippet(const SnippetRequest& request) const = 0;

    virtual protocol::ExecutionResult invoke_entry_point(
        const EntryPointRequest& request) const = 0;
};

struct ExecutorOptions {
    std::filesystem::path scratch_root;
    std::filesystem::path artifact_store;
    std::uint64_t memory_limit_bytes = 1024ULL * 1024 * 1024;
    std::uint64_t max_file_bytes = 256ULL * 1024 * 1024;
    std::size_t max_output_bytes = 16 * 1024 * 1024;
    std::size_t diagnostic_tail_lines = 25;
};

// One forked child per call, inside a private scratch directory that is
// removed afterwards. New files in the call's artifact directory are moved
// into the artifact store under fresh random names.
class IsolationExecutor : public CodeExecutor {
public:
    IsolationExecutor(InterpreterProfile profile, ExecutorOptions options);

    protocol::ExecutionResult execute_snippet(const SnippetRequest& request) const override;

    protocol::ExecutionResult invoke_entry_point(
        const EntryPointRequest& request) const override;

    const ExecutorOptions& options() const { return options_; }

private:
    struct Launch;

    protocol::ExecutionResult run_guarded(const Launch& launch) const;
    protocol::ExecutionResult run(const Launch& launch) const;

    InterpreterProfile profile_;
    ExecutorOptions options_;
};

// Last `max_lines` lines of `text`, or a placeholder when it is blank.
std::string tail_lines(const std::string& text, std::size_t max_lines);

}  // namespace simlab::runtime
