#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/lab_errors.hpp"

namespace simlab::runtime {

// Applied to the child with setrlimit(). Zero leaves a limit untouched.
struct ResourceLimits {
    std::uint64_t cpu_seconds = 0;
    std::uint64_t address_space_bytes = 0;
    std::uint64_t max_file_bytes = 0;
};

struct ProcessRequest {
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::vector<std::pair<std::string, std::string>> environment;
    std::optional<std::filesystem::path> stdin_file;
    std::uint32_t timeout_ms = 5000;
    ResourceLimits limits;
    std::size_t max_output_bytes = 16 * 1024 * 1024;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Forks argv[0] (looked up on PATH) into its own process group, captures
// both output streams and kills the whole group on timeout or cancellation.
// Only setup failures (pipe, fork) are errors; everything the child does is
// reported through ProcessCapture.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

bool executable_on_path(const std::string& program);

// Replaces every byte that does not start a well-formed UTF-8 sequence with
// U+FFFD. Captured output must pass through this before it is serialized.
std::string to_valid_utf8(const std::string& text);

}  // namespace simlab::runtime
