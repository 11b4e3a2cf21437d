#pragma once

#include <string>
#include <vector>

namespace simlab::runtime {

// How the executor drives one interpreter. The executor writes the user code
// to its own file and launches `command + [runner script]`. The runner finds
// its inputs through these environment variables:
//   SIMLAB_CODE_FILE     user code / candidate source
//   SIMLAB_DATASET       read-only CSV, empty when no dataset is bound
//   SIMLAB_ARTIFACT_DIR  designated artifact directory (also the cwd)
//   SIMLAB_ENTRY_POINT   entry-point name (entry-point runs)
//   SIMLAB_PARAMS_FILE   JSON object of keyword arguments (entry-point runs)
//   SIMLAB_RESULT_FILE   where the runner writes the JSON return value
struct InterpreterProfile {
    std::string name;
    std::vector<std::string> command;
    std::string script_extension;
    std::string snippet_runner;
    std::string entry_point_runner;
};

// Exit status a runner uses when the entry point's return value cannot be
// serialized to JSON.
inline constexpr int kUnserializableResultExit = 3;

InterpreterProfile python_profile(const std::string& interpreter = "python3");

// POSIX sh: snippets are sourced, the entry point is a shell function whose
// stdout is the JSON record.
InterpreterProfile shell_profile();

}  // namespace simlab::runtime
