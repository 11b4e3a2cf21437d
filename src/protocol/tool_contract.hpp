#pragma once
#include <cstddef>
#include <string>

namespace simlab::protocol {

    // The single tool the analysis agent may call.
    inline constexpr const char* kPythonExecTool = "python_exec";

    // How the model asks the execution layer to do something
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "python_exec"
        std::string arguments;  // Raw JSON string of the arguments
    };

    // A tool call that passed protocol checks: the code to run and the
    // conversation turn that requested it.
    struct ToolInvocation {
        std::string code;
        std::size_t turn_index = 0;
    };

    // Advertised to the model with every request
    struct ToolDeclaration {
        std::string name;
        std::string description;
        std::string parameters_schema;  // JSON schema as text
    };

} // namespace simlab::protocol
