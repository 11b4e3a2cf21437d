#include "generation/prompts.hpp"

#include <sstream>
#include <nlohmann/json.hpp>
#include "generation/code_normalizer.hpp"
#include "protocol/serialization.hpp"
#include "protocol/tool_contract.hpp"

namespace simlab::generation {

std::string codegen_system_prompt(const protocol::ExperimentMetadata& metadata,
                                  const std::string& entry_point) {
    std::ostringstream out;
    out << "You are a Python code generator for single-run physical simulations.\n"
        << "Given the structured metadata below, emit only executable Python code.\n\n"
        << "FORMAT RULES\n"
        << "- Output pure Python: no Markdown, no prose outside # comments.\n"
        << "- Never leave a string literal unterminated.\n"
        << "- Do not include the metadata object in the code.\n\n"
        << "REQUIRED STRUCTURE\n"
        << "1. Imports with standard aliases (numpy as np, scipy, matplotlib.pyplot as plt).\n"
        << "2. np.random.seed(0) at top level.\n"
        << "3. A function `" << entry_point << "(**params)` that reads its parameters from\n"
        << "   `params` with sensible defaults, so that calling it with no arguments works.\n"
        << "4. It returns a flat dict: keys are strings, values are finite numbers,\n"
        << "   strings, booleans or short lists of those. No nested dicts.\n\n"
        << "METADATA (reference only)\n"
        << protocol::to_wire_text(protocol::metadata_to_json(metadata), 2) << "\n\n"
        << "Finish your reply with the line " << kEndOfCodeSentinel << "\n";
    return out.str();
}

std::string analysis_system_prompt(const std::string& simulation_source,
                                   const std::vector<std::string>& columns,
                                   const protocol::ExperimentMetadata& metadata) {
    std::ostringstream schema;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        schema << (i == 0 ? "" : ", ") << columns[i];
    }

    std::ostringstream params;
    for (const auto& [name, description] : metadata.parameters) {
        params << "  " << name << ": " << description << "\n";
    }

    std::ostringstream out;
    out << "You are a scientific reasoning assistant.\n\n"
        << "This is the simulation model that produced the data:\n\n"
        << simulation_source << "\n"
        << "A pandas DataFrame `df` holds all experiment results, with columns:\n  "
        << schema.str() << "\n\n"
        << "Simulation parameters (name: description):\n"
        << params.str() << "\n"
        << "To analyse or plot the data, call the tool as one JSON object:\n"
        << "  {\"tool\": \"" << protocol::kPythonExecTool
        << "\", \"args\": {\"code\": \"<python>\"}}\n"
        << "Print the values you need; plots shown with plt.show() are saved for you.\n"
        << "When you are finished, reply with exactly one JSON object:\n"
        << "  {\"answer\": \"<your report and conclusion>\"}\n"
        << "Only one JSON object per message, with either \"tool\" or \"answer\".\n";
    return out.str();
}

std::string python_exec_parameters_schema() {
    const nlohmann::json schema = {
        {"type", "object"},
        {"properties",
         {{"code", {{"type", "string"}, {"description", "Python code to run against df"}}}}},
        {"required", {"code"}}};
    return schema.dump();
}

}  // namespace simlab::generation
