#pragma once

#include <string>
#include <vector>
#include "data/dataset.hpp"
#include "protocol/candidate_contract.hpp"

namespace simlab::generation {

// System turn for code generation; embeds the metadata as JSON.
std::string codegen_system_prompt(const protocol::ExperimentMetadata& metadata,
                                  const std::string& entry_point);

// System turn for the analysis agent: the simulation source, the dataset
// columns and the parameter descriptions.
std::string analysis_system_prompt(const std::string& simulation_source,
                                   const std::vector<std::string>& columns,
                                   const protocol::ExperimentMetadata& metadata);

// JSON schema advertised for the python_exec tool.
std::string python_exec_parameters_schema();

}  // namespace simlab::generation
