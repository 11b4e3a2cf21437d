#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/lab_errors.hpp"
#include "protocol/candidate_contract.hpp"

namespace simlab::generation {

// Directory-per-model persistence for verified candidates:
//   <root>/<model_id>/simulate.py   the source, byte for byte
//   <root>/<model_id>/metadata.json
//   <root>/index.jsonl              one line per persisted model
// Model directories are never overwritten; a name collision gets a
// numeric suffix ("pendulum-2").
class CandidateStore {
public:
    explicit CandidateStore(std::filesystem::path models_root,
                            std::string script_name = "simulate.py");

    core::errors::Result<protocol::CandidateHandle> persist(
        const protocol::CandidateProgram& program,
        const protocol::ExperimentMetadata& metadata) const;

    core::errors::Result<protocol::CandidateProgram> load(const std::string& model_id) const;

    core::errors::Result<protocol::ExperimentMetadata> load_metadata(
        const std::string& model_id) const;

    core::errors::Result<protocol::CandidateHandle> handle_for(const std::string& model_id) const;

    // Model ids in the order they were persisted.
    core::errors::Result<std::vector<std::string>> list() const;

    const std::filesystem::path& root() const { return models_root_; }

private:
    core::errors::Result<std::filesystem::path> model_dir(const std::string& model_id) const;

    std::filesystem::path models_root_;
    std::string script_name_;
};

// Lowercase, runs of anything but [a-z0-9] collapsed to '-', trimmed.
std::string slugify(const std::string& name);

}  // namespace simlab::generation
