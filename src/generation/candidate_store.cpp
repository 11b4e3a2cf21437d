#include "generation/candidate_store.hpp"

#include <cctype>
#include <chrono>
#include <fstream>
#include <iterator>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/serialization.hpp"

namespace simlab::generation {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

namespace {

constexpr const char* kIndexFile = "index.jsonl";
constexpr const char* kMetadataFile = "metadata.json";
constexpr int kMaxSlugSuffix = 1000;

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

core::errors::Result<std::string> read_file(const std::filesystem::path& path,
                                            const std::string& missing_code) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return LabError{ErrorCategory::Input, "Unable to open " + path.string(), missing_code};
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return content;
}

core::errors::Result<std::filesystem::path> write_file(const std::filesystem::path& path,
                                                       const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return LabError{ErrorCategory::Storage, "Unable to open " + path.string(),
                        "candidate_open_failed"};
    }
    out << content;
    if (!out.good()) {
        return LabError{ErrorCategory::Storage, "Unable to write " + path.string(),
                        "candidate_write_failed"};
    }
    return path;
}

}  // namespace

std::string slugify(const std::string& name) {
    std::string slug;
    bool pending_dash = false;
    for (const char raw : name) {
        const auto c = static_cast<unsigned char>(raw);
        if (std::isalnum(c) != 0 && c < 0x80) {
            if (pending_dash && !slug.empty()) {
                slug.push_back('-');
            }
            pending_dash = false;
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_dash = true;
        }
    }
    return slug.empty() ? "model" : slug;
}

CandidateStore::CandidateStore(std::filesystem::path models_root, std::string script_name)
    : models_root_(std::move(models_root)), script_name_(std::move(script_name)) {}

core::errors::Result<std::filesystem::path> CandidateStore::model_dir(
    const std::string& model_id) const {
    if (model_id.empty() || model_id != slugify(model_id)) {
        return LabError{ErrorCategory::Input, "Invalid model id: '" + model_id + "'",
                        "invalid_model_id",
                        "Model ids are lowercase slugs such as 'simple-pendulum'."};
    }
    const auto dir = models_root_ / model_id;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return LabError{ErrorCategory::Input, "Model not found: " + model_id, "model_not_found"};
    }
    return dir;
}

core::errors::Result<protocol::CandidateHandle> CandidateStore::persist(
    const protocol::CandidateProgram& program,
    const protocol::ExperimentMetadata& metadata) const {
    if (program.status != protocol::ValidationStatus::ExecutionVerified) {
        return LabError{ErrorCategory::Internal,
                        "Refusing to persist a candidate with status " +
                            protocol::to_string(program.status),
                        "candidate_not_verified"};
    }

    std::error_code ec;
    std::filesystem::create_directories(models_root_, ec);
    if (ec) {
        return LabError{ErrorCategory::Storage,
                        "Unable to create models directory: " + models_root_.string(),
                        "models_dir_create_failed"};
    }

    // create_directory() reports false when the name is taken, which makes
    // claiming a slug race-free.
    const std::string base = slugify(metadata.model_name);
    std::string model_id;
    for (int suffix = 1; suffix <= kMaxSlugSuffix; ++suffix) {
        const std::string candidate = suffix == 1 ? base : base + "-" + std::to_string(suffix);
        if (std::filesystem::create_directory(models_root_ / candidate, ec)) {
            model_id = candidate;
            break;
        }
        if (ec) {
            return LabError{ErrorCategory::Storage,
                            "Unable to create model directory for " + candidate,
                            "model_dir_create_failed"};
        }
    }
    if (model_id.empty()) {
        return LabError{ErrorCategory::Storage, "No free model id for '" + base + "'",
                        "model_id_exhausted"};
    }

    const auto dir = models_root_ / model_id;
    const auto script_path = dir / script_name_;
    if (auto written = write_file(script_path, program.source); core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    if (auto written = write_file(dir / kMetadataFile,
                                  protocol::to_wire_text(protocol::metadata_to_json(metadata), 2));
        core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    json entry;
    entry["ts_unix_ms"] = now_unix_ms();
    entry["model_id"] = model_id;
    entry["model_name"] = metadata.model_name;
    entry["script_path"] = script_path.string();
    entry["attempt"] = program.attempt;

    std::ofstream index(models_root_ / kIndexFile, std::ios::app);
    if (!index.is_open()) {
        return LabError{ErrorCategory::Storage, "Unable to open model index",
                        "model_index_open_failed"};
    }
    index << protocol::to_wire_text(entry) << "\n";
    if (!index.good()) {
        return LabError{ErrorCategory::Storage, "Unable to append to model index",
                        "model_index_write_failed"};
    }

    LOG_INFO("CandidateStore: persisted " + model_id + " -> " + script_path.string());
    return protocol::CandidateHandle{model_id, script_path, program.attempt};
}

core::errors::Result<protocol::CandidateProgram> CandidateStore::load(
    const std::string& model_id) const {
    auto dir = model_dir(model_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    auto source = read_file(core::errors::get_value(dir) / script_name_, "model_not_found");
    if (core::errors::is_error(source)) {
        return core::errors::get_error(source);
    }

    protocol::CandidateProgram program;
    program.source = core::errors::get_value(source);
    program.status = protocol::ValidationStatus::ExecutionVerified;
    return program;
}

core::errors::Result<protocol::ExperimentMetadata> CandidateStore::load_metadata(
    const std::string& model_id) const {
    auto dir = model_dir(model_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    auto text = read_file(core::errors::get_value(dir) / kMetadataFile, "metadata_not_found");
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    const json doc = json::parse(core::errors::get_value(text), nullptr, false);
    if (doc.is_discarded()) {
        return LabError{ErrorCategory::Storage, "Stored metadata is not valid JSON: " + model_id,
                        "corrupt_metadata"};
    }
    return protocol::metadata_from_json(doc);
}

core::errors::Result<protocol::CandidateHandle> CandidateStore::handle_for(
    const std::string& model_id) const {
    auto dir = model_dir(model_id);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    const auto script_path = core::errors::get_value(dir) / script_name_;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(script_path, ec)) {
        return LabError{ErrorCategory::Input, "Model has no script: " + model_id,
                        "model_not_found"};
    }
    return protocol::CandidateHandle{model_id, script_path, 0};
}

core::errors::Result<std::vector<std::string>> CandidateStore::list() const {
    std::vector<std::string> ids;
    std::ifstream in(models_root_ / kIndexFile);
    if (!in.is_open()) {
        return ids;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        const json entry = json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.contains("model_id") ||
            !entry.at("model_id").is_string()) {
            return LabError{ErrorCategory::Storage, "Model index contains a corrupt line",
                            "corrupt_model_index"};
        }
        ids.push_back(entry.at("model_id").get<std::string>());
    }
    return ids;
}

}  // namespace simlab::generation
