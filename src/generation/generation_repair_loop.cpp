#include "generation/generation_repair_loop.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "generation/code_normalizer.hpp"
#include "generation/prompts.hpp"
#include "generation/repair_feedback.hpp"

namespace simlab::generation {

using core::errors::ErrorCategory;
using core::errors::LabError;
using protocol::Message;
using protocol::Role;

namespace {

constexpr const char* kInitialInstruction =
    "Write the complete simulation program now. Return only Python source.";

}  // namespace

GenerationRepairLoop::GenerationRepairLoop(llm::ModelClient& model,
                                           const runtime::CodeExecutor& executor,
                                           const CandidateStore& store,
                                           GenerationOptions options)
    : model_(model),
      executor_(executor),
      store_(store),
      options_(std::move(options)),
      validator_(options_.entry_point, options_.parse_check) {}

core::errors::Result<protocol::CandidateHandle> GenerationRepairLoop::generate_verified(
    const protocol::ExperimentMetadata& metadata, const std::uint32_t max_attempts) {
    attempt_log_.clear();
    if (max_attempts == 0) {
        return LabError{ErrorCategory::Input, "max_attempts must be at least 1.",
                        "invalid_max_attempts"};
    }

    protocol::ModelRequest request;
    request.system = codegen_system_prompt(metadata, options_.entry_point);
    request.messages.push_back(Message{Role::User, kInitialInstruction, std::nullopt, std::nullopt});

    for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        LOG_INFO("GenerationRepairLoop: attempt " + std::to_string(attempt) + "/" +
                 std::to_string(max_attempts) + " for '" + metadata.model_name + "'");

        auto reply = model_.complete(request);
        if (core::errors::is_error(reply)) {
            const auto& err = core::errors::get_error(reply);
            LOG_WARN("GenerationRepairLoop: provider error on attempt " +
                     std::to_string(attempt) + ": " + err.message);
            attempt_log_.push_back(AttemptRecord{attempt, "provider_error", err.message});
            continue;
        }
        const std::string& raw = core::errors::get_value(reply).content;

        protocol::CandidateProgram candidate;
        candidate.source = normalize_candidate_source(raw);
        candidate.attempt = attempt;
        request.messages.push_back(Message{Role::Assistant, raw, std::nullopt, std::nullopt});

        auto structure = validator_.validate_structure(candidate.source);
        if (core::errors::is_error(structure)) {
            const auto& err = core::errors::get_error(structure);
            LOG_WARN("GenerationRepairLoop: attempt " + std::to_string(attempt) +
                     " rejected (" + err.code + "): " + err.message);
            attempt_log_.push_back(AttemptRecord{attempt, err.code, err.message});
            request.messages.push_back(Message{
                Role::User, validation_feedback(attempt, candidate.source, err), std::nullopt,
                std::nullopt});
            continue;
        }
        candidate.status = protocol::ValidationStatus::StructurallyValid;

        runtime::EntryPointRequest smoke;
        smoke.source = candidate.source;
        smoke.entry_point = options_.entry_point;
        smoke.params = nlohmann::json::object();
        smoke.timeout_ms = options_.smoke_timeout_ms;
        const auto result = executor_.invoke_entry_point(smoke);
        if (!result.ok) {
            const std::string kind = result.diagnostic.has_value()
                                         ? protocol::to_string(result.diagnostic->kind)
                                         : "runtime_error";
            const std::string detail =
                result.diagnostic.has_value() ? result.diagnostic->message : result.stderr_text;
            LOG_WARN("GenerationRepairLoop: smoke run failed on attempt " +
                     std::to_string(attempt) + " (" + kind + ")");
            attempt_log_.push_back(AttemptRecord{attempt, kind, detail});
            request.messages.push_back(
                Message{Role::User, runtime_feedback(attempt, result), std::nullopt, std::nullopt});
            continue;
        }
        candidate.status = protocol::ValidationStatus::ExecutionVerified;

        auto handle = store_.persist(candidate, metadata);
        if (core::errors::is_error(handle)) {
            return core::errors::get_error(handle);
        }
        attempt_log_.push_back(
            AttemptRecord{attempt, "verified", core::errors::get_value(handle).model_id});
        LOG_INFO("GenerationRepairLoop: verified on attempt " + std::to_string(attempt));
        return handle;
    }

    std::string last_failure;
    if (!attempt_log_.empty()) {
        last_failure = "Last failure (" + attempt_log_.back().outcome + "): " +
                       attempt_log_.back().detail;
    }
    return LabError{ErrorCategory::Execution,
                    "No verified candidate after " + std::to_string(max_attempts) + " attempts",
                    "exhausted_attempts", last_failure};
}

}  // namespace simlab::generation
