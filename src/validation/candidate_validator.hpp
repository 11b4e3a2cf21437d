#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/lab_errors.hpp"

namespace simlab::validation {

struct EntryPointInfo {
    std::string name;
    std::size_t line = 0;
    std::vector<std::string> parameters;
    bool has_keyword_bag = false;
};

struct CandidateStructure {
    EntryPointInfo entry_point;
    std::vector<std::string> top_level_functions;
    std::size_t line_count = 0;
};

// Second pass after the scanner: the interpreter compiles the source with
// ast.parse (nothing is executed) and its SyntaxError position becomes the
// reported location. An empty `interpreter` disables the pass.
struct ParseCheckOptions {
    std::vector<std::string> interpreter;
    std::filesystem::path scratch_root = ".simlab/scratch";
    std::uint32_t timeout_ms = 10000;
};

// Static checks on a Python candidate before it is ever executed.
//
// The source is tokenized far enough to know where string literals,
// comments, brackets and logical lines are. That catches the syntax faults
// generated code actually shows (unterminated strings, unbalanced brackets,
// broken indentation, incomplete def headers) and reports them with a
// 1-based line/column under code "syntax_error". The entry point must then
// be a top-level `def <name>(..., **bag)` that returns a value; otherwise
// the error is "missing_entry_point" or "entry_point_without_return".
// Statement-level faults the scanner cannot see (`x = = 1`, stray prose)
// are left to the optional interpreter parse.
class CandidateValidator {
public:
    explicit CandidateValidator(std::string entry_point = "simulate",
                                ParseCheckOptions parse_check = {});

    core::errors::Result<CandidateStructure> validate_structure(
        const std::string& source) const;

    const std::string& entry_point() const { return entry_point_; }

private:
    std::optional<core::errors::LabError> parse_check(const std::string& source) const;

    std::string entry_point_;
    ParseCheckOptions parse_check_;
};

}  // namespace simlab::validation
