#pragma once

#include <string>

namespace simlab::generation {

inline constexpr const char* kEndOfCodeSentinel = "### END_OF_CODE";

// Turns a raw model reply into candidate source. When the reply holds a
// Markdown fence only the first fenced block is kept (an unclosed fence runs
// to the end); otherwise an introductory "here is the code" line is dropped.
// Anything after the END_OF_CODE sentinel goes, common indentation and
// leading blank lines are removed, and the text ends with one newline.
std::string normalize_candidate_source(const std::string& raw);

// Removes the whitespace prefix shared by all non-blank lines.
std::string dedent(const std::string& text);

}  // namespace simlab::generation
