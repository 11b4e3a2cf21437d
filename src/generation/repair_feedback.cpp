#include "generation/repair_feedback.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>
#include "runtime/isolation_executor.hpp"

namespace simlab::generation {

namespace {

constexpr const char* kRetryInstruction =
    "Please correct the code and return only the updated Python.";

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string last_non_blank_line(const std::string& text) {
    const auto lines = split_lines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->find_first_not_of(" \t\r") != std::string::npos) {
            return *it;
        }
    }
    return "<no output>";
}

}  // namespace

std::string syntax_context(const std::string& source, const std::size_t line,
                           const std::size_t radius) {
    const auto lines = split_lines(source);
    if (lines.empty()) {
        return "";
    }
    const std::size_t target = std::clamp<std::size_t>(line, 1, lines.size());
    const std::size_t first = target > radius ? target - radius : 1;
    const std::size_t last = std::min(lines.size(), target + radius);

    std::ostringstream out;
    for (std::size_t i = first; i <= last; ++i) {
        out << (i == target ? "→" : " ") << ' ' << std::setw(4) << i << ": " << lines[i - 1];
        if (i != last) {
            out << '\n';
        }
    }
    return out.str();
}

std::string validation_feedback(const std::uint32_t attempt, const std::string& source,
                                const core::errors::LabError& error) {
    std::ostringstream out;
    if (error.code == "syntax_error" && error.location.has_value()) {
        out << "Attempt " << attempt << ": SyntaxError `" << error.message << "` at line "
            << error.location->line << "\n"
            << "Context:\n"
            << syntax_context(source, error.location->line) << "\n\n";
    } else {
        out << "Attempt " << attempt << ": ValidationError `" << error.message << "`\n";
        if (!error.hint.empty()) {
            out << error.hint << "\n";
        }
        out << "\n";
    }
    out << kRetryInstruction;
    return out.str();
}

std::string runtime_feedback(const std::uint32_t attempt, const protocol::ExecutionResult& result) {
    std::string kind = "RuntimeError";
    std::string detail = result.stderr_text;
    if (result.diagnostic.has_value()) {
        kind = protocol::to_string(result.diagnostic->kind);
        if (!result.diagnostic->message.empty()) {
            detail = result.diagnostic->message;
        }
    }

    std::ostringstream out;
    out << "Attempt " << attempt << ": " << kind << " `" << last_non_blank_line(detail) << "`\n"
        << "Traceback (last " << kRuntimeTailLines << " lines):\n"
        << runtime::tail_lines(detail, kRuntimeTailLines) << "\n\n"
        << "Please fix the code and return only the updated Python.";
    return out.str();
}

}  // namespace simlab::generation
