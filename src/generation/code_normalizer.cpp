#include "generation/code_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace simlab::generation {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_fence(const std::string& line) {
    const auto first = line.find_first_not_of(" \t");
    return first != std::string::npos && line.compare(first, 3, "```") == 0;
}

bool is_preamble(const std::string& line) {
    const std::string lowered = lowercase(line);
    return lowered.find("here is the code") != std::string::npos ||
           lowered.find("here's the code") != std::string::npos;
}

}  // namespace

std::string dedent(const std::string& text) {
    const auto lines = split_lines(text);
    std::string prefix;
    bool first = true;
    for (const auto& line : lines) {
        if (is_blank(line)) {
            continue;
        }
        const std::string indent = line.substr(0, line.find_first_not_of(" \t"));
        if (first) {
            prefix = indent;
            first = false;
            continue;
        }
        std::size_t shared = 0;
        while (shared < prefix.size() && shared < indent.size() &&
               prefix[shared] == indent[shared]) {
            ++shared;
        }
        prefix.resize(shared);
    }

    std::string out;
    for (const auto& line : lines) {
        out += is_blank(line) ? std::string() : line.substr(prefix.size());
        out += '\n';
    }
    return out;
}

std::string normalize_candidate_source(const std::string& raw) {
    std::string body = raw;
    const auto sentinel = body.find(kEndOfCodeSentinel);
    if (sentinel != std::string::npos) {
        body.erase(sentinel);
    }

    auto lines = split_lines(body);
    // With a fenced block present, only the body of the first one is code.
    const auto open_fence = std::find_if(lines.begin(), lines.end(), is_fence);
    if (open_fence != lines.end()) {
        const auto close_fence = std::find_if(open_fence + 1, lines.end(), is_fence);
        lines = std::vector<std::string>(open_fence + 1, close_fence);
    }

    std::vector<std::string> kept;
    bool seen_code = false;
    for (const auto& line : lines) {
        if (is_fence(line)) {
            continue;
        }
        if (!seen_code && is_preamble(line)) {
            continue;
        }
        if (!is_blank(line)) {
            seen_code = true;
        }
        kept.push_back(line);
    }

    std::string joined;
    for (const auto& line : kept) {
        joined += line;
        joined += '\n';
    }
    std::string source = dedent(joined);

    const auto first = source.find_first_not_of(" \t\n");
    if (first == std::string::npos) {
        return "\n";
    }
    // Keep the indentation of the first code line.
    const auto line_start = source.rfind('\n', first);
    source.erase(0, line_start == std::string::npos ? 0 : line_start + 1);

    const auto last = source.find_last_not_of(" \t\n");
    source.erase(last + 1);
    source += '\n';
    return source;
}

}  // namespace simlab::generation
