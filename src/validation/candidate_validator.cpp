#include "validation/candidate_validator.hpp"

#include <cctype>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "runtime/process_runner.hpp"

namespace simlab::validation {

using core::errors::ErrorCategory;
using core::errors::LabError;
using core::errors::SourceLocation;

namespace {

constexpr std::size_t kTabWidth = 8;

// Exit 0 when the file parses; otherwise exit 1 with the SyntaxError as one
// JSON line on stdout.
constexpr const char* kParseScript =
    "import ast, json, sys\n"
    "with open(sys.argv[1], encoding='utf-8', errors='replace') as f:\n"
    "    source = f.read()\n"
    "try:\n"
    "    ast.parse(source, sys.argv[1])\n"
    "except (SyntaxError, ValueError) as e:\n"
    "    print(json.dumps({'line': getattr(e, 'lineno', None) or 1,\n"
    "                      'column': getattr(e, 'offset', None) or 1,\n"
    "                      'message': getattr(e, 'msg', None) or str(e)}))\n"
    "    sys.exit(1)\n";

bool is_ident_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\f");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\f");
    return text.substr(first, last - first + 1);
}

LabError syntax_error(std::string message, const std::size_t line, const std::size_t column) {
    return LabError{ErrorCategory::Validation, std::move(message), "syntax_error",
                    "Fix the reported line; the candidate must be valid Python.",
                    SourceLocation{line, column}};
}

// Physical lines with string literals collapsed to "" and comments removed.
// `continuation[n]` is true when line n belongs to the logical line started
// above it (open bracket, backslash, or a string spanning lines).
class Scanner {
public:
    explicit Scanner(const std::string& source) : src_(source) {
        sanitized_.resize(2);
        continuation_.resize(2, false);
    }

    std::optional<LabError> run() {
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') {
                    advance();
                }
                continue;
            }
            if (c == '\'' || c == '"') {
                if (auto err = scan_string()) {
                    return err;
                }
                continue;
            }
            if (c == '\\' && peek(1) == '\n') {
                advance();
                mark_continuation();
                advance();
                emit(' ');
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                open_.push_back(Open{c, line_, col_});
                emit(c);
                advance();
                continue;
            }
            if (c == ')' || c == ']' || c == '}') {
                if (open_.empty()) {
                    return syntax_error(std::string("unmatched '") + c + "'", line_, col_);
                }
                const Open opener = open_.back();
                if (opener.ch != opening_for(c)) {
                    return syntax_error(std::string("closing parenthesis '") + c +
                                            "' does not match opening parenthesis '" +
                                            opener.ch + "' on line " +
                                            std::to_string(opener.line),
                                        line_, col_);
                }
                open_.pop_back();
                emit(c);
                advance();
                continue;
            }
            if (c == '\n') {
                if (!open_.empty()) {
                    mark_continuation();
                }
                advance();
                continue;
            }
            emit(c);
            advance();
        }

        if (!open_.empty()) {
            const Open& opener = open_.back();
            return syntax_error(std::string("'") + opener.ch + "' was never closed",
                                opener.line, opener.col);
        }
        return std::nullopt;
    }

    std::size_t line_count() const { return line_; }
    const std::vector<std::string>& sanitized() const { return sanitized_; }
    const std::vector<bool>& continuation() const { return continuation_; }

private:
    struct Open {
        char ch;
        std::size_t line;
        std::size_t col;
    };

    static char opening_for(const char closer) {
        switch (closer) {
            case ')': return '(';
            case ']': return '[';
            default:  return '{';
        }
    }

    char peek(const std::size_t offset) const {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    void advance() {
        if (src_[pos_] == '\n') {
            ++line_;
            col_ = 1;
            if (sanitized_.size() <= line_ + 1) {
                sanitized_.resize(line_ + 2);
                continuation_.resize(line_ + 2, false);
            }
        } else {
            ++col_;
        }
        ++pos_;
    }

    void emit(const char c) { sanitized_[line_].push_back(c); }

    void mark_continuation() { continuation_[line_ + 1] = true; }

    std::optional<LabError> scan_string() {
        const char quote = src_[pos_];
        const std::size_t start_line = line_;
        const std::size_t start_col = col_;
        const bool triple = peek(1) == quote && peek(2) == quote;
        for (int i = 0; i < (triple ? 3 : 1); ++i) {
            advance();
        }

        while (true) {
            if (pos_ >= src_.size()) {
                if (triple) {
                    return syntax_error("unterminated triple-quoted string literal (detected at line " +
                                            std::to_string(line_) + ")",
                                        start_line, start_col);
                }
                return syntax_error("unterminated string literal (detected at line " +
                                        std::to_string(start_line) + ")",
                                    start_line, start_col);
            }

            const char ch = src_[pos_];
            if (ch == '\\') {
                advance();
                if (pos_ < src_.size()) {
                    if (src_[pos_] == '\n') {
                        mark_continuation();
                    }
                    advance();
                }
                continue;
            }
            if (ch == '\n') {
                if (!triple) {
                    return syntax_error("unterminated string literal (detected at line " +
                                            std::to_string(start_line) + ")",
                                        start_line, start_col);
                }
                mark_continuation();
            }
            if (ch == quote) {
                if (!triple) {
                    advance();
                    break;
                }
                if (peek(1) == quote && peek(2) == quote) {
                    advance();
                    advance();
                    advance();
                    break;
                }
            }
            advance();
        }

        // The literal lands on the line where it opened.
        sanitized_[start_line] += "\"\"";
        return std::nullopt;
    }

    const std::string& src_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t col_ = 1;
    std::vector<std::string> sanitized_;
    std::vector<bool> continuation_;
    std::vector<Open> open_;
};

struct LogicalLine {
    std::size_t line;
    std::size_t indent;
    std::string text;
};

std::size_t measure_indent(const std::string& text) {
    std::size_t width = 0;
    for (const char c : text) {
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / kTabWidth + 1) * kTabWidth;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
    }
    return width;
}

std::vector<LogicalLine> build_logical_lines(const Scanner& scanner) {
    std::vector<LogicalLine> lines;
    const auto& sanitized = scanner.sanitized();
    const auto& continuation = scanner.continuation();
    for (std::size_t n = 1; n <= scanner.line_count() && n < sanitized.size(); ++n) {
        if (continuation[n] && !lines.empty()) {
            lines.back().text += " " + trim(sanitized[n]);
            continue;
        }
        const std::string text = trim(sanitized[n]);
        if (text.empty()) {
            continue;
        }
        lines.push_back(LogicalLine{n, measure_indent(sanitized[n]), text});
    }
    return lines;
}

std::string first_word(const std::string& text) {
    std::size_t end = 0;
    while (end < text.size() && is_ident_char(text[end])) {
        ++end;
    }
    return text.substr(0, end);
}

bool opens_block(const LogicalLine& line) {
    static const char* const kCompound[] = {"def",    "class", "if",      "elif", "else",
                                            "for",    "while", "try",     "except",
                                            "finally", "with", "async",   "match", "case"};
    if (line.text.empty() || line.text.back() != ':') {
        return false;
    }
    const std::string word = first_word(line.text);
    for (const char* keyword : kCompound) {
        if (word == keyword) {
            return true;
        }
    }
    return false;
}

std::optional<LabError> check_indentation(const std::vector<LogicalLine>& lines) {
    std::vector<std::size_t> stack{0};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const LogicalLine& current = lines[i];
        if (i > 0 && opens_block(lines[i - 1])) {
            if (current.indent <= stack.back()) {
                return syntax_error("expected an indented block after '" +
                                        first_word(lines[i - 1].text) +
                                        "' statement on line " +
                                        std::to_string(lines[i - 1].line),
                                    current.line, current.indent + 1);
            }
            stack.push_back(current.indent);
            continue;
        }
        if (current.indent > stack.back()) {
            return syntax_error("unexpected indent", current.line, current.indent + 1);
        }
        while (current.indent < stack.back()) {
            stack.pop_back();
        }
        if (current.indent != stack.back()) {
            return syntax_error("unindent does not match any outer indentation level",
                                current.line, current.indent + 1);
        }
    }
    if (!lines.empty() && opens_block(lines.back())) {
        return syntax_error("expected an indented block after '" +
                                first_word(lines.back().text) + "' statement on line " +
                                std::to_string(lines.back().line),
                            lines.back().line, lines.back().indent + lines.back().text.size());
    }
    return std::nullopt;
}

struct DefHeader {
    std::string name;
    std::vector<std::string> parameters;
    std::string inline_body;  // "return x" in "def f(x): return x"
};

// Splits "def name(a, b=1, **kw) -> T:" into its parts. Returns nullopt
// when the header is malformed.
std::optional<DefHeader> parse_def_header(const std::string& text) {
    std::size_t pos = 3;
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
        ++pos;
    }
    const std::size_t name_start = pos;
    while (pos < text.size() && is_ident_char(text[pos])) {
        ++pos;
    }
    if (pos == name_start) {
        return std::nullopt;
    }
    std::string name = text.substr(name_start, pos - name_start);
    while (pos < text.size() && text[pos] == ' ') {
        ++pos;
    }
    if (pos >= text.size() || text[pos] != '(') {
        return std::nullopt;
    }

    std::vector<std::string> params;
    std::string current;
    int depth = 0;
    ++pos;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth == 0) {
                break;
            }
            --depth;
        } else if (c == ',' && depth == 0) {
            params.push_back(trim(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }
    if (!trim(current).empty()) {
        params.push_back(trim(current));
    }

    const std::string tail = trim(text.substr(pos + 1));
    std::size_t colon = std::string::npos;
    if (tail.rfind(":", 0) == 0) {
        colon = 0;
    } else if (tail.rfind("->", 0) == 0) {
        colon = tail.find(':');
    }
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    std::vector<std::string> names;
    for (const auto& param : params) {
        if (param.empty()) {
            continue;
        }
        std::size_t end = 0;
        while (end < param.size() && (param[end] == '*' || is_ident_char(param[end]) ||
                                      param[end] == '/')) {
            ++end;
        }
        names.push_back(param.substr(0, end));
    }
    return DefHeader{std::move(name), std::move(names), trim(tail.substr(colon + 1))};
}

bool returns_value(const std::string& text) {
    if (text.rfind("return", 0) != 0 || text.size() <= 6 || is_ident_char(text[6])) {
        return false;
    }
    return !trim(text.substr(6)).empty();
}

}  // namespace

CandidateValidator::CandidateValidator(std::string entry_point, ParseCheckOptions parse_check)
    : entry_point_(std::move(entry_point)), parse_check_(std::move(parse_check)) {}

std::optional<LabError> CandidateValidator::parse_check(const std::string& source) const {
    if (parse_check_.interpreter.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    std::filesystem::create_directories(parse_check_.scratch_root, ec);
    const auto source_file = parse_check_.scratch_root /
                             ("parse-" + core::config::generate_unique_hex() + ".py");
    {
        std::ofstream out(source_file, std::ios::binary | std::ios::trunc);
        out << source;
        if (!out.good()) {
            LOG_WARN("CandidateValidator: unable to stage " + source_file.string() +
                     ", skipping interpreter parse");
            return std::nullopt;
        }
    }

    runtime::ProcessRequest process;
    process.argv = parse_check_.interpreter;
    process.argv.push_back("-c");
    process.argv.push_back(kParseScript);
    process.argv.push_back(source_file.string());
    process.working_directory = parse_check_.scratch_root;
    process.timeout_ms = parse_check_.timeout_ms;
    auto capture_result = runtime::run_process(process);
    std::filesystem::remove(source_file, ec);

    if (core::errors::is_error(capture_result)) {
        LOG_WARN("CandidateValidator: interpreter parse unavailable: " +
                 core::errors::get_error(capture_result).message);
        return std::nullopt;
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.exit_code == 0 && !capture.timed_out) {
        return std::nullopt;
    }

    const auto doc = nlohmann::json::parse(capture.stdout_text, nullptr, false);
    if (capture.exit_code != 1 || doc.is_discarded() || !doc.is_object()) {
        LOG_WARN("CandidateValidator: interpreter parse failed to run (exit " +
                 std::to_string(capture.exit_code) + "), keeping scanner verdict");
        return std::nullopt;
    }
    const auto line = doc.value("line", std::size_t{1});
    const auto column = doc.value("column", std::size_t{1});
    return syntax_error(doc.value("message", std::string("invalid syntax")), line, column);
}

core::errors::Result<CandidateStructure> CandidateValidator::validate_structure(
    const std::string& source) const {
    std::string normalized;
    normalized.reserve(source.size());
    for (std::size_t i = 0; i < source.size(); ++i) {
        if (source[i] == '\r' && i + 1 < source.size() && source[i + 1] == '\n') {
            continue;
        }
        normalized.push_back(source[i]);
    }

    Scanner scanner(normalized);
    if (auto err = scanner.run()) {
        return *err;
    }

    const auto lines = build_logical_lines(scanner);
    for (const auto& current : lines) {
        if (first_word(current.text) == "def" && !parse_def_header(current.text).has_value()) {
            return syntax_error("invalid function header, expected 'def name(...):'",
                                current.line, current.indent + 1);
        }
    }
    if (auto err = check_indentation(lines)) {
        return *err;
    }
    if (auto err = parse_check(normalized)) {
        return *err;
    }

    CandidateStructure structure;
    structure.line_count = scanner.line_count();
    std::optional<std::size_t> entry_index;
    std::string inline_body;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const LogicalLine& current = lines[i];
        if (first_word(current.text) != "def") {
            continue;
        }
        const auto header = parse_def_header(current.text);
        if (!header.has_value() || current.indent != 0) {
            continue;
        }
        structure.top_level_functions.push_back(header->name);
        if (header->name == entry_point_ && !entry_index.has_value()) {
            entry_index = i;
            inline_body = header->inline_body;
            structure.entry_point.name = header->name;
            structure.entry_point.line = current.line;
            structure.entry_point.parameters = header->parameters;
            for (const auto& param : header->parameters) {
                if (param.rfind("**", 0) == 0 && param.size() > 2) {
                    structure.entry_point.has_keyword_bag = true;
                }
            }
        }
    }

    if (!entry_index.has_value()) {
        return LabError{ErrorCategory::Validation,
                        "Missing required top-level function '" + entry_point_ + "'",
                        "missing_entry_point",
                        "Define `def " + entry_point_ + "(**params):` returning a dict."};
    }
    if (!structure.entry_point.has_keyword_bag) {
        return LabError{ErrorCategory::Validation,
                        "Function '" + entry_point_ + "' must accept a keyword parameter bag",
                        "missing_entry_point",
                        "Declare it as `def " + entry_point_ + "(**params):`.",
                        SourceLocation{structure.entry_point.line, 1}};
    }

    bool has_return = returns_value(inline_body);
    for (std::size_t i = entry_index.value() + 1; i < lines.size() && lines[i].indent > 0; ++i) {
        if (returns_value(lines[i].text)) {
            has_return = true;
            break;
        }
    }
    if (!has_return) {
        return LabError{ErrorCategory::Validation,
                        "Function '" + entry_point_ + "' never returns a record",
                        "entry_point_without_return",
                        "End the function with `return {...}`.",
                        SourceLocation{structure.entry_point.line, 1}};
    }

    return structure;
}

}  // namespace simlab::validation
