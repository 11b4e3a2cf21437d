#include <string>
#include <gtest/gtest.h>
#include "generation/repair_feedback.hpp"

namespace {

using simlab::core::errors::ErrorCategory;
using simlab::core::errors::LabError;
using simlab::core::errors::SourceLocation;
using simlab::generation::runtime_feedback;
using simlab::generation::syntax_context;
using simlab::generation::validation_feedback;
using simlab::protocol::Diagnostic;
using simlab::protocol::DiagnosticKind;
using simlab::protocol::ExecutionResult;

const char* kSixLines = "a\nb\nc\nd\ne\nf\n";

TEST(RepairFeedbackTest, ContextMarksFailingLineWithNeighbours) {
    EXPECT_EQ(syntax_context(kSixLines, 3),
              "     1: a\n"
              "     2: b\n"
              "→    3: c\n"
              "     4: d\n"
              "     5: e");
}

TEST(RepairFeedbackTest, ContextClampsAtSourceEdges) {
    EXPECT_EQ(syntax_context(kSixLines, 1), "→    1: a\n     2: b\n     3: c");
    EXPECT_EQ(syntax_context(kSixLines, 40), "     4: d\n     5: e\n→    6: f");
    EXPECT_EQ(syntax_context("", 1), "");
}

TEST(RepairFeedbackTest, SyntaxFeedbackEmbedsMessageLineAndContext) {
    const std::string source =
        "import math\n"
        "def simulate(**params):\n"
        "    label = 'pendulum\n"
        "    return {\"period\": 2.0}\n";
    const LabError err{ErrorCategory::Validation,
                       "unterminated string literal (detected at line 3)", "syntax_error", "",
                       SourceLocation{3, 13}};

    const std::string feedback = validation_feedback(1, source, err);
    EXPECT_EQ(feedback.rfind("Attempt 1: SyntaxError `unterminated string literal "
                             "(detected at line 3)` at line 3\n",
                             0),
              0u);
    EXPECT_NE(feedback.find("Context:\n"), std::string::npos);
    EXPECT_NE(feedback.find("→    3:     label = 'pendulum"), std::string::npos);
    EXPECT_NE(feedback.find("     1: import math"), std::string::npos);
    EXPECT_NE(feedback.find("Please correct the code and return only the updated Python."),
              std::string::npos);
}

TEST(RepairFeedbackTest, StructuralFeedbackCarriesHint) {
    const LabError err{ErrorCategory::Validation, "Missing required top-level function 'simulate'",
                       "missing_entry_point", "Define `def simulate(**params):` returning a dict."};

    const std::string feedback = validation_feedback(2, "x = 1\n", err);
    EXPECT_NE(feedback.find("Attempt 2: ValidationError `Missing required top-level function "
                            "'simulate'`"),
              std::string::npos);
    EXPECT_NE(feedback.find("Define `def simulate(**params):`"), std::string::npos);
    EXPECT_EQ(feedback.find("Context:"), std::string::npos);
}

TEST(RepairFeedbackTest, RuntimeFeedbackQuotesLastLineAndTail) {
    std::string traceback = "Traceback (most recent call last):\n";
    for (int i = 10; i < 40; ++i) {
        traceback += "  frame " + std::to_string(i) + "\n";
    }
    traceback += "ZeroDivisionError: division by zero\n";

    ExecutionResult result;
    result.ok = false;
    result.stderr_text = traceback;
    result.diagnostic = Diagnostic{DiagnosticKind::RuntimeError, traceback};

    const std::string feedback = runtime_feedback(3, result);
    EXPECT_EQ(feedback.rfind("Attempt 3: runtime_error `ZeroDivisionError: division by zero`", 0),
              0u);
    EXPECT_NE(feedback.find("Traceback (last 25 lines):"), std::string::npos);
    EXPECT_NE(feedback.find("frame 39"), std::string::npos);
    EXPECT_NE(feedback.find("frame 16"), std::string::npos);
    EXPECT_EQ(feedback.find("frame 15"), std::string::npos);
}

TEST(RepairFeedbackTest, RuntimeFeedbackNamesTimeouts) {
    ExecutionResult result;
    result.diagnostic = Diagnostic{DiagnosticKind::Timeout, "Execution exceeded 30000 ms and was killed."};

    const std::string feedback = runtime_feedback(1, result);
    EXPECT_NE(feedback.find("timeout `Execution exceeded 30000 ms and was killed.`"),
              std::string::npos);
}

}  // namespace
