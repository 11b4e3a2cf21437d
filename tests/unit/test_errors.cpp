#include <gtest/gtest.h>
#include "core/errors/lab_errors.hpp"

using namespace simlab::core::errors;

// A dummy function to simulate a failing dataset read
Result<std::string> simulate_read_file(bool should_fail) {
    if (should_fail) {
        return LabError{ErrorCategory::Storage, "File not found", "dataset_not_found"};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_file(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_file(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Storage);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.code, "dataset_not_found");
    EXPECT_FALSE(error.location.has_value());
}

TEST(ErrorModelTest, CarriesSourceLocation) {
    Result<int> result = LabError{ErrorCategory::Validation, "unterminated string literal",
                                  "syntax_error", "", SourceLocation{3, 9}};
    ASSERT_TRUE(is_error(result));
    ASSERT_TRUE(get_error(result).location.has_value());
    EXPECT_EQ(get_error(result).location->line, 3u);
    EXPECT_EQ(get_error(result).location->column, 9u);
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Provider), "provider");
    EXPECT_EQ(to_string(ErrorCategory::Storage), "storage");
}
