#include "specir/core/result.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>

using namespace specir;

TEST(Result, HasValueSuccess) {
    result<int> r = 42;
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, HasValueError) {
    result<int> r = std::unexpected(make_error_code(error_code::missing_paths_section));
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(error_code::missing_paths_section));
}

TEST(Result, MoveOutValue) {
    result<std::string> r = std::string("spec");
    auto moved = std::move(r).value();
    EXPECT_EQ(moved, "spec");
}

TEST(ErrorCode, CategoryName) {
    auto ec = make_error_code(error_code::openapi_parse_error);
    EXPECT_STREQ(ec.category().name(), "specir");
    EXPECT_EQ(ec.value(), 1);
}

TEST(ErrorCode, MessagesNameTheStructuralProblem) {
    EXPECT_EQ(make_error_code(error_code::ok).message(), "success");
    EXPECT_EQ(make_error_code(error_code::document_not_object).message(),
              "OpenAPI document root is not a mapping");
    EXPECT_EQ(make_error_code(error_code::missing_openapi_field).message(),
              "missing 'openapi' field in the specification");
    EXPECT_EQ(make_error_code(error_code::missing_paths_section).message(),
              "missing 'paths' section in the specification");
    EXPECT_EQ(make_error_code(error_code::file_read_error).message(),
              "failed to read specification file");
}

TEST(ErrorCode, ImplicitConversionFromEnum) {
    std::error_code ec = error_code::file_read_error;
    EXPECT_EQ(ec, make_error_code(error_code::file_read_error));
    EXPECT_NE(ec, make_error_code(error_code::openapi_parse_error));
}

TEST(ErrorCode, UnknownValue) {
    std::error_code ec(999, get_error_category());
    EXPECT_EQ(ec.message(), "unknown error");
}
