//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace dsv {

    TEST(ErrorTest, BasicConstruction) {
        const Error error(ErrorCode::InvalidArgument, "unknown option");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "unknown option");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConstructionWithContext) {
        const Error error(ErrorCode::NotFound, "Manifest not found", "/repo/package.json");

        EXPECT_EQ(error.code(), ErrorCode::NotFound);
        EXPECT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "/repo/package.json");
    }

    TEST(ErrorTest, Factories) {
        EXPECT_EQ(Error::invalid_argument("x").code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(Error::not_found("x").code(), ErrorCode::NotFound);
        EXPECT_EQ(Error::parse_error("x", "src/a.js").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::io_error("x").code(), ErrorCode::IoError);
        EXPECT_EQ(Error::config_error("x", "[performance]").context().value(), "[performance]");
        EXPECT_EQ(Error::analysis_error("x").code(), ErrorCode::AnalysisError);
        EXPECT_EQ(Error::internal_error("x").code(), ErrorCode::InternalError);
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto error = Error::parse_error("Unterminated string literal");
        const auto with_line = error.with_context("line 3");
        EXPECT_EQ(with_line.context().value(), "line 3");

        const auto with_file = with_line.with_context("src/index.js");
        EXPECT_EQ(with_file.context().value(), "line 3; src/index.js");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ToString) {
        EXPECT_EQ(Error::parse_error("invalid syntax").to_string(), "[ParseError] invalid syntax");
        EXPECT_EQ(Error::io_error("open failed", "/tmp/a.js").to_string(),
                  "[IoError] open failed (context: /tmp/a.js)");
    }

    TEST(ErrorTest, StreamOutput) {
        std::ostringstream oss;
        oss << Error::not_found("missing", "key") << " " << ErrorCode::ConfigError;
        EXPECT_EQ(oss.str(), "[NotFound] missing (context: key) ConfigError");
    }

    TEST(ErrorTest, ErrorCodeToString) {
        EXPECT_STREQ(error_code_to_string(ErrorCode::None), "None");
        EXPECT_STREQ(error_code_to_string(ErrorCode::InvalidArgument), "InvalidArgument");
        EXPECT_STREQ(error_code_to_string(ErrorCode::NotFound), "NotFound");
        EXPECT_STREQ(error_code_to_string(ErrorCode::ParseError), "ParseError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::IoError), "IoError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::ConfigError), "ConfigError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::AnalysisError), "AnalysisError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::InternalError), "InternalError");
    }

    TEST(ErrorTest, Equality) {
        const auto e1 = Error::not_found("missing", "key");
        const auto e2 = Error::not_found("missing", "key");
        const auto e3 = Error::not_found("missing", "other");
        const auto e4 = Error::io_error("missing", "key");

        EXPECT_EQ(e1, e2);
        EXPECT_NE(e1, e3);
        EXPECT_NE(e1, e4);
    }

}  // namespace dsv
