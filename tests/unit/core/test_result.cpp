//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace dsv {

    TEST(ResultTest, SuccessConstruction) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
    }

    TEST(ResultTest, FailureConstruction) {
        auto result = Result<int, Error>::failure(Error::not_found("Manifest not found"));

        EXPECT_FALSE(result.is_ok());
        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST(ResultTest, WrongAlternativeThrows) {
        auto failure = Result<int, Error>::failure(Error::invalid_argument("bad arg"));
        EXPECT_THROW((void)failure.value(), std::logic_error);

        auto success = Result<int, Error>::success(10);
        EXPECT_THROW((void)success.error(), std::logic_error);
    }

    TEST(ResultTest, ValueOr) {
        const auto success = Result<int, Error>::success(42);
        const auto failure = Result<int, Error>::failure(Error::internal_error("oops"));

        EXPECT_EQ(success.value_or(0), 42);
        EXPECT_EQ(failure.value_or(0), 0);
    }

    TEST(ResultTest, MapAndChain) {
        const auto result = Result<int, Error>::success(10);
        auto mapped = result.map([](const int x) { return x * 2; });
        ASSERT_TRUE(mapped.is_ok());
        EXPECT_EQ(mapped.value(), 20);

        auto chained = result.and_then([](const int x) {
            return Result<std::string, Error>::success(std::to_string(x));
        });
        ASSERT_TRUE(chained.is_ok());
        EXPECT_EQ(chained.value(), "10");
    }

    TEST(ResultTest, ErrorsPassThroughMapAndChain) {
        const auto result = Result<int, Error>::failure(Error::parse_error("invalid"));

        auto mapped = result.map([](const int x) { return x * 2; });
        ASSERT_TRUE(mapped.is_err());
        EXPECT_EQ(mapped.error().code(), ErrorCode::ParseError);

        auto chained = result.and_then([](const int x) {
            return Result<std::string, Error>::success(std::to_string(x));
        });
        ASSERT_TRUE(chained.is_err());
        EXPECT_EQ(chained.error().code(), ErrorCode::ParseError);
    }

    TEST(ResultTest, OrElseRecovers) {
        const auto result = Result<int, Error>::failure(Error::not_found("missing"));
        auto recovered = result.or_else([](const Error&) {
            return Result<int, Error>::success(0);
        });

        ASSERT_TRUE(recovered.is_ok());
        EXPECT_EQ(recovered.value(), 0);
    }

    TEST(ResultTest, MoveOutOfRvalue) {
        auto result = Result<std::vector<std::string>, Error>::success({"a.js", "b.js"});
        const auto files = std::move(result).value();

        EXPECT_EQ(files.size(), 2u);
    }

    TEST(VoidResultTest, SuccessAndFailure) {
        const auto ok = Result<void, Error>::success();
        EXPECT_TRUE(ok.is_ok());

        const auto bad = Result<void, Error>::failure(Error::config_error("bad config"));
        ASSERT_TRUE(bad.is_err());
        EXPECT_EQ(bad.error().code(), ErrorCode::ConfigError);
    }

    TEST(VoidResultTest, AndThenRunsOnlyOnSuccess) {
        int counter = 0;
        auto step = [&counter]() {
            ++counter;
            return Result<void, Error>::success();
        };

        EXPECT_TRUE((Result<void, Error>::success().and_then(step).is_ok()));
        EXPECT_TRUE((Result<void, Error>::failure(Error::io_error("x")).and_then(step).is_err()));
        EXPECT_EQ(counter, 1);
    }

}  // namespace dsv
