#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "renewfolio/core/error.hpp"

using namespace renewfolio;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::INFEASIBLE_CONSTRAINTS, "bounds sum to 1.2", "Optimizer");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INFEASIBLE_CONSTRAINTS);
    EXPECT_STREQ(error_result.error()->what(), "bounds sum to 1.2");
    EXPECT_EQ(error_result.error()->component(), "Optimizer");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in Optimizer: bounds sum to 1.2 (INFEASIBLE_CONSTRAINTS)");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<double>(ErrorCode::MODEL_FIT_ERROR, "no convergence", "GARCH");
    EXPECT_THROW(error_result.value(), RenewfolioError);

    auto void_error = make_error<void>(ErrorCode::INVALID_DATA, "gap", "TimeSeries");
    EXPECT_THROW(void_error.value(), RenewfolioError);
}

TEST_F(ResultTest, ForwardErrorKeepsDetails) {
    auto original = make_error<int>(ErrorCode::SERIES_MISMATCH, "lengths differ", "Backtest");
    auto forwarded = forward_error<std::string>(original.error());

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::SERIES_MISMATCH);
    EXPECT_STREQ(forwarded.error()->what(), "lengths differ");
    EXPECT_EQ(forwarded.error()->component(), "Backtest");
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));
    Result<std::unique_ptr<int>> moved = std::move(result);

    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(*moved.value(), 42);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());
    EXPECT_NO_THROW(success.value());
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::CONFIGURATION_ERROR), "CONFIGURATION_ERROR");
    EXPECT_EQ(error_code_to_string(ErrorCode::INSUFFICIENT_DATA), "INSUFFICIENT_DATA");
    EXPECT_EQ(error_code_to_string(ErrorCode::JSON_PARSE_ERROR), "JSON_PARSE_ERROR");
}
