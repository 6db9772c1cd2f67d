// =============================================================================
// rarity-core - Error Handling Tests
// =============================================================================
// Unit tests for error codes, error context formatting, the exception
// hierarchy and Result<T> helpers.
// =============================================================================

#include "rarity/common/error.h"

#include <gtest/gtest.h>

#include <string>

namespace rarity {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesMatchEnumValues) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kEmptyCollection), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kDataError), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kDegenerateCategory), 6);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidState), 7);
}

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kEmptyCollection), "empty collection");
    EXPECT_EQ(errorCodeToString(ErrorCode::kDataError), "data error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kDegenerateCategory), "degenerate category");
}

// =============================================================================
// ErrorContext Tests
// =============================================================================

TEST(ErrorContextTest, EmptyContextFormatsToEmptyString) {
    ErrorContext context;
    EXPECT_TRUE(context.format().empty());
}

TEST(ErrorContextTest, ChainedSetters) {
    ErrorContext context;
    context.withItem("42").withCategory("Color").withFile("punks.tsv").withLine(7);

    const std::string text = context.format();
    EXPECT_NE(text.find("item: 42"), std::string::npos);
    EXPECT_NE(text.find("category: \"Color\""), std::string::npos);
    EXPECT_NE(text.find("file: punks.tsv"), std::string::npos);
    EXPECT_NE(text.find("line: 7"), std::string::npos);
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(RarityExceptionTest, WhatIncludesCodeMessageAndContext) {
    DataError error("category listed twice", ErrorContext{}.withItem("7").withCategory("Hat"));

    EXPECT_EQ(error.code(), ErrorCode::kDataError);
    EXPECT_EQ(error.exitCode(), 5);
    EXPECT_EQ(error.message(), "category listed twice");
    EXPECT_TRUE(error.hasContext());

    const std::string what = error.what();
    EXPECT_NE(what.find("[data error]"), std::string::npos);
    EXPECT_NE(what.find("category listed twice"), std::string::npos);
    EXPECT_NE(what.find("item: 7"), std::string::npos);
}

// =============================================================================
// Error / Result Tests
// =============================================================================

TEST(ErrorTest, ThrowExceptionUsesMatchingType) {
    Error empty(ErrorCode::kEmptyCollection, "no items");
    EXPECT_THROW(empty.throwException(), EmptyCollectionError);

    Error degenerate(ErrorCode::kDegenerateCategory, "unknown value");
    EXPECT_THROW(degenerate.throwException(), DegenerateCategoryError);

    Error format(ErrorCode::kFormatError, "bad line");
    EXPECT_THROW(format.throwException(), FormatError);
}

TEST(ErrorTest, ToExceptionKeepsCodeAndContext) {
    Error error(ErrorCode::kDataError, "duplicate id", ErrorContext{}.withItem("3"));
    RarityException ex = error.toException();

    EXPECT_EQ(ex.code(), ErrorCode::kDataError);
    ASSERT_TRUE(ex.context().has_value());
    EXPECT_EQ(ex.context()->itemId, "3");
}

TEST(ErrorTest, DescribeMatchesWhat) {
    Error error(ErrorCode::kDataError, "duplicate id", ErrorContext{}.withItem("3"));
    DataError ex("duplicate id", ErrorContext{}.withItem("3"));
    EXPECT_EQ(error.describe(), std::string(ex.what()));
}

TEST(ResultTest, UnwrapOrThrow) {
    Result<int> ok = 5;
    EXPECT_EQ(unwrapOrThrow(ok), 5);

    Result<int> failed = makeError<int>(ErrorCode::kDataError, "bad");
    EXPECT_THROW((void)unwrapOrThrow(failed), DataError);

    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kUsageError, "bad option")), UsageError);
}

}  // namespace
}  // namespace rarity
