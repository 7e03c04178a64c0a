/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <util.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ============================================================================
// StringSplit
// ============================================================================

TEST(StringSplit, BasicSplit)
{
    auto result = StringSplit("a:b:c", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
}

TEST(StringSplit, MultiCharDelimiter)
{
    auto result = StringSplit("one::two::three", "::");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "one");
    EXPECT_EQ(result[1], "two");
    EXPECT_EQ(result[2], "three");
}

TEST(StringSplit, NoDelimiterFound)
{
    auto result = StringSplit("nodelimiter", ":");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "nodelimiter");
}

TEST(StringSplit, EmptyString)
{
    auto result = StringSplit("", ":");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "");
}

TEST(StringSplit, TrailingDelimiter)
{
    auto result = StringSplit("a:b:", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "");
}

TEST(StringSplit, LeadingDelimiter)
{
    auto result = StringSplit(":a:b", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "");
    EXPECT_EQ(result[1], "a");
    EXPECT_EQ(result[2], "b");
}

TEST(StringSplit, ConsecutiveDelimiters)
{
    auto result = StringSplit("a::b", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "");
    EXPECT_EQ(result[2], "b");
}

// ============================================================================
// TrimString
// ============================================================================

TEST(TrimString, WhitespaceTrimming)
{
    EXPECT_EQ(TrimString("  hello  "), "hello");
    EXPECT_EQ(TrimString("\t\nhello\r\n"), "hello");
}

TEST(TrimString, NoTrimmingNeeded)
{
    EXPECT_EQ(TrimString("hello"), "hello");
}

TEST(TrimString, CustomPattern)
{
    EXPECT_EQ(TrimString("xxhelloxx", "x"), "hello");
}

TEST(TrimString, EmptyString)
{
    EXPECT_EQ(TrimString(""), "");
}

TEST(TrimString, AllWhitespace)
{
    EXPECT_EQ(TrimString("   \t\n  "), "");
}

TEST(TrimString, InternalWhitespacePreserved)
{
    EXPECT_EQ(TrimString("  hello world  "), "hello world");
}

// ============================================================================
// StripQuotes
// ============================================================================

TEST(StripQuotes, DoubleQuotes)
{
    EXPECT_EQ(StripQuotes("\"hello\""), "hello");
}

TEST(StripQuotes, SingleQuotes)
{
    EXPECT_EQ(StripQuotes("'hello'"), "hello");
}

TEST(StripQuotes, MixedQuotes)
{
    EXPECT_EQ(StripQuotes("\"hello'"), "hello");
    EXPECT_EQ(StripQuotes("'hello\""), "hello");
}

TEST(StripQuotes, NoQuotes)
{
    EXPECT_EQ(StripQuotes("hello"), "hello");
}

TEST(StripQuotes, EmptyString)
{
    EXPECT_EQ(StripQuotes(""), "");
}

TEST(StripQuotes, QuotesOnly)
{
    EXPECT_EQ(StripQuotes("\"\""), "");
    EXPECT_EQ(StripQuotes("''"), "");
}

TEST(StripQuotes, SingleCharacterQuote)
{
    EXPECT_EQ(StripQuotes("\""), "");
    EXPECT_EQ(StripQuotes("'"), "");
}

// ============================================================================
// ToLower
// ============================================================================

TEST(ToLower, CharUppercase)
{
    EXPECT_EQ(ToLower(std::string("A")), "a");
    EXPECT_EQ(ToLower(std::string("Z")), "z");
}

TEST(ToLower, CharLowercase)
{
    EXPECT_EQ(ToLower(std::string("a")), "a");
}

TEST(ToLower, CharNonAlpha)
{
    EXPECT_EQ(ToLower(std::string("1")), "1");
    EXPECT_EQ(ToLower(std::string("!")), "!");
}

TEST(ToLower, StringMixedCase)
{
    EXPECT_EQ(ToLower(std::string("Hello World")), "hello world");
}

TEST(ToLower, StringEmpty)
{
    EXPECT_EQ(ToLower(std::string("")), "");
}

TEST(ToLower, StringAllUpper)
{
    EXPECT_EQ(ToLower(std::string("ABCXYZ")), "abcxyz");
}

// ============================================================================
// GetUnixEpochTime
// ============================================================================

TEST(GetUnixEpochTime, ReasonableValue)
{
    int64_t now = GetUnixEpochTime();

    // Must be after 2024-01-01 (1704067200)
    EXPECT_GT(now, 1704067200);

    // Must not be more than 1 second in the future relative to a second call
    int64_t now2 = GetUnixEpochTime();
    EXPECT_LE(now, now2 + 1);
}

// ============================================================================
// FormatISO8601DateTime
// ============================================================================

TEST(FormatISO8601DateTime, Epoch)
{
    EXPECT_EQ(FormatISO8601DateTime(0), "1970-01-01T00:00:00Z");
}

TEST(FormatISO8601DateTime, KnownTimestamp)
{
    // 2001-09-09T01:46:40Z = 1000000000
    EXPECT_EQ(FormatISO8601DateTime(1000000000), "2001-09-09T01:46:40Z");
}

TEST(FormatISO8601DateTime, AnotherKnownTimestamp)
{
    // 2024-01-01T00:00:00Z = 1704067200
    EXPECT_EQ(FormatISO8601DateTime(1704067200), "2024-01-01T00:00:00Z");
}

// ============================================================================
// ParseISO8601DateTime
// ============================================================================

TEST(ParseISO8601DateTime, UtcZulu)
{
    auto result = ParseISO8601DateTime("2024-01-01T00:00:00Z");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1704067200);
}

TEST(ParseISO8601DateTime, AcceptsOwnFormat)
{
    auto result = ParseISO8601DateTime(FormatISO8601DateTime(1000000000));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1000000000);
}

TEST(ParseISO8601DateTime, FractionalSecondsAndOffset)
{
    // Format written by earlier tooling.
    auto result = ParseISO8601DateTime("2025-12-05T10:00:00.123456+00:00");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1764928800);
}

TEST(ParseISO8601DateTime, NaiveIsUtc)
{
    auto result = ParseISO8601DateTime("2024-01-01T00:00:00");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1704067200);
}

TEST(ParseISO8601DateTime, SpaceSeparator)
{
    auto result = ParseISO8601DateTime("2024-01-01 00:00:00Z");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1704067200);
}

TEST(ParseISO8601DateTime, PositiveOffset)
{
    // 02:00 at +02:00 is midnight UTC.
    auto result = ParseISO8601DateTime("2024-01-01T02:00:00+02:00");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1704067200);
}

TEST(ParseISO8601DateTime, NegativeOffsetWithoutColon)
{
    auto result = ParseISO8601DateTime("2023-12-31T19:00:00-0500");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1704067200);
}

TEST(ParseISO8601DateTime, Garbage)
{
    EXPECT_FALSE(ParseISO8601DateTime("not a date").has_value());
    EXPECT_FALSE(ParseISO8601DateTime("").has_value());
}

TEST(ParseISO8601DateTime, OutOfRangeFields)
{
    EXPECT_FALSE(ParseISO8601DateTime("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(ParseISO8601DateTime("2024-01-01T25:00:00Z").has_value());
}

TEST(ParseISO8601DateTime, ImpossibleDates)
{
    EXPECT_FALSE(ParseISO8601DateTime("2025-02-31T00:00:00Z").has_value());
    EXPECT_FALSE(ParseISO8601DateTime("2023-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(ParseISO8601DateTime("2024-04-31T12:00:00Z").has_value());
}

TEST(ParseISO8601DateTime, LeapDayAndLeapSecond)
{
    auto leap_day = ParseISO8601DateTime("2024-02-29T00:00:00Z");
    ASSERT_TRUE(leap_day.has_value());
    EXPECT_EQ(*leap_day, 1709164800);

    auto leap_second = ParseISO8601DateTime("2016-12-31T23:59:60Z");
    ASSERT_TRUE(leap_second.has_value());
    EXPECT_EQ(*leap_second, 1483228800);
}

TEST(ParseISO8601DateTime, TrailingJunk)
{
    EXPECT_FALSE(ParseISO8601DateTime("2024-01-01T00:00:00Zjunk").has_value());
    EXPECT_FALSE(ParseISO8601DateTime("2024-01-01T00:00:00+5").has_value());
}

// ============================================================================
// ParseStringToInt
// ============================================================================

TEST(ParseStringToInt, ValidInt)
{
    EXPECT_EQ(ParseStringToInt("42"), 42);
}

TEST(ParseStringToInt, Negative)
{
    EXPECT_EQ(ParseStringToInt("-10"), -10);
}

TEST(ParseStringToInt, Zero)
{
    EXPECT_EQ(ParseStringToInt("0"), 0);
}

TEST(ParseStringToInt, InvalidString)
{
    EXPECT_THROW((void)ParseStringToInt("abc"), std::invalid_argument);
}

TEST(ParseStringToInt, EmptyString)
{
    EXPECT_THROW((void)ParseStringToInt(""), std::invalid_argument);
}

TEST(ParseStringToInt, Overflow)
{
    EXPECT_THROW((void)ParseStringToInt("99999999999999999999"), std::out_of_range);
}

// ============================================================================
// GetEnvVariable
// ============================================================================

TEST(GetEnvVariable, SetVariable)
{
    setenv("APP_LAUNCHER_TEST_VAR", "test_value", 1);
    auto result = GetEnvVariable("APP_LAUNCHER_TEST_VAR");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "test_value");
    unsetenv("APP_LAUNCHER_TEST_VAR");
}

TEST(GetEnvVariable, UnsetVariable)
{
    unsetenv("APP_LAUNCHER_NONEXISTENT_VAR");
    auto result = GetEnvVariable("APP_LAUNCHER_NONEXISTENT_VAR");
    EXPECT_FALSE(result.has_value());
}

TEST(GetEnvVariable, EmptyValue)
{
    setenv("APP_LAUNCHER_EMPTY_VAR", "", 1);
    auto result = GetEnvVariable("APP_LAUNCHER_EMPTY_VAR");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "");
    unsetenv("APP_LAUNCHER_EMPTY_VAR");
}

// ============================================================================
// Exception classes
// ============================================================================

TEST(AppLauncherException, ConstructionAndWhat)
{
    AppLauncherException ex("test error message");
    EXPECT_STREQ(ex.what(), "test error message");
}

TEST(AppLauncherException, IsStdException)
{
    AppLauncherException ex("test");
    const std::exception& base_ref = ex;
    EXPECT_STREQ(base_ref.what(), "test");
}

TEST(FileSystemException, ConstructionAndWhat)
{
    FileSystemException ex("file error", "/tmp/test.txt");
    std::string what_str = ex.what();
    EXPECT_NE(what_str.find("file error"), std::string::npos);
    EXPECT_NE(what_str.find("/tmp/test.txt"), std::string::npos);
}

TEST(FileSystemException, PathAccessor)
{
    FileSystemException ex("error", "/tmp/test.txt");
    EXPECT_EQ(ex.path(), fs::path("/tmp/test.txt"));
}

TEST(ConfigException, CarriesAppId)
{
    ConfigException ex("Missing required field 'cmd'.", "editor");
    EXPECT_EQ(ex.app_id(), "editor");
    EXPECT_STREQ(ex.what(), "App 'editor': Missing required field 'cmd'.");
}

TEST(ConfigException, GlobalErrorHasNoAppId)
{
    ConfigException ex("Config file not found");
    EXPECT_TRUE(ex.app_id().empty());
    EXPECT_STREQ(ex.what(), "Config file not found");
}

TEST(MigrationException, IsStoreException)
{
    MigrationException ex("step failed", 1);
    const StoreException& base_ref = ex;
    EXPECT_EQ(ex.to_version(), 1);
    EXPECT_NE(std::string(base_ref.what()).find("schema version 1"), std::string::npos);
}
