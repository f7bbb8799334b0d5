#include <gtest/gtest.h>

#include "number_parser.hpp"
#include "duckdb/common/exception.hpp"

#include <cstdint>
#include <limits>
#include <string>

using namespace numparse;

TEST(NumberParserTest, TryParseValidLiterals) {
	int32_t int_value;
	ASSERT_TRUE(TryParseInteger("123", int_value));
	EXPECT_EQ(123, int_value);
	ASSERT_TRUE(TryParseInteger(" -2147483648 ", int_value));
	EXPECT_EQ(std::numeric_limits<int32_t>::min(), int_value);
	ASSERT_TRUE(TryParseInteger("+0042", int_value));
	EXPECT_EQ(42, int_value);

	int8_t sbyte_value;
	ASSERT_TRUE(TrySignedByte("-128", sbyte_value));
	EXPECT_EQ(-128, sbyte_value);
	uint8_t byte_value;
	ASSERT_TRUE(TryParseByte("255", byte_value));
	EXPECT_EQ(255, byte_value);
	int16_t short_value;
	ASSERT_TRUE(TryParseShort("-32768", short_value));
	EXPECT_EQ(-32768, short_value);
	uint16_t ushort_value;
	ASSERT_TRUE(TryParseUnsignedShort("65535", ushort_value));
	EXPECT_EQ(65535, ushort_value);
	uint32_t uint_value;
	ASSERT_TRUE(TryParseUnsignedInteger("4294967295", uint_value));
	EXPECT_EQ(4294967295U, uint_value);
	int64_t long_value;
	ASSERT_TRUE(TryParseLong("-9223372036854775808", long_value));
	EXPECT_EQ(std::numeric_limits<int64_t>::min(), long_value);
	uint64_t ulong_value;
	ASSERT_TRUE(TryParseUnsignedLong("18446744073709551615", ulong_value));
	EXPECT_EQ(std::numeric_limits<uint64_t>::max(), ulong_value);
	ASSERT_TRUE(TryParseUnsignedLong("-0", ulong_value));
	EXPECT_EQ(0U, ulong_value);
}

TEST(NumberParserTest, TryParseBlankInput) {
	for (const char *str : {static_cast<const char *>(nullptr), "", "   ", "\t\n"}) {
		int8_t sbyte_value = 7;
		EXPECT_FALSE(TrySignedByte(str, sbyte_value));
		EXPECT_EQ(0, sbyte_value);
		uint8_t byte_value = 7;
		EXPECT_FALSE(TryParseByte(str, byte_value));
		EXPECT_EQ(0, byte_value);
		int16_t short_value = 7;
		EXPECT_FALSE(TryParseShort(str, short_value));
		EXPECT_EQ(0, short_value);
		uint16_t ushort_value = 7;
		EXPECT_FALSE(TryParseUnsignedShort(str, ushort_value));
		EXPECT_EQ(0, ushort_value);
		int32_t int_value = 7;
		EXPECT_FALSE(TryParseInteger(str, int_value));
		EXPECT_EQ(0, int_value);
		uint32_t uint_value = 7;
		EXPECT_FALSE(TryParseUnsignedInteger(str, uint_value));
		EXPECT_EQ(0U, uint_value);
		int64_t long_value = 7;
		EXPECT_FALSE(TryParseLong(str, long_value));
		EXPECT_EQ(0, long_value);
		uint64_t ulong_value = 7;
		EXPECT_FALSE(TryParseUnsignedLong(str, ulong_value));
		EXPECT_EQ(0U, ulong_value);
	}
}

TEST(NumberParserTest, TryParseFailuresSetZero) {
	int32_t int_value = 7;
	EXPECT_FALSE(TryParseInteger("abc", int_value));
	EXPECT_EQ(0, int_value);
	EXPECT_FALSE(TryParseInteger("2147483648", int_value));
	EXPECT_EQ(0, int_value);
	EXPECT_FALSE(TryParseInteger("1.0", int_value));
	EXPECT_FALSE(TryParseInteger("1 000", int_value));

	uint8_t byte_value = 7;
	EXPECT_FALSE(TryParseByte("256", byte_value));
	EXPECT_EQ(0, byte_value);
	EXPECT_FALSE(TryParseByte("-1", byte_value));

	uint64_t ulong_value = 7;
	EXPECT_FALSE(TryParseUnsignedLong("18446744073709551616", ulong_value));
	EXPECT_EQ(0U, ulong_value);
	EXPECT_FALSE(TryParseUnsignedLong("99999999999999999999999", ulong_value));
}

TEST(NumberParserTest, TaggedResult) {
	EXPECT_EQ(ParseOutcome::SUCCESS, ParseIntegral<int16_t>("-32768").outcome);
	EXPECT_EQ(ParseOutcome::OUT_OF_RANGE, ParseIntegral<int16_t>("32768").outcome);
	EXPECT_EQ(ParseOutcome::OUT_OF_RANGE, ParseIntegral<uint32_t>("-5").outcome);
	EXPECT_EQ(ParseOutcome::MALFORMED, ParseIntegral<int64_t>("12a").outcome);
	EXPECT_EQ(ParseOutcome::MALFORMED, ParseIntegral<int64_t>("   ").outcome);
	EXPECT_EQ(ParseOutcome::OUT_OF_RANGE, ParseIntegral<int64_t>("00000000000000000000000009223372036854775808").outcome);
	EXPECT_EQ(9223372036854775807LL, ParseIntegral<int64_t>("00000000000000000000000009223372036854775807").value);
	EXPECT_STREQ("overflow", ParseOutcomeName(ParseOutcome::OUT_OF_RANGE));
	EXPECT_STREQ("malformed", ParseOutcomeName(ParseOutcome::MALFORMED));
	EXPECT_STREQ("success", ParseOutcomeName(ParseOutcome::SUCCESS));
}

TEST(NumberParserTest, ParseIntegerSentinels) {
	EXPECT_EQ(42, ParseInteger(" 42 "));
	EXPECT_EQ(-1, ParseInteger("99999999999999999999"));
	EXPECT_EQ(0, ParseInteger("abc"));
	EXPECT_EQ(0, ParseInteger(""));
	EXPECT_EQ(-1, ParseInteger("-1"));
}

TEST(NumberParserTest, ParseUnsignedIntegerSentinels) {
	EXPECT_EQ(7U, ParseUnsignedInteger("7"));
	EXPECT_EQ(std::numeric_limits<uint32_t>::min(), ParseUnsignedInteger("x"));
	EXPECT_EQ(std::numeric_limits<uint32_t>::max(), ParseUnsignedInteger("4294967296"));
	EXPECT_EQ(std::numeric_limits<uint32_t>::max(), ParseUnsignedInteger("-1"));
}

TEST(NumberParserTest, ParseByteSentinels) {
	EXPECT_EQ(200, ParseByte("200"));
	EXPECT_EQ(std::numeric_limits<uint8_t>::max(), ParseByte("two hundred"));
	EXPECT_EQ(std::numeric_limits<uint8_t>::min(), ParseByte("256"));
}

TEST(NumberParserTest, ParseSignedByteSentinels) {
	EXPECT_EQ(-100, ParseSignedByte(" -100"));
	EXPECT_EQ(std::numeric_limits<int8_t>::max(), ParseSignedByte("abc"));
	EXPECT_EQ(std::numeric_limits<int8_t>::max(), ParseSignedByte("-129"));
	EXPECT_EQ(std::numeric_limits<int8_t>::max(), ParseSignedByte("   "));
}

TEST(NumberParserTest, ParseShortSentinels) {
	EXPECT_EQ(-300, ParseShort("-300"));
	EXPECT_EQ(std::numeric_limits<int16_t>::max(), ParseShort("40000"));
	EXPECT_EQ(std::numeric_limits<int16_t>::max(), ParseShort("-40000"));
	EXPECT_THROW(ParseShort("abc"), duckdb::ConversionException);
}

TEST(NumberParserTest, ParseUnsignedShortSentinels) {
	EXPECT_EQ(65535, ParseUnsignedShort("65535"));
	EXPECT_EQ(0, ParseUnsignedShort("abc"));
	EXPECT_EQ(std::numeric_limits<uint16_t>::max(), ParseUnsignedShort("65536"));
}

TEST(NumberParserTest, ParseLongSentinels) {
	EXPECT_EQ(-5000000000LL, ParseLong("-5000000000"));
	EXPECT_EQ(std::numeric_limits<int64_t>::min(), ParseLong("abc"));
	EXPECT_EQ(-1, ParseLong("9223372036854775808"));
}

TEST(NumberParserTest, ParseUnsignedLongThrows) {
	EXPECT_EQ(18446744073709551615ULL, ParseUnsignedLong(" 18446744073709551615 "));
	EXPECT_THROW(ParseUnsignedLong(""), duckdb::ConversionException);
	EXPECT_THROW(ParseUnsignedLong("   "), duckdb::ConversionException);
	EXPECT_THROW(ParseUnsignedLong("abc"), duckdb::ConversionException);
	EXPECT_THROW(ParseUnsignedLong(nullptr), duckdb::InvalidInputException);
	EXPECT_THROW(ParseUnsignedLong("99999999999999999999999"), duckdb::OutOfRangeException);
	EXPECT_THROW(ParseUnsignedLong("-1"), duckdb::OutOfRangeException);
}

TEST(NumberParserTest, ParseNullThrowsInvalidInput) {
	EXPECT_THROW(ParseSignedByte(nullptr), duckdb::InvalidInputException);
	EXPECT_THROW(ParseByte(nullptr), duckdb::InvalidInputException);
	EXPECT_THROW(ParseShort(nullptr), duckdb::InvalidInputException);
	EXPECT_THROW(ParseUnsignedShort(nullptr), duckdb::InvalidInputException);
	EXPECT_THROW(ParseInteger(nullptr), duckdb::InvalidInputException);
	EXPECT_THROW(ParseUnsignedInteger(nullptr), duckdb::InvalidInputException);
	EXPECT_THROW(ParseLong(nullptr), duckdb::InvalidInputException);
}

TEST(NumberParserTest, MalformedFallbackFollowsSentinels) {
	const std::string text("12\0x", 4);
	EXPECT_EQ(std::numeric_limits<int8_t>::max(), MalformedFallback<int8_t>(text));
	EXPECT_EQ(std::numeric_limits<uint8_t>::max(), MalformedFallback<uint8_t>(text));
	EXPECT_EQ(0, MalformedFallback<int32_t>(text));
	EXPECT_EQ(std::numeric_limits<int64_t>::min(), MalformedFallback<int64_t>(text));
	EXPECT_THROW(MalformedFallback<int16_t>(text), duckdb::ConversionException);
	EXPECT_THROW(MalformedFallback<uint64_t>(text), duckdb::ConversionException);
}

TEST(NumberParserTest, FallbackPolicyDescriptor) {
	const FallbackPolicy<int32_t> policy {FailureAction::RETURN_SENTINEL, 11, FailureAction::THROW, 0};
	EXPECT_EQ(11, ParseWithFallback("eleven", policy));
	EXPECT_THROW(ParseWithFallback("3000000000", policy), duckdb::OutOfRangeException);
	EXPECT_EQ(3, ParseWithFallback("3", policy));
}

TEST(NumberParserTest, WhitespaceNeverChangesTheValue) {
	for (std::string literal : {"0", "-17", "+250", "2147483647"}) {
		EXPECT_EQ(ParseInteger(literal.c_str()), ParseInteger((" \t" + literal + "\n ").c_str()));
		EXPECT_EQ(ParseLong(literal.c_str()), ParseLong(("  " + literal).c_str()));
	}
}

TEST(NumberParserTest, ParseIsIdempotent) {
	for (const char *literal : {"-0042", "+7", "2147483647", "  -2147483648 "}) {
		const auto value = ParseInteger(literal);
		EXPECT_EQ(value, ParseInteger(std::to_string(value).c_str()));
	}
	for (const char *literal : {"18446744073709551615", "000"}) {
		const auto value = ParseUnsignedLong(literal);
		EXPECT_EQ(value, ParseUnsignedLong(std::to_string(value).c_str()));
	}
}
