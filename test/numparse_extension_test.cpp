#include <gtest/gtest.h>

#include "duckdb.hpp"
#include "numparse_extension.hpp"

#include <cmath>
#include <limits>

using namespace duckdb;

class NumparseExtensionTest : public ::testing::Test {
protected:
	NumparseExtensionTest() : db(nullptr), con(LoadExtension(db)) {
	}

	static DuckDB &LoadExtension(DuckDB &database) {
		database.LoadStaticExtension<NumparseExtension>();
		return database;
	}

	Value QueryWithText(const string &sql, const string &text) {
		auto prepared = con.Prepare(sql);
		if (prepared->HasError()) {
			ADD_FAILURE() << sql << ": " << prepared->GetError();
			return Value();
		}
		auto result = prepared->Execute(Value(text));
		if (result->HasError()) {
			ADD_FAILURE() << sql << ": " << result->GetError();
			return Value();
		}
		return result->Cast<MaterializedQueryResult>().GetValue(0, 0);
	}

	Value QueryValue(const string &sql) {
		auto result = con.Query(sql);
		if (result->HasError()) {
			ADD_FAILURE() << sql << ": " << result->GetError();
			return Value();
		}
		return result->GetValue(0, 0);
	}

	DuckDB db;
	Connection con;
};

TEST_F(NumparseExtensionTest, TryParseReturnsNullOnFailure) {
	EXPECT_EQ(42, QueryValue("SELECT try_parse_int32(' 42 ')").GetValue<int32_t>());
	EXPECT_TRUE(QueryValue("SELECT try_parse_int32('abc')").IsNull());
	EXPECT_TRUE(QueryValue("SELECT try_parse_uint8('256')").IsNull());
	EXPECT_TRUE(QueryValue("SELECT try_parse_int64(NULL)").IsNull());
	EXPECT_EQ(2.5, QueryValue("SELECT try_parse_double('2.5')").GetValue<double>());
	EXPECT_EQ("42.50", QueryValue("SELECT try_parse_decimal('42.50')").ToString());
	EXPECT_TRUE(QueryValue("SELECT try_parse_decimal('x')").IsNull());
}

TEST_F(NumparseExtensionTest, TryParseReturnsZeroSetting) {
	ASSERT_FALSE(con.Query("SET numparse_try_returns_zero = true")->HasError());
	EXPECT_EQ(0, QueryValue("SELECT try_parse_int32('abc')").GetValue<int32_t>());
	EXPECT_EQ("0", QueryValue("SELECT try_parse_decimal('abc')").ToString());
	// SQL NULL stays NULL
	EXPECT_TRUE(QueryValue("SELECT try_parse_int32(NULL)").IsNull());
}

TEST_F(NumparseExtensionTest, ParseReturnsSentinels) {
	EXPECT_EQ(-1, QueryValue("SELECT parse_int32('99999999999999999999')").GetValue<int32_t>());
	EXPECT_EQ(0, QueryValue("SELECT parse_int32('abc')").GetValue<int32_t>());
	EXPECT_EQ(255, QueryValue("SELECT parse_uint8('abc')").GetValue<uint8_t>());
	EXPECT_EQ(std::numeric_limits<int64_t>::min(), QueryValue("SELECT parse_int64('abc')").GetValue<int64_t>());
	EXPECT_TRUE(std::isnan(QueryValue("SELECT parse_float('abc')").GetValue<float>()));
	EXPECT_EQ(std::numeric_limits<double>::denorm_min(), QueryValue("SELECT parse_double('abc')").GetValue<double>());
	EXPECT_EQ("-2.2", QueryValue("SELECT parse_decimal('1e400')").ToString());
	EXPECT_EQ("-1.1", QueryValue("SELECT parse_decimal('not-a-number')").ToString());
	EXPECT_EQ("42.5", QueryValue("SELECT parse_decimal(' 42.5 ')").ToString());
}

TEST_F(NumparseExtensionTest, ParseUnsignedLongRaises) {
	EXPECT_EQ(18446744073709551615ULL,
	          QueryValue("SELECT parse_uint64('18446744073709551615')").GetValue<uint64_t>());
	auto malformed = con.Query("SELECT parse_uint64('abc')");
	ASSERT_TRUE(malformed->HasError());
	EXPECT_EQ(ExceptionType::CONVERSION, malformed->GetErrorType());
	auto overflow = con.Query("SELECT parse_uint64('99999999999999999999999')");
	ASSERT_TRUE(overflow->HasError());
	EXPECT_EQ(ExceptionType::OUT_OF_RANGE, overflow->GetErrorType());
	auto short_malformed = con.Query("SELECT parse_int16('abc')");
	EXPECT_TRUE(short_malformed->HasError());
}

TEST_F(NumparseExtensionTest, EmbeddedNulIsMalformed) {
	const string text("12\0x", 4);
	EXPECT_TRUE(QueryWithText("SELECT try_parse_int32($1)", text).IsNull());
	EXPECT_TRUE(QueryWithText("SELECT try_parse_double($1)", text).IsNull());
	EXPECT_TRUE(QueryWithText("SELECT try_parse_decimal($1)", text).IsNull());
	EXPECT_EQ(0, QueryWithText("SELECT parse_int32($1)", text).GetValue<int32_t>());
	EXPECT_EQ(255, QueryWithText("SELECT parse_uint8($1)", text).GetValue<uint8_t>());
	EXPECT_EQ(std::numeric_limits<double>::denorm_min(),
	          QueryWithText("SELECT parse_double($1)", text).GetValue<double>());
	EXPECT_EQ("-1.1", QueryWithText("SELECT parse_decimal($1)", text).ToString());

	auto prepared = con.Prepare("SELECT parse_int16($1)");
	ASSERT_FALSE(prepared->HasError());
	auto result = prepared->Execute(Value(text));
	ASSERT_TRUE(result->HasError());
	EXPECT_EQ(ExceptionType::CONVERSION, result->GetErrorType());
}

TEST_F(NumparseExtensionTest, ParseOutcome) {
	EXPECT_EQ("success", QueryValue("SELECT parse_outcome('int32', '12')").ToString());
	EXPECT_EQ("malformed", QueryValue("SELECT parse_outcome('INT32', '1 2')").ToString());
	EXPECT_EQ("overflow", QueryValue("SELECT parse_outcome('uint16', '65536')").ToString());
	EXPECT_EQ("overflow", QueryValue("SELECT parse_outcome('decimal', '1e29')").ToString());
	EXPECT_EQ("success", QueryValue("SELECT parse_outcome('double', '1e400')").ToString());
	EXPECT_TRUE(con.Query("SELECT parse_outcome('int128', '1')")->HasError());
}
