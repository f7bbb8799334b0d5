#pragma once

#include "number_decimal.hpp"
#include "number_literal.hpp"
#include "parse_result.hpp"

#include <string_view>

// Floating point and decimal conversions, in the same two flavours as number_parser.hpp.
//
// Float and double accept [+|-]Infinity and [+|-]NaN. Values beyond their range parse as +-infinity and values too
// small parse as +-0; neither is a failure. Decimals round to at most 28 fraction digits and 29 significant digits,
// half to even, and fail when the magnitude stays above NumberDecimal::MaxValue().

namespace numparse {

// Parses text in the float grammar into float or double. Blank text is MALFORMED.
template <class T>
ParseResult<T> ParseFloating(std::string_view text);

// Parses text in the float grammar into a decimal. Blank text is MALFORMED, a magnitude above the decimal range is
// OUT_OF_RANGE.
ParseResult<NumberDecimal> ParseNumberDecimal(std::string_view text);

// True when the literal denotes an integer whose magnitude exceeds NumberDecimal::MaxValue(). The comparison runs on
// the digit string, so any number of digits and any exponent is handled.
bool ExceedsDecimalRange(const NumberLiteral &literal);

bool TryParseFloat(const char *str, float &result);
//! Any failure: NaN
float ParseFloat(const char *str);

bool TryParseDouble(const char *str, double &result);
//! Any failure: the smallest positive subnormal double, 4.94e-324
double ParseDouble(const char *str);

bool TryParseDecimal(const char *str, NumberDecimal &result);
//! An integer literal beyond the decimal range: -2.2, any other failure: -1.1
NumberDecimal ParseDecimal(const char *str);

//! NaN, returned by ParseFloat for malformed text
float FloatMalformedSentinel();
//! The smallest subnormal double, returned by ParseDouble for malformed text
double DoubleMalformedSentinel();
//! -1.1, returned by ParseDecimal for malformed text
NumberDecimal DecimalMalformedSentinel();
//! -2.2, returned by ParseDecimal for integers beyond the decimal range
NumberDecimal DecimalOverflowSentinel();

} // namespace numparse
