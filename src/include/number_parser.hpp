#pragma once

#include "parse_result.hpp"

#include <cstdint>
#include <string_view>

// Integer conversions.
//
// Every type comes with two entry points:
//  - TryParseX(str, result): never throws. On nullptr, blank, malformed or out of range input it returns false and
//    sets result to zero.
//  - ParseX(str): returns a fixed sentinel on failure, chosen per type and per failure kind, see FallbackPolicy.
//    A nullptr str throws duckdb::InvalidInputException.
//
// The sentinels are kept for callers that depend on the exact values. They are an anti-pattern: a sentinel cannot
// be told apart from a parsed value equal to it. New code should use ParseIntegral, which returns a tagged result.

namespace numparse {

// Parses trimmed text in the integer grammar into T. Blank text is MALFORMED.
template <class T>
ParseResult<T> ParseIntegral(std::string_view text);

enum class FailureAction : uint8_t { RETURN_SENTINEL, THROW };

// What a ParseX function does for each failure kind.
template <class T>
struct FallbackPolicy {
	FailureAction on_malformed;
	T malformed_value;
	FailureAction on_overflow;
	T overflow_value;
};

//! Applies policy to the parse of str. Throws InvalidInputException when str is nullptr, ConversionException for a
//! malformed failure with FailureAction::THROW, OutOfRangeException for an overflow failure with FailureAction::THROW.
template <class T>
T ParseWithFallback(const char *str, const FallbackPolicy<T> &policy);

// What ParseX gives for text that is not a number: the malformed sentinel of T, or the ConversionException it throws.
// For callers holding text a C string cannot carry, such as text with an embedded NUL.
template <class T>
T MalformedFallback(std::string_view text);

bool TrySignedByte(const char *str, int8_t &result);
//! Malformed and overflow: INT8_MAX
int8_t ParseSignedByte(const char *str);

bool TryParseByte(const char *str, uint8_t &result);
//! Malformed: UINT8_MAX, overflow: 0
uint8_t ParseByte(const char *str);

bool TryParseShort(const char *str, int16_t &result);
//! Malformed: throws ConversionException, overflow: INT16_MAX
int16_t ParseShort(const char *str);

bool TryParseUnsignedShort(const char *str, uint16_t &result);
//! Malformed: 0, overflow: UINT16_MAX
uint16_t ParseUnsignedShort(const char *str);

bool TryParseInteger(const char *str, int32_t &result);
//! Malformed: 0, overflow: -1
int32_t ParseInteger(const char *str);

bool TryParseUnsignedInteger(const char *str, uint32_t &result);
//! Malformed: 0, overflow: UINT32_MAX
uint32_t ParseUnsignedInteger(const char *str);

bool TryParseLong(const char *str, int64_t &result);
//! Malformed: INT64_MIN, overflow: -1
int64_t ParseLong(const char *str);

bool TryParseUnsignedLong(const char *str, uint64_t &result);
//! No sentinel. Malformed (blank included): throws ConversionException, overflow: throws OutOfRangeException
uint64_t ParseUnsignedLong(const char *str);

} // namespace numparse
