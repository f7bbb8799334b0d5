#include "number_parser.hpp"
#include "number_literal.hpp"
#include "utils.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/limits.hpp"
#include "duckdb/common/types.hpp"

#include <string>
#include <type_traits>

using duckdb::ConversionException;
using duckdb::InternalException;
using duckdb::InvalidInputException;
using duckdb::NumericLimits;
using duckdb::OutOfRangeException;

namespace numparse {

template <class T>
ParseResult<T> ParseIntegral(std::string_view text) {
	NumberLiteral literal;
	if (!ScanNumberLiteral(text, LiteralStyle::INTEGER, literal)) {
		return ParseResult<T>::Malformed();
	}
	if (literal.IsZero()) {
		// "-0" is zero for unsigned types as well
		return ParseResult<T>::Success(0);
	}
	if (literal.negative && !std::is_signed<T>::value) {
		return ParseResult<T>::Overflow();
	}
	// 20 digits is the widest uint64_t
	if (literal.digits.size() > 20) {
		return ParseResult<T>::Overflow();
	}

	uint64_t magnitude = 0;
	for (auto c : literal.digits) {
		const uint64_t digit = c - '0';
		if (magnitude > (NumericLimits<uint64_t>::Maximum() - digit) / 10) {
			return ParseResult<T>::Overflow();
		}
		magnitude = magnitude * 10 + digit;
	}

	const auto max_magnitude = static_cast<uint64_t>(NumericLimits<T>::Maximum());
	if (literal.negative) {
		// two's complement: the minimum is one further from zero than the maximum
		if (magnitude > max_magnitude + 1) {
			return ParseResult<T>::Overflow();
		}
		return ParseResult<T>::Success(static_cast<T>(-static_cast<int64_t>(magnitude - 1) - 1));
	}
	if (magnitude > max_magnitude) {
		return ParseResult<T>::Overflow();
	}
	return ParseResult<T>::Success(static_cast<T>(magnitude));
}

template <class T>
static T ApplyPolicy(const ParseResult<T> &parsed, std::string_view text, const FallbackPolicy<T> &policy) {
	switch (parsed.outcome) {
	case ParseOutcome::SUCCESS:
		return parsed.value;
	case ParseOutcome::MALFORMED:
		if (policy.on_malformed == FailureAction::THROW) {
			throw ConversionException("Could not convert string '%s' to %s", std::string(text),
			                          duckdb::TypeIdToString(duckdb::GetTypeId<T>()));
		}
		return policy.malformed_value;
	case ParseOutcome::OUT_OF_RANGE:
		if (policy.on_overflow == FailureAction::THROW) {
			throw OutOfRangeException("Value '%s' is out of range for %s", std::string(text),
			                          duckdb::TypeIdToString(duckdb::GetTypeId<T>()));
		}
		return policy.overflow_value;
	}
	throw InternalException("Unrecognized parse outcome %d", static_cast<int>(parsed.outcome));
}

template <class T>
T ParseWithFallback(const char *str, const FallbackPolicy<T> &policy) {
	if (!str) {
		throw InvalidInputException("Value cannot be null (parameter '%s')", "str");
	}
	return ApplyPolicy(ParseIntegral<T>(str), str, policy);
}

template <class T>
static bool TryParseIntegral(const char *str, T &result) {
	result = 0;
	if (IsNullOrWhiteSpace(str)) {
		return false;
	}
	auto parsed = ParseIntegral<T>(str);
	result = parsed.value;
	return parsed.IsSuccess();
}

static constexpr auto SENTINEL = FailureAction::RETURN_SENTINEL;
static constexpr auto THROW = FailureAction::THROW;

// The overflow of a signed byte is not told apart from a malformed string.
static const FallbackPolicy<int8_t> SIGNED_BYTE_POLICY {SENTINEL, NumericLimits<int8_t>::Maximum(), SENTINEL,
                                                        NumericLimits<int8_t>::Maximum()};
static const FallbackPolicy<uint8_t> BYTE_POLICY {SENTINEL, NumericLimits<uint8_t>::Maximum(), SENTINEL,
                                                  NumericLimits<uint8_t>::Minimum()};
// Malformed shorts are not handled and reach the caller.
static const FallbackPolicy<int16_t> SHORT_POLICY {THROW, 0, SENTINEL, NumericLimits<int16_t>::Maximum()};
static const FallbackPolicy<uint16_t> UNSIGNED_SHORT_POLICY {SENTINEL, 0, SENTINEL,
                                                             NumericLimits<uint16_t>::Maximum()};
static const FallbackPolicy<int32_t> INTEGER_POLICY {SENTINEL, 0, SENTINEL, -1};
static const FallbackPolicy<uint32_t> UNSIGNED_INTEGER_POLICY {SENTINEL, NumericLimits<uint32_t>::Minimum(), SENTINEL,
                                                               NumericLimits<uint32_t>::Maximum()};
static const FallbackPolicy<int64_t> LONG_POLICY {SENTINEL, NumericLimits<int64_t>::Minimum(), SENTINEL, -1};
static const FallbackPolicy<uint64_t> UNSIGNED_LONG_POLICY {THROW, 0, THROW, 0};

static const FallbackPolicy<int8_t> &PolicyFor(int8_t) {
	return SIGNED_BYTE_POLICY;
}
static const FallbackPolicy<uint8_t> &PolicyFor(uint8_t) {
	return BYTE_POLICY;
}
static const FallbackPolicy<int16_t> &PolicyFor(int16_t) {
	return SHORT_POLICY;
}
static const FallbackPolicy<uint16_t> &PolicyFor(uint16_t) {
	return UNSIGNED_SHORT_POLICY;
}
static const FallbackPolicy<int32_t> &PolicyFor(int32_t) {
	return INTEGER_POLICY;
}
static const FallbackPolicy<uint32_t> &PolicyFor(uint32_t) {
	return UNSIGNED_INTEGER_POLICY;
}
static const FallbackPolicy<int64_t> &PolicyFor(int64_t) {
	return LONG_POLICY;
}
static const FallbackPolicy<uint64_t> &PolicyFor(uint64_t) {
	return UNSIGNED_LONG_POLICY;
}

template <class T>
T MalformedFallback(std::string_view text) {
	return ApplyPolicy(ParseResult<T>::Malformed(), text, PolicyFor(T()));
}

template ParseResult<int8_t> ParseIntegral<int8_t>(std::string_view text);
template ParseResult<uint8_t> ParseIntegral<uint8_t>(std::string_view text);
template ParseResult<int16_t> ParseIntegral<int16_t>(std::string_view text);
template ParseResult<uint16_t> ParseIntegral<uint16_t>(std::string_view text);
template ParseResult<int32_t> ParseIntegral<int32_t>(std::string_view text);
template ParseResult<uint32_t> ParseIntegral<uint32_t>(std::string_view text);
template ParseResult<int64_t> ParseIntegral<int64_t>(std::string_view text);
template ParseResult<uint64_t> ParseIntegral<uint64_t>(std::string_view text);

template int8_t ParseWithFallback<int8_t>(const char *str, const FallbackPolicy<int8_t> &policy);
template uint8_t ParseWithFallback<uint8_t>(const char *str, const FallbackPolicy<uint8_t> &policy);
template int16_t ParseWithFallback<int16_t>(const char *str, const FallbackPolicy<int16_t> &policy);
template uint16_t ParseWithFallback<uint16_t>(const char *str, const FallbackPolicy<uint16_t> &policy);
template int32_t ParseWithFallback<int32_t>(const char *str, const FallbackPolicy<int32_t> &policy);
template uint32_t ParseWithFallback<uint32_t>(const char *str, const FallbackPolicy<uint32_t> &policy);
template int64_t ParseWithFallback<int64_t>(const char *str, const FallbackPolicy<int64_t> &policy);
template uint64_t ParseWithFallback<uint64_t>(const char *str, const FallbackPolicy<uint64_t> &policy);

template int8_t MalformedFallback<int8_t>(std::string_view text);
template uint8_t MalformedFallback<uint8_t>(std::string_view text);
template int16_t MalformedFallback<int16_t>(std::string_view text);
template uint16_t MalformedFallback<uint16_t>(std::string_view text);
template int32_t MalformedFallback<int32_t>(std::string_view text);
template uint32_t MalformedFallback<uint32_t>(std::string_view text);
template int64_t MalformedFallback<int64_t>(std::string_view text);
template uint64_t MalformedFallback<uint64_t>(std::string_view text);

bool TrySignedByte(const char *str, int8_t &result) {
	return TryParseIntegral(str, result);
}

int8_t ParseSignedByte(const char *str) {
	return ParseWithFallback(str, SIGNED_BYTE_POLICY);
}

bool TryParseByte(const char *str, uint8_t &result) {
	return TryParseIntegral(str, result);
}

uint8_t ParseByte(const char *str) {
	return ParseWithFallback(str, BYTE_POLICY);
}

bool TryParseShort(const char *str, int16_t &result) {
	return TryParseIntegral(str, result);
}

int16_t ParseShort(const char *str) {
	return ParseWithFallback(str, SHORT_POLICY);
}

bool TryParseUnsignedShort(const char *str, uint16_t &result) {
	return TryParseIntegral(str, result);
}

uint16_t ParseUnsignedShort(const char *str) {
	return ParseWithFallback(str, UNSIGNED_SHORT_POLICY);
}

bool TryParseInteger(const char *str, int32_t &result) {
	return TryParseIntegral(str, result);
}

int32_t ParseInteger(const char *str) {
	return ParseWithFallback(str, INTEGER_POLICY);
}

bool TryParseUnsignedInteger(const char *str, uint32_t &result) {
	return TryParseIntegral(str, result);
}

uint32_t ParseUnsignedInteger(const char *str) {
	return ParseWithFallback(str, UNSIGNED_INTEGER_POLICY);
}

bool TryParseLong(const char *str, int64_t &result) {
	return TryParseIntegral(str, result);
}

int64_t ParseLong(const char *str) {
	return ParseWithFallback(str, LONG_POLICY);
}

bool TryParseUnsignedLong(const char *str, uint64_t &result) {
	return TryParseIntegral(str, result);
}

uint64_t ParseUnsignedLong(const char *str) {
	return ParseWithFallback(str, UNSIGNED_LONG_POLICY);
}

} // namespace numparse
