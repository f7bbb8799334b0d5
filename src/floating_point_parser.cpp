#include "floating_point_parser.hpp"
#include "utils.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/types/hugeint.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

using duckdb::Hugeint;
using duckdb::InvalidInputException;

namespace numparse {

template <class T>
ParseResult<T> ParseFloating(std::string_view text) {
	NumberLiteral literal;
	if (!ScanFloatingLiteral(text, literal)) {
		return ParseResult<T>::Malformed();
	}
	switch (literal.kind) {
	case LiteralKind::INFINITY_SYMBOL:
		return ParseResult<T>::Success(literal.negative ? -std::numeric_limits<T>::infinity()
		                                                : std::numeric_limits<T>::infinity());
	case LiteralKind::NAN_SYMBOL:
		return ParseResult<T>::Success(std::numeric_limits<T>::quiet_NaN());
	case LiteralKind::FINITE:
		break;
	}

	std::optional<T> converted;
	if constexpr (std::is_same<T, float>::value) {
		converted = ConvertFloat(literal.ToNormalizedString());
	} else {
		converted = ConvertDouble(literal.ToNormalizedString());
	}
	if (converted) {
		return ParseResult<T>::Success(*converted);
	}
	// out of range: large magnitudes saturate to infinity, tiny ones flush to zero
	const T magnitude = literal.IntegerDigitCount() > 0 ? std::numeric_limits<T>::infinity() : T(0);
	return ParseResult<T>::Success(literal.negative ? -magnitude : magnitude);
}

template ParseResult<float> ParseFloating<float>(std::string_view text);
template ParseResult<double> ParseFloating<double>(std::string_view text);

static hugeint_t DigitsToHugeint(std::string_view digits) {
	hugeint_t result(0);
	for (auto c : digits) {
		result = result * hugeint_t(10) + hugeint_t(c - '0');
	}
	return result;
}

// The first keep digits as an integer, rounded half to even on the digits dropped.
static hugeint_t RoundDigits(const std::string &digits, int64_t keep) {
	if (keep < 0) {
		return hugeint_t(0);
	}
	const auto kept_count = std::min<size_t>(static_cast<size_t>(keep), digits.size());
	const auto kept = std::string_view(digits).substr(0, kept_count);
	auto result = DigitsToHugeint(kept);
	if (kept_count == digits.size()) {
		return result;
	}

	const auto first_dropped = digits[kept_count];
	bool round_up = first_dropped > '5';
	if (first_dropped == '5') {
		const bool nonzero_tail = digits.find_first_not_of('0', kept_count + 1) != std::string::npos;
		const bool odd = !kept.empty() && (kept.back() - '0') % 2 == 1;
		round_up = nonzero_tail || odd;
	}
	if (round_up) {
		result += hugeint_t(1);
	}
	return result;
}

bool ExceedsDecimalRange(const NumberLiteral &literal) {
	if (literal.kind != LiteralKind::FINITE || literal.IsZero() || !literal.IsIntegral()) {
		return false;
	}
	const auto integer_digits = literal.IntegerDigitCount();
	if (integer_digits != NumberDecimal::MAX_DIGITS) {
		return integer_digits > NumberDecimal::MAX_DIGITS;
	}
	// as many digits as the maximum: any fraction digits are zeros, so compare the integer digits as text
	auto integer_part = literal.digits.substr(0, NumberDecimal::MAX_DIGITS);
	integer_part.resize(NumberDecimal::MAX_DIGITS, '0');
	return integer_part > Hugeint::ToString(NumberDecimal::MaxMantissa());
}

ParseResult<NumberDecimal> ParseNumberDecimal(std::string_view text) {
	NumberLiteral literal;
	if (!ScanNumberLiteral(text, LiteralStyle::FLOAT, literal)) {
		return ParseResult<NumberDecimal>::Malformed();
	}

	if (literal.IsZero()) {
		const auto scale = std::min<int64_t>(std::max<int64_t>(-literal.exponent, 0), NumberDecimal::MAX_SCALE);
		return ParseResult<NumberDecimal>::Success(
		    NumberDecimal::FromParts(hugeint_t(0), false, static_cast<uint8_t>(scale)));
	}

	const auto integer_digits = literal.IntegerDigitCount();
	if (integer_digits > NumberDecimal::MAX_DIGITS) {
		return ParseResult<NumberDecimal>::Overflow();
	}

	if (literal.exponent >= 0) {
		// fewer than 29 significant digits here, so the shift stays within 10^28
		auto mantissa = DigitsToHugeint(literal.digits) * Hugeint::POWERS_OF_TEN[literal.exponent];
		if (mantissa > NumberDecimal::MaxMantissa()) {
			return ParseResult<NumberDecimal>::Overflow();
		}
		return ParseResult<NumberDecimal>::Success(NumberDecimal::FromParts(mantissa, literal.negative, 0));
	}

	int64_t scale = std::min<int64_t>(-literal.exponent, NumberDecimal::MAX_SCALE);
	int64_t keep = integer_digits + scale;
	if (keep > NumberDecimal::MAX_DIGITS) {
		scale -= keep - NumberDecimal::MAX_DIGITS;
		keep = NumberDecimal::MAX_DIGITS;
	}
	while (true) {
		auto mantissa = RoundDigits(literal.digits, keep);
		if (mantissa <= NumberDecimal::MaxMantissa()) {
			return ParseResult<NumberDecimal>::Success(
			    NumberDecimal::FromParts(mantissa, literal.negative, static_cast<uint8_t>(scale)));
		}
		if (scale == 0) {
			return ParseResult<NumberDecimal>::Overflow();
		}
		// 29 digits above 2^96: give up one fraction digit
		scale--;
		keep--;
	}
}

static void ThrowIfNull(const char *str) {
	if (!str) {
		throw InvalidInputException("Value cannot be null (parameter '%s')", "str");
	}
}

template <class T>
static bool TryParseFloating(const char *str, T &result) {
	result = 0;
	if (IsNullOrWhiteSpace(str)) {
		return false;
	}
	auto parsed = ParseFloating<T>(str);
	result = parsed.value;
	return parsed.IsSuccess();
}

bool TryParseFloat(const char *str, float &result) {
	return TryParseFloating(str, result);
}

float ParseFloat(const char *str) {
	ThrowIfNull(str);
	auto parsed = ParseFloating<float>(str);
	if (parsed) {
		return parsed.value;
	}
	return FloatMalformedSentinel();
}

bool TryParseDouble(const char *str, double &result) {
	return TryParseFloating(str, result);
}

double ParseDouble(const char *str) {
	ThrowIfNull(str);
	auto parsed = ParseFloating<double>(str);
	if (parsed) {
		return parsed.value;
	}
	return DoubleMalformedSentinel();
}

bool TryParseDecimal(const char *str, NumberDecimal &result) {
	result = NumberDecimal();
	if (IsNullOrWhiteSpace(str)) {
		return false;
	}
	auto parsed = ParseNumberDecimal(str);
	result = parsed.value;
	return parsed.IsSuccess();
}

float FloatMalformedSentinel() {
	return std::numeric_limits<float>::quiet_NaN();
}

double DoubleMalformedSentinel() {
	return std::numeric_limits<double>::denorm_min();
}

NumberDecimal DecimalMalformedSentinel() {
	return NumberDecimal::FromParts(hugeint_t(11), true, 1);
}

NumberDecimal DecimalOverflowSentinel() {
	return NumberDecimal::FromParts(hugeint_t(22), true, 1);
}

NumberDecimal ParseDecimal(const char *str) {
	ThrowIfNull(str);
	NumberLiteral literal;
	if (ScanNumberLiteral(str, LiteralStyle::FLOAT, literal) && ExceedsDecimalRange(literal)) {
		return DecimalOverflowSentinel();
	}
	auto parsed = ParseNumberDecimal(str);
	if (parsed) {
		return parsed.value;
	}
	// also reached by non-integral literals beyond the range, e.g. 100000000000000000000000000000.5
	return DecimalMalformedSentinel();
}

} // namespace numparse
