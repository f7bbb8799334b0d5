#include "number_decimal.hpp"
#include "utils.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/types/hugeint.hpp"

using duckdb::Hugeint;
using duckdb::InternalException;
using duckdb::OutOfRangeException;

namespace numparse {

hugeint_t NumberDecimal::MaxMantissa() {
	hugeint_t result;
	result.upper = 0xFFFFFFFF;
	result.lower = 0xFFFFFFFFFFFFFFFFULL;
	return result;
}

NumberDecimal::NumberDecimal() : mantissa(0), negative(false), scale(0) {
}

NumberDecimal::NumberDecimal(int64_t value)
    : mantissa(value < 0 ? -hugeint_t(value) : hugeint_t(value)), negative(value < 0), scale(0) {
}

NumberDecimal::NumberDecimal(hugeint_t mantissa_p, bool negative_p, uint8_t scale_p)
    : mantissa(mantissa_p), negative(negative_p && mantissa_p != hugeint_t(0)), scale(scale_p) {
}

NumberDecimal NumberDecimal::FromParts(hugeint_t mantissa, bool negative, uint8_t scale) {
	if (mantissa < hugeint_t(0) || mantissa > MaxMantissa()) {
		throw OutOfRangeException("Decimal mantissa %s does not fit in 96 bits", Hugeint::ToString(mantissa));
	}
	if (scale > MAX_SCALE) {
		throw OutOfRangeException("Decimal scale %d exceeds the maximum of %d", static_cast<int>(scale),
		                          static_cast<int>(MAX_SCALE));
	}
	return NumberDecimal(mantissa, negative, scale);
}

NumberDecimal NumberDecimal::MaxValue() {
	return NumberDecimal(MaxMantissa(), false, 0);
}

NumberDecimal NumberDecimal::MinValue() {
	return NumberDecimal(MaxMantissa(), true, 0);
}

std::string NumberDecimal::ToString() const {
	auto digits = Hugeint::ToString(mantissa);
	if (scale > 0) {
		if (digits.size() <= scale) {
			digits.insert(0, scale - digits.size() + 1, '0');
		}
		digits.insert(digits.size() - scale, 1, '.');
	}
	if (negative) {
		digits.insert(0, 1, '-');
	}
	return digits;
}

double NumberDecimal::ToDouble() const {
	auto text = Hugeint::ToString(mantissa);
	if (scale > 0) {
		text += "e-" + std::to_string(scale);
	}
	auto result = ConvertDouble(text);
	if (!result) {
		// every 96-bit decimal is far inside the double range
		throw InternalException("Could not convert decimal %s to DOUBLE", ToString());
	}
	return negative ? -*result : *result;
}

static int CompareMagnitude(hugeint_t lhs, uint8_t lhs_scale, hugeint_t rhs, uint8_t rhs_scale) {
	// bring both sides to the larger scale, a side that overflows 128 bits is the larger one
	if (lhs_scale < rhs_scale) {
		if (!Hugeint::TryMultiply(lhs, Hugeint::POWERS_OF_TEN[rhs_scale - lhs_scale], lhs)) {
			return 1;
		}
	} else if (lhs_scale > rhs_scale) {
		if (!Hugeint::TryMultiply(rhs, Hugeint::POWERS_OF_TEN[lhs_scale - rhs_scale], rhs)) {
			return -1;
		}
	}
	if (lhs < rhs) {
		return -1;
	}
	return lhs > rhs ? 1 : 0;
}

int NumberDecimal::Compare(const NumberDecimal &other) const {
	if (negative != other.negative) {
		return negative ? -1 : 1;
	}
	auto result = CompareMagnitude(mantissa, scale, other.mantissa, other.scale);
	return negative ? -result : result;
}

} // namespace numparse
