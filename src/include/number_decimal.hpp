#pragma once

#include "duckdb/common/hugeint.hpp"

#include <cstdint>
#include <string>

namespace numparse {

using duckdb::hugeint_t;

// A 96-bit scaled decimal: value = (-1)^negative * mantissa / 10^scale, with mantissa < 2^96 and scale <= 28.
// Zero is never negative. Comparison is by numeric value, so 42.5 == 42.50, while ToString keeps the scale.
class NumberDecimal {
public:
	static constexpr uint8_t MAX_SCALE = 28;
	static constexpr uint8_t MAX_DIGITS = 29;
	//! 2^96 - 1 = 79228162514264337593543950335
	static hugeint_t MaxMantissa();

	NumberDecimal();
	explicit NumberDecimal(int64_t value);

	//! Throws OutOfRangeException when the mantissa is negative or above MaxMantissa(), or the scale is above MAX_SCALE
	static NumberDecimal FromParts(hugeint_t mantissa, bool negative, uint8_t scale);
	static NumberDecimal MaxValue();
	static NumberDecimal MinValue();

	const hugeint_t &Mantissa() const {
		return mantissa;
	}
	bool IsNegative() const {
		return negative;
	}
	uint8_t Scale() const {
		return scale;
	}
	bool IsZero() const {
		return mantissa == hugeint_t(0);
	}

	//! Plain decimal text without exponent, e.g. "-0.050"
	std::string ToString() const;
	double ToDouble() const;

	//! -1, 0 or 1
	int Compare(const NumberDecimal &other) const;

	bool operator==(const NumberDecimal &other) const {
		return Compare(other) == 0;
	}
	bool operator!=(const NumberDecimal &other) const {
		return Compare(other) != 0;
	}
	bool operator<(const NumberDecimal &other) const {
		return Compare(other) < 0;
	}
	bool operator<=(const NumberDecimal &other) const {
		return Compare(other) <= 0;
	}
	bool operator>(const NumberDecimal &other) const {
		return Compare(other) > 0;
	}
	bool operator>=(const NumberDecimal &other) const {
		return Compare(other) >= 0;
	}

private:
	NumberDecimal(hugeint_t mantissa, bool negative, uint8_t scale);

	hugeint_t mantissa;
	bool negative;
	uint8_t scale;
};

} // namespace numparse
