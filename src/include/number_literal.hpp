#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace numparse {

// The fixed numeric grammar. Only '.' is a decimal point, there are no group separators and the host locale is
// never consulted.
//   INTEGER: [ws] [+|-] digit+ [ws]
//   FLOAT:   [ws] [+|-] (digit+ [. digit*] | . digit+) [(e|E) [+|-] digit+] [ws]
enum class LiteralStyle : uint8_t { INTEGER, FLOAT };

enum class LiteralKind : uint8_t { FINITE, INFINITY_SYMBOL, NAN_SYMBOL };

constexpr int64_t MAX_LITERAL_EXPONENT = 1000000000;

// A scanned literal: value = (-1)^negative * digits * 10^exponent.
struct NumberLiteral {
	LiteralKind kind = LiteralKind::FINITE;
	bool negative = false;
	// Significant digits, leading zeros stripped, trailing zeros kept. Empty for zero.
	std::string digits;
	int64_t exponent = 0;

	bool IsZero() const {
		return digits.empty();
	}
	// Number of digits left of the decimal point, may be zero or negative.
	int64_t IntegerDigitCount() const {
		return static_cast<int64_t>(digits.size()) + exponent;
	}
	// True when no non-zero digit sits right of the decimal point.
	bool IsIntegral() const;
	// "[-]digits[e exponent]", the form std::from_chars accepts.
	std::string ToNormalizedString() const;
};

// Scans text in the given style. Surrounding whitespace is skipped.
// Returns false when the text is not a literal of the grammar.
bool ScanNumberLiteral(std::string_view text, LiteralStyle style, NumberLiteral &literal);

// As ScanNumberLiteral in FLOAT style, additionally accepting [+|-]Infinity and [+|-]NaN in any letter case.
bool ScanFloatingLiteral(std::string_view text, NumberLiteral &literal);

} // namespace numparse
