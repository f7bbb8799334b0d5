#include "number_literal.hpp"
#include "utils.hpp"

#include "duckdb/common/string_util.hpp"

using duckdb::StringUtil;

namespace numparse {

static bool IsDigit(char c) {
	return c >= '0' && c <= '9';
}

bool NumberLiteral::IsIntegral() const {
	if (kind != LiteralKind::FINITE) {
		return false;
	}
	if (IsZero() || exponent >= 0) {
		return true;
	}
	auto fraction_digits = static_cast<uint64_t>(-exponent);
	if (fraction_digits >= digits.size()) {
		// the leading digit is never zero
		return false;
	}
	for (auto i = digits.size() - fraction_digits; i < digits.size(); i++) {
		if (digits[i] != '0') {
			return false;
		}
	}
	return true;
}

std::string NumberLiteral::ToNormalizedString() const {
	std::string result;
	if (negative) {
		result += '-';
	}
	if (IsZero()) {
		result += '0';
		return result;
	}
	result += digits;
	if (exponent != 0) {
		result += 'e';
		result += std::to_string(exponent);
	}
	return result;
}

bool ScanNumberLiteral(std::string_view text, LiteralStyle style, NumberLiteral &literal) {
	literal = NumberLiteral();
	text = TrimNumberWhitespace(text);

	size_t pos = 0;
	const size_t len = text.size();
	if (pos < len && (text[pos] == '+' || text[pos] == '-')) {
		literal.negative = text[pos] == '-';
		pos++;
	}

	size_t mantissa_digits = 0;
	int64_t fraction_digits = 0;
	for (; pos < len && IsDigit(text[pos]); pos++) {
		mantissa_digits++;
		if (!literal.digits.empty() || text[pos] != '0') {
			literal.digits += text[pos];
		}
	}
	if (style == LiteralStyle::FLOAT && pos < len && text[pos] == '.') {
		pos++;
		for (; pos < len && IsDigit(text[pos]); pos++) {
			mantissa_digits++;
			fraction_digits++;
			if (!literal.digits.empty() || text[pos] != '0') {
				literal.digits += text[pos];
			}
		}
	}
	if (mantissa_digits == 0) {
		return false;
	}

	int64_t explicit_exponent = 0;
	if (style == LiteralStyle::FLOAT && pos < len && (text[pos] == 'e' || text[pos] == 'E')) {
		pos++;
		bool negative_exponent = false;
		if (pos < len && (text[pos] == '+' || text[pos] == '-')) {
			negative_exponent = text[pos] == '-';
			pos++;
		}
		if (pos == len || !IsDigit(text[pos])) {
			return false;
		}
		for (; pos < len && IsDigit(text[pos]); pos++) {
			if (explicit_exponent < MAX_LITERAL_EXPONENT) {
				explicit_exponent = explicit_exponent * 10 + (text[pos] - '0');
			}
		}
		if (explicit_exponent > MAX_LITERAL_EXPONENT) {
			explicit_exponent = MAX_LITERAL_EXPONENT;
		}
		if (negative_exponent) {
			explicit_exponent = -explicit_exponent;
		}
	}
	if (pos != len) {
		return false;
	}

	// zero keeps its exponent so that "0.00" still carries two fraction digits
	literal.exponent = explicit_exponent - fraction_digits;
	return true;
}

bool ScanFloatingLiteral(std::string_view text, NumberLiteral &literal) {
	if (ScanNumberLiteral(text, LiteralStyle::FLOAT, literal)) {
		return true;
	}
	literal = NumberLiteral();
	auto symbol = TrimNumberWhitespace(text);
	if (!symbol.empty() && (symbol[0] == '+' || symbol[0] == '-')) {
		literal.negative = symbol[0] == '-';
		symbol.remove_prefix(1);
	}
	if (StringUtil::CIEquals(std::string(symbol), "infinity")) {
		literal.kind = LiteralKind::INFINITY_SYMBOL;
		return true;
	}
	if (StringUtil::CIEquals(std::string(symbol), "nan")) {
		literal.kind = LiteralKind::NAN_SYMBOL;
		return true;
	}
	literal = NumberLiteral();
	return false;
}

} // namespace numparse
