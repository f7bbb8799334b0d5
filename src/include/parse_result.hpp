#pragma once

#include <cstdint>

namespace numparse {

enum class ParseOutcome : uint8_t { SUCCESS = 0, MALFORMED = 1, OUT_OF_RANGE = 2 };

// Outcome tag plus value. The value is zero unless the outcome is SUCCESS.
template <class T>
struct ParseResult {
	ParseOutcome outcome = ParseOutcome::MALFORMED;
	T value = T();

	static ParseResult Success(T value) {
		return ParseResult {ParseOutcome::SUCCESS, value};
	}
	static ParseResult Malformed() {
		return ParseResult {ParseOutcome::MALFORMED, T()};
	}
	static ParseResult Overflow() {
		return ParseResult {ParseOutcome::OUT_OF_RANGE, T()};
	}

	bool IsSuccess() const {
		return outcome == ParseOutcome::SUCCESS;
	}
	explicit operator bool() const {
		return IsSuccess();
	}
};

// "success", "malformed" or "overflow".
const char *ParseOutcomeName(ParseOutcome outcome);

} // namespace numparse
