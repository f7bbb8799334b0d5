#include "utils.hpp"

#include <charconv>
#include <optional>
#include <system_error>

namespace numparse {

bool IsNumberWhitespace(char c) {
	switch (c) {
	case ' ':
	case '\t':
	case '\n':
	case '\v':
	case '\f':
	case '\r':
		return true;
	default:
		return false;
	}
}

std::string_view TrimNumberWhitespace(std::string_view s) {
	size_t begin = 0;
	size_t end = s.size();
	while (begin < end && IsNumberWhitespace(s[begin])) {
		begin++;
	}
	while (end > begin && IsNumberWhitespace(s[end - 1])) {
		end--;
	}
	return s.substr(begin, end - begin);
}

bool IsNullOrWhiteSpace(const char *s) {
	if (!s) {
		return true;
	}
	for (; *s; s++) {
		if (!IsNumberWhitespace(*s)) {
			return false;
		}
	}
	return true;
}

// std::from_chars never consults the locale, unlike strtod / std::stof.
template <class T>
static std::optional<T> ConvertFloating(std::string_view s) {
	T result;
	auto last = s.data() + s.size();
	auto [ptr, ec] = std::from_chars(s.data(), last, result, std::chars_format::general);
	if (ec == std::errc() && ptr == last) {
		return result;
	}
	return std::nullopt;
}

std::optional<float> ConvertFloat(std::string_view s) {
	return ConvertFloating<float>(s);
}

std::optional<double> ConvertDouble(std::string_view s) {
	return ConvertFloating<double>(s);
}

} // namespace numparse
