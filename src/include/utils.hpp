#pragma once

#include <optional>
#include <string_view>

// Character and string helpers shared by the integer and floating point parsers.
// These functions are defined in utils.cpp.

namespace numparse {

// True for the ASCII whitespace accepted around a number: space, \t, \n, \v, \f and \r.
bool IsNumberWhitespace(char c);

// Strips leading and trailing number whitespace.
std::string_view TrimNumberWhitespace(std::string_view s);

// True for nullptr, "" and strings made only of number whitespace.
bool IsNullOrWhiteSpace(const char *s);

// Converts a normalized "[-]digits[e[-]digits]" string into a float.
// Returns std::nullopt when the value does not fit the type.
std::optional<float> ConvertFloat(std::string_view s);

// Converts a normalized "[-]digits[e[-]digits]" string into a double.
// Returns std::nullopt when the value does not fit the type.
std::optional<double> ConvertDouble(std::string_view s);

} // namespace numparse
