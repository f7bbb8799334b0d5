#pragma once

#include "duckdb.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include <cstring>
#include <string_view>

namespace duckdb {

// BOOLEAN setting: when true, try_parse_* return 0 instead of NULL for text that does not parse.
static constexpr const char *TRY_RETURNS_ZERO_SETTING = "numparse_try_returns_zero";

bool TryReturnsZero(ExpressionState &state);

// VARCHAR values may hold NUL bytes, which the C string conversions would stop at. Such text is never a number.
inline bool HasEmbeddedNul(const string_t &input) {
	return std::memchr(input.GetData(), '\0', input.GetSize()) != nullptr;
}

template <class T, bool (*TRY_PARSE)(const char *, T &)>
void NumparseTryFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	const bool returns_zero = TryReturnsZero(state);
	UnaryExecutor::ExecuteWithNulls<string_t, T>(args.data[0], result, args.size(),
	                                             [&](string_t input, ValidityMask &mask, idx_t idx) {
		                                             T value = 0;
		                                             const bool parsed = !HasEmbeddedNul(input) &&
		                                                                 TRY_PARSE(input.GetString().c_str(), value);
		                                             if (!parsed && !returns_zero) {
			                                             mask.SetInvalid(idx);
		                                             }
		                                             return value;
	                                             });
}

template <class T, T (*PARSE)(const char *), T (*ON_MALFORMED)(std::string_view)>
void NumparseParseFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, T>(args.data[0], result, args.size(), [&](string_t input) {
		if (HasEmbeddedNul(input)) {
			return ON_MALFORMED(std::string_view(input.GetData(), input.GetSize()));
		}
		return PARSE(input.GetString().c_str());
	});
}

template <class T, bool (*TRY_PARSE)(const char *, T &), T (*PARSE)(const char *),
          T (*ON_MALFORMED)(std::string_view)>
void RegisterParsePair(ExtensionLoader &loader, const string &type_name, const LogicalType &return_type) {
	loader.RegisterFunction(ScalarFunction("try_parse_" + type_name, {LogicalType::VARCHAR}, return_type,
	                                       NumparseTryFunction<T, TRY_PARSE>));
	loader.RegisterFunction(
	    ScalarFunction("parse_" + type_name, {LogicalType::VARCHAR}, return_type, NumparseParseFunction<T, PARSE, ON_MALFORMED>));
}

// try_parse_<type> and parse_<type> for int8 .. uint64
void RegisterIntegerFunctions(ExtensionLoader &loader);
// try_parse_<type> and parse_<type> for float, double and decimal
void RegisterFloatingPointFunctions(ExtensionLoader &loader);
// parse_outcome(type, text)
void RegisterParseOutcomeFunction(ExtensionLoader &loader);

} // namespace duckdb
