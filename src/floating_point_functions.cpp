#include "numeric_functions.hpp"
#include "floating_point_parser.hpp"

namespace duckdb {

static float MalformedFloat(std::string_view) {
	return numparse::FloatMalformedSentinel();
}

static double MalformedDouble(std::string_view) {
	return numparse::DoubleMalformedSentinel();
}

// Decimals leave the engine as text: a 96-bit mantissa with a per-value scale fits no single DECIMAL(width, scale).
static void TryParseDecimalFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	const bool returns_zero = TryReturnsZero(state);
	UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
	    args.data[0], result, args.size(), [&](string_t input, ValidityMask &mask, idx_t idx) {
		    numparse::NumberDecimal value;
		    const bool parsed =
		        !HasEmbeddedNul(input) && numparse::TryParseDecimal(input.GetString().c_str(), value);
		    if (!parsed && !returns_zero) {
			    mask.SetInvalid(idx);
			    return string_t();
		    }
		    return StringVector::AddString(result, value.ToString());
	    });
}

static void ParseDecimalFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t input) {
		const auto value = HasEmbeddedNul(input) ? numparse::DecimalMalformedSentinel()
		                                         : numparse::ParseDecimal(input.GetString().c_str());
		return StringVector::AddString(result, value.ToString());
	});
}

void RegisterFloatingPointFunctions(ExtensionLoader &loader) {
	RegisterParsePair<float, numparse::TryParseFloat, numparse::ParseFloat, MalformedFloat>(loader, "float",
	                                                                                       LogicalType::FLOAT);
	RegisterParsePair<double, numparse::TryParseDouble, numparse::ParseDouble, MalformedDouble>(loader, "double",
	                                                                                           LogicalType::DOUBLE);

	loader.RegisterFunction(
	    ScalarFunction("try_parse_decimal", {LogicalType::VARCHAR}, LogicalType::VARCHAR, TryParseDecimalFunction));
	loader.RegisterFunction(
	    ScalarFunction("parse_decimal", {LogicalType::VARCHAR}, LogicalType::VARCHAR, ParseDecimalFunction));
}

} // namespace duckdb
