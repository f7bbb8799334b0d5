#include "numeric_functions.hpp"
#include "number_parser.hpp"

namespace duckdb {

namespace np = numparse;

void RegisterIntegerFunctions(ExtensionLoader &loader) {
	RegisterParsePair<int8_t, np::TrySignedByte, np::ParseSignedByte, np::MalformedFallback<int8_t>>(
	    loader, "int8", LogicalType::TINYINT);
	RegisterParsePair<uint8_t, np::TryParseByte, np::ParseByte, np::MalformedFallback<uint8_t>>(loader, "uint8",
	                                                                                           LogicalType::UTINYINT);
	RegisterParsePair<int16_t, np::TryParseShort, np::ParseShort, np::MalformedFallback<int16_t>>(
	    loader, "int16", LogicalType::SMALLINT);
	RegisterParsePair<uint16_t, np::TryParseUnsignedShort, np::ParseUnsignedShort, np::MalformedFallback<uint16_t>>(
	    loader, "uint16", LogicalType::USMALLINT);
	RegisterParsePair<int32_t, np::TryParseInteger, np::ParseInteger, np::MalformedFallback<int32_t>>(
	    loader, "int32", LogicalType::INTEGER);
	RegisterParsePair<uint32_t, np::TryParseUnsignedInteger, np::ParseUnsignedInteger,
	                  np::MalformedFallback<uint32_t>>(loader, "uint32", LogicalType::UINTEGER);
	RegisterParsePair<int64_t, np::TryParseLong, np::ParseLong, np::MalformedFallback<int64_t>>(loader, "int64",
	                                                                                           LogicalType::BIGINT);
	RegisterParsePair<uint64_t, np::TryParseUnsignedLong, np::ParseUnsignedLong, np::MalformedFallback<uint64_t>>(
	    loader, "uint64", LogicalType::UBIGINT);
}

} // namespace duckdb
