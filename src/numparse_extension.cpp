#define DUCKDB_EXTENSION_MAIN

#include "numparse_extension.hpp"
#include "numeric_functions.hpp"
#include "number_parser.hpp"
#include "floating_point_parser.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

bool TryReturnsZero(ExpressionState &state) {
	Value setting;
	if (!state.GetContext().TryGetCurrentSetting(TRY_RETURNS_ZERO_SETTING, setting) || setting.IsNull()) {
		return false;
	}
	return BooleanValue::Get(setting);
}

static numparse::ParseOutcome ClassifyNumber(const string &type_name, const string &text) {
	const auto type = StringUtil::Lower(type_name);
	if (type == "int8") {
		return numparse::ParseIntegral<int8_t>(text).outcome;
	} else if (type == "uint8") {
		return numparse::ParseIntegral<uint8_t>(text).outcome;
	} else if (type == "int16") {
		return numparse::ParseIntegral<int16_t>(text).outcome;
	} else if (type == "uint16") {
		return numparse::ParseIntegral<uint16_t>(text).outcome;
	} else if (type == "int32") {
		return numparse::ParseIntegral<int32_t>(text).outcome;
	} else if (type == "uint32") {
		return numparse::ParseIntegral<uint32_t>(text).outcome;
	} else if (type == "int64") {
		return numparse::ParseIntegral<int64_t>(text).outcome;
	} else if (type == "uint64") {
		return numparse::ParseIntegral<uint64_t>(text).outcome;
	} else if (type == "float") {
		return numparse::ParseFloating<float>(text).outcome;
	} else if (type == "double") {
		return numparse::ParseFloating<double>(text).outcome;
	} else if (type == "decimal") {
		return numparse::ParseNumberDecimal(text).outcome;
	}
	throw InvalidInputException("parse_outcome: unsupported type \"%s\", expected one of int8, uint8, int16, uint16, "
	                            "int32, uint32, int64, uint64, float, double, decimal",
	                            type_name);
}

static void ParseOutcomeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	BinaryExecutor::Execute<string_t, string_t, string_t>(
	    args.data[0], args.data[1], result, args.size(), [&](string_t type_name, string_t text) {
		    const auto outcome = ClassifyNumber(type_name.GetString(), text.GetString());
		    return StringVector::AddString(result, numparse::ParseOutcomeName(outcome));
	    });
}

void RegisterParseOutcomeFunction(ExtensionLoader &loader) {
	loader.RegisterFunction(ScalarFunction("parse_outcome", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                       LogicalType::VARCHAR, ParseOutcomeFunction));
}

static void LoadInternal(ExtensionLoader &loader) {
	auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());
	config.AddExtensionOption(TRY_RETURNS_ZERO_SETTING,
	                          "Return 0 instead of NULL from try_parse_* when the text does not parse",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));

	RegisterIntegerFunctions(loader);
	RegisterFloatingPointFunctions(loader);
	RegisterParseOutcomeFunction(loader);
}

void NumparseExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string NumparseExtension::Name() {
	return "numparse";
}

std::string NumparseExtension::Version() const {
#ifdef EXT_VERSION_NUMPARSE
	return EXT_VERSION_NUMPARSE;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(numparse, loader) {
	duckdb::LoadInternal(loader);
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
