#include "parse_result.hpp"

#include "duckdb/common/exception.hpp"

namespace numparse {

const char *ParseOutcomeName(ParseOutcome outcome) {
	switch (outcome) {
	case ParseOutcome::SUCCESS:
		return "success";
	case ParseOutcome::MALFORMED:
		return "malformed";
	case ParseOutcome::OUT_OF_RANGE:
		return "overflow";
	}
	throw duckdb::InternalException("Unrecognized parse outcome %d", static_cast<int>(outcome));
}

} // namespace numparse
