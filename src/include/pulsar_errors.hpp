#pragma once

#include "pulsar_connector.hpp"
#include "duckdb.hpp"
#include <stdexcept>
#include <string>

namespace duckdb {

inline const char *PulsarErrorCodeToString(PulsarErrorCode code) {
	switch (code) {
	case PulsarErrorCode::Ok:
		return "Ok";
	case PulsarErrorCode::NotFound:
		return "NotFound";
	case PulsarErrorCode::PermissionDenied:
		return "PermissionDenied";
	case PulsarErrorCode::Transient:
		return "Transient";
	case PulsarErrorCode::InvalidConfig:
		return "InvalidConfig";
	case PulsarErrorCode::Unsupported:
		return "Unsupported";
	case PulsarErrorCode::InvalidArgument:
		return "InvalidArgument";
	case PulsarErrorCode::SchemaNotFound:
		return "SchemaNotFound";
	case PulsarErrorCode::TableNotFound:
		return "TableNotFound";
	case PulsarErrorCode::InvalidSchema:
		return "InvalidSchema";
	default:
		return "Unknown";
	}
}

//! Structured error tag for context
struct PulsarErrorTag {
	//! Which component: "config", "names", "metadata"
	std::string component;
	//! Which operation: "ResolveConnectorConfig", "GetTableMetadata", etc.
	std::string operation;
	//! Whether the error is potentially transient and safe to retry
	bool retryable = false;
};

//! Exception class for configuration and registration errors
class PulsarException : public std::runtime_error {
public:
	PulsarException(PulsarErrorCode code, const PulsarErrorTag &tag, const std::string &message)
	    : std::runtime_error(message), error_code_(code), error_tag_(tag) {
	}

	PulsarErrorCode GetErrorCode() const {
		return error_code_;
	}

	const PulsarErrorTag &GetErrorTag() const {
		return error_tag_;
	}

private:
	PulsarErrorCode error_code_;
	PulsarErrorTag error_tag_;
};

//! Helper function to throw a pulsar error
inline void throw_pulsar_error(PulsarErrorCode code, const PulsarErrorTag &tag, const std::string &message) {
	throw PulsarException(code, tag, message);
}

//===--------------------------------------------------------------------===//
// Catalog error messages
//===--------------------------------------------------------------------===//
inline std::string SchemaNotFoundMessage(const std::string &schema_name) {
	return "Schema " + schema_name + " does not exist";
}

inline std::string TableNotFoundMessage(const std::string &schema_name, const std::string &table_name) {
	return "Table '" + schema_name + "." + table_name + "' not found";
}

inline std::string InvalidSchemaMessage(const std::string &fully_qualified_topic) {
	return "Topic " + fully_qualified_topic + " does not have a valid schema";
}

//! Raise a catalog error as the DuckDB exception matching its kind.
[[noreturn]] void ThrowPulsarError(const PulsarError &error);

} // namespace duckdb
