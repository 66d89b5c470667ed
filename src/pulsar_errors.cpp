#include "pulsar_errors.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

void ThrowPulsarError(const PulsarError &error) {
	switch (error.code) {
	case PulsarErrorCode::SchemaNotFound:
	case PulsarErrorCode::TableNotFound:
		throw CatalogException(error.message);
	case PulsarErrorCode::InvalidSchema:
		if (error.detail.empty()) {
			throw InvalidInputException(error.message);
		}
		throw InvalidInputException(error.message + ": " + error.detail);
	case PulsarErrorCode::InvalidConfig:
	case PulsarErrorCode::InvalidArgument:
		throw InvalidInputException(error.message);
	case PulsarErrorCode::PermissionDenied:
		throw PermissionException(error.message);
	default: {
		std::string message = std::string("Pulsar ") + PulsarErrorCodeToString(error.code) + ": " + error.message;
		if (!error.detail.empty()) {
			message += " (" + error.detail + ")";
		}
		throw IOException(message);
	}
	}
}

} // namespace duckdb
