#pragma once

#include "pulsar_errors.hpp"
#include "duckdb.hpp"

#include <string>

namespace duckdb {

//===--------------------------------------------------------------------===//
// PulsarConnectorConfig - normalized config resolved from catalog options
//
// This is the single chokepoint where registration options are mapped to
// connector configuration. The configuration is immutable once resolved and
// is shared read-only by every catalog call.
//===--------------------------------------------------------------------===//
struct PulsarConnectorConfig {
	//! Identifier stamped on every table and column handle
	std::string connector_id = "pulsar";
	//! Replacement for '/' in schema names shown to the engine; empty disables rewriting
	std::string rewrite_namespace_delimiter;

	bool IsNamespaceDelimiterRewriteEnabled() const {
		return !rewrite_namespace_delimiter.empty();
	}
};

//! Check that a rewrite delimiter can be reversed: it must contain at least one
//! character that Pulsar does not allow in tenant or namespace names.
//! Throws PulsarException with PulsarErrorCode::InvalidConfig otherwise.
void ValidateRewriteNamespaceDelimiter(const std::string &delimiter);

//! Replace '/' in a canonical namespace name with the delimiter; identity for an empty delimiter.
std::string RewriteNamespaceDelimiter(const std::string &namespace_name, const std::string &delimiter);

//! Replace the delimiter with '/'; identity for an empty delimiter.
std::string RestoreNamespaceDelimiter(const std::string &schema_name, const std::string &delimiter);

//===--------------------------------------------------------------------===//
// ResolveConnectorConfig - the one config normalization chokepoint
//===--------------------------------------------------------------------===//
//! Resolve a PulsarConnectorConfig from a case-insensitive option map.
//!
//! Reads TYPE, CONNECTOR_ID and REWRITE_NAMESPACE_DELIMITER. TYPE, when
//! present, must be 'pulsar'. Missing options keep their defaults; any other
//! option is rejected.
//!
//! Throws PulsarException with PulsarErrorCode::InvalidConfig on invalid
//! configuration.
PulsarConnectorConfig ResolveConnectorConfig(const case_insensitive_map_t<Value> &options);

} // namespace duckdb
