#include "pulsar_config.hpp"
#include "duckdb/common/string_util.hpp"

#include <cctype>

namespace duckdb {

static std::string GetOptionString(const case_insensitive_map_t<Value> &options, const std::string &key) {
	auto it = options.find(key);
	if (it == options.end() || it->second.IsNull()) {
		return "";
	}
	return it->second.ToString();
}

static bool IsNameCharacter(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '=' || c == ':' || c == '.';
}

void ValidateRewriteNamespaceDelimiter(const std::string &delimiter) {
	if (delimiter.empty()) {
		return;
	}
	for (char c : delimiter) {
		if (!IsNameCharacter(c)) {
			return;
		}
	}
	throw_pulsar_error(PulsarErrorCode::InvalidConfig, PulsarErrorTag {"config", "ResolveConnectorConfig", false},
	                   "Can't use '" + delimiter +
	                       "' as namespace delimiter, because the delimiter must contain a character that "
	                       "namespace names are not allowed to have");
}

std::string RewriteNamespaceDelimiter(const std::string &namespace_name, const std::string &delimiter) {
	if (delimiter.empty()) {
		return namespace_name;
	}
	return StringUtil::Replace(namespace_name, "/", delimiter);
}

std::string RestoreNamespaceDelimiter(const std::string &schema_name, const std::string &delimiter) {
	if (delimiter.empty()) {
		return schema_name;
	}
	return StringUtil::Replace(schema_name, delimiter, "/");
}

PulsarConnectorConfig ResolveConnectorConfig(const case_insensitive_map_t<Value> &options) {
	PulsarConnectorConfig config;

	auto type_str = GetOptionString(options, "TYPE");
	if (!type_str.empty() && StringUtil::Lower(type_str) != "pulsar") {
		throw_pulsar_error(PulsarErrorCode::InvalidConfig, PulsarErrorTag {"config", "ResolveConnectorConfig", false},
		                   "TYPE must be 'pulsar', got '" + type_str + "'");
	}

	auto connector_id = GetOptionString(options, "CONNECTOR_ID");
	if (!connector_id.empty()) {
		config.connector_id = connector_id;
	}

	config.rewrite_namespace_delimiter = GetOptionString(options, "REWRITE_NAMESPACE_DELIMITER");
	ValidateRewriteNamespaceDelimiter(config.rewrite_namespace_delimiter);

	for (auto &entry : options) {
		auto key = StringUtil::Lower(entry.first);
		if (key != "type" && key != "connector_id" && key != "rewrite_namespace_delimiter") {
			throw_pulsar_error(PulsarErrorCode::InvalidConfig,
			                   PulsarErrorTag {"config", "ResolveConnectorConfig", false},
			                   "Unknown pulsar catalog option '" + entry.first + "'");
		}
	}

	return config;
}

} // namespace duckdb
