#include "pulsar_metadata.hpp"
#include "pulsar_errors.hpp"
#include "pulsar_logger.hpp"
#include "schema/pulsar_schema_translator.hpp"

namespace duckdb {

static PulsarAdminClients RequireCompleteClients(PulsarAdminClients clients) {
	if (!clients.IsComplete()) {
		throw_pulsar_error(PulsarErrorCode::InvalidConfig, PulsarErrorTag {"metadata", "PulsarMetadata", false},
		                   "Pulsar catalog requires a namespace directory, a topic directory and a schema registry");
	}
	return clients;
}

PulsarMetadata::PulsarMetadata(PulsarConnectorConfig config, PulsarAdminClients clients)
    : config_(std::move(config)), clients_(RequireCompleteClients(std::move(clients))),
      namespace_catalog_(clients_.namespaces, config_.rewrite_namespace_delimiter),
      topic_catalog_(clients_.topics, config_.rewrite_namespace_delimiter), handle_resolver_(config_.connector_id) {
	ValidateRewriteNamespaceDelimiter(config_.rewrite_namespace_delimiter);
}

PulsarResult<std::vector<std::string>> PulsarMetadata::ListSchemaNames(const PulsarSession &session) const {
	(void)session;
	return namespace_catalog_.ListSchemaNames();
}

PulsarTableHandle PulsarMetadata::GetTableHandle(const PulsarSession &session, const SchemaTableName &table) const {
	(void)session;
	auto canonical = namespace_catalog_.RestoreNamespaceDelimiter(table.schema_name);
	return handle_resolver_.MakeTableHandle(canonical, table.table_name);
}

PulsarResult<PulsarTableMetadata> PulsarMetadata::GetTableMetadata(const PulsarSession &session,
                                                                   const PulsarTableHandle &handle) const {
	(void)session;
	auto columns = ResolveColumns(handle);
	if (!columns.IsOk()) {
		return PulsarResult<PulsarTableMetadata>::Error(columns.error);
	}
	PulsarTableMetadata metadata;
	metadata.table = handle.GetSchemaTableName();
	metadata.columns = std::move(columns.value);
	return PulsarResult<PulsarTableMetadata>::Success(std::move(metadata));
}

PulsarResult<std::unordered_map<std::string, PulsarColumnHandle>>
PulsarMetadata::GetColumnHandles(const PulsarSession &session, const PulsarTableHandle &handle) const {
	(void)session;
	using result_t = PulsarResult<std::unordered_map<std::string, PulsarColumnHandle>>;
	auto columns = ResolveColumns(handle);
	if (!columns.IsOk()) {
		return result_t::Error(columns.error);
	}
	std::unordered_map<std::string, PulsarColumnHandle> handles;
	for (auto &column : columns.value) {
		handles.emplace(column.name, handle_resolver_.MakeColumnHandle(column));
	}
	return result_t::Success(std::move(handles));
}

PulsarResult<std::vector<SchemaTableName>>
PulsarMetadata::ListTables(const PulsarSession &session, const std::optional<std::string> &schema_name) const {
	(void)session;
	std::vector<SchemaTableName> result;
	auto tables = topic_catalog_.ListTables(schema_name);
	if (!tables.IsOk()) {
		return PulsarResult<std::vector<SchemaTableName>>::Error(tables.error);
	}
	if (tables.value.empty()) {
		return PulsarResult<std::vector<SchemaTableName>>::Success(std::move(result));
	}
	auto canonical = namespace_catalog_.RestoreNamespaceDelimiter(*schema_name);
	result.reserve(tables.value.size());
	for (auto &table : tables.value) {
		result.emplace_back(canonical, table);
	}
	return PulsarResult<std::vector<SchemaTableName>>::Success(std::move(result));
}

PulsarResult<std::map<SchemaTableName, std::vector<PulsarColumnMetadata>>>
PulsarMetadata::ListTableColumns(const PulsarSession &session, const SchemaTablePrefix &prefix) const {
	(void)session;
	using columns_map_t = std::map<SchemaTableName, std::vector<PulsarColumnMetadata>>;
	using result_t = PulsarResult<columns_map_t>;
	columns_map_t result;

	auto canonical = namespace_catalog_.RestoreNamespaceDelimiter(prefix.schema_name);
	auto namespace_name = ResolveNamespace(canonical);
	if (!namespace_name.IsOk()) {
		if (namespace_name.error.code == PulsarErrorCode::SchemaNotFound) {
			return result_t::Success(std::move(result));
		}
		return result_t::Error(namespace_name.error);
	}

	std::vector<TopicName> topics;
	if (prefix.table_name.has_value()) {
		auto topic = topic_catalog_.ResolveTopic(namespace_name.value, *prefix.table_name);
		if (!topic.IsOk()) {
			GetPulsarLogger()->warn("Skipping table {}.{}: {}", canonical, *prefix.table_name, topic.error.message);
			return result_t::Success(std::move(result));
		}
		topics.push_back(std::move(topic.value));
	} else {
		auto listed = topic_catalog_.ListLogicalTopics(namespace_name.value);
		if (!listed.IsOk()) {
			if (listed.error.code == PulsarErrorCode::NotFound) {
				return result_t::Success(std::move(result));
			}
			return result_t::Error(listed.error);
		}
		topics = std::move(listed.value);
	}

	for (auto &topic : topics) {
		SchemaTableName key(canonical, topic.GetLocalName());
		auto columns = ColumnsForTopic(topic);
		if (columns.IsOk()) {
			result.emplace(std::move(key), std::move(columns.value));
			continue;
		}
		if (columns.error.code == PulsarErrorCode::InvalidSchema) {
			GetPulsarLogger()->warn("Listing {} with internal columns only: {} ({})", key.ToString(),
			                        columns.error.message, columns.error.detail);
			result.emplace(std::move(key), PulsarSchemaTranslator::InternalOnlyColumns());
			continue;
		}
		GetPulsarLogger()->warn("Skipping table {}: {} {}", key.ToString(), PulsarErrorCodeToString(columns.error.code),
		                        columns.error.message);
	}
	return result_t::Success(std::move(result));
}

PulsarResult<NamespaceName> PulsarMetadata::ResolveNamespace(const std::string &canonical) const {
	auto parsed = NamespaceName::Parse(canonical);
	if (!parsed.IsOk()) {
		return PulsarResult<NamespaceName>::Error(PulsarErrorCode::SchemaNotFound, SchemaNotFoundMessage(canonical),
		                                          parsed.error.message);
	}
	auto exists = namespace_catalog_.NamespaceExists(canonical);
	if (!exists.IsOk()) {
		return PulsarResult<NamespaceName>::Error(exists.error);
	}
	if (!exists.value) {
		return PulsarResult<NamespaceName>::Error(PulsarErrorCode::SchemaNotFound, SchemaNotFoundMessage(canonical));
	}
	return parsed;
}

PulsarResult<std::vector<PulsarColumnMetadata>> PulsarMetadata::ResolveColumns(const PulsarTableHandle &handle) const {
	using result_t = PulsarResult<std::vector<PulsarColumnMetadata>>;
	// schema_name is canonical; the delimiter was restored when the handle was built
	const auto &canonical = handle.schema_name;
	auto namespace_name = ResolveNamespace(canonical);
	if (!namespace_name.IsOk()) {
		return result_t::Error(namespace_name.error);
	}

	auto topic = topic_catalog_.ResolveTopic(namespace_name.value, handle.topic_name);
	if (!topic.IsOk()) {
		switch (topic.error.code) {
		case PulsarErrorCode::TableNotFound:
			return result_t::Error(PulsarErrorCode::TableNotFound, TableNotFoundMessage(canonical, handle.table_name));
		case PulsarErrorCode::NotFound:
			// namespace removed after the existence check
			return result_t::Error(PulsarErrorCode::SchemaNotFound, SchemaNotFoundMessage(canonical),
			                       topic.error.message);
		default:
			return result_t::Error(topic.error);
		}
	}
	GetPulsarLogger()->debug("Resolved {} to topic {}", handle.ToString(), topic.value.ToString());
	return ColumnsForTopic(topic.value);
}

PulsarResult<std::vector<PulsarColumnMetadata>> PulsarMetadata::ColumnsForTopic(const TopicName &topic) const {
	using result_t = PulsarResult<std::vector<PulsarColumnMetadata>>;
	auto schema_info = clients_.schemas->GetSchemaInfo(topic.GetSchemaName());
	if (!schema_info.IsOk()) {
		if (schema_info.error.code == PulsarErrorCode::NotFound) {
			GetPulsarLogger()->debug("Topic {} has no schema, exposing raw message value", topic.ToString());
			return result_t::Success(PulsarSchemaTranslator::NoSchemaColumns());
		}
		return result_t::Error(schema_info.error);
	}

	auto columns = PulsarSchemaTranslator::Translate(schema_info.value);
	if (!columns.IsOk()) {
		if (columns.error.code == PulsarErrorCode::InvalidSchema) {
			return result_t::Error(PulsarErrorCode::InvalidSchema, InvalidSchemaMessage(topic.ToString()),
			                       columns.error.message);
		}
		return result_t::Error(columns.error);
	}
	return columns;
}

} // namespace duckdb
