#pragma once

#include "catalog/pulsar_handles.hpp"
#include "catalog/pulsar_namespace_catalog.hpp"
#include "catalog/pulsar_topic_catalog.hpp"
#include "pulsar_config.hpp"
#include "pulsar_connector.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace duckdb {

//! Caller context of a catalog call. Carried through every operation and never inspected.
struct PulsarSession {
	std::string user;
	std::string query_id;
};

//===--------------------------------------------------------------------===//
// PulsarMetadata — the catalog surface of one Pulsar cluster
//
// Resolves engine identifiers through the namespace and topic catalogs,
// fetches the latest schema of a topic and translates it to columns. Holds
// no state besides its configuration and collaborators, so one instance may
// serve concurrent calls.
//
// Failure kinds:
//   SchemaNotFound  the namespace does not exist
//   TableNotFound   the namespace exists but has no such topic
//   InvalidSchema   the registered schema cannot be turned into columns
//   anything else   a collaborator failure, returned unchanged
// A topic without a registered schema is not a failure; its table has the
// internal columns plus a BLOB "__value__" column.
//===--------------------------------------------------------------------===//
class PulsarMetadata {
public:
	//! Throws PulsarException(InvalidConfig) when a collaborator is missing or the
	//! rewrite delimiter is not reversible.
	PulsarMetadata(PulsarConnectorConfig config, PulsarAdminClients clients);

	//! All namespaces, in engine (possibly rewritten) form.
	PulsarResult<std::vector<std::string>> ListSchemaNames(const PulsarSession &session) const;

	//! Handle for schema.table without checking that it exists.
	PulsarTableHandle GetTableHandle(const PulsarSession &session, const SchemaTableName &table) const;

	PulsarResult<PulsarTableMetadata> GetTableMetadata(const PulsarSession &session,
	                                                   const PulsarTableHandle &handle) const;

	//! Column handles keyed by column name; fails exactly like GetTableMetadata().
	PulsarResult<std::unordered_map<std::string, PulsarColumnHandle>>
	GetColumnHandles(const PulsarSession &session, const PulsarTableHandle &handle) const;

	//! Tables of a namespace; empty for an absent or unknown namespace.
	PulsarResult<std::vector<SchemaTableName>> ListTables(const PulsarSession &session,
	                                                      const std::optional<std::string> &schema_name) const;

	//! Columns of every table matching the prefix. Tables with an unusable schema
	//! keep only the internal columns; tables that cannot be resolved are left out.
	PulsarResult<std::map<SchemaTableName, std::vector<PulsarColumnMetadata>>>
	ListTableColumns(const PulsarSession &session, const SchemaTablePrefix &prefix) const;

	const PulsarConnectorConfig &GetConfig() const {
		return config_;
	}

private:
	PulsarResult<NamespaceName> ResolveNamespace(const std::string &canonical) const;
	PulsarResult<std::vector<PulsarColumnMetadata>> ResolveColumns(const PulsarTableHandle &handle) const;
	PulsarResult<std::vector<PulsarColumnMetadata>> ColumnsForTopic(const TopicName &topic) const;

	PulsarConnectorConfig config_;
	PulsarAdminClients clients_;
	PulsarNamespaceCatalog namespace_catalog_;
	PulsarTopicCatalog topic_catalog_;
	PulsarHandleResolver handle_resolver_;
};

} // namespace duckdb
