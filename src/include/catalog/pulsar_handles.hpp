#pragma once

#include "pulsar_connector.hpp"
#include "pulsar_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// PulsarTableHandle — identifies one topic table across engine calls
//===--------------------------------------------------------------------===//
struct PulsarTableHandle {
	std::string connector_id;
	//! Canonical "tenant/namespace", never rewritten
	std::string schema_name;
	std::string table_name;
	std::string topic_name;

	PulsarTableHandle() = default;
	PulsarTableHandle(std::string connector_id_p, std::string schema_name_p, std::string table_name_p,
	                  std::string topic_name_p)
	    : connector_id(std::move(connector_id_p)), schema_name(std::move(schema_name_p)),
	      table_name(std::move(table_name_p)), topic_name(std::move(topic_name_p)) {
	}

	SchemaTableName GetSchemaTableName() const {
		return SchemaTableName(schema_name, table_name);
	}

	std::string ToString() const;

	bool operator==(const PulsarTableHandle &other) const {
		return connector_id == other.connector_id && schema_name == other.schema_name &&
		       table_name == other.table_name && topic_name == other.topic_name;
	}
	bool operator!=(const PulsarTableHandle &other) const {
		return !(*this == other);
	}
};

struct PulsarTableHandleHash {
	std::size_t operator()(const PulsarTableHandle &handle) const;
};

//===--------------------------------------------------------------------===//
// PulsarColumnHandle — locates one column inside a topic's messages
//===--------------------------------------------------------------------===//
struct PulsarColumnHandle {
	std::string connector_id;
	std::string name;
	LogicalType type;
	std::vector<idx_t> position_indices;
	std::vector<std::string> field_names;
	bool hidden = false;
	bool internal = false;

	std::string ToString() const;

	bool operator==(const PulsarColumnHandle &other) const {
		return connector_id == other.connector_id && name == other.name && type == other.type &&
		       position_indices == other.position_indices && field_names == other.field_names &&
		       hidden == other.hidden && internal == other.internal;
	}
	bool operator!=(const PulsarColumnHandle &other) const {
		return !(*this == other);
	}
};

//===--------------------------------------------------------------------===//
// PulsarHandleResolver — builds handles; performs no I/O
//===--------------------------------------------------------------------===//
class PulsarHandleResolver {
public:
	explicit PulsarHandleResolver(std::string connector_id);

	//! Handle for a table of a canonical namespace; the topic is the table itself.
	PulsarTableHandle MakeTableHandle(const std::string &schema_name, const std::string &table_name) const;

	PulsarColumnHandle MakeColumnHandle(const PulsarColumnMetadata &column) const;

	const std::string &GetConnectorId() const {
		return connector_id_;
	}

private:
	std::string connector_id_;
};

} // namespace duckdb
