#pragma once

#include "duckdb.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace duckdb {

enum class PulsarSchemaType : uint8_t {
	NONE,
	STRING,
	JSON,
	PROTOBUF,
	AVRO,
	BOOLEAN,
	INT8,
	INT16,
	INT32,
	INT64,
	FLOAT,
	DOUBLE,
	DATE,
	TIME,
	TIMESTAMP,
	KEY_VALUE,
	BYTES,
	AUTO,
	AUTO_CONSUME,
	AUTO_PUBLISH
};

inline const char *PulsarSchemaTypeToString(PulsarSchemaType type) {
	switch (type) {
	case PulsarSchemaType::NONE:
		return "NONE";
	case PulsarSchemaType::STRING:
		return "STRING";
	case PulsarSchemaType::JSON:
		return "JSON";
	case PulsarSchemaType::PROTOBUF:
		return "PROTOBUF";
	case PulsarSchemaType::AVRO:
		return "AVRO";
	case PulsarSchemaType::BOOLEAN:
		return "BOOLEAN";
	case PulsarSchemaType::INT8:
		return "INT8";
	case PulsarSchemaType::INT16:
		return "INT16";
	case PulsarSchemaType::INT32:
		return "INT32";
	case PulsarSchemaType::INT64:
		return "INT64";
	case PulsarSchemaType::FLOAT:
		return "FLOAT";
	case PulsarSchemaType::DOUBLE:
		return "DOUBLE";
	case PulsarSchemaType::DATE:
		return "DATE";
	case PulsarSchemaType::TIME:
		return "TIME";
	case PulsarSchemaType::TIMESTAMP:
		return "TIMESTAMP";
	case PulsarSchemaType::KEY_VALUE:
		return "KEY_VALUE";
	case PulsarSchemaType::BYTES:
		return "BYTES";
	case PulsarSchemaType::AUTO:
		return "AUTO";
	case PulsarSchemaType::AUTO_CONSUME:
		return "AUTO_CONSUME";
	case PulsarSchemaType::AUTO_PUBLISH:
		return "AUTO_PUBLISH";
	default:
		return "UNKNOWN";
	}
}

//! Schemas whose payload is a single value rather than a record
inline bool IsPrimitiveSchemaType(PulsarSchemaType type) {
	switch (type) {
	case PulsarSchemaType::NONE:
	case PulsarSchemaType::STRING:
	case PulsarSchemaType::BOOLEAN:
	case PulsarSchemaType::INT8:
	case PulsarSchemaType::INT16:
	case PulsarSchemaType::INT32:
	case PulsarSchemaType::INT64:
	case PulsarSchemaType::FLOAT:
	case PulsarSchemaType::DOUBLE:
	case PulsarSchemaType::DATE:
	case PulsarSchemaType::TIME:
	case PulsarSchemaType::TIMESTAMP:
	case PulsarSchemaType::BYTES:
		return true;
	default:
		return false;
	}
}

//! Snapshot of the latest schema registered for a topic
struct PulsarSchemaInfo {
	//! Registry key, "tenant/namespace/topic"
	std::string name;
	PulsarSchemaType type = PulsarSchemaType::NONE;
	//! Raw schema definition; for AVRO and JSON an Avro schema in JSON form
	std::string schema;
	std::unordered_map<std::string, std::string> properties;
};

//===--------------------------------------------------------------------===//
// PulsarColumnMetadata — one relational column of a topic table
//===--------------------------------------------------------------------===//
struct PulsarColumnMetadata {
	//! Dotted path for nested fields ("b.c")
	std::string name;
	LogicalType type;
	std::optional<std::string> comment;
	bool hidden = false;
	//! True for the synthetic message-envelope columns
	bool internal = false;
	//! Declared field index at each nesting level, outermost first
	std::vector<idx_t> position_indices;
	//! Path segments leading to the field, outermost first
	std::vector<std::string> field_names;

	bool operator==(const PulsarColumnMetadata &other) const {
		return name == other.name && type == other.type && comment == other.comment && hidden == other.hidden &&
		       internal == other.internal && position_indices == other.position_indices &&
		       field_names == other.field_names;
	}
	bool operator!=(const PulsarColumnMetadata &other) const {
		return !(*this == other);
	}
};

struct SchemaTableName {
	std::string schema_name;
	std::string table_name;

	SchemaTableName() = default;
	SchemaTableName(std::string schema_name_p, std::string table_name_p)
	    : schema_name(std::move(schema_name_p)), table_name(std::move(table_name_p)) {
	}

	std::string ToString() const {
		return schema_name + "." + table_name;
	}

	bool operator==(const SchemaTableName &other) const {
		return schema_name == other.schema_name && table_name == other.table_name;
	}
	bool operator!=(const SchemaTableName &other) const {
		return !(*this == other);
	}
	bool operator<(const SchemaTableName &other) const {
		if (schema_name != other.schema_name) {
			return schema_name < other.schema_name;
		}
		return table_name < other.table_name;
	}
};

//! Selects all tables of a schema, or one table when table_name is set
struct SchemaTablePrefix {
	std::string schema_name;
	std::optional<std::string> table_name;
};

struct PulsarTableMetadata {
	SchemaTableName table;
	std::vector<PulsarColumnMetadata> columns;
};

} // namespace duckdb
