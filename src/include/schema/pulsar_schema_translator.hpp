#pragma once

#include "pulsar_connector.hpp"
#include "pulsar_types.hpp"

#include <string>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// PulsarSchemaTranslator — maps a topic schema to relational columns
//
// Record schemas (AVRO, JSON) are flattened: every leaf field becomes one
// column named by its dotted path, and nested records never become columns
// themselves. Primitive schemas produce a single "__value__" column. The
// internal columns are always appended after the data columns.
//===--------------------------------------------------------------------===//
class PulsarSchemaTranslator {
public:
	//! Translate a schema snapshot into its ordered column list.
	//! Returns Error(InvalidSchema) if the definition is empty, is not valid JSON,
	//! is not a record, contains a shape that cannot be mapped, or produces a
	//! column name that collides with another column.
	static PulsarResult<std::vector<PulsarColumnMetadata>> Translate(const PulsarSchemaInfo &schema_info);

	//! Map a primitive schema type to the type of its "__value__" column.
	//! Returns Error(InvalidSchema) for record and composite schema types.
	static PulsarResult<LogicalType> MapPrimitiveSchemaType(PulsarSchemaType type);

	//! Columns of a topic without a registered schema: internal columns plus a BLOB "__value__".
	static std::vector<PulsarColumnMetadata> NoSchemaColumns();

	//! Internal columns only; used when a table must be listed despite an unusable schema.
	static std::vector<PulsarColumnMetadata> InternalOnlyColumns();
};

} // namespace duckdb
