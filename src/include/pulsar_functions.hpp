#pragma once

#include "duckdb.hpp"

namespace duckdb {

// Register pulsar catalog table functions:
//   pulsar_schemas(catalog)
//   pulsar_tables(catalog, schema)
//   pulsar_describe(catalog, schema, table)
//   pulsar_column_handles(catalog, schema, table)
//   pulsar_columns(catalog, schema [, table])
void RegisterPulsarFunctions(ExtensionLoader &loader);

} // namespace duckdb
