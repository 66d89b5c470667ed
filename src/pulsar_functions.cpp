#include "pulsar_functions.hpp"
#include "pulsar_errors.hpp"
#include "pulsar_runtime.hpp"
#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/common/exception.hpp"

#include <optional>

namespace duckdb {

//===--------------------------------------------------------------------===//
// Shared bind data and row state
//===--------------------------------------------------------------------===//

struct PulsarCatalogBindData : public FunctionData {
	std::string catalog;
	std::string schema;
	std::optional<std::string> table;

	unique_ptr<FunctionData> Copy() const override {
		auto copy = make_uniq<PulsarCatalogBindData>();
		copy->catalog = catalog;
		copy->schema = schema;
		copy->table = table;
		return std::move(copy);
	}

	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<PulsarCatalogBindData>();
		return catalog == other.catalog && schema == other.schema && table == other.table;
	}
};

// Rows are produced in InitGlobal and streamed out by PulsarRowsExecute
struct PulsarRowsGlobalState : public GlobalTableFunctionState {
	std::vector<std::vector<Value>> rows;
	idx_t offset = 0;
};

static unique_ptr<PulsarCatalogBindData> BindCatalogArguments(const TableFunctionBindInput &input,
                                                              const std::string &function_name,
                                                              const std::vector<const char *> &arg_names) {
	if (input.inputs.size() < arg_names.size()) {
		throw BinderException(function_name + " requires " + to_string(arg_names.size()) + " arguments");
	}
	std::vector<std::string> args;
	for (idx_t i = 0; i < input.inputs.size(); i++) {
		const char *arg_name = i < arg_names.size() ? arg_names[i] : "table";
		if (input.inputs[i].IsNull()) {
			throw InvalidInputException("Argument " + to_string(i) + " (" + arg_name + ") cannot be NULL");
		}
		auto arg_val = input.inputs[i].GetValue<string>();
		if (arg_val.empty()) {
			throw InvalidInputException("Argument " + to_string(i) + " (" + arg_name + ") cannot be empty");
		}
		args.push_back(std::move(arg_val));
	}

	auto bind_data = make_uniq<PulsarCatalogBindData>();
	bind_data->catalog = args[0];
	if (args.size() > 1) {
		bind_data->schema = args[1];
	}
	if (args.size() > 2) {
		bind_data->table = args[2];
	}
	return bind_data;
}

static std::shared_ptr<const PulsarMetadata> RequirePulsarCatalog(const std::string &catalog) {
	auto metadata = LookupPulsarCatalog(catalog);
	if (!metadata) {
		throw InvalidInputException("Catalog is not registered as pulsar: " + catalog);
	}
	return metadata;
}

template <typename T>
static T UnwrapResult(PulsarResult<T> result) {
	if (!result.IsOk()) {
		ThrowPulsarError(result.error);
	}
	return std::move(result.value);
}

static Value CommentValue(const std::optional<std::string> &comment) {
	return comment.has_value() ? Value(*comment) : Value(LogicalType::VARCHAR);
}

static void PulsarRowsExecute(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &gstate = data.global_state->Cast<PulsarRowsGlobalState>();

	idx_t count = 0;
	while (gstate.offset < gstate.rows.size() && count < STANDARD_VECTOR_SIZE) {
		auto &row = gstate.rows[gstate.offset];
		for (idx_t col = 0; col < row.size(); col++) {
			output.SetValue(col, count, row[col]);
		}
		count++;
		gstate.offset++;
	}
	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// pulsar_schemas(catalog VARCHAR)
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> PulsarSchemasBind(ClientContext &context, TableFunctionBindInput &input,
                                                  vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindCatalogArguments(input, "pulsar_schemas", {"catalog"});
	return_types = {LogicalType::VARCHAR};
	names = {"schema_name"};
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> PulsarSchemasInitGlobal(ClientContext &context,
                                                                    TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<PulsarCatalogBindData>();
	auto gstate = make_uniq<PulsarRowsGlobalState>();
	auto metadata = RequirePulsarCatalog(bind_data.catalog);

	PulsarSession session;
	for (auto &schema_name : UnwrapResult(metadata->ListSchemaNames(session))) {
		gstate->rows.push_back({Value(schema_name)});
	}
	return std::move(gstate);
}

//===--------------------------------------------------------------------===//
// pulsar_tables(catalog VARCHAR, schema VARCHAR)
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> PulsarTablesBind(ClientContext &context, TableFunctionBindInput &input,
                                                 vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindCatalogArguments(input, "pulsar_tables", {"catalog", "schema"});
	return_types = {LogicalType::VARCHAR};
	names = {"table_name"};
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> PulsarTablesInitGlobal(ClientContext &context,
                                                                   TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<PulsarCatalogBindData>();
	auto gstate = make_uniq<PulsarRowsGlobalState>();
	auto metadata = RequirePulsarCatalog(bind_data.catalog);

	PulsarSession session;
	for (auto &table : UnwrapResult(metadata->ListTables(session, bind_data.schema))) {
		gstate->rows.push_back({Value(table.table_name)});
	}
	return std::move(gstate);
}

//===--------------------------------------------------------------------===//
// pulsar_describe(catalog VARCHAR, schema VARCHAR, table VARCHAR)
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> PulsarDescribeBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindCatalogArguments(input, "pulsar_describe", {"catalog", "schema", "table"});
	return_types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::BOOLEAN,
	                LogicalType::BOOLEAN};
	names = {"column_name", "column_type", "comment", "hidden", "internal"};
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> PulsarDescribeInitGlobal(ClientContext &context,
                                                                     TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<PulsarCatalogBindData>();
	auto gstate = make_uniq<PulsarRowsGlobalState>();
	auto metadata = RequirePulsarCatalog(bind_data.catalog);

	PulsarSession session;
	auto handle = metadata->GetTableHandle(session, SchemaTableName(bind_data.schema, *bind_data.table));
	auto table_metadata = UnwrapResult(metadata->GetTableMetadata(session, handle));
	for (auto &column : table_metadata.columns) {
		gstate->rows.push_back({Value(column.name), Value(column.type.ToString()), CommentValue(column.comment),
		                        Value::BOOLEAN(column.hidden), Value::BOOLEAN(column.internal)});
	}
	return std::move(gstate);
}

//===--------------------------------------------------------------------===//
// pulsar_column_handles(catalog VARCHAR, schema VARCHAR, table VARCHAR)
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> PulsarColumnHandlesBind(ClientContext &context, TableFunctionBindInput &input,
                                                        vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindCatalogArguments(input, "pulsar_column_handles", {"catalog", "schema", "table"});
	return_types = {LogicalType::VARCHAR,
	                LogicalType::VARCHAR,
	                LogicalType::LIST(LogicalType::UBIGINT),
	                LogicalType::LIST(LogicalType::VARCHAR),
	                LogicalType::BOOLEAN,
	                LogicalType::BOOLEAN};
	names = {"column_name", "column_type", "position_indices", "field_names", "hidden", "internal"};
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> PulsarColumnHandlesInitGlobal(ClientContext &context,
                                                                          TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<PulsarCatalogBindData>();
	auto gstate = make_uniq<PulsarRowsGlobalState>();
	auto metadata = RequirePulsarCatalog(bind_data.catalog);

	PulsarSession session;
	auto table_handle = metadata->GetTableHandle(session, SchemaTableName(bind_data.schema, *bind_data.table));
	auto handles = UnwrapResult(metadata->GetColumnHandles(session, table_handle));

	// same column order as pulsar_describe
	auto table = UnwrapResult(metadata->GetTableMetadata(session, table_handle));
	std::vector<const PulsarColumnHandle *> ordered;
	ordered.reserve(table.columns.size());
	for (auto &column : table.columns) {
		ordered.push_back(&handles.at(column.name));
	}

	for (auto *handle : ordered) {
		vector<Value> positions;
		for (auto position : handle->position_indices) {
			positions.push_back(Value::UBIGINT(position));
		}
		vector<Value> field_names;
		for (auto &field_name : handle->field_names) {
			field_names.push_back(Value(field_name));
		}
		gstate->rows.push_back({Value(handle->name), Value(handle->type.ToString()),
		                        Value::LIST(LogicalType::UBIGINT, std::move(positions)),
		                        Value::LIST(LogicalType::VARCHAR, std::move(field_names)),
		                        Value::BOOLEAN(handle->hidden), Value::BOOLEAN(handle->internal)});
	}
	return std::move(gstate);
}

//===--------------------------------------------------------------------===//
// pulsar_columns(catalog VARCHAR, schema VARCHAR [, table VARCHAR])
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> PulsarColumnsBind(ClientContext &context, TableFunctionBindInput &input,
                                                  vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindCatalogArguments(input, "pulsar_columns", {"catalog", "schema"});
	return_types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::VARCHAR};
	names = {"schema_name", "table_name", "column_name", "column_type", "comment"};
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> PulsarColumnsInitGlobal(ClientContext &context,
                                                                    TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<PulsarCatalogBindData>();
	auto gstate = make_uniq<PulsarRowsGlobalState>();
	auto metadata = RequirePulsarCatalog(bind_data.catalog);

	PulsarSession session;
	SchemaTablePrefix prefix;
	prefix.schema_name = bind_data.schema;
	prefix.table_name = bind_data.table;
	for (auto &entry : UnwrapResult(metadata->ListTableColumns(session, prefix))) {
		for (auto &column : entry.second) {
			gstate->rows.push_back({Value(entry.first.schema_name), Value(entry.first.table_name), Value(column.name),
			                        Value(column.type.ToString()), CommentValue(column.comment)});
		}
	}
	return std::move(gstate);
}

void RegisterPulsarFunctions(ExtensionLoader &loader) {
	loader.RegisterFunction(TableFunction("pulsar_schemas", {LogicalType::VARCHAR}, PulsarRowsExecute,
	                                      PulsarSchemasBind, PulsarSchemasInitGlobal));

	loader.RegisterFunction(TableFunction("pulsar_tables", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                      PulsarRowsExecute, PulsarTablesBind, PulsarTablesInitGlobal));

	loader.RegisterFunction(TableFunction("pulsar_describe",
	                                      {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                      PulsarRowsExecute, PulsarDescribeBind, PulsarDescribeInitGlobal));

	loader.RegisterFunction(TableFunction("pulsar_column_handles",
	                                      {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                      PulsarRowsExecute, PulsarColumnHandlesBind, PulsarColumnHandlesInitGlobal));

	// pulsar_columns(catalog, schema) and pulsar_columns(catalog, schema, table)
	TableFunctionSet columns_set("pulsar_columns");
	columns_set.AddFunction(TableFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, PulsarRowsExecute,
	                                      PulsarColumnsBind, PulsarColumnsInitGlobal));
	columns_set.AddFunction(TableFunction({LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                      PulsarRowsExecute, PulsarColumnsBind, PulsarColumnsInitGlobal));
	loader.RegisterFunction(columns_set);
}

} // namespace duckdb
