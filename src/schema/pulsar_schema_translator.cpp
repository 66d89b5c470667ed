#include "schema/pulsar_schema_translator.hpp"
#include "catalog/pulsar_internal_columns.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace duckdb {

namespace {

using json = nlohmann::json;

constexpr int64_t MAX_DECIMAL_PRECISION = 38;

PulsarError InvalidSchema(std::string reason) {
	return PulsarError(PulsarErrorCode::InvalidSchema, std::move(reason));
}

std::string JoinPath(const std::vector<std::string> &path) {
	std::string joined;
	for (size_t i = 0; i < path.size(); i++) {
		if (i > 0) {
			joined += ".";
		}
		joined += path[i];
	}
	return joined;
}

std::string GetString(const json &node, const char *key) {
	auto it = node.find(key);
	if (it == node.end() || !it->is_string()) {
		return "";
	}
	return it->get<std::string>();
}

//===--------------------------------------------------------------------===//
// AvroSchemaFlattener — walks one Avro schema definition
//===--------------------------------------------------------------------===//
class AvroSchemaFlattener {
public:
	PulsarError FlattenRecord(const json &record, const std::string &enclosing_namespace,
	                          std::vector<std::string> &path, std::vector<idx_t> &indices,
	                          std::vector<PulsarColumnMetadata> &columns);

	//! Returns the record definition a field type denotes, or nullptr when the type is not a record.
	PulsarResult<const json *> ResolveRecord(const json &type, const std::string &enclosing_namespace);

	PulsarResult<const json *> UnwrapNullable(const json &type);

	PulsarResult<LogicalType> MapType(const json &type, const std::string &enclosing_namespace);

private:
	PulsarResult<LogicalType> MapPrimitive(const std::string &type_name, const std::string &enclosing_namespace);
	PulsarResult<LogicalType> MapLogicalType(const json &type, const std::string &base_type);
	PulsarResult<LogicalType> MapStruct(const json &record, const std::string &enclosing_namespace);

	//! Register a named definition; returns its full name.
	PulsarResult<std::string> RegisterNamed(const json &definition, const std::string &enclosing_namespace);
	const json *LookupNamed(const std::string &name, const std::string &enclosing_namespace) const;
	std::string NamespaceOf(const json &definition, const std::string &enclosing_namespace) const;
	std::string FullNameOf(const json &definition, const std::string &enclosing_namespace) const;
	//! Full name a definition was registered under; computed when it has not been registered yet.
	std::string KnownFullName(const json &definition, const std::string &enclosing_namespace) const;

	PulsarError EmitLeaf(const std::vector<std::string> &path, const std::vector<idx_t> &indices, LogicalType type,
	                     std::vector<PulsarColumnMetadata> &columns);

	std::unordered_map<std::string, const json *> named_types_;
	std::unordered_map<const json *, std::string> full_names_;
	std::unordered_set<std::string> records_in_progress_;
	std::unordered_set<std::string> emitted_names_;
};

std::string AvroSchemaFlattener::NamespaceOf(const json &definition, const std::string &enclosing_namespace) const {
	auto name = GetString(definition, "name");
	auto dot = name.rfind('.');
	if (dot != std::string::npos) {
		return name.substr(0, dot);
	}
	auto it = definition.find("namespace");
	if (it != definition.end() && it->is_string()) {
		return it->get<std::string>();
	}
	return enclosing_namespace;
}

std::string AvroSchemaFlattener::FullNameOf(const json &definition, const std::string &enclosing_namespace) const {
	auto name = GetString(definition, "name");
	if (name.find('.') != std::string::npos) {
		return name;
	}
	auto ns = NamespaceOf(definition, enclosing_namespace);
	return ns.empty() ? name : ns + "." + name;
}

std::string AvroSchemaFlattener::KnownFullName(const json &definition, const std::string &enclosing_namespace) const {
	auto it = full_names_.find(&definition);
	if (it != full_names_.end()) {
		return it->second;
	}
	return FullNameOf(definition, enclosing_namespace);
}

PulsarResult<std::string> AvroSchemaFlattener::RegisterNamed(const json &definition,
                                                             const std::string &enclosing_namespace) {
	auto known = full_names_.find(&definition);
	if (known != full_names_.end()) {
		return PulsarResult<std::string>::Success(known->second);
	}
	// anonymous records are accepted but cannot be referenced
	if (GetString(definition, "name").empty()) {
		return PulsarResult<std::string>::Success("");
	}
	auto full_name = FullNameOf(definition, enclosing_namespace);
	if (named_types_.count(full_name)) {
		return PulsarResult<std::string>::Error(InvalidSchema("type '" + full_name + "' is defined twice"));
	}
	named_types_[full_name] = &definition;
	full_names_[&definition] = full_name;
	return PulsarResult<std::string>::Success(std::move(full_name));
}

const json *AvroSchemaFlattener::LookupNamed(const std::string &name, const std::string &enclosing_namespace) const {
	auto it = named_types_.find(name);
	if (it != named_types_.end()) {
		return it->second;
	}
	if (!enclosing_namespace.empty() && name.find('.') == std::string::npos) {
		it = named_types_.find(enclosing_namespace + "." + name);
		if (it != named_types_.end()) {
			return it->second;
		}
	}
	return nullptr;
}

PulsarResult<const json *> AvroSchemaFlattener::UnwrapNullable(const json &type) {
	if (!type.is_array()) {
		return PulsarResult<const json *>::Success(&type);
	}
	const json *non_null = nullptr;
	for (auto &branch : type) {
		if (branch.is_string() && branch.get<std::string>() == "null") {
			continue;
		}
		if (non_null) {
			return PulsarResult<const json *>::Error(
			    InvalidSchema("unions with more than one non-null branch are not supported"));
		}
		non_null = &branch;
	}
	if (!non_null) {
		return PulsarResult<const json *>::Error(InvalidSchema("union has no non-null branch"));
	}
	if (non_null->is_array()) {
		return PulsarResult<const json *>::Error(InvalidSchema("unions may not immediately contain other unions"));
	}
	return PulsarResult<const json *>::Success(non_null);
}

PulsarResult<const json *> AvroSchemaFlattener::ResolveRecord(const json &type,
                                                              const std::string &enclosing_namespace) {
	if (type.is_object()) {
		auto type_it = type.find("type");
		if (type_it != type.end() && !type_it->is_string()) {
			// {"type": {...}} wraps the actual schema
			auto inner = UnwrapNullable(*type_it);
			if (!inner.IsOk()) {
				return inner;
			}
			return ResolveRecord(*inner.value, enclosing_namespace);
		}
		auto kind = GetString(type, "type");
		if (kind == "record" || kind == "error") {
			return PulsarResult<const json *>::Success(&type);
		}
		if (type_it != type.end()) {
			// {"type": "Name"} refers to a named type
			return ResolveRecord(*type_it, enclosing_namespace);
		}
		return PulsarResult<const json *>::Success(nullptr);
	}
	if (type.is_string()) {
		auto *named = LookupNamed(type.get<std::string>(), enclosing_namespace);
		if (named) {
			auto kind = GetString(*named, "type");
			if (kind == "record" || kind == "error") {
				return PulsarResult<const json *>::Success(named);
			}
		}
	}
	return PulsarResult<const json *>::Success(nullptr);
}

PulsarError AvroSchemaFlattener::EmitLeaf(const std::vector<std::string> &path, const std::vector<idx_t> &indices,
                                          LogicalType type, std::vector<PulsarColumnMetadata> &columns) {
	auto name = JoinPath(path);
	if (PulsarInternalColumns::IsInternalColumn(name)) {
		return InvalidSchema("field '" + name + "' collides with the internal column of the same name");
	}
	if (!emitted_names_.insert(name).second) {
		return InvalidSchema("field '" + name + "' maps to a column name that is already in use");
	}
	PulsarColumnMetadata column;
	column.name = std::move(name);
	column.type = std::move(type);
	column.position_indices = indices;
	column.field_names = path;
	columns.push_back(std::move(column));
	return PulsarError();
}

PulsarError AvroSchemaFlattener::FlattenRecord(const json &record, const std::string &enclosing_namespace,
                                               std::vector<std::string> &path, std::vector<idx_t> &indices,
                                               std::vector<PulsarColumnMetadata> &columns) {
	auto registered = RegisterNamed(record, enclosing_namespace);
	if (!registered.IsOk()) {
		return registered.error;
	}
	auto full_name = registered.value;
	auto record_namespace = NamespaceOf(record, enclosing_namespace);

	auto fields = record.find("fields");
	if (fields == record.end() || !fields->is_array()) {
		return InvalidSchema("record '" + full_name + "' has no fields array");
	}

	if (!full_name.empty()) {
		records_in_progress_.insert(full_name);
	}
	for (idx_t i = 0; i < fields->size(); i++) {
		auto &field = (*fields)[i];
		auto field_name = GetString(field, "name");
		if (field_name.empty()) {
			return InvalidSchema("record '" + full_name + "' has a field without a name");
		}
		auto type_it = field.find("type");
		if (type_it == field.end()) {
			return InvalidSchema("field '" + field_name + "' has no type");
		}
		auto unwrapped = UnwrapNullable(*type_it);
		if (!unwrapped.IsOk()) {
			return PulsarError(unwrapped.error.code, "field '" + field_name + "': " + unwrapped.error.message);
		}
		auto nested = ResolveRecord(*unwrapped.value, record_namespace);
		if (!nested.IsOk()) {
			return nested.error;
		}

		path.push_back(field_name);
		indices.push_back(i);
		if (nested.value) {
			auto nested_name = KnownFullName(*nested.value, record_namespace);
			if (!nested_name.empty() && records_in_progress_.count(nested_name)) {
				return InvalidSchema("record '" + nested_name + "' refers to itself");
			}
			auto err = FlattenRecord(*nested.value, record_namespace, path, indices, columns);
			if (!err.IsOk()) {
				return err;
			}
		} else {
			auto mapped = MapType(*unwrapped.value, record_namespace);
			if (!mapped.IsOk()) {
				return PulsarError(mapped.error.code, "field '" + JoinPath(path) + "': " + mapped.error.message);
			}
			auto err = EmitLeaf(path, indices, std::move(mapped.value), columns);
			if (!err.IsOk()) {
				return err;
			}
		}
		path.pop_back();
		indices.pop_back();
	}
	records_in_progress_.erase(full_name);
	return PulsarError();
}

PulsarResult<LogicalType> AvroSchemaFlattener::MapPrimitive(const std::string &type_name,
                                                            const std::string &enclosing_namespace) {
	if (type_name == "boolean") {
		return PulsarResult<LogicalType>::Success(LogicalType::BOOLEAN);
	}
	if (type_name == "int") {
		return PulsarResult<LogicalType>::Success(LogicalType::INTEGER);
	}
	if (type_name == "long") {
		return PulsarResult<LogicalType>::Success(LogicalType::BIGINT);
	}
	if (type_name == "float") {
		return PulsarResult<LogicalType>::Success(LogicalType::FLOAT);
	}
	if (type_name == "double") {
		return PulsarResult<LogicalType>::Success(LogicalType::DOUBLE);
	}
	if (type_name == "string") {
		return PulsarResult<LogicalType>::Success(LogicalType::VARCHAR);
	}
	if (type_name == "bytes") {
		return PulsarResult<LogicalType>::Success(LogicalType::BLOB);
	}
	if (type_name == "null") {
		return PulsarResult<LogicalType>::Error(InvalidSchema("a null-only field cannot be mapped to a column"));
	}

	auto *named = LookupNamed(type_name, enclosing_namespace);
	if (!named) {
		return PulsarResult<LogicalType>::Error(InvalidSchema("unknown type '" + type_name + "'"));
	}
	auto kind = GetString(*named, "type");
	if (kind == "enum") {
		return PulsarResult<LogicalType>::Success(LogicalType::VARCHAR);
	}
	if (kind == "fixed") {
		return MapLogicalType(*named, "fixed");
	}
	auto full_name = KnownFullName(*named, enclosing_namespace);
	if (records_in_progress_.count(full_name)) {
		return PulsarResult<LogicalType>::Error(InvalidSchema("record '" + full_name + "' refers to itself"));
	}
	return MapStruct(*named, enclosing_namespace);
}

PulsarResult<LogicalType> AvroSchemaFlattener::MapLogicalType(const json &type, const std::string &base_type) {
	auto logical = GetString(type, "logicalType");
	if (logical == "date" && base_type == "int") {
		return PulsarResult<LogicalType>::Success(LogicalType::DATE);
	}
	if ((logical == "time-millis" && base_type == "int") || (logical == "time-micros" && base_type == "long")) {
		return PulsarResult<LogicalType>::Success(LogicalType::TIME);
	}
	if ((logical == "timestamp-millis" || logical == "timestamp-micros" || logical == "local-timestamp-millis" ||
	     logical == "local-timestamp-micros") &&
	    base_type == "long") {
		return PulsarResult<LogicalType>::Success(LogicalType::TIMESTAMP);
	}
	if (logical == "uuid" && base_type == "string") {
		return PulsarResult<LogicalType>::Success(LogicalType::UUID);
	}
	if (logical == "decimal" && (base_type == "bytes" || base_type == "fixed")) {
		auto precision_it = type.find("precision");
		if (precision_it == type.end() || !precision_it->is_number_integer()) {
			return PulsarResult<LogicalType>::Error(InvalidSchema("decimal without an integer precision"));
		}
		auto precision = precision_it->get<int64_t>();
		int64_t scale = 0;
		auto scale_it = type.find("scale");
		if (scale_it != type.end()) {
			if (!scale_it->is_number_integer()) {
				return PulsarResult<LogicalType>::Error(InvalidSchema("decimal scale must be an integer"));
			}
			scale = scale_it->get<int64_t>();
		}
		if (precision < 1 || precision > MAX_DECIMAL_PRECISION) {
			return PulsarResult<LogicalType>::Error(
			    InvalidSchema("decimal precision " + std::to_string(precision) + " is out of range"));
		}
		if (scale < 0 || scale > precision) {
			return PulsarResult<LogicalType>::Error(
			    InvalidSchema("decimal scale " + std::to_string(scale) + " is out of range"));
		}
		return PulsarResult<LogicalType>::Success(
		    LogicalType::DECIMAL(static_cast<uint8_t>(precision), static_cast<uint8_t>(scale)));
	}
	// unknown logical types fall back to their underlying type
	if (base_type == "fixed") {
		return PulsarResult<LogicalType>::Success(LogicalType::BLOB);
	}
	return MapPrimitive(base_type, "");
}

PulsarResult<LogicalType> AvroSchemaFlattener::MapStruct(const json &record, const std::string &enclosing_namespace) {
	auto full_name = KnownFullName(record, enclosing_namespace);
	auto record_namespace = NamespaceOf(record, enclosing_namespace);
	auto fields = record.find("fields");
	if (fields == record.end() || !fields->is_array()) {
		return PulsarResult<LogicalType>::Error(InvalidSchema("record '" + full_name + "' has no fields array"));
	}

	if (!full_name.empty()) {
		records_in_progress_.insert(full_name);
	}
	child_list_t<LogicalType> children;
	for (auto &field : *fields) {
		auto field_name = GetString(field, "name");
		auto type_it = field.find("type");
		if (field_name.empty() || type_it == field.end()) {
			return PulsarResult<LogicalType>::Error(
			    InvalidSchema("record '" + full_name + "' has a field without a name or type"));
		}
		auto child = MapType(*type_it, record_namespace);
		if (!child.IsOk()) {
			return child;
		}
		children.emplace_back(field_name, std::move(child.value));
	}
	records_in_progress_.erase(full_name);
	return PulsarResult<LogicalType>::Success(LogicalType::STRUCT(std::move(children)));
}

PulsarResult<LogicalType> AvroSchemaFlattener::MapType(const json &type, const std::string &enclosing_namespace) {
	if (type.is_array()) {
		auto unwrapped = UnwrapNullable(type);
		if (!unwrapped.IsOk()) {
			return PulsarResult<LogicalType>::Error(unwrapped.error);
		}
		return MapType(*unwrapped.value, enclosing_namespace);
	}
	if (type.is_string()) {
		return MapPrimitive(type.get<std::string>(), enclosing_namespace);
	}
	if (!type.is_object()) {
		return PulsarResult<LogicalType>::Error(InvalidSchema("type must be a string, object or union"));
	}

	auto type_it = type.find("type");
	if (type_it == type.end()) {
		return PulsarResult<LogicalType>::Error(InvalidSchema("type object without a 'type' attribute"));
	}
	if (!type_it->is_string()) {
		// {"type": {...}} wraps another type definition
		return MapType(*type_it, enclosing_namespace);
	}
	auto kind = type_it->get<std::string>();

	if (kind == "record" || kind == "error") {
		auto registered = RegisterNamed(type, enclosing_namespace);
		if (!registered.IsOk()) {
			return PulsarResult<LogicalType>::Error(registered.error);
		}
		return MapStruct(type, enclosing_namespace);
	}
	if (kind == "enum") {
		auto registered = RegisterNamed(type, enclosing_namespace);
		if (!registered.IsOk()) {
			return PulsarResult<LogicalType>::Error(registered.error);
		}
		return PulsarResult<LogicalType>::Success(LogicalType::VARCHAR);
	}
	if (kind == "fixed") {
		auto registered = RegisterNamed(type, enclosing_namespace);
		if (!registered.IsOk()) {
			return PulsarResult<LogicalType>::Error(registered.error);
		}
		return MapLogicalType(type, "fixed");
	}
	if (kind == "array") {
		auto items = type.find("items");
		if (items == type.end()) {
			return PulsarResult<LogicalType>::Error(InvalidSchema("array without 'items'"));
		}
		auto child = MapType(*items, enclosing_namespace);
		if (!child.IsOk()) {
			return child;
		}
		return PulsarResult<LogicalType>::Success(LogicalType::LIST(std::move(child.value)));
	}
	if (kind == "map") {
		auto values = type.find("values");
		if (values == type.end()) {
			return PulsarResult<LogicalType>::Error(InvalidSchema("map without 'values'"));
		}
		auto child = MapType(*values, enclosing_namespace);
		if (!child.IsOk()) {
			return child;
		}
		return PulsarResult<LogicalType>::Success(LogicalType::MAP(LogicalType::VARCHAR, std::move(child.value)));
	}
	if (type.contains("logicalType")) {
		return MapLogicalType(type, kind);
	}
	return MapPrimitive(kind, enclosing_namespace);
}

PulsarResult<std::vector<PulsarColumnMetadata>> TranslateRecordSchema(const PulsarSchemaInfo &schema_info) {
	using ColumnsResult = PulsarResult<std::vector<PulsarColumnMetadata>>;

	if (schema_info.schema.empty()) {
		return ColumnsResult::Error(InvalidSchema("schema definition is empty"));
	}
	auto root = json::parse(schema_info.schema, nullptr, false);
	if (root.is_discarded()) {
		return ColumnsResult::Error(InvalidSchema("schema definition is not valid JSON"));
	}

	AvroSchemaFlattener flattener;
	auto top = flattener.UnwrapNullable(root);
	if (!top.IsOk()) {
		return ColumnsResult::Error(top.error);
	}
	auto record = flattener.ResolveRecord(*top.value, "");
	if (!record.IsOk()) {
		return ColumnsResult::Error(record.error);
	}
	if (!record.value) {
		return ColumnsResult::Error(InvalidSchema("top-level schema is not a record"));
	}

	std::vector<PulsarColumnMetadata> columns;
	std::vector<std::string> path;
	std::vector<idx_t> indices;
	auto err = flattener.FlattenRecord(*record.value, "", path, indices, columns);
	if (!err.IsOk()) {
		return ColumnsResult::Error(std::move(err));
	}
	PulsarInternalColumns::AppendTo(columns);
	return ColumnsResult::Success(std::move(columns));
}

} // namespace

PulsarResult<LogicalType> PulsarSchemaTranslator::MapPrimitiveSchemaType(PulsarSchemaType type) {
	switch (type) {
	case PulsarSchemaType::STRING:
		return PulsarResult<LogicalType>::Success(LogicalType::VARCHAR);
	case PulsarSchemaType::BOOLEAN:
		return PulsarResult<LogicalType>::Success(LogicalType::BOOLEAN);
	case PulsarSchemaType::INT8:
		return PulsarResult<LogicalType>::Success(LogicalType::TINYINT);
	case PulsarSchemaType::INT16:
		return PulsarResult<LogicalType>::Success(LogicalType::SMALLINT);
	case PulsarSchemaType::INT32:
		return PulsarResult<LogicalType>::Success(LogicalType::INTEGER);
	case PulsarSchemaType::INT64:
		return PulsarResult<LogicalType>::Success(LogicalType::BIGINT);
	case PulsarSchemaType::FLOAT:
		return PulsarResult<LogicalType>::Success(LogicalType::FLOAT);
	case PulsarSchemaType::DOUBLE:
		return PulsarResult<LogicalType>::Success(LogicalType::DOUBLE);
	case PulsarSchemaType::DATE:
		return PulsarResult<LogicalType>::Success(LogicalType::DATE);
	case PulsarSchemaType::TIME:
		return PulsarResult<LogicalType>::Success(LogicalType::TIME);
	case PulsarSchemaType::TIMESTAMP:
		return PulsarResult<LogicalType>::Success(LogicalType::TIMESTAMP);
	case PulsarSchemaType::BYTES:
	case PulsarSchemaType::NONE:
		return PulsarResult<LogicalType>::Success(LogicalType::BLOB);
	default:
		return PulsarResult<LogicalType>::Error(
		    PulsarErrorCode::InvalidSchema,
		    std::string("schema type ") + PulsarSchemaTypeToString(type) + " is not a primitive type");
	}
}

PulsarResult<std::vector<PulsarColumnMetadata>> PulsarSchemaTranslator::Translate(const PulsarSchemaInfo &schema_info) {
	using ColumnsResult = PulsarResult<std::vector<PulsarColumnMetadata>>;

	if (IsPrimitiveSchemaType(schema_info.type)) {
		auto value_type = MapPrimitiveSchemaType(schema_info.type);
		if (!value_type.IsOk()) {
			return ColumnsResult::Error(value_type.error);
		}
		std::vector<PulsarColumnMetadata> columns;
		columns.push_back(PulsarInternalColumns::ValueColumn(value_type.value));
		PulsarInternalColumns::AppendTo(columns);
		return ColumnsResult::Success(std::move(columns));
	}

	switch (schema_info.type) {
	case PulsarSchemaType::AVRO:
	case PulsarSchemaType::JSON:
		return TranslateRecordSchema(schema_info);
	default:
		return ColumnsResult::Error(PulsarErrorCode::InvalidSchema,
		                            std::string("schema type ") + PulsarSchemaTypeToString(schema_info.type) +
		                                " is not supported");
	}
}

std::vector<PulsarColumnMetadata> PulsarSchemaTranslator::NoSchemaColumns() {
	std::vector<PulsarColumnMetadata> columns;
	columns.push_back(PulsarInternalColumns::ValueColumn(LogicalType::BLOB));
	PulsarInternalColumns::AppendTo(columns);
	return columns;
}

std::vector<PulsarColumnMetadata> PulsarSchemaTranslator::InternalOnlyColumns() {
	return PulsarInternalColumns::GetInternalColumns();
}

} // namespace duckdb
