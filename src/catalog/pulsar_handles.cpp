#include "catalog/pulsar_handles.hpp"

#include <functional>

namespace duckdb {

std::string PulsarTableHandle::ToString() const {
	return "PulsarTableHandle{connector_id=" + connector_id + ", schema_name=" + schema_name +
	       ", table_name=" + table_name + ", topic_name=" + topic_name + "}";
}

std::size_t PulsarTableHandleHash::operator()(const PulsarTableHandle &handle) const {
	std::hash<std::string> hasher;
	std::size_t seed = hasher(handle.connector_id);
	for (auto *part : {&handle.schema_name, &handle.table_name, &handle.topic_name}) {
		seed ^= hasher(*part) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
	}
	return seed;
}

static std::string JoinList(const std::vector<idx_t> &values) {
	std::string result = "[";
	for (idx_t i = 0; i < values.size(); i++) {
		if (i > 0) {
			result += ", ";
		}
		result += to_string(values[i]);
	}
	return result + "]";
}

static std::string JoinList(const std::vector<std::string> &values) {
	std::string result = "[";
	for (idx_t i = 0; i < values.size(); i++) {
		if (i > 0) {
			result += ", ";
		}
		result += values[i];
	}
	return result + "]";
}

std::string PulsarColumnHandle::ToString() const {
	return "PulsarColumnHandle{connector_id=" + connector_id + ", name=" + name + ", type=" + type.ToString() +
	       ", position_indices=" + JoinList(position_indices) + ", field_names=" + JoinList(field_names) +
	       ", hidden=" + (hidden ? "true" : "false") + ", internal=" + (internal ? "true" : "false") + "}";
}

PulsarHandleResolver::PulsarHandleResolver(std::string connector_id) : connector_id_(std::move(connector_id)) {
}

PulsarTableHandle PulsarHandleResolver::MakeTableHandle(const std::string &schema_name,
                                                        const std::string &table_name) const {
	return PulsarTableHandle(connector_id_, schema_name, table_name, table_name);
}

PulsarColumnHandle PulsarHandleResolver::MakeColumnHandle(const PulsarColumnMetadata &column) const {
	PulsarColumnHandle handle;
	handle.connector_id = connector_id_;
	handle.name = column.name;
	handle.type = column.type;
	handle.position_indices = column.position_indices;
	handle.field_names = column.field_names;
	handle.hidden = column.hidden;
	handle.internal = column.internal;
	return handle;
}

} // namespace duckdb
