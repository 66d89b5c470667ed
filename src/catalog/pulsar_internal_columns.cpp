#include "catalog/pulsar_internal_columns.hpp"

namespace duckdb {

namespace {

PulsarColumnMetadata MakeInternal(const char *name, LogicalType type, const char *comment) {
	PulsarColumnMetadata column;
	column.name = name;
	column.type = std::move(type);
	column.comment = std::string(comment);
	column.hidden = false;
	column.internal = true;
	column.field_names = {name};
	return column;
}

std::vector<PulsarColumnMetadata> BuildInternalColumns() {
	std::vector<PulsarColumnMetadata> columns;
	columns.push_back(MakeInternal(PulsarInternalColumns::PARTITION, LogicalType::INTEGER,
	                               "The partition number which the message belongs to"));
	columns.push_back(
	    MakeInternal(PulsarInternalColumns::EVENT_TIME, LogicalType::TIMESTAMP,
	                 "Application defined timestamp in milliseconds of when the event occurred"));
	columns.push_back(MakeInternal(PulsarInternalColumns::PUBLISH_TIME, LogicalType::TIMESTAMP,
	                               "The timestamp in milliseconds of when event as published"));
	columns.push_back(MakeInternal(PulsarInternalColumns::MESSAGE_ID, LogicalType::VARCHAR,
	                               "The message ID of the message used to generate this row"));
	columns.push_back(MakeInternal(PulsarInternalColumns::SEQUENCE_ID, LogicalType::BIGINT,
	                               "The sequence ID of the message used to generate this row"));
	columns.push_back(
	    MakeInternal(PulsarInternalColumns::PRODUCER_NAME, LogicalType::VARCHAR,
	                 "The name of the producer that publish the message used to generate this row"));
	columns.push_back(
	    MakeInternal(PulsarInternalColumns::KEY, LogicalType::VARCHAR, "The partition key for the topic"));
	columns.push_back(
	    MakeInternal(PulsarInternalColumns::PROPERTIES, LogicalType::VARCHAR, "User defined properties"));
	return columns;
}

} // namespace

const std::vector<PulsarColumnMetadata> &PulsarInternalColumns::GetInternalColumns() {
	static const std::vector<PulsarColumnMetadata> columns = BuildInternalColumns();
	return columns;
}

const PulsarColumnMetadata *PulsarInternalColumns::Lookup(const std::string &name) {
	for (auto &column : GetInternalColumns()) {
		if (column.name == name) {
			return &column;
		}
	}
	return nullptr;
}

PulsarColumnMetadata PulsarInternalColumns::ValueColumn(const LogicalType &type) {
	PulsarColumnMetadata column;
	column.name = VALUE;
	column.type = type;
	column.comment = std::string("The value of the message with primitive type schema");
	column.field_names = {VALUE};
	return column;
}

void PulsarInternalColumns::AppendTo(std::vector<PulsarColumnMetadata> &columns) {
	auto &internal = GetInternalColumns();
	columns.insert(columns.end(), internal.begin(), internal.end());
}

} // namespace duckdb
