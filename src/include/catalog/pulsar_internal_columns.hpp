#pragma once

#include "pulsar_types.hpp"

#include <string>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// PulsarInternalColumns — the message-envelope columns of every topic table
//
// The table is built once and never modified; all accessors are pure and
// safe to call concurrently.
//===--------------------------------------------------------------------===//
class PulsarInternalColumns {
public:
	static constexpr const char *PARTITION = "__partition__";
	static constexpr const char *EVENT_TIME = "__event_time__";
	static constexpr const char *PUBLISH_TIME = "__publish_time__";
	static constexpr const char *MESSAGE_ID = "__message_id__";
	static constexpr const char *SEQUENCE_ID = "__sequence_id__";
	static constexpr const char *PRODUCER_NAME = "__producer_name__";
	static constexpr const char *KEY = "__key__";
	static constexpr const char *PROPERTIES = "__properties__";

	//! Column holding the whole payload of topics without a record schema
	static constexpr const char *VALUE = "__value__";

	//! All internal columns, in the order they are appended to a table.
	static const std::vector<PulsarColumnMetadata> &GetInternalColumns();

	//! Internal column by name, or nullptr when the name is not an internal column.
	static const PulsarColumnMetadata *Lookup(const std::string &name);

	static bool IsInternalColumn(const std::string &name) {
		return Lookup(name) != nullptr;
	}

	static idx_t Count() {
		return GetInternalColumns().size();
	}

	//! The "__value__" column with the given type.
	static PulsarColumnMetadata ValueColumn(const LogicalType &type);

	//! Append the internal columns to a column list.
	static void AppendTo(std::vector<PulsarColumnMetadata> &columns);
};

} // namespace duckdb
