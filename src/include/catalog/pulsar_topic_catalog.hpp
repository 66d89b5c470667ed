#pragma once

#include "pulsar_connector.hpp"
#include "pulsar_names.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// PulsarTopicCatalog — topics of a namespace as table entries
//
// Every partition of a partitioned topic collapses into one entry named
// after the partitioned topic, at the position its first partition was
// discovered.
//===--------------------------------------------------------------------===//
class PulsarTopicCatalog {
public:
	PulsarTopicCatalog(std::shared_ptr<const IPulsarTopicDirectory> directory, std::string rewrite_delimiter);

	//! Table names of a namespace, given in engine (possibly rewritten) form.
	//! An absent, unparsable or unknown namespace yields an empty list.
	PulsarResult<std::vector<std::string>> ListTables(const std::optional<std::string> &schema_name) const;

	//! Coalesced topics of a canonical "tenant/namespace".
	//! Returns Error(NotFound) when the namespace is unknown to the directory.
	PulsarResult<std::vector<TopicName>> ListLogicalTopics(const NamespaceName &namespace_name) const;

	//! Resolve a table of a canonical namespace to its topic.
	//! Returns Error(TableNotFound) when no logical topic carries that name, and
	//! the directory's NotFound when the namespace itself is unknown.
	PulsarResult<TopicName> ResolveTopic(const NamespaceName &namespace_name, const std::string &table_name) const;

private:
	std::shared_ptr<const IPulsarTopicDirectory> directory_;
	std::string rewrite_delimiter_;
};

} // namespace duckdb
