#include "catalog/pulsar_topic_catalog.hpp"
#include "pulsar_config.hpp"
#include "pulsar_errors.hpp"
#include "pulsar_logger.hpp"

#include <unordered_set>

namespace duckdb {

PulsarTopicCatalog::PulsarTopicCatalog(std::shared_ptr<const IPulsarTopicDirectory> directory,
                                       std::string rewrite_delimiter)
    : directory_(std::move(directory)), rewrite_delimiter_(std::move(rewrite_delimiter)) {
}

PulsarResult<std::vector<std::string>>
PulsarTopicCatalog::ListTables(const std::optional<std::string> &schema_name) const {
	std::vector<std::string> tables;
	if (!schema_name.has_value()) {
		return PulsarResult<std::vector<std::string>>::Success(std::move(tables));
	}
	auto canonical = RestoreNamespaceDelimiter(*schema_name, rewrite_delimiter_);
	auto namespace_name = NamespaceName::Parse(canonical);
	if (!namespace_name.IsOk()) {
		GetPulsarLogger()->debug("'{}' is not a namespace name, no tables listed", canonical);
		return PulsarResult<std::vector<std::string>>::Success(std::move(tables));
	}

	auto topics = ListLogicalTopics(namespace_name.value);
	if (!topics.IsOk()) {
		if (topics.error.code == PulsarErrorCode::NotFound) {
			return PulsarResult<std::vector<std::string>>::Success(std::move(tables));
		}
		return PulsarResult<std::vector<std::string>>::Error(topics.error);
	}
	tables.reserve(topics.value.size());
	for (auto &topic : topics.value) {
		tables.push_back(topic.GetLocalName());
	}
	return PulsarResult<std::vector<std::string>>::Success(std::move(tables));
}

PulsarResult<std::vector<TopicName>> PulsarTopicCatalog::ListLogicalTopics(const NamespaceName &namespace_name) const {
	auto ns = namespace_name.ToString();
	auto raw_topics = directory_->ListTopics(ns);
	if (!raw_topics.IsOk()) {
		return PulsarResult<std::vector<TopicName>>::Error(raw_topics.error);
	}
	auto partitioned_topics = directory_->ListPartitionedTopics(ns);
	if (!partitioned_topics.IsOk()) {
		if (partitioned_topics.error.code != PulsarErrorCode::NotFound) {
			return PulsarResult<std::vector<TopicName>>::Error(partitioned_topics.error);
		}
		partitioned_topics.value.clear();
	}

	std::vector<TopicName> topics;
	std::unordered_set<std::string> seen;
	auto add_topic = [&](const TopicName &topic) {
		auto base = topic.GetPartitionedTopicName();
		if (seen.insert(base.GetLocalName()).second) {
			topics.push_back(std::move(base));
		}
	};

	for (auto &raw : raw_topics.value) {
		auto topic = TopicName::Parse(raw);
		if (!topic.IsOk()) {
			GetPulsarLogger()->debug("Ignoring unparsable topic '{}' in {}: {}", raw, ns, topic.error.message);
			continue;
		}
		add_topic(topic.value);
	}
	// partitioned topics whose partitions were not listed yet
	for (auto &raw : partitioned_topics.value) {
		auto topic = TopicName::Parse(raw);
		if (!topic.IsOk()) {
			GetPulsarLogger()->debug("Ignoring unparsable partitioned topic '{}' in {}: {}", raw, ns,
			                         topic.error.message);
			continue;
		}
		add_topic(topic.value);
	}

	GetPulsarLogger()->debug("Namespace {} has {} raw topics coalesced into {} tables", ns, raw_topics.value.size(),
	                         topics.size());
	return PulsarResult<std::vector<TopicName>>::Success(std::move(topics));
}

PulsarResult<TopicName> PulsarTopicCatalog::ResolveTopic(const NamespaceName &namespace_name,
                                                         const std::string &table_name) const {
	auto topics = ListLogicalTopics(namespace_name);
	if (!topics.IsOk()) {
		return PulsarResult<TopicName>::Error(topics.error);
	}
	for (auto &topic : topics.value) {
		if (topic.GetLocalName() == table_name) {
			return PulsarResult<TopicName>::Success(topic);
		}
	}
	return PulsarResult<TopicName>::Error(PulsarErrorCode::TableNotFound,
	                                      TableNotFoundMessage(namespace_name.ToString(), table_name));
}

} // namespace duckdb
