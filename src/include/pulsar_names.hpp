#pragma once

#include "pulsar_connector.hpp"

#include <cstdint>
#include <string>

namespace duckdb {

//===--------------------------------------------------------------------===//
// TopicDomain — persistence domain of a topic
//===--------------------------------------------------------------------===//
enum class TopicDomain : uint8_t { Persistent = 0, NonPersistent = 1 };

inline const char *TopicDomainToString(TopicDomain domain) {
	switch (domain) {
	case TopicDomain::NonPersistent:
		return "non-persistent";
	case TopicDomain::Persistent:
	default:
		return "persistent";
	}
}

//===--------------------------------------------------------------------===//
// NamespaceName — "tenant/namespace"
//===--------------------------------------------------------------------===//
class NamespaceName {
public:
	NamespaceName() = default;
	NamespaceName(std::string tenant, std::string local_name);

	//! Parse the canonical "tenant/namespace" form.
	//! Returns Error(InvalidArgument) unless there are exactly two non-empty parts.
	static PulsarResult<NamespaceName> Parse(const std::string &name);

	const std::string &GetTenant() const {
		return tenant_;
	}
	const std::string &GetLocalName() const {
		return local_name_;
	}
	std::string ToString() const;

	bool operator==(const NamespaceName &other) const {
		return tenant_ == other.tenant_ && local_name_ == other.local_name_;
	}
	bool operator!=(const NamespaceName &other) const {
		return !(*this == other);
	}

private:
	std::string tenant_;
	std::string local_name_;
};

//===--------------------------------------------------------------------===//
// TopicName — "persistent://tenant/namespace/local"
//
// Supported forms:
//   persistent://tenant/ns/topic          -> persistent topic
//   non-persistent://tenant/ns/topic      -> non-persistent topic
//   tenant/ns/topic                       -> persistent topic
//
// A local name ending in "-partition-<N>" names one partition of the
// partitioned topic whose local name is the part before the suffix.
//===--------------------------------------------------------------------===//
class TopicName {
public:
	static constexpr const char *PARTITION_SUFFIX = "-partition-";

	TopicName() = default;

	static PulsarResult<TopicName> Parse(const std::string &name);
	static TopicName Create(const NamespaceName &namespace_name, const std::string &local_name,
	                        TopicDomain domain = TopicDomain::Persistent);

	TopicDomain GetDomain() const {
		return domain_;
	}
	const NamespaceName &GetNamespaceObject() const {
		return namespace_;
	}
	//! "tenant/namespace"
	std::string GetNamespace() const {
		return namespace_.ToString();
	}
	//! Local name as given, including any partition suffix
	const std::string &GetLocalName() const {
		return local_name_;
	}
	//! Local name without the partition suffix
	const std::string &GetBaseLocalName() const {
		return base_local_name_;
	}
	bool IsPartition() const {
		return partition_index_ >= 0;
	}
	//! -1 when the topic is not a partition
	int64_t GetPartitionIndex() const {
		return partition_index_;
	}
	//! The partitioned (logical) topic this topic belongs to; itself when not a partition
	TopicName GetPartitionedTopicName() const;
	//! Key under which the schema registry stores the topic's schema, "tenant/namespace/base"
	std::string GetSchemaName() const;
	//! Fully qualified form, "persistent://tenant/namespace/local"
	std::string ToString() const;

	bool operator==(const TopicName &other) const {
		return domain_ == other.domain_ && namespace_ == other.namespace_ && local_name_ == other.local_name_;
	}
	bool operator!=(const TopicName &other) const {
		return !(*this == other);
	}

private:
	TopicDomain domain_ = TopicDomain::Persistent;
	NamespaceName namespace_;
	std::string local_name_;
	std::string base_local_name_;
	int64_t partition_index_ = -1;
};

} // namespace duckdb
