#include "pulsar_names.hpp"

#include <cctype>

namespace duckdb {

namespace {

bool IsDecimal(const std::string &value) {
	if (value.empty()) {
		return false;
	}
	for (char c : value) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

//! Split a local name into base name and partition index (-1 when not a partition)
void SplitPartition(const std::string &local_name, std::string &base_out, int64_t &index_out) {
	base_out = local_name;
	index_out = -1;
	auto pos = local_name.rfind(TopicName::PARTITION_SUFFIX);
	if (pos == std::string::npos || pos == 0) {
		return;
	}
	auto index_str = local_name.substr(pos + std::char_traits<char>::length(TopicName::PARTITION_SUFFIX));
	// more than 9 digits is not a partition index
	if (!IsDecimal(index_str) || index_str.size() > 9) {
		return;
	}
	base_out = local_name.substr(0, pos);
	index_out = std::stoll(index_str);
}

} // namespace

NamespaceName::NamespaceName(std::string tenant, std::string local_name)
    : tenant_(std::move(tenant)), local_name_(std::move(local_name)) {
}

PulsarResult<NamespaceName> NamespaceName::Parse(const std::string &name) {
	auto slash = name.find('/');
	if (slash == std::string::npos || name.find('/', slash + 1) != std::string::npos) {
		return PulsarResult<NamespaceName>::Error(PulsarErrorCode::InvalidArgument,
		                                          "Invalid namespace name: '" + name + "'",
		                                          "expected the form tenant/namespace");
	}
	auto tenant = name.substr(0, slash);
	auto local = name.substr(slash + 1);
	if (tenant.empty() || local.empty()) {
		return PulsarResult<NamespaceName>::Error(PulsarErrorCode::InvalidArgument,
		                                          "Invalid namespace name: '" + name + "'",
		                                          "tenant and namespace must be non-empty");
	}
	return PulsarResult<NamespaceName>::Success(NamespaceName(std::move(tenant), std::move(local)));
}

std::string NamespaceName::ToString() const {
	return tenant_ + "/" + local_name_;
}

PulsarResult<TopicName> TopicName::Parse(const std::string &name) {
	const std::string persistent_scheme = "persistent://";
	const std::string non_persistent_scheme = "non-persistent://";

	TopicDomain domain = TopicDomain::Persistent;
	std::string remainder;
	if (name.rfind(persistent_scheme, 0) == 0) {
		remainder = name.substr(persistent_scheme.size());
	} else if (name.rfind(non_persistent_scheme, 0) == 0) {
		domain = TopicDomain::NonPersistent;
		remainder = name.substr(non_persistent_scheme.size());
	} else if (name.find("://") != std::string::npos) {
		return PulsarResult<TopicName>::Error(PulsarErrorCode::InvalidArgument, "Invalid topic name: '" + name + "'",
		                                      "unknown topic domain");
	} else {
		remainder = name;
	}

	// tenant/namespace/local; the local name may not contain further slashes
	auto first = remainder.find('/');
	auto second = first == std::string::npos ? std::string::npos : remainder.find('/', first + 1);
	if (second == std::string::npos || remainder.find('/', second + 1) != std::string::npos) {
		return PulsarResult<TopicName>::Error(PulsarErrorCode::InvalidArgument, "Invalid topic name: '" + name + "'",
		                                      "expected the form [domain://]tenant/namespace/topic");
	}
	auto ns_result = NamespaceName::Parse(remainder.substr(0, second));
	if (!ns_result.IsOk()) {
		return PulsarResult<TopicName>::Error(PulsarErrorCode::InvalidArgument, "Invalid topic name: '" + name + "'",
		                                      ns_result.error.detail);
	}
	auto local = remainder.substr(second + 1);
	if (local.empty()) {
		return PulsarResult<TopicName>::Error(PulsarErrorCode::InvalidArgument, "Invalid topic name: '" + name + "'",
		                                      "topic local name is empty");
	}
	return PulsarResult<TopicName>::Success(Create(ns_result.value, local, domain));
}

TopicName TopicName::Create(const NamespaceName &namespace_name, const std::string &local_name, TopicDomain domain) {
	TopicName topic;
	topic.domain_ = domain;
	topic.namespace_ = namespace_name;
	topic.local_name_ = local_name;
	SplitPartition(local_name, topic.base_local_name_, topic.partition_index_);
	return topic;
}

TopicName TopicName::GetPartitionedTopicName() const {
	if (!IsPartition()) {
		return *this;
	}
	return Create(namespace_, base_local_name_, domain_);
}

std::string TopicName::GetSchemaName() const {
	return namespace_.ToString() + "/" + base_local_name_;
}

std::string TopicName::ToString() const {
	return std::string(TopicDomainToString(domain_)) + "://" + namespace_.ToString() + "/" + local_name_;
}

} // namespace duckdb
