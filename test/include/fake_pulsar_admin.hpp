#pragma once

#include "pulsar_connector.hpp"
#include "pulsar_names.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// FakePulsarAdmin — in-memory namespace directory, topic directory and
// schema registry for tests
//
// Failures are injected per operation and argument, e.g.
//   admin->FailWith("GetSchemaInfo", "tenant-1/ns-1/topic-2", PulsarErrorCode::Transient);
//===--------------------------------------------------------------------===//
class FakePulsarAdmin : public IPulsarNamespaceDirectory, public IPulsarTopicDirectory, public IPulsarSchemaRegistry {
public:
	void AddNamespace(const std::string &namespace_name) {
		auto parsed = NamespaceName::Parse(namespace_name);
		auto &tenant = parsed.value.GetTenant();
		if (namespaces_.find(tenant) == namespaces_.end()) {
			tenants_.push_back(tenant);
		}
		auto &list = namespaces_[tenant];
		for (auto &existing : list) {
			if (existing == namespace_name) {
				return;
			}
		}
		list.push_back(namespace_name);
		topics_[namespace_name];
		partitioned_[namespace_name];
	}

	//! Adds a tenant that lists no namespaces
	void AddTenant(const std::string &tenant) {
		if (namespaces_.find(tenant) == namespaces_.end()) {
			tenants_.push_back(tenant);
			namespaces_[tenant];
		}
	}

	//! Tenant reported by ListTenants() whose namespaces can no longer be listed
	void AddVanishedTenant(const std::string &tenant) {
		tenants_.push_back(tenant);
	}

	void AddTopic(const std::string &topic_name) {
		auto parsed = TopicName::Parse(topic_name);
		topics_[parsed.value.GetNamespace()].push_back(parsed.value.ToString());
	}

	//! Registers the partitioned topic and one raw topic per partition
	void AddPartitionedTopic(const std::string &topic_name, int partitions) {
		auto parsed = TopicName::Parse(topic_name);
		auto ns = parsed.value.GetNamespace();
		partitioned_[ns].push_back(parsed.value.ToString());
		for (int i = 0; i < partitions; i++) {
			topics_[ns].push_back(parsed.value.ToString() + TopicName::PARTITION_SUFFIX + std::to_string(i));
		}
	}

	//! Raw partition topics only, without a partitioned-topic entry
	void AddOrphanPartitions(const std::string &topic_name, int partitions) {
		auto parsed = TopicName::Parse(topic_name);
		for (int i = 0; i < partitions; i++) {
			topics_[parsed.value.GetNamespace()].push_back(parsed.value.ToString() + TopicName::PARTITION_SUFFIX +
			                                               std::to_string(i));
		}
	}

	void SetSchema(const std::string &schema_name, PulsarSchemaType type, const std::string &definition) {
		PulsarSchemaInfo info;
		info.name = schema_name;
		info.type = type;
		info.schema = definition;
		schemas_[schema_name] = std::move(info);
	}

	void RemoveSchema(const std::string &schema_name) {
		schemas_.erase(schema_name);
	}

	void FailWith(const std::string &operation, const std::string &argument, PulsarErrorCode code) {
		failures_[operation + ":" + argument] =
		    PulsarError(code, "injected " + operation + " failure", argument, code == PulsarErrorCode::Transient);
	}

	void ClearFailures() {
		failures_.clear();
	}

	PulsarResult<std::vector<std::string>> ListTenants() const override {
		if (auto *failure = FindFailure("ListTenants", "")) {
			return PulsarResult<std::vector<std::string>>::Error(*failure);
		}
		return PulsarResult<std::vector<std::string>>::Success(tenants_);
	}

	PulsarResult<std::vector<std::string>> ListNamespaces(const std::string &tenant) const override {
		if (auto *failure = FindFailure("ListNamespaces", tenant)) {
			return PulsarResult<std::vector<std::string>>::Error(*failure);
		}
		auto it = namespaces_.find(tenant);
		if (it == namespaces_.end()) {
			return PulsarResult<std::vector<std::string>>::Error(PulsarErrorCode::NotFound,
			                                                     "Tenant does not exist", tenant);
		}
		return PulsarResult<std::vector<std::string>>::Success(it->second);
	}

	PulsarResult<std::vector<std::string>> ListTopics(const std::string &namespace_name) const override {
		if (auto *failure = FindFailure("ListTopics", namespace_name)) {
			return PulsarResult<std::vector<std::string>>::Error(*failure);
		}
		auto it = topics_.find(namespace_name);
		if (it == topics_.end()) {
			return PulsarResult<std::vector<std::string>>::Error(PulsarErrorCode::NotFound,
			                                                     "Namespace does not exist", namespace_name);
		}
		return PulsarResult<std::vector<std::string>>::Success(it->second);
	}

	PulsarResult<std::vector<std::string>> ListPartitionedTopics(const std::string &namespace_name) const override {
		if (auto *failure = FindFailure("ListPartitionedTopics", namespace_name)) {
			return PulsarResult<std::vector<std::string>>::Error(*failure);
		}
		auto it = partitioned_.find(namespace_name);
		if (it == partitioned_.end()) {
			return PulsarResult<std::vector<std::string>>::Error(PulsarErrorCode::NotFound,
			                                                     "Namespace does not exist", namespace_name);
		}
		return PulsarResult<std::vector<std::string>>::Success(it->second);
	}

	PulsarResult<PulsarSchemaInfo> GetSchemaInfo(const std::string &schema_name) const override {
		if (auto *failure = FindFailure("GetSchemaInfo", schema_name)) {
			return PulsarResult<PulsarSchemaInfo>::Error(*failure);
		}
		auto it = schemas_.find(schema_name);
		if (it == schemas_.end()) {
			return PulsarResult<PulsarSchemaInfo>::Error(PulsarErrorCode::NotFound, "Schema not found", schema_name);
		}
		return PulsarResult<PulsarSchemaInfo>::Success(it->second);
	}

private:
	const PulsarError *FindFailure(const std::string &operation, const std::string &argument) const {
		auto it = failures_.find(operation + ":" + argument);
		return it == failures_.end() ? nullptr : &it->second;
	}

	std::vector<std::string> tenants_;
	std::map<std::string, std::vector<std::string>> namespaces_;
	std::map<std::string, std::vector<std::string>> topics_;
	std::map<std::string, std::vector<std::string>> partitioned_;
	std::unordered_map<std::string, PulsarSchemaInfo> schemas_;
	std::unordered_map<std::string, PulsarError> failures_;
};

inline PulsarAdminClients MakeAdminClients(const std::shared_ptr<FakePulsarAdmin> &admin) {
	PulsarAdminClients clients;
	clients.namespaces = admin;
	clients.topics = admin;
	clients.schemas = admin;
	return clients;
}

//! Avro definition of the record used by most catalog tests.
//! Flattens to 13 columns, see FooColumnNames().
inline const char *FooAvroSchema() {
	return R"({
  "type": "record",
  "name": "Foo",
  "namespace": "org.apache.pulsar.sql.presto",
  "fields": [
    {"name": "field1", "type": "int"},
    {"name": "field2", "type": ["null", "string"]},
    {"name": "field3", "type": "float"},
    {"name": "field4", "type": "double"},
    {"name": "field5", "type": "boolean"},
    {"name": "field6", "type": "long"},
    {"name": "timestamp", "type": {"type": "long", "logicalType": "timestamp-millis"}},
    {"name": "time", "type": {"type": "int", "logicalType": "time-millis"}},
    {"name": "date", "type": {"type": "int", "logicalType": "date"}},
    {"name": "bar", "type": ["null", {
      "type": "record",
      "name": "Bar",
      "fields": [
        {"name": "field1", "type": ["null", "int"]},
        {"name": "field2", "type": "string"},
        {"name": "test2", "type": ["null", {
          "type": "record",
          "name": "Foobar",
          "fields": [{"name": "field1", "type": ["null", "int"]}]
        }]}
      ]
    }]},
    {"name": "field7", "type": {"type": "enum", "name": "Boo", "symbols": ["A", "B", "C"]}}
  ]
})";
}

inline std::vector<std::string> FooColumnNames() {
	return {"field1", "field2",     "field3",     "field4",          "field5", "field6", "timestamp",
	        "time",   "date",       "bar.field1", "bar.field2",      "bar.test2.field1", "field7"};
}

//! The catalog used by the metadata tests:
//!   tenant-1/ns-1  topic-1, topic-2, topic-3 (no schema), partitioned-topic-1 (2 partitions)
//!   tenant-1/ns-2  (empty)
//!   tenant-2/ns-1  topic-4, partitioned-topic-4 (3 partitions)
//!   tenant-2/ns-2  topic-5, topic-6, partitioned-topic-5 (1), partitioned-topic-6 (4)
inline std::shared_ptr<FakePulsarAdmin> MakeStandardAdmin() {
	auto admin = std::make_shared<FakePulsarAdmin>();
	admin->AddNamespace("tenant-1/ns-1");
	admin->AddNamespace("tenant-1/ns-2");
	admin->AddNamespace("tenant-2/ns-1");
	admin->AddNamespace("tenant-2/ns-2");

	admin->AddTopic("persistent://tenant-1/ns-1/topic-1");
	admin->AddTopic("persistent://tenant-1/ns-1/topic-2");
	admin->AddTopic("persistent://tenant-1/ns-1/topic-3");
	admin->AddPartitionedTopic("persistent://tenant-1/ns-1/partitioned-topic-1", 2);
	admin->AddTopic("persistent://tenant-2/ns-1/topic-4");
	admin->AddPartitionedTopic("persistent://tenant-2/ns-1/partitioned-topic-4", 3);
	admin->AddTopic("persistent://tenant-2/ns-2/topic-5");
	admin->AddTopic("persistent://tenant-2/ns-2/topic-6");
	admin->AddPartitionedTopic("persistent://tenant-2/ns-2/partitioned-topic-5", 1);
	admin->AddPartitionedTopic("persistent://tenant-2/ns-2/partitioned-topic-6", 4);

	for (auto *schema_name : {"tenant-1/ns-1/topic-1", "tenant-1/ns-1/topic-2", "tenant-1/ns-1/partitioned-topic-1",
	                          "tenant-2/ns-1/topic-4", "tenant-2/ns-1/partitioned-topic-4", "tenant-2/ns-2/topic-5",
	                          "tenant-2/ns-2/topic-6", "tenant-2/ns-2/partitioned-topic-5",
	                          "tenant-2/ns-2/partitioned-topic-6"}) {
		admin->SetSchema(schema_name, PulsarSchemaType::AVRO, FooAvroSchema());
	}
	return admin;
}

} // namespace duckdb
