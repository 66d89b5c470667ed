#include "catalog/pulsar_handles.hpp"
#include "catalog/pulsar_internal_columns.hpp"
#include "catalog/pulsar_namespace_catalog.hpp"
#include "catalog/pulsar_topic_catalog.hpp"
#include "pulsar_config.hpp"
#include "pulsar_errors.hpp"
#include "pulsar_names.hpp"
#include "fake_pulsar_admin.hpp"
#include "duckdb/common/exception.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

using namespace duckdb;

void Assert(bool condition, const std::string &message) {
	if (!condition) {
		std::cerr << "[FAIL] " << message << std::endl;
		std::exit(1);
	}
}

void TestNamespaceNames() {
	auto ns = NamespaceName::Parse("tenant-1/ns-1");
	Assert(ns.IsOk(), "tenant/namespace should parse");
	Assert(ns.value.GetTenant() == "tenant-1", "tenant should parse");
	Assert(ns.value.GetLocalName() == "ns-1", "namespace should parse");
	Assert(ns.value.ToString() == "tenant-1/ns-1", "namespace round trips");

	for (auto *bad : {"tenant-1", "tenant-1/", "/ns-1", "a/b/c", ""}) {
		auto result = NamespaceName::Parse(bad);
		Assert(!result.IsOk() && result.error.code == PulsarErrorCode::InvalidArgument,
		       std::string("'") + bad + "' is not a namespace name");
	}
}

void TestTopicNames() {
	auto topic = TopicName::Parse("persistent://tenant-1/ns-1/topic-1");
	Assert(topic.IsOk(), "persistent topic should parse");
	Assert(topic.value.GetNamespace() == "tenant-1/ns-1", "topic namespace");
	Assert(topic.value.GetLocalName() == "topic-1", "topic local name");
	Assert(!topic.value.IsPartition(), "plain topic is not a partition");
	Assert(topic.value.GetSchemaName() == "tenant-1/ns-1/topic-1", "schema name of plain topic");
	Assert(topic.value.ToString() == "persistent://tenant-1/ns-1/topic-1", "topic round trips");

	auto bare = TopicName::Parse("tenant-1/ns-1/topic-1");
	Assert(bare.IsOk() && bare.value == topic.value, "bare names are persistent topics");

	auto non_persistent = TopicName::Parse("non-persistent://tenant-1/ns-1/topic-1");
	Assert(non_persistent.IsOk() && non_persistent.value.GetDomain() == TopicDomain::NonPersistent,
	       "non-persistent topic should parse");
	Assert(non_persistent.value != topic.value, "domain is part of topic identity");

	auto partition = TopicName::Parse("persistent://tenant-1/ns-1/orders-partition-12");
	Assert(partition.IsOk() && partition.value.IsPartition(), "partition suffix is recognized");
	Assert(partition.value.GetPartitionIndex() == 12, "partition index");
	Assert(partition.value.GetBaseLocalName() == "orders", "partition base name");
	Assert(partition.value.GetSchemaName() == "tenant-1/ns-1/orders", "partitions share the base schema name");
	Assert(partition.value.GetPartitionedTopicName().ToString() == "persistent://tenant-1/ns-1/orders",
	       "partitioned topic name");

	auto not_partition = TopicName::Parse("persistent://tenant-1/ns-1/orders-partition-x");
	Assert(not_partition.IsOk() && !not_partition.value.IsPartition(), "non-numeric suffix is part of the name");

	for (auto *bad : {"http://tenant-1/ns-1/topic-1", "persistent://tenant-1/ns-1", "tenant-1/ns-1/",
	                  "persistent://tenant-1/ns-1/a/b"}) {
		auto result = TopicName::Parse(bad);
		Assert(!result.IsOk() && result.error.code == PulsarErrorCode::InvalidArgument,
		       std::string("'") + bad + "' is not a topic name");
	}
}

void TestConfig() {
	case_insensitive_map_t<Value> options;
	auto defaults = ResolveConnectorConfig(options);
	Assert(defaults.connector_id == "pulsar", "default connector id");
	Assert(!defaults.IsNamespaceDelimiterRewriteEnabled(), "rewriting is disabled by default");

	options["type"] = Value("PULSAR");
	options["connector_id"] = Value("pulsar-prod");
	options["rewrite_namespace_delimiter"] = Value("/");
	auto config = ResolveConnectorConfig(options);
	Assert(config.connector_id == "pulsar-prod", "connector id is read");
	Assert(config.rewrite_namespace_delimiter == "/", "delimiter is read");

	auto expect_invalid = [](const std::string &key, const std::string &value, const std::string &what) {
		case_insensitive_map_t<Value> bad;
		bad[key] = Value(value);
		bool invalid_config = false;
		try {
			(void)ResolveConnectorConfig(bad);
		} catch (const PulsarException &ex) {
			invalid_config = ex.GetErrorCode() == PulsarErrorCode::InvalidConfig;
		}
		Assert(invalid_config, what + " must raise InvalidConfig");
	};
	expect_invalid("TYPE", "hms", "a foreign TYPE");
	expect_invalid("WEB_SERVICE_URL", "http://localhost:8080", "an option the connector does not read");
	expect_invalid("REWRITE_NAMESPACE_DELIMITER", "-", "a delimiter of name characters");
	expect_invalid("REWRITE_NAMESPACE_DELIMITER", "a_b.c", "a word delimiter");

	ValidateRewriteNamespaceDelimiter("%");
	ValidateRewriteNamespaceDelimiter("a%");
	Assert(RewriteNamespaceDelimiter("tenant-1/ns-1", "%") == "tenant-1%ns-1", "rewrite replaces '/'");
	Assert(RestoreNamespaceDelimiter("tenant-1%ns-1", "%") == "tenant-1/ns-1", "restore undoes rewrite");
	Assert(RestoreNamespaceDelimiter("tenant-1%ns-1", "") == "tenant-1%ns-1", "empty delimiter is identity");
}

void TestNamespaceCatalog() {
	auto admin = MakeStandardAdmin();
	PulsarNamespaceCatalog catalog(admin, "");
	auto schemas = catalog.ListSchemaNames();
	Assert(schemas.IsOk(), "schemas should list");
	std::vector<std::string> expected = {"tenant-1/ns-1", "tenant-1/ns-2", "tenant-2/ns-1", "tenant-2/ns-2"};
	Assert(schemas.value == expected, "schemas in directory order");
	Assert(catalog.ListSchemaNames().value == schemas.value, "listing schemas is idempotent");

	PulsarNamespaceCatalog rewriting(admin, "%%");
	auto rewritten = rewriting.ListSchemaNames();
	Assert(rewritten.IsOk() && rewritten.value[0] == "tenant-1%%ns-1", "schemas are rewritten");
	Assert(rewriting.RestoreNamespaceDelimiter(rewritten.value[3]) == "tenant-2/ns-2", "schemas are restored");

	Assert(catalog.NamespaceExists("tenant-1/ns-2").value, "empty namespace exists");
	Assert(!catalog.NamespaceExists("tenant-1/ns-9").value, "unknown namespace");
	Assert(!catalog.NamespaceExists("wrong-tenant/wrong-ns").value, "unknown tenant");
	Assert(!catalog.NamespaceExists("not-a-namespace").value, "malformed namespace");

	admin->AddVanishedTenant("tenant-gone");
	admin->AddTenant("tenant-3");
	admin->AddNamespace("tenant-1/ns-1");
	auto skipped = catalog.ListSchemaNames();
	Assert(skipped.IsOk() && skipped.value == expected, "vanished tenants are skipped and nothing is duplicated");

	admin->FailWith("ListNamespaces", "tenant-2", PulsarErrorCode::PermissionDenied);
	auto denied = catalog.ListSchemaNames();
	Assert(!denied.IsOk() && denied.error.code == PulsarErrorCode::PermissionDenied,
	       "collaborator failures propagate");

	PulsarNamespaceCatalog empty(std::make_shared<FakePulsarAdmin>(), "");
	Assert(empty.ListSchemaNames().IsOk() && empty.ListSchemaNames().value.empty(), "empty directory");
}

void TestTopicCatalog() {
	auto admin = MakeStandardAdmin();
	PulsarTopicCatalog catalog(admin, "");

	Assert(catalog.ListTables(std::nullopt).value.empty(), "no namespace lists nothing");
	auto wrong = catalog.ListTables(std::string("wrong-tenant/wrong-ns"));
	Assert(wrong.IsOk() && wrong.value.empty(), "unknown namespace lists nothing");
	Assert(catalog.ListTables(std::string("garbage")).value.empty(), "malformed namespace lists nothing");

	auto ns3 = catalog.ListTables(std::string("tenant-2/ns-1"));
	Assert(ns3.IsOk(), "tables should list");
	Assert(ns3.value == std::vector<std::string>({"topic-4", "partitioned-topic-4"}),
	       "partitions coalesce into their partitioned topic");

	auto ns4 = catalog.ListTables(std::string("tenant-2/ns-2"));
	Assert(ns4.value == std::vector<std::string>({"topic-5", "topic-6", "partitioned-topic-5", "partitioned-topic-6"}),
	       "a partitioned topic yields one table, never one per partition");

	admin->AddOrphanPartitions("persistent://tenant-1/ns-2/orphan", 3);
	admin->AddTopic("persistent://tenant-1/ns-2/plain");
	auto orphans = catalog.ListTables(std::string("tenant-1/ns-2"));
	Assert(orphans.value == std::vector<std::string>({"orphan", "plain"}),
	       "partition names coalesce without a partitioned-topic entry");

	admin->AddNamespace("tenant-3/ns-1");
	admin->AddPartitionedTopic("persistent://tenant-3/ns-1/first", 2);
	admin->AddTopic("persistent://tenant-3/ns-1/second");
	admin->AddPartitionedTopic("persistent://tenant-3/ns-1/third", 0);
	auto ordered = catalog.ListTables(std::string("tenant-3/ns-1"));
	Assert(ordered.value == std::vector<std::string>({"first", "second", "third"}),
	       "tables keep the order their topics were discovered in");

	PulsarTopicCatalog rewriting(admin, "%%");
	Assert(rewriting.ListTables(std::string("tenant-2%%ns-1")).value.size() == 2, "rewritten namespace is restored");

	auto ns = NamespaceName::Parse("tenant-2/ns-1").value;
	auto resolved = catalog.ResolveTopic(ns, "partitioned-topic-4");
	Assert(resolved.IsOk(), "partitioned topic resolves");
	Assert(resolved.value.ToString() == "persistent://tenant-2/ns-1/partitioned-topic-4", "resolved to base topic");
	auto missing = catalog.ResolveTopic(ns, "partitioned-topic-4-partition-0");
	Assert(!missing.IsOk() && missing.error.code == PulsarErrorCode::TableNotFound, "partitions are not tables");
	Assert(missing.error.message == "Table 'tenant-2/ns-1.partitioned-topic-4-partition-0' not found",
	       "table not found message");
	auto unknown_ns = catalog.ResolveTopic(NamespaceName("tenant-9", "ns-9"), "topic-1");
	Assert(!unknown_ns.IsOk() && unknown_ns.error.code == PulsarErrorCode::NotFound, "unknown namespace is NotFound");

	admin->FailWith("ListTopics", "tenant-2/ns-1", PulsarErrorCode::Transient);
	auto transient = catalog.ListTables(std::string("tenant-2/ns-1"));
	Assert(!transient.IsOk() && transient.error.code == PulsarErrorCode::Transient && transient.error.retryable,
	       "transient failures propagate unchanged");
}

void TestHandles() {
	PulsarHandleResolver resolver("pulsar");
	auto handle = resolver.MakeTableHandle("tenant-1/ns-1", "topic-1");
	Assert(handle.connector_id == "pulsar", "handle connector id");
	Assert(handle.topic_name == handle.table_name, "topic name equals table name");
	Assert(handle == PulsarTableHandle("pulsar", "tenant-1/ns-1", "topic-1", "topic-1"), "handles are value-equal");
	Assert(handle.ToString() ==
	           "PulsarTableHandle{connector_id=pulsar, schema_name=tenant-1/ns-1, table_name=topic-1, topic_name=topic-1}",
	       "table handle string form");
	Assert(PulsarTableHandleHash()(handle) == PulsarTableHandleHash()(resolver.MakeTableHandle("tenant-1/ns-1", "topic-1")),
	       "equal handles hash equally");
	std::unordered_set<PulsarTableHandle, PulsarTableHandleHash> handle_set = {handle, handle};
	Assert(handle_set.size() == 1, "handles work as hash keys");

	PulsarTableHandle foreign("persistent://tenant-1/ns-1/topic-1", "tenant-1/ns-1", "topic-1", "topic-1");
	Assert(foreign != handle, "connector id takes part in equality");
	Assert(foreign.schema_name == handle.schema_name && foreign.topic_name == handle.topic_name,
	       "handles of other connectors still address the same topic");

	PulsarColumnMetadata column;
	column.name = "bar.field1";
	column.type = LogicalType::INTEGER;
	column.position_indices = {9, 0};
	column.field_names = {"bar", "field1"};
	auto column_handle = resolver.MakeColumnHandle(column);
	Assert(column_handle.connector_id == "pulsar" && column_handle.name == "bar.field1", "column handle fields");
	Assert(column_handle == resolver.MakeColumnHandle(column), "column handles are value-equal");
	Assert(column_handle.ToString() ==
	           "PulsarColumnHandle{connector_id=pulsar, name=bar.field1, type=INTEGER, position_indices=[9, 0], "
	           "field_names=[bar, field1], hidden=false, internal=false}",
	       "column handle string form");

	auto *key = PulsarInternalColumns::Lookup("__key__");
	auto key_handle = resolver.MakeColumnHandle(*key);
	Assert(key_handle.internal && !key_handle.hidden && key_handle.type == LogicalType::VARCHAR,
	       "internal column handle");
}

void TestErrorMapping() {
	bool catalog_error = false;
	try {
		ThrowPulsarError(PulsarError(PulsarErrorCode::SchemaNotFound, SchemaNotFoundMessage("wrong-tenant/wrong-ns")));
	} catch (const CatalogException &) {
		catalog_error = true;
	}
	Assert(catalog_error, "SchemaNotFound raises CatalogException");

	bool invalid_input = false;
	try {
		ThrowPulsarError(PulsarError(PulsarErrorCode::InvalidSchema, InvalidSchemaMessage("persistent://t/n/x")));
	} catch (const InvalidInputException &) {
		invalid_input = true;
	}
	Assert(invalid_input, "InvalidSchema raises InvalidInputException");

	bool io_error = false;
	try {
		ThrowPulsarError(PulsarError(PulsarErrorCode::Transient, "connection reset"));
	} catch (const IOException &) {
		io_error = true;
	}
	Assert(io_error, "collaborator failures raise IOException");
}

} // namespace

int main() {
	TestNamespaceNames();
	TestTopicNames();
	TestConfig();
	TestNamespaceCatalog();
	TestTopicCatalog();
	TestHandles();
	TestErrorMapping();
	std::cout << "[PASS] catalog harness checks completed" << std::endl;
	return 0;
}
