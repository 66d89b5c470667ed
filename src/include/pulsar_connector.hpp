#pragma once

#include "pulsar_types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// PulsarErrorCode — error classification for catalog operations
//===--------------------------------------------------------------------===//
enum class PulsarErrorCode : int32_t {
	Ok = 0,
	//! Collaborator reported a missing tenant, namespace or schema (404)
	NotFound = 1,
	PermissionDenied = 2,
	Transient = 3,
	InvalidConfig = 4,
	Unsupported = 5,
	InvalidArgument = 6,
	//! Namespace absent from the directory
	SchemaNotFound = 10,
	//! Topic absent in an existing namespace
	TableNotFound = 11,
	//! Schema bytes empty, unparsable or not mappable to columns
	InvalidSchema = 12
};

//===--------------------------------------------------------------------===//
// PulsarResult<T> — result-or-error envelope for catalog operations
//===--------------------------------------------------------------------===//
struct PulsarError {
	PulsarErrorCode code;
	std::string message;
	std::string detail;
	bool retryable;

	PulsarError() : code(PulsarErrorCode::Ok), retryable(false) {
	}
	PulsarError(PulsarErrorCode code_p, std::string message_p, std::string detail_p = "", bool retryable_p = false)
	    : code(code_p), message(std::move(message_p)), detail(std::move(detail_p)), retryable(retryable_p) {
	}

	bool IsOk() const {
		return code == PulsarErrorCode::Ok;
	}
};

template <typename T>
struct PulsarResult {
	T value {};
	PulsarError error;

	//! Check whether the operation succeeded
	bool IsOk() const {
		return error.IsOk();
	}

	//! Construct a success result
	static PulsarResult Success(T val) {
		PulsarResult r;
		r.value = std::move(val);
		return r;
	}

	//! Construct an error result
	static PulsarResult Error(PulsarErrorCode code, std::string message, std::string detail = "",
	                          bool retryable = false) {
		PulsarResult r;
		r.error = PulsarError(code, std::move(message), std::move(detail), retryable);
		return r;
	}

	//! Forward an error produced by another operation unchanged
	static PulsarResult Error(PulsarError error) {
		PulsarResult r;
		r.error = std::move(error);
		return r;
	}
};

//===--------------------------------------------------------------------===//
// Collaborator interfaces
//
// The Pulsar admin client and schema registry live outside this extension.
// The embedding application implements these interfaces and registers them
// per catalog through RegisterPulsarCatalog(). Missing objects are reported
// with PulsarErrorCode::NotFound; every other failure code is propagated by
// the catalog layer unchanged.
//===--------------------------------------------------------------------===//
class IPulsarNamespaceDirectory {
public:
	virtual ~IPulsarNamespaceDirectory() = default;

	//! List all tenants, in directory order.
	virtual PulsarResult<std::vector<std::string>> ListTenants() const = 0;

	//! List the namespaces of a tenant as "tenant/namespace" strings.
	//! Fails with NotFound if the tenant does not exist.
	virtual PulsarResult<std::vector<std::string>> ListNamespaces(const std::string &tenant) const = 0;
};

class IPulsarTopicDirectory {
public:
	virtual ~IPulsarTopicDirectory() = default;

	//! List the fully qualified names of all topics in a namespace, including
	//! individual partitions ("persistent://t/ns/topic-partition-0").
	//! Fails with NotFound if the namespace does not exist.
	virtual PulsarResult<std::vector<std::string>> ListTopics(const std::string &namespace_name) const = 0;

	//! List the fully qualified base names of partitioned topics in a namespace.
	virtual PulsarResult<std::vector<std::string>> ListPartitionedTopics(const std::string &namespace_name) const = 0;
};

class IPulsarSchemaRegistry {
public:
	virtual ~IPulsarSchemaRegistry() = default;

	//! Fetch the latest schema registered for "tenant/namespace/topic".
	//! Fails with NotFound if the topic has no schema.
	virtual PulsarResult<PulsarSchemaInfo> GetSchemaInfo(const std::string &schema_name) const = 0;
};

//! The collaborators a catalog is resolved against. Any member may be shared
//! by several catalogs; all calls on them are const and may run concurrently.
struct PulsarAdminClients {
	std::shared_ptr<const IPulsarNamespaceDirectory> namespaces;
	std::shared_ptr<const IPulsarTopicDirectory> topics;
	std::shared_ptr<const IPulsarSchemaRegistry> schemas;

	bool IsComplete() const {
		return namespaces && topics && schemas;
	}
};

} // namespace duckdb
