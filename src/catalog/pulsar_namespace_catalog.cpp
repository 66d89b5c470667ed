#include "catalog/pulsar_namespace_catalog.hpp"
#include "pulsar_config.hpp"
#include "pulsar_logger.hpp"
#include "pulsar_names.hpp"

#include <unordered_set>

namespace duckdb {

PulsarNamespaceCatalog::PulsarNamespaceCatalog(std::shared_ptr<const IPulsarNamespaceDirectory> directory,
                                               std::string rewrite_delimiter)
    : directory_(std::move(directory)), rewrite_delimiter_(std::move(rewrite_delimiter)) {
}

PulsarResult<std::vector<std::string>> PulsarNamespaceCatalog::ListSchemaNames() const {
	auto tenants = directory_->ListTenants();
	if (!tenants.IsOk()) {
		return PulsarResult<std::vector<std::string>>::Error(tenants.error);
	}

	std::vector<std::string> schema_names;
	std::unordered_set<std::string> seen;
	for (auto &tenant : tenants.value) {
		auto namespaces = directory_->ListNamespaces(tenant);
		if (!namespaces.IsOk()) {
			if (namespaces.error.code == PulsarErrorCode::NotFound) {
				GetPulsarLogger()->warn("Tenant {} disappeared while listing namespaces, skipping", tenant);
				continue;
			}
			return PulsarResult<std::vector<std::string>>::Error(namespaces.error);
		}
		for (auto &ns : namespaces.value) {
			auto schema_name = RewriteNamespaceDelimiter(ns);
			if (seen.insert(schema_name).second) {
				schema_names.push_back(std::move(schema_name));
			}
		}
	}
	GetPulsarLogger()->debug("Listed {} namespaces across {} tenants", schema_names.size(), tenants.value.size());
	return PulsarResult<std::vector<std::string>>::Success(std::move(schema_names));
}

PulsarResult<bool> PulsarNamespaceCatalog::NamespaceExists(const std::string &namespace_name) const {
	auto parsed = NamespaceName::Parse(namespace_name);
	if (!parsed.IsOk()) {
		return PulsarResult<bool>::Success(false);
	}
	auto namespaces = directory_->ListNamespaces(parsed.value.GetTenant());
	if (!namespaces.IsOk()) {
		if (namespaces.error.code == PulsarErrorCode::NotFound) {
			return PulsarResult<bool>::Success(false);
		}
		return PulsarResult<bool>::Error(namespaces.error);
	}
	auto canonical = parsed.value.ToString();
	for (auto &ns : namespaces.value) {
		if (ns == canonical) {
			return PulsarResult<bool>::Success(true);
		}
	}
	return PulsarResult<bool>::Success(false);
}

std::string PulsarNamespaceCatalog::RewriteNamespaceDelimiter(const std::string &namespace_name) const {
	return duckdb::RewriteNamespaceDelimiter(namespace_name, rewrite_delimiter_);
}

std::string PulsarNamespaceCatalog::RestoreNamespaceDelimiter(const std::string &schema_name) const {
	return duckdb::RestoreNamespaceDelimiter(schema_name, rewrite_delimiter_);
}

} // namespace duckdb
