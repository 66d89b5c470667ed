#pragma once

#include "pulsar_connector.hpp"

#include <memory>
#include <string>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// PulsarNamespaceCatalog — tenant/namespace listing and name rewriting
//
// Schema names shown to the engine are "tenant/namespace" strings, with '/'
// optionally replaced by a configured delimiter. Restore() undoes Rewrite().
//===--------------------------------------------------------------------===//
class PulsarNamespaceCatalog {
public:
	PulsarNamespaceCatalog(std::shared_ptr<const IPulsarNamespaceDirectory> directory,
	                       std::string rewrite_delimiter);

	//! All namespaces of all tenants, rewritten for display.
	//! Tenants removed while listing are skipped; other failures propagate.
	PulsarResult<std::vector<std::string>> ListSchemaNames() const;

	//! Whether the canonical "tenant/namespace" exists in the directory.
	//! A tenant that does not exist yields false, not an error.
	PulsarResult<bool> NamespaceExists(const std::string &namespace_name) const;

	//! Replace '/' with the configured delimiter; identity when rewriting is disabled.
	std::string RewriteNamespaceDelimiter(const std::string &namespace_name) const;

	//! Replace the configured delimiter with '/'; identity when rewriting is disabled.
	std::string RestoreNamespaceDelimiter(const std::string &schema_name) const;

private:
	std::shared_ptr<const IPulsarNamespaceDirectory> directory_;
	std::string rewrite_delimiter_;
};

} // namespace duckdb
