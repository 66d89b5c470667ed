#pragma once

#include "pulsar_metadata.hpp"
#include "duckdb.hpp"

#include <memory>
#include <string>

namespace duckdb {

//===--------------------------------------------------------------------===//
// Pulsar catalog registry
//
// Maps a catalog name to the PulsarMetadata serving it, so the table
// functions can reach the collaborators registered by the embedding
// application. Names are case-insensitive. Registering an existing name
// replaces its entry.
//===--------------------------------------------------------------------===//

//! Register a catalog from an already resolved configuration.
//! Throws PulsarException(InvalidConfig) when a collaborator is missing.
void RegisterPulsarCatalog(const std::string &catalog_name, PulsarConnectorConfig config, PulsarAdminClients clients);

//! Register a catalog from raw options, see ResolveConnectorConfig().
void RegisterPulsarCatalog(const std::string &catalog_name, const case_insensitive_map_t<Value> &options,
                           PulsarAdminClients clients);

//! The catalog registered under the name, or nullptr.
std::shared_ptr<const PulsarMetadata> LookupPulsarCatalog(const std::string &catalog_name);

//! Remove a catalog; returns false when nothing was registered under the name.
bool UnregisterPulsarCatalog(const std::string &catalog_name);

} // namespace duckdb
