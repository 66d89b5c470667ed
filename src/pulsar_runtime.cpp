#include "pulsar_runtime.hpp"
#include "pulsar_logger.hpp"

#include "duckdb/common/string_util.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace duckdb {

static std::mutex runtime_mutex;
static std::unordered_map<std::string, std::shared_ptr<const PulsarMetadata>> runtime_catalogs;

void RegisterPulsarCatalog(const std::string &catalog_name, PulsarConnectorConfig config, PulsarAdminClients clients) {
	std::shared_ptr<const PulsarMetadata> metadata =
	    std::make_shared<PulsarMetadata>(std::move(config), std::move(clients));
	GetPulsarLogger()->debug("Registering catalog {} (connector {}, delimiter '{}')", catalog_name,
	                         metadata->GetConfig().connector_id, metadata->GetConfig().rewrite_namespace_delimiter);
	std::lock_guard<std::mutex> lock(runtime_mutex);
	runtime_catalogs[StringUtil::Lower(catalog_name)] = std::move(metadata);
}

void RegisterPulsarCatalog(const std::string &catalog_name, const case_insensitive_map_t<Value> &options,
                           PulsarAdminClients clients) {
	RegisterPulsarCatalog(catalog_name, ResolveConnectorConfig(options), std::move(clients));
}

std::shared_ptr<const PulsarMetadata> LookupPulsarCatalog(const std::string &catalog_name) {
	std::lock_guard<std::mutex> lock(runtime_mutex);
	auto it = runtime_catalogs.find(StringUtil::Lower(catalog_name));
	if (it == runtime_catalogs.end()) {
		return nullptr;
	}
	return it->second;
}

bool UnregisterPulsarCatalog(const std::string &catalog_name) {
	std::lock_guard<std::mutex> lock(runtime_mutex);
	return runtime_catalogs.erase(StringUtil::Lower(catalog_name)) > 0;
}

} // namespace duckdb
