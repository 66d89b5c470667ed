#define DUCKDB_EXTENSION_MAIN

#include "pulsar_extension.hpp"
#include "pulsar_functions.hpp"
#include "pulsar_logger.hpp"
#include "duckdb.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {

static void SetPulsarDebugLogging(ClientContext &context, SetScope scope, Value &parameter) {
	auto enabled = !parameter.IsNull() && BooleanValue::Get(parameter);
	GetPulsarLogger()->set_level(enabled ? spdlog::level::debug : spdlog::level::warn);
}

static void LoadInternal(ExtensionLoader &loader) {
	auto &db_instance = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db_instance);
	config.AddExtensionOption("pulsar_debug", "Enable debug logging for pulsar catalog operations",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false), SetPulsarDebugLogging);

	RegisterPulsarFunctions(loader);
}

void PulsarExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string PulsarExtension::Name() {
	return "pulsar";
}

std::string PulsarExtension::Version() const {
#ifdef EXT_VERSION_PULSAR
	return EXT_VERSION_PULSAR;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(pulsar, loader) {
	duckdb::LoadInternal(loader);
}
}
