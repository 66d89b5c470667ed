#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace duckdb {

//! Name of the logger shared by every component of the extension
constexpr const char *PULSAR_LOGGER_NAME = "pulsar";

//! Returns the extension's named logger, creating it on first use.
//! An application may register its own logger under the same name first to
//! route the extension's output elsewhere.
inline std::shared_ptr<spdlog::logger> GetPulsarLogger() {
	if (auto existing = spdlog::get(PULSAR_LOGGER_NAME)) {
		return existing;
	}
	try {
		auto logger = spdlog::stdout_color_mt(PULSAR_LOGGER_NAME);
		logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
		logger->set_level(spdlog::level::warn);
		return logger;
	} catch (const spdlog::spdlog_ex &) {
		// another thread registered it between get() and stdout_color_mt()
		return spdlog::get(PULSAR_LOGGER_NAME);
	}
}

} // namespace duckdb
