#pragma once
#include <spdlog/spdlog.h>

namespace simrng::log {

// Library logger "simrng". Created on first use at level warn; SPDLOG_LEVEL
// (e.g. SPDLOG_LEVEL=simrng=debug) overrides it.
spdlog::logger& logger();

void set_level(spdlog::level::level_enum lvl);

} // namespace simrng::log

#define SIMRNG_LOG_TRACE(...) ::simrng::log::logger().trace(__VA_ARGS__)
#define SIMRNG_LOG_DEBUG(...) ::simrng::log::logger().debug(__VA_ARGS__)
#define SIMRNG_LOG_INFO(...) ::simrng::log::logger().info(__VA_ARGS__)
#define SIMRNG_LOG_WARN(...) ::simrng::log::logger().warn(__VA_ARGS__)
#define SIMRNG_LOG_ERROR(...) ::simrng::log::logger().error(__VA_ARGS__)
