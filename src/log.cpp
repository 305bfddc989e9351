#include "simrng/log.hpp"

#include <memory>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace simrng::log {

static std::shared_ptr<spdlog::logger> make_logger() {
  if (auto existing = spdlog::get("simrng")) return existing;

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern("%^[%T] %n: %v%$");

  auto lg = std::make_shared<spdlog::logger>("simrng", std::move(sink));
  lg->set_level(spdlog::level::warn);
  spdlog::register_logger(lg);

  // applies SPDLOG_LEVEL to the logger registered above
  spdlog::cfg::load_env_levels();
  return lg;
}

spdlog::logger& logger() {
  static const std::shared_ptr<spdlog::logger> s_logger = make_logger();
  return *s_logger;
}

void set_level(spdlog::level::level_enum lvl) { logger().set_level(lvl); }

} // namespace simrng::log
