#pragma once

#include <daemon/config.hpp>
#include <diagnostics/diagnostics.hpp>
#include <engine/engine.hpp>
#include <memory>
#include <optional>
#include <service/service.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace repld::daemon {

using logger_t = spdlog::logger *;

/*
  Wires the REPL capability of one daemon configuration together: the
  logger, the diagnostics sink, the engine (built once) and the service
  with its session registry. An engine that fails to build leaves the
  daemon running with every REPL call degraded.
*/
class daemon_c {
public:
  daemon_c(const daemon_c &) = delete;
  daemon_c(daemon_c &&) = delete;
  daemon_c &operator=(const daemon_c &) = delete;
  daemon_c &operator=(daemon_c &&) = delete;

  daemon_c(const options_s &options, const engine::provider_catalog_c &catalog);
  ~daemon_c();

  bool initialize();
  bool shutdown();
  bool is_running() const;

  logger_t get_logger() const;
  service::repl_service_c *get_service();
  bool has_engine() const;
  const std::optional<std::string> &get_initialization_error() const;

private:
  options_s options_;
  const engine::provider_catalog_c &catalog_;
  bool running_;
  std::shared_ptr<spdlog::logger> spdlog_logger_;
  logger_t logger_;

  std::unique_ptr<diagnostics::diagnostic_sink_if> sink_;
  engine::engine_t engine_;
  std::unique_ptr<service::logging_tracer_c> tracer_;
  std::unique_ptr<service::repl_service_c> service_;
  std::optional<std::string> initialization_error_;
};

} // namespace repld::daemon
