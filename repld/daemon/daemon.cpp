#include "daemon/daemon.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace repld::daemon {

daemon_c::daemon_c(const options_s &options,
                   const engine::provider_catalog_c &catalog)
    : options_(options), catalog_(catalog), running_(false) {
  spdlog_logger_ = spdlog::get("repld");
  if (!spdlog_logger_) {
    spdlog_logger_ = spdlog::stdout_color_mt("repld");
  }
  spdlog_logger_->set_level(spdlog::level::from_str(options_.log_level));
  spdlog_logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

  logger_ = spdlog_logger_.get();

  sink_ = std::make_unique<diagnostics::logging_sink_c>(logger_);
}

daemon_c::~daemon_c() {
  if (running_) {
    shutdown();
  }
}

bool daemon_c::initialize() {
  if (running_) {
    return false;
  }

  logger_->info("[daemon] Initializing repl service on port {}", options_.port);

  try {
    engine_ = engine::make_engine(options_.engine, catalog_, *sink_, logger_);
    initialization_error_.reset();
  } catch (const engine::initialization_error &e) {
    logger_->error("[daemon] {}", e.what());
    initialization_error_ = e.what();
    engine_.reset();
  }

  if (options_.trace_operations) {
    tracer_ = std::make_unique<service::logging_tracer_c>(logger_);
  }

  service_ = std::make_unique<service::repl_service_c>(
      options_.port, engine_.get(), *sink_, logger_, tracer_.get());

  running_ = true;
  logger_->info("[daemon] Repl service ready ({})",
                engine_ ? "engine loaded" : "no engine");
  return true;
}

bool daemon_c::shutdown() {
  if (!running_) {
    return false;
  }

  logger_->info("[daemon] Shutting down repl service");

  service_.reset();
  tracer_.reset();
  engine_.reset();

  running_ = false;
  return true;
}

bool daemon_c::is_running() const { return running_; }

logger_t daemon_c::get_logger() const { return logger_; }

service::repl_service_c *daemon_c::get_service() { return service_.get(); }

bool daemon_c::has_engine() const { return engine_ != nullptr; }

const std::optional<std::string> &daemon_c::get_initialization_error() const {
  return initialization_error_;
}

} // namespace repld::daemon
