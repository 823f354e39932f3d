#include "service/service.hpp"

namespace repld::service {

namespace {
constexpr const char *INITIALIZATION_ERROR = "Initialization error";
} // namespace

repl_service_base_c::trace_scope_c::trace_scope_c(repl_service_base_c &service,
                                                  const char *operation)
    : service_(service), operation_(operation) {
  service_.before(operation_);
}

repl_service_base_c::trace_scope_c::~trace_scope_c() {
  try {
    service_.after(operation_);
  } catch (const std::exception &e) {
    service_.logger_->error("[repl_service] tracer failed after {}: {}",
                            operation_, e.what());
  }
}

repl_service_base_c::repl_service_base_c(engine::engine_if *engine,
                                         diagnostics::diagnostic_sink_if &sink,
                                         logger_t logger)
    : logger_(logger), engine_(engine), sink_(sink) {}

bool repl_service_base_c::has_engine() const { return engine_ != nullptr; }

engine::check_result_s repl_service_base_c::uninitialized_check() {
  trace_scope_c scope(*this, "check");
  return engine::check_result_s::error(INITIALIZATION_ERROR);
}

engine::compile_result_s repl_service_base_c::uninitialized_compile() {
  trace_scope_c scope(*this, "compile");
  return engine::compile_result_s::error(INITIALIZATION_ERROR);
}

engine::compilation_state_t
repl_service_base_c::create_state(std::shared_mutex &lock) {
  if (!engine_) {
    throw engine::illegal_state_exception(
        "repl compiler is not initialized properly");
  }
  return engine_->create_state(lock);
}

engine::check_result_s
repl_service_base_c::check(engine::compilation_state_if &state,
                           const engine::code_line_s &line) {
  if (!engine_) {
    return uninitialized_check();
  }

  trace_scope_c scope(*this, "check");

  diagnostics::first_error_collector_c collector(sink_);
  engine::check_result_s result;
  try {
    result = engine_->check(state, line, collector);
  } catch (const std::exception &e) {
    logger_->error("[repl_service] check of line {} failed: {}", line.no,
                   e.what());
    collector.report(diagnostics::severity_e::EXCEPTION, e.what(),
                     std::nullopt);
    result = engine::check_result_s::error(e.what());
  }
  result.first_error = collector.first_error();
  return result;
}

engine::compile_result_s
repl_service_base_c::compile(engine::compilation_state_if &state,
                             const engine::code_line_s &line) {
  if (!engine_) {
    return uninitialized_compile();
  }

  trace_scope_c scope(*this, "compile");

  diagnostics::first_error_collector_c collector(sink_);
  engine::compile_result_s result;
  try {
    result = engine_->compile(state, line, collector);
  } catch (const std::exception &e) {
    logger_->error("[repl_service] compile of line {} failed: {}", line.no,
                   e.what());
    collector.report(diagnostics::severity_e::EXCEPTION, e.what(),
                     std::nullopt);
    result = engine::compile_result_s::error(e.what());
  }
  result.first_error = collector.first_error();
  return result;
}

repl_service_c::repl_service_c(std::int32_t port_for_servers,
                               engine::engine_if *engine,
                               diagnostics::diagnostic_sink_if &sink,
                               logger_t logger, operations_tracer_if *tracer,
                               std::optional<std::uint64_t> id_seed)
    : repl_service_base_c(engine, sink, logger),
      port_for_servers_(port_for_servers), tracer_(tracer),
      registry_(
          [this](std::shared_mutex &lock) { return create_state(lock); },
          logger, id_seed) {
  if (!has_engine()) {
    logger_->warn("[repl_service] No repl compiler available, every call "
                  "will report an initialization error");
  }
}

session::session_handle_t repl_service_c::create_session() {
  return create_session(port_for_servers_);
}

session::session_handle_t repl_service_c::create_session(std::int32_t port) {
  return registry_.create(port);
}

session::call_result_c<engine::check_result_s>
repl_service_c::check(session::id_t id, const engine::code_line_s &line) {
  return registry_.with_session(
      id, [&](engine::compilation_state_if &state) {
        return repl_service_base_c::check(state, line);
      });
}

session::call_result_c<engine::compile_result_s>
repl_service_c::compile(session::id_t id, const engine::code_line_s &line) {
  return registry_.with_session(
      id, [&](engine::compilation_state_if &state) {
        return repl_service_base_c::compile(state, line);
      });
}

session::session_registry_c &repl_service_c::get_registry() {
  return registry_;
}

std::int32_t repl_service_c::get_port_for_servers() const {
  return port_for_servers_;
}

void repl_service_c::before(const std::string &operation) {
  if (tracer_) {
    tracer_->before(operation);
  }
}

void repl_service_c::after(const std::string &operation) {
  if (tracer_) {
    tracer_->after(operation);
  }
}

logging_tracer_c::logging_tracer_c(logger_t logger)
    : logger_(logger), completed_(0) {}

void logging_tracer_c::before(const std::string &operation) {
  logger_->debug("[tracer] before {}", operation);
}

void logging_tracer_c::after(const std::string &operation) {
  completed_.fetch_add(1);
  logger_->debug("[tracer] after {}", operation);
}

std::size_t logging_tracer_c::get_completed() const {
  return completed_.load();
}

} // namespace repld::service
