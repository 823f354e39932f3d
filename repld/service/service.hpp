#pragma once

#include <atomic>
#include <diagnostics/diagnostics.hpp>
#include <engine/engine.hpp>
#include <session/registry.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace repld::service {

using logger_t = spdlog::logger *;

//! \brief External instrumentation bracketing every engine call
class operations_tracer_if {
public:
  virtual ~operations_tracer_if() = default;
  virtual void before(const std::string &operation) = 0;
  virtual void after(const std::string &operation) = 0;
};

/*
  The check/compile facade over an engine that may be absent. Without an
  engine every call degrades to an "Initialization error" result, only
  create_state throws.
*/
class repl_service_base_c {
public:
  repl_service_base_c(const repl_service_base_c &) = delete;
  repl_service_base_c &operator=(const repl_service_base_c &) = delete;

  repl_service_base_c(engine::engine_if *engine,
                      diagnostics::diagnostic_sink_if &sink, logger_t logger);
  virtual ~repl_service_base_c() = default;

  //! \throws engine::illegal_state_exception when there is no engine
  engine::compilation_state_t create_state(std::shared_mutex &lock);

  engine::check_result_s check(engine::compilation_state_if &state,
                               const engine::code_line_s &line);

  engine::compile_result_s compile(engine::compilation_state_if &state,
                                   const engine::code_line_s &line);

  bool has_engine() const;

  //! \brief Traced "Initialization error" results for callers that have no
  //!        state to pass because no engine could create one
  engine::check_result_s uninitialized_check();
  engine::compile_result_s uninitialized_compile();

protected:
  virtual void before(const std::string &operation) {}
  virtual void after(const std::string &operation) {}

  logger_t logger_;

private:
  class trace_scope_c {
  public:
    trace_scope_c(repl_service_base_c &service, const char *operation);
    ~trace_scope_c();

  private:
    repl_service_base_c &service_;
    const char *operation_;
  };

  engine::engine_if *engine_;
  diagnostics::diagnostic_sink_if &sink_;
};

class repl_service_c : public repl_service_base_c {
public:
  repl_service_c(std::int32_t port_for_servers, engine::engine_if *engine,
                 diagnostics::diagnostic_sink_if &sink, logger_t logger,
                 operations_tracer_if *tracer = nullptr,
                 std::optional<std::uint64_t> id_seed = std::nullopt);
  ~repl_service_c() override = default;

  session::session_handle_t create_session();
  session::session_handle_t create_session(std::int32_t port);

  session::call_result_c<engine::check_result_s>
  check(session::id_t id, const engine::code_line_s &line);

  session::call_result_c<engine::compile_result_s>
  compile(session::id_t id, const engine::code_line_s &line);

  template <typename F> auto with_valid_repl_state(session::id_t id, F &&body) {
    return registry_.with_session(id, std::forward<F>(body));
  }

  session::session_registry_c &get_registry();
  std::int32_t get_port_for_servers() const;

  using repl_service_base_c::check;
  using repl_service_base_c::compile;

protected:
  void before(const std::string &operation) override;
  void after(const std::string &operation) override;

private:
  std::int32_t port_for_servers_;
  operations_tracer_if *tracer_;
  session::session_registry_c registry_;
};

//! \brief Logs every traced operation and counts them
class logging_tracer_c : public operations_tracer_if {
public:
  explicit logging_tracer_c(logger_t logger);

  void before(const std::string &operation) override;
  void after(const std::string &operation) override;

  std::size_t get_completed() const;

private:
  logger_t logger_;
  std::atomic<std::size_t> completed_;
};

} // namespace repld::service
