#pragma once

#include <engine/engine.hpp>
#include <lines/parser.hpp>
#include <map>
#include <string>
#include <vector>

namespace repld::lines {

/*
  Session state for the line engine: every successfully compiled line
  and the values bound so far. Guarded by the lock handed in at creation,
  shared while checking and exclusive while compiling.
*/
class line_state_c : public engine::compilation_state_if {
public:
  line_state_c(const line_state_c &) = delete;
  line_state_c &operator=(const line_state_c &) = delete;

  explicit line_state_c(std::shared_mutex &lock);
  ~line_state_c() override = default;

  std::shared_mutex &get_lock() override;
  std::size_t history_size() const override;
  std::int32_t current_generation() const override;

  const std::vector<engine::code_line_s> &get_history() const;
  const std::map<std::string, std::int64_t> &get_bindings() const;

private:
  friend class line_engine_c;

  std::shared_mutex &lock_;
  std::vector<engine::code_line_s> history_;
  std::map<std::string, std::int64_t> bindings_;
  std::int32_t generation_;
};

class line_engine_c : public engine::engine_if {
public:
  line_engine_c(const line_engine_c &) = delete;
  line_engine_c &operator=(const line_engine_c &) = delete;

  line_engine_c(const engine::engine_config_s &config, engine::logger_t logger);
  ~line_engine_c() override = default;

  engine::compilation_state_t create_state(std::shared_mutex &lock) override;

  engine::check_result_s check(engine::compilation_state_if &state,
                               const engine::code_line_s &line,
                               diagnostics::diagnostic_sink_if &sink) override;

  engine::compile_result_s
  compile(engine::compilation_state_if &state, const engine::code_line_s &line,
          diagnostics::diagnostic_sink_if &sink) override;

private:
  engine::logger_t logger_;
  std::string module_name_;

  line_state_c &as_line_state(engine::compilation_state_if &state) const;

  std::optional<std::string>
  find_unresolved(const node_s &expr,
                  const std::map<std::string, std::int64_t> &bindings,
                  std::int32_t &column) const;
};

class line_engine_provider_c : public engine::engine_provider_if {
public:
  const char *get_name() const override;
  engine::engine_t make_engine(const engine::engine_config_s &config,
                               diagnostics::diagnostic_sink_if &sink,
                               engine::logger_t logger) override;
};

} // namespace repld::lines
