#pragma once

#include <cstdint>
#include <diagnostics/diagnostics.hpp>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace repld::engine {

using logger_t = spdlog::logger *;

struct code_line_s {
  std::int32_t no{0};
  std::int32_t generation{0};
  std::string code;
};

enum class check_status_e {
  OK,
  INCOMPLETE,
  ERROR,
};

enum class compile_status_e {
  OK,
  ERROR,
};

struct compiled_artifact_s {
  code_line_s line;
  std::string class_name;
  std::vector<std::string> referenced_names;
  std::vector<std::string> listing;
  std::optional<std::int64_t> value;
};

struct check_result_s {
  check_status_e status{check_status_e::ERROR};
  std::string message;
  std::optional<diagnostics::location_s> location;
  std::optional<diagnostics::first_error_s> first_error;

  static check_result_s ok() { return {check_status_e::OK, "", {}, {}}; }
  static check_result_s incomplete() {
    return {check_status_e::INCOMPLETE, "", {}, {}};
  }
  static check_result_s
  error(const std::string &message,
        std::optional<diagnostics::location_s> location = std::nullopt) {
    return {check_status_e::ERROR, message, location, {}};
  }
};

struct compile_result_s {
  compile_status_e status{compile_status_e::ERROR};
  std::optional<compiled_artifact_s> artifact;
  std::string message;
  std::optional<diagnostics::location_s> location;
  std::optional<diagnostics::first_error_s> first_error;

  static compile_result_s ok(compiled_artifact_s artifact) {
    return {compile_status_e::OK, std::move(artifact), "", {}, {}};
  }
  static compile_result_s
  error(const std::string &message,
        std::optional<diagnostics::location_s> location = std::nullopt) {
    return {compile_status_e::ERROR, std::nullopt, message, location, {}};
  }
};

/*
  The accumulated state of one session. Only the engine that created a
  state knows what is inside; everyone else sees the lock it was made
  with and how far along it is.
*/
class compilation_state_if {
public:
  virtual ~compilation_state_if() = default;
  virtual std::shared_mutex &get_lock() = 0;
  virtual std::size_t history_size() const = 0;
  virtual std::int32_t current_generation() const = 0;
};

using compilation_state_t = std::unique_ptr<compilation_state_if>;

class engine_if {
public:
  virtual ~engine_if() = default;

  //! \brief Make a fresh state whose mutation is guarded by lock
  virtual compilation_state_t create_state(std::shared_mutex &lock) = 0;

  //! \brief Analyze a line against the state without advancing it
  virtual check_result_s check(compilation_state_if &state,
                               const code_line_s &line,
                               diagnostics::diagnostic_sink_if &sink) = 0;

  //! \brief Compile a line, advancing the state only on success
  virtual compile_result_s compile(compilation_state_if &state,
                                   const code_line_s &line,
                                   diagnostics::diagnostic_sink_if &sink) = 0;
};

using engine_t = std::unique_ptr<engine_if>;

struct compiler_id_s {
  std::vector<std::string> compiler_classpath;
  std::string compiler_version;
};

struct engine_config_s {
  compiler_id_s compiler_id;
  std::vector<std::string> template_classpath;
  std::string template_class_name;
  std::string module_name{"repl-script"};
  std::vector<std::string> enabled_plugins;
};

class engine_provider_if {
public:
  virtual ~engine_provider_if() = default;
  virtual const char *get_name() const = 0;
  virtual engine_t make_engine(const engine_config_s &config,
                               diagnostics::diagnostic_sink_if &sink,
                               logger_t logger) = 0;
};

using engine_provider_t = std::shared_ptr<engine_provider_if>;

//! \brief Every engine provider the daemon build knows about
class provider_catalog_c {
public:
  provider_catalog_c() = default;
  ~provider_catalog_c() = default;

  void register_provider(engine_provider_t provider);

  //! \brief Providers enabled by the configuration (all when none listed)
  std::vector<engine_provider_t> discover(const engine_config_s &config) const;

  std::size_t size() const;

private:
  std::vector<engine_provider_t> providers_;
};

class initialization_error : public std::runtime_error {
public:
  enum class reason_e {
    NOT_FOUND,
    AMBIGUOUS,
    LIBRARY_MISSING,
    CONSTRUCTION_FAILED,
  };

  initialization_error(reason_e reason, const std::string &cause);

  reason_e get_reason() const;
  const std::string &get_cause() const;

private:
  reason_e reason_;
  std::string cause_;
};

class illegal_state_exception : public std::logic_error {
public:
  explicit illegal_state_exception(const std::string &msg)
      : std::logic_error(msg) {}
};

/*
  Build the engine for this daemon. Exactly one provider must be enabled
  and every compiler and template classpath entry must exist. Any failure is reported to the sink and re-raised as a single
  initialization_error, the original exception nested inside it when
  there was one.
*/
engine_t make_engine(const engine_config_s &config,
                     const provider_catalog_c &catalog,
                     diagnostics::diagnostic_sink_if &sink, logger_t logger);

} // namespace repld::engine
