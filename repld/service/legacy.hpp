#pragma once

#include <mutex>
#include <optional>
#include <service/service.hpp>
#include <vector>

namespace repld::service {

/*
  Compatibility layer for clients that predate explicit sessions. Every
  call goes to one default session, created on first use and held for
  the lifetime of this object. Sits strictly on top of repl_service_c.
  Deprecated: new integrations pass a session id instead.
*/
class legacy_repl_service_c {
public:
  legacy_repl_service_c(const legacy_repl_service_c &) = delete;
  legacy_repl_service_c &operator=(const legacy_repl_service_c &) = delete;

  explicit legacy_repl_service_c(repl_service_c &service);
  ~legacy_repl_service_c() = default;

  engine::check_result_s check(const engine::code_line_s &line);

  //! \brief verify_history is accepted for compatibility and ignored
  engine::compile_result_s
  compile(const engine::code_line_s &line,
          const std::optional<std::vector<engine::code_line_s>>
              &verify_history = std::nullopt);

  session::id_t get_default_session_id();

private:
  session::session_handle_t &default_session();

  repl_service_c &service_;
  std::once_flag created_;
  session::session_handle_t default_session_;
};

} // namespace repld::service
