#include "service/legacy.hpp"

namespace repld::service {

legacy_repl_service_c::legacy_repl_service_c(repl_service_c &service)
    : service_(service) {}

session::session_handle_t &legacy_repl_service_c::default_session() {
  std::call_once(created_,
                 [this]() { default_session_ = service_.create_session(); });
  return default_session_;
}

session::id_t legacy_repl_service_c::get_default_session_id() {
  return default_session()->get_id();
}

engine::check_result_s
legacy_repl_service_c::check(const engine::code_line_s &line) {
  if (!service_.has_engine()) {
    return service_.uninitialized_check();
  }
  auto result = service_.check(get_default_session_id(), line);
  if (result.is_error()) {
    return engine::check_result_s::error(result.error_message());
  }
  return result.get();
}

engine::compile_result_s legacy_repl_service_c::compile(
    const engine::code_line_s &line,
    const std::optional<std::vector<engine::code_line_s>> & /*verify_history*/) {
  if (!service_.has_engine()) {
    return service_.uninitialized_compile();
  }
  auto result = service_.compile(get_default_session_id(), line);
  if (result.is_error()) {
    return engine::compile_result_s::error(result.error_message());
  }
  return result.get();
}

} // namespace repld::service
