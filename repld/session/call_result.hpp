#pragma once

#include <optional>
#include <string>
#include <utility>

namespace repld::session {

//! \brief Outcome of a call routed to a session: a value, or the reason
//!        the call could not be made
template <typename R> class call_result_c {
public:
  static call_result_c good(R value) {
    call_result_c result;
    result.value_ = std::move(value);
    return result;
  }

  static call_result_c error(std::string message) {
    call_result_c result;
    result.error_ = std::move(message);
    return result;
  }

  bool is_good() const { return value_.has_value(); }
  bool is_error() const { return error_.has_value(); }

  const R &get() const { return value_.value(); }
  R &get() { return value_.value(); }
  const std::string &error_message() const { return error_.value(); }

private:
  call_result_c() = default;

  std::optional<R> value_;
  std::optional<std::string> error_;
};

} // namespace repld::session
