#include "diagnostics/diagnostics.hpp"
#include <fmt/core.h>
#include <fmt/ostream.h>

namespace repld::diagnostics {

namespace {

std::string render(severity_e severity, const std::string &message,
                   const std::optional<location_s> &location) {
  if (location.has_value() && location->line >= 0) {
    return fmt::format("{}: {} ({}, {})", severity_to_string(severity),
                       message, location->line, location->column);
  }
  return fmt::format("{}: {}", severity_to_string(severity), message);
}

} // namespace

const char *severity_to_string(severity_e severity) {
  switch (severity) {
  case severity_e::EXCEPTION:
    return "exception";
  case severity_e::ERROR:
    return "error";
  case severity_e::STRONG_WARNING:
    return "warning";
  case severity_e::WARNING:
    return "warning";
  case severity_e::INFO:
    return "info";
  case severity_e::LOGGING:
    return "logging";
  case severity_e::OUTPUT:
    return "output";
  }
  return "unknown";
}

printing_sink_c::printing_sink_c(std::ostream &out, bool verbose)
    : out_(out), verbose_(verbose), has_errors_(false) {}

void printing_sink_c::report(severity_e severity, const std::string &message,
                             const std::optional<location_s> &location) {
  if (is_error(severity)) {
    has_errors_ = true;
  }

  if (!verbose_ && severity == severity_e::LOGGING) {
    return;
  }

  std::lock_guard<std::mutex> lock(out_mutex_);

  if (severity == severity_e::OUTPUT) {
    fmt::print(out_, "{}\n", message);
    return;
  }

  fmt::print(out_, "{}\n", render(severity, message, location));

  if (location.has_value() && !location->line_content.empty()) {
    fmt::print(out_, "{}\n", location->line_content);
    if (location->column > 0) {
      fmt::print(out_, "{:>{}}\n", "^", location->column);
    }
  }
}

bool printing_sink_c::has_errors() const { return has_errors_; }

void printing_sink_c::clear() { has_errors_ = false; }

logging_sink_c::logging_sink_c(spdlog::logger *logger)
    : logger_(logger), has_errors_(false) {}

void logging_sink_c::report(severity_e severity, const std::string &message,
                            const std::optional<location_s> &location) {
  const std::string text = render(severity, message, location);

  switch (severity) {
  case severity_e::EXCEPTION:
  case severity_e::ERROR:
    has_errors_ = true;
    logger_->error("[diagnostics] {}", text);
    break;
  case severity_e::STRONG_WARNING:
  case severity_e::WARNING:
    logger_->warn("[diagnostics] {}", text);
    break;
  case severity_e::INFO:
  case severity_e::OUTPUT:
    logger_->info("[diagnostics] {}", text);
    break;
  case severity_e::LOGGING:
    logger_->debug("[diagnostics] {}", text);
    break;
  }
}

bool logging_sink_c::has_errors() const { return has_errors_; }

void logging_sink_c::clear() { has_errors_ = false; }

first_error_collector_c::first_error_collector_c(diagnostic_sink_if &inner)
    : inner_(inner) {}

void first_error_collector_c::report(
    severity_e severity, const std::string &message,
    const std::optional<location_s> &location) {
  if (!first_error_.has_value() && is_error(severity)) {
    first_error_ = first_error_s{message, location};
  }
  inner_.report(severity, message, location);
}

bool first_error_collector_c::has_errors() const {
  return inner_.has_errors();
}

void first_error_collector_c::clear() { inner_.clear(); }

const std::optional<first_error_s> &
first_error_collector_c::first_error() const {
  return first_error_;
}

} // namespace repld::diagnostics
