#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <spdlog/spdlog.h>
#include <string>

namespace repld::diagnostics {

enum class severity_e {
  EXCEPTION = 0,
  ERROR = 1,
  STRONG_WARNING = 2,
  WARNING = 3,
  INFO = 4,
  LOGGING = 5,
  OUTPUT = 6,
};

inline bool is_error(severity_e severity) {
  return severity == severity_e::EXCEPTION || severity == severity_e::ERROR;
}

const char *severity_to_string(severity_e severity);

struct location_s {
  std::string path;
  std::int32_t line{-1};
  std::int32_t column{-1};
  std::string line_content;
};

struct diagnostic_s {
  severity_e severity{severity_e::INFO};
  std::string message;
  std::optional<location_s> location;
};

struct first_error_s {
  std::string message;
  std::optional<location_s> location;
};

//! \brief Destination for everything an engine has to say about a line
class diagnostic_sink_if {
public:
  virtual ~diagnostic_sink_if() = default;
  virtual void report(severity_e severity, const std::string &message,
                      const std::optional<location_s> &location) = 0;
  virtual bool has_errors() const = 0;
  virtual void clear() = 0;
};

/*
  Renders diagnostics to a stream without file paths:
    error: Unresolved reference: y (1, 5)
*/
class printing_sink_c : public diagnostic_sink_if {
public:
  printing_sink_c(const printing_sink_c &) = delete;
  printing_sink_c &operator=(const printing_sink_c &) = delete;

  explicit printing_sink_c(std::ostream &out, bool verbose = false);
  ~printing_sink_c() = default;

  void report(severity_e severity, const std::string &message,
              const std::optional<location_s> &location) override;
  bool has_errors() const override;
  void clear() override;

private:
  std::ostream &out_;
  bool verbose_;
  std::atomic<bool> has_errors_;
  std::mutex out_mutex_;
};

//! \brief Routes diagnostics into the daemon log
class logging_sink_c : public diagnostic_sink_if {
public:
  logging_sink_c(const logging_sink_c &) = delete;
  logging_sink_c &operator=(const logging_sink_c &) = delete;

  explicit logging_sink_c(spdlog::logger *logger);
  ~logging_sink_c() = default;

  void report(severity_e severity, const std::string &message,
              const std::optional<location_s> &location) override;
  bool has_errors() const override;
  void clear() override;

private:
  spdlog::logger *logger_;
  std::atomic<bool> has_errors_;
};

/*
  Forwards everything to the inner sink and remembers the first error
  seen through this instance. clear() only resets the inner sink, the
  first error lives as long as the collector does.
*/
class first_error_collector_c : public diagnostic_sink_if {
public:
  first_error_collector_c(const first_error_collector_c &) = delete;
  first_error_collector_c &operator=(const first_error_collector_c &) = delete;

  explicit first_error_collector_c(diagnostic_sink_if &inner);
  ~first_error_collector_c() = default;

  void report(severity_e severity, const std::string &message,
              const std::optional<location_s> &location) override;
  bool has_errors() const override;
  void clear() override;

  const std::optional<first_error_s> &first_error() const;

private:
  diagnostic_sink_if &inner_;
  std::optional<first_error_s> first_error_;
};

} // namespace repld::diagnostics
