#include <algorithm>
#include <atomic>
#include <lines/line_engine.hpp>
#include <mutex>
#include <service/legacy.hpp>
#include <service/service.hpp>
#include <snitch/snitch.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <thread>
#include <vector>

namespace {

auto create_test_logger() {
  auto logger = spdlog::get("service_test");
  if (!logger) {
    logger = spdlog::stdout_color_mt("service_test");
  }
  return logger;
}

class recording_tracer_c : public repld::service::operations_tracer_if {
public:
  void before(const std::string &operation) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events.push_back("before " + operation);
  }
  void after(const std::string &operation) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events.push_back("after " + operation);
  }

  std::vector<std::string> events;

private:
  std::mutex mutex_;
};

class failing_tracer_c : public repld::service::operations_tracer_if {
public:
  void before(const std::string &) override { ++started; }
  void after(const std::string &) override {
    throw std::runtime_error("tracer backend unavailable");
  }

  int started{0};
};

// Reports two errors per compile and throws on check
class faulty_engine_c : public repld::engine::engine_if {
public:
  explicit faulty_engine_c(std::shared_ptr<spdlog::logger> logger)
      : inner_(config_, logger.get()) {}

  repld::engine::compilation_state_t
  create_state(std::shared_mutex &lock) override {
    return inner_.create_state(lock);
  }

  repld::engine::check_result_s
  check(repld::engine::compilation_state_if &,
        const repld::engine::code_line_s &,
        repld::diagnostics::diagnostic_sink_if &) override {
    throw std::runtime_error("engine crashed");
  }

  repld::engine::compile_result_s
  compile(repld::engine::compilation_state_if &,
          const repld::engine::code_line_s &line,
          repld::diagnostics::diagnostic_sink_if &sink) override {
    sink.report(repld::diagnostics::severity_e::WARNING, "deprecated syntax",
                std::nullopt);
    sink.report(repld::diagnostics::severity_e::ERROR, "first problem",
                repld::diagnostics::location_s{"repl-script", line.no, 4, ""});
    sink.report(repld::diagnostics::severity_e::ERROR, "second problem",
                repld::diagnostics::location_s{"repl-script", line.no, 9, ""});
    return repld::engine::compile_result_s::error("first problem");
  }

private:
  repld::engine::engine_config_s config_;
  repld::lines::line_engine_c inner_;
};

repld::engine::code_line_s line(std::int32_t no, const std::string &code) {
  return {no, 0, code};
}

} // namespace

TEST_CASE("service without an engine degrades every call",
          "[unit][service]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  recording_tracer_c tracer;
  repld::service::repl_service_c service(17031, nullptr, sink, logger.get(),
                                         &tracer);

  CHECK_FALSE(service.has_engine());
  CHECK_THROWS_AS(service.create_session(),
                  repld::engine::illegal_state_exception);
  CHECK(service.get_registry().size() == 0);

  std::shared_mutex lock;
  CHECK_THROWS_AS(service.create_state(lock),
                  repld::engine::illegal_state_exception);

  SECTION("unknown sessions are reported before the engine is consulted") {
    auto checked = service.check(1, line(1, "val x = 1"));
    REQUIRE(checked.is_error());
    CHECK(checked.error_message() == "No REPL state with id 1 found");
  }

  SECTION("legacy shim reports initialization errors") {
    repld::service::legacy_repl_service_c legacy(service);
    auto checked = legacy.check(line(1, "val x = 1"));
    CHECK(checked.status == repld::engine::check_status_e::ERROR);
    CHECK(checked.message == "Initialization error");

    auto compiled = legacy.compile(line(1, "val x = 1"));
    CHECK(compiled.status == repld::engine::compile_status_e::ERROR);
    CHECK(compiled.message == "Initialization error");
    CHECK(service.get_registry().size() == 0);

    const std::vector<std::string> expected{"before check", "after check",
                                            "before compile", "after compile"};
    CHECK(tracer.events == expected);
  }
}

TEST_CASE("service routes calls to the named session", "[unit][service]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  repld::engine::engine_config_s config;
  repld::lines::line_engine_c engine(config, logger.get());
  repld::service::repl_service_c service(17031, &engine, sink, logger.get());

  auto handle = service.create_session();
  CHECK(handle->get_id() == 1);
  CHECK(handle->get_port() == 17031);
  CHECK(service.create_session(4000)->get_port() == 4000);

  auto check = service.check(1, line(1, "val x = 1"));
  REQUIRE(check.is_good());
  CHECK(check.get().status == repld::engine::check_status_e::OK);
  CHECK_FALSE(check.get().first_error.has_value());

  auto incomplete = service.check(1, line(1, "val x ="));
  REQUIRE(incomplete.is_good());
  CHECK(incomplete.get().status == repld::engine::check_status_e::INCOMPLETE);

  auto compiled = service.compile(1, line(1, "val x = 1"));
  REQUIRE(compiled.is_good());
  CHECK(compiled.get().status == repld::engine::compile_status_e::OK);

  auto value = service.compile(1, line(2, "x + 1"));
  REQUIRE(value.is_good());
  REQUIRE(value.get().artifact.has_value());
  CHECK(*value.get().artifact->value == 2);

  auto history = service.with_valid_repl_state(
      1, [](repld::engine::compilation_state_if &state) {
        return state.history_size();
      });
  REQUIRE(history.is_good());
  CHECK(history.get() == 2);

  auto missing = service.compile(99, line(1, "1"));
  REQUIRE(missing.is_error());
  CHECK(missing.error_message() == "No REPL state with id 99 found");

  SECTION("a failed line carries its first error") {
    auto failed = service.compile(1, line(3, "y * 2"));
    REQUIRE(failed.is_good());
    CHECK(failed.get().status == repld::engine::compile_status_e::ERROR);
    REQUIRE(failed.get().first_error.has_value());
    CHECK(failed.get().first_error->message == "Unresolved reference: y");
    REQUIRE(failed.get().first_error->location.has_value());
    CHECK(failed.get().first_error->location->line == 3);
  }

  SECTION("dropping the handle ends the session") {
    handle.reset();
    CHECK(service.check(1, line(3, "x")).is_error());
  }
}

TEST_CASE("sessions opened concurrently stay independent",
          "[unit][service]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  repld::engine::engine_config_s config;
  repld::lines::line_engine_c engine(config, logger.get());
  repld::service::repl_service_c service(17031, &engine, sink, logger.get(),
                                         nullptr, 3);

  auto first = service.create_session();
  REQUIRE(first->get_id() == 1);
  REQUIRE(service.compile(1, line(1, "val x = 1")).get().status ==
          repld::engine::compile_status_e::OK);

  std::vector<repld::session::session_handle_t> handles(2);
  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < handles.size(); ++t) {
    threads.emplace_back(
        [&, t]() { handles[t] = service.create_session(); });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  std::vector<repld::session::id_t> ids{handles[0]->get_id(),
                                        handles[1]->get_id()};
  std::sort(ids.begin(), ids.end());
  CHECK(ids[0] == 2);
  CHECK(ids[1] == 3);

  // x only exists in session 1
  auto in_first = service.check(1, line(2, "x + 1"));
  auto in_second = service.check(2, line(1, "x + 1"));
  REQUIRE(in_first.is_good());
  REQUIRE(in_second.is_good());
  CHECK(in_first.get().status == repld::engine::check_status_e::OK);
  CHECK(in_second.get().status == repld::engine::check_status_e::ERROR);

  std::atomic<int> good{0};
  std::vector<std::thread> workers;
  for (repld::session::id_t id = 1; id <= 3; ++id) {
    workers.emplace_back([&, id]() {
      for (std::int32_t n = 0; n < 20; ++n) {
        if (service.compile(id, line(n + 2, "val y = 2 * 3")).is_good()) {
          good.fetch_add(1);
        }
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
  CHECK(good.load() == 60);

  for (repld::session::id_t id = 1; id <= 3; ++id) {
    auto size = service.with_valid_repl_state(
        id, [](repld::engine::compilation_state_if &state) {
          return state.history_size();
        });
    REQUIRE(size.is_good());
    CHECK(size.get() == (id == 1 ? 21u : 20u));
  }
}

TEST_CASE("tracer brackets every engine call", "[unit][service][tracer]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  faulty_engine_c engine(logger);
  recording_tracer_c tracer;
  repld::service::repl_service_c service(17031, &engine, sink, logger.get(),
                                         &tracer);

  auto handle = service.create_session();

  SECTION("engine exceptions become error results") {
    auto checked = service.check(handle->get_id(), line(1, "1"));
    REQUIRE(checked.is_good());
    CHECK(checked.get().status == repld::engine::check_status_e::ERROR);
    CHECK(checked.get().message == "engine crashed");
    REQUIRE(checked.get().first_error.has_value());
    CHECK(checked.get().first_error->message == "engine crashed");

    const std::vector<std::string> expected{"before check", "after check"};
    CHECK(tracer.events == expected);
  }

  SECTION("first error is taken from this call only") {
    auto compiled = service.compile(handle->get_id(), line(1, "1"));
    REQUIRE(compiled.is_good());
    REQUIRE(compiled.get().first_error.has_value());
    CHECK(compiled.get().first_error->message == "first problem");
    CHECK(compiled.get().first_error->location->column == 4);

    auto again = service.compile(handle->get_id(), line(2, "1"));
    REQUIRE(again.get().first_error.has_value());
    CHECK(again.get().first_error->location->line == 2);

    CHECK(tracer.events.size() == 4);
    CHECK(tracer.events.back() == "after compile");
  }

  SECTION("calls on missing sessions are not traced") {
    CHECK(service.check(404, line(1, "1")).is_error());
    CHECK(tracer.events.empty());
  }
}

TEST_CASE("a failing tracer does not break the call",
          "[unit][service][tracer]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  repld::engine::engine_config_s config;
  repld::lines::line_engine_c engine(config, logger.get());
  failing_tracer_c tracer;
  repld::service::repl_service_c service(17031, &engine, sink, logger.get(),
                                         &tracer);

  auto handle = service.create_session();
  auto compiled = service.compile(handle->get_id(), line(1, "val x = 4"));
  REQUIRE(compiled.is_good());
  CHECK(compiled.get().status == repld::engine::compile_status_e::OK);

  auto checked = service.check(handle->get_id(), line(2, "x"));
  REQUIRE(checked.is_good());
  CHECK(checked.get().status == repld::engine::check_status_e::OK);
  CHECK(tracer.started == 2);

  repld::service::repl_service_c degraded(17031, nullptr, sink, logger.get(),
                                          &tracer);
  CHECK(degraded.uninitialized_check().message == "Initialization error");
  CHECK(tracer.started == 3);
}

TEST_CASE("logging tracer counts completed operations",
          "[unit][service][tracer]") {
  auto logger = create_test_logger();
  repld::service::logging_tracer_c tracer(logger.get());
  tracer.before("check");
  CHECK(tracer.get_completed() == 0);
  tracer.after("check");
  tracer.before("compile");
  tracer.after("compile");
  CHECK(tracer.get_completed() == 2);
}

TEST_CASE("legacy shim uses one default session", "[unit][service][legacy]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  repld::engine::engine_config_s config;
  repld::lines::line_engine_c engine(config, logger.get());
  repld::service::repl_service_c service(17031, &engine, sink, logger.get());

  repld::service::legacy_repl_service_c legacy(service);
  CHECK(service.get_registry().size() == 0);

  CHECK(legacy.compile(line(1, "val a = 5")).status ==
        repld::engine::compile_status_e::OK);
  CHECK(service.get_registry().size() == 1);

  const auto id = legacy.get_default_session_id();
  CHECK(id > 0);

  std::vector<repld::engine::code_line_s> history{line(1, "val a = 5")};
  auto value = legacy.compile(line(2, "a * 2"), history);
  REQUIRE(value.artifact.has_value());
  CHECK(*value.artifact->value == 10);
  CHECK(legacy.check(line(3, "a")).status ==
        repld::engine::check_status_e::OK);

  // sessions opened through the service never see the default one's bindings
  auto other = service.create_session();
  CHECK(other->get_id() != id);
  CHECK(service.check(other->get_id(), line(1, "a")).get().status ==
        repld::engine::check_status_e::ERROR);
  CHECK(legacy.get_default_session_id() == id);
}
