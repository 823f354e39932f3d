#include <lines/line_engine.hpp>
#include <lines/parser.hpp>
#include <snitch/snitch.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>

namespace {

auto create_test_logger() {
  auto logger = spdlog::get("line_engine_test");
  if (!logger) {
    logger = spdlog::stdout_color_mt("line_engine_test");
  }
  return logger;
}

repld::engine::code_line_s line(std::int32_t no, const std::string &code) {
  return {no, 0, code};
}

} // namespace

TEST_CASE("parser statuses", "[unit][lines][parser]") {
  using repld::lines::parse;
  using repld::lines::parse_status_e;

  CHECK(parse("val x = 1").status == parse_status_e::OK);
  CHECK(parse("x + 1").status == parse_status_e::OK);
  CHECK(parse("-(2 * 3) / x").status == parse_status_e::OK);

  CHECK(parse("val x =").status == parse_status_e::INCOMPLETE);
  CHECK(parse("val x").status == parse_status_e::INCOMPLETE);
  CHECK(parse("(1 + 2").status == parse_status_e::INCOMPLETE);
  CHECK(parse("1 +").status == parse_status_e::INCOMPLETE);
  CHECK(parse("   ").status == parse_status_e::INCOMPLETE);

  auto unbalanced = parse("1 + 2)");
  CHECK(unbalanced.status == parse_status_e::ERROR);
  CHECK(unbalanced.message == "Unexpected token ')'");
  CHECK(unbalanced.column == 6);

  auto bad_char = parse("1 $ 2");
  CHECK(bad_char.status == parse_status_e::ERROR);
  CHECK(bad_char.message == "Unexpected character '$'");
  CHECK(bad_char.column == 3);

  auto no_name = parse("val = 3");
  CHECK(no_name.status == parse_status_e::ERROR);
  CHECK(no_name.message == "Expecting property name");

  auto too_big = parse("99999999999999999999");
  CHECK(too_big.status == parse_status_e::ERROR);
}

TEST_CASE("parser builds the binding and expression", "[unit][lines][parser]") {
  auto result = repld::lines::parse("val total = a * (b + a)");
  REQUIRE(result.status == repld::lines::parse_status_e::OK);
  REQUIRE(result.statement.binding.has_value());
  CHECK(*result.statement.binding == "total");
  REQUIRE(result.statement.expr != nullptr);
  CHECK(result.statement.expr->kind == repld::lines::node_kind_e::MUL);

  auto names = repld::lines::collect_names(*result.statement.expr);
  REQUIRE(names.size() == 2);
  CHECK(names[0] == "a");
  CHECK(names[1] == "b");
}

TEST_CASE("line engine check does not advance the state",
          "[unit][lines][engine]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  repld::engine::engine_config_s config;
  repld::lines::line_engine_c engine(config, logger.get());

  std::shared_mutex lock;
  auto state = engine.create_state(lock);

  SECTION("complete, incomplete and unresolved") {
    CHECK(engine.check(*state, line(1, "val x = 1"), sink).status ==
          repld::engine::check_status_e::OK);
    CHECK(engine.check(*state, line(1, "val x ="), sink).status ==
          repld::engine::check_status_e::INCOMPLETE);

    auto unresolved = engine.check(*state, line(2, "x + 1"), sink);
    CHECK(unresolved.status == repld::engine::check_status_e::ERROR);
    CHECK(unresolved.message == "Unresolved reference: x");
    REQUIRE(unresolved.location.has_value());
    CHECK(unresolved.location->line == 2);
    CHECK(unresolved.location->column == 1);
    CHECK(sink.has_errors());

    CHECK(state->history_size() == 0);
    CHECK(state->current_generation() == 0);
  }

  SECTION("check sees earlier compiled bindings") {
    REQUIRE(engine.compile(*state, line(1, "val x = 1"), sink).status ==
            repld::engine::compile_status_e::OK);
    CHECK(engine.check(*state, line(2, "x + 1"), sink).status ==
          repld::engine::check_status_e::OK);
    CHECK(state->history_size() == 1);
  }
}

TEST_CASE("line engine compile advances the state only on success",
          "[unit][lines][engine]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  repld::engine::engine_config_s config;
  repld::lines::line_engine_c engine(config, logger.get());

  std::shared_mutex lock;
  auto state = engine.create_state(lock);
  auto &line_state = dynamic_cast<repld::lines::line_state_c &>(*state);

  auto first = engine.compile(*state, line(1, "val x = 1"), sink);
  REQUIRE(first.status == repld::engine::compile_status_e::OK);
  REQUIRE(first.artifact.has_value());
  CHECK(first.artifact->class_name == "Line_1");
  CHECK_FALSE(first.artifact->value.has_value());
  CHECK(first.artifact->listing.back() == "store x");
  CHECK(line_state.get_bindings().at("x") == 1);

  auto second = engine.compile(*state, line(2, "x + 1"), sink);
  REQUIRE(second.status == repld::engine::compile_status_e::OK);
  REQUIRE(second.artifact.has_value());
  CHECK(second.artifact->class_name == "Line_2");
  REQUIRE(second.artifact->value.has_value());
  CHECK(*second.artifact->value == 2);
  REQUIRE(second.artifact->referenced_names.size() == 1);
  CHECK(second.artifact->referenced_names[0] == "x");
  const std::vector<std::string> expected_listing{"load x", "push 1", "add",
                                                  "ret"};
  CHECK(second.artifact->listing == expected_listing);

  SECTION("division by zero leaves the state untouched") {
    auto failed = engine.compile(*state, line(3, "val y = x / 0"), sink);
    CHECK(failed.status == repld::engine::compile_status_e::ERROR);
    CHECK(failed.message == "Division by zero");
    CHECK_FALSE(failed.artifact.has_value());
    CHECK(state->history_size() == 2);
    CHECK(line_state.get_bindings().count("y") == 0);
  }

  SECTION("incomplete input is a compile error") {
    auto failed = engine.compile(*state, line(3, "val y ="), sink);
    CHECK(failed.status == repld::engine::compile_status_e::ERROR);
    CHECK(failed.message == "Incomplete code");
    CHECK(state->history_size() == 2);
  }

  SECTION("overflow is reported") {
    auto failed =
        engine.compile(*state, line(3, "9223372036854775807 + x"), sink);
    CHECK(failed.status == repld::engine::compile_status_e::ERROR);
    CHECK(failed.message == "Integer overflow");
  }

  SECTION("rebinding shadows the earlier value") {
    REQUIRE(engine.compile(*state, line(3, "val x = x * 10"), sink).status ==
            repld::engine::compile_status_e::OK);
    CHECK(line_state.get_bindings().at("x") == 10);
    CHECK(state->history_size() == 3);
    CHECK(state->current_generation() == 3);
  }
}

TEST_CASE("line engine provider", "[unit][lines][provider]") {
  auto logger = create_test_logger();
  std::ostringstream out;
  repld::diagnostics::printing_sink_c sink(out);
  repld::lines::line_engine_provider_c provider;

  CHECK(std::string(provider.get_name()) == "lines");

  repld::engine::engine_config_s config;
  CHECK(provider.make_engine(config, sink, logger.get()) != nullptr);

  config.module_name.clear();
  CHECK_THROWS_AS(provider.make_engine(config, sink, logger.get()),
                  std::invalid_argument);
}
