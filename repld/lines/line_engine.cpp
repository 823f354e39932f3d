#include "lines/line_engine.hpp"
#include <fmt/core.h>
#include <limits>
#include <mutex>

namespace repld::lines {

namespace {

using bindings_t = std::map<std::string, std::int64_t>;

struct eval_failure_s {
  std::string message;
  std::int32_t column{0};
};

constexpr std::int64_t I64_MAX = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t I64_MIN = std::numeric_limits<std::int64_t>::min();

bool add_overflows(std::int64_t a, std::int64_t b) {
  return (b > 0 && a > I64_MAX - b) || (b < 0 && a < I64_MIN - b);
}

bool sub_overflows(std::int64_t a, std::int64_t b) {
  return (b < 0 && a > I64_MAX + b) || (b > 0 && a < I64_MIN + b);
}

bool mul_overflows(std::int64_t a, std::int64_t b) {
  if (a == 0 || b == 0) {
    return false;
  }
  if (a == -1) {
    return b == I64_MIN;
  }
  if (b == -1) {
    return a == I64_MIN;
  }
  if (a > 0) {
    return b > 0 ? a > I64_MAX / b : b < I64_MIN / a;
  }
  return b > 0 ? a < I64_MIN / b : a < I64_MAX / b;
}

std::optional<eval_failure_s> evaluate(const node_s &node,
                                       const bindings_t &bindings,
                                       std::int64_t &out) {
  switch (node.kind) {
  case node_kind_e::LITERAL:
    out = node.value;
    return std::nullopt;
  case node_kind_e::NAME:
    out = bindings.at(node.name);
    return std::nullopt;
  case node_kind_e::NEGATE: {
    std::int64_t operand = 0;
    if (auto failure = evaluate(*node.lhs, bindings, operand)) {
      return failure;
    }
    if (operand == I64_MIN) {
      return eval_failure_s{"Integer overflow", node.column};
    }
    out = -operand;
    return std::nullopt;
  }
  default:
    break;
  }

  std::int64_t lhs = 0;
  std::int64_t rhs = 0;
  if (auto failure = evaluate(*node.lhs, bindings, lhs)) {
    return failure;
  }
  if (auto failure = evaluate(*node.rhs, bindings, rhs)) {
    return failure;
  }

  switch (node.kind) {
  case node_kind_e::ADD:
    if (add_overflows(lhs, rhs)) {
      return eval_failure_s{"Integer overflow", node.column};
    }
    out = lhs + rhs;
    break;
  case node_kind_e::SUB:
    if (sub_overflows(lhs, rhs)) {
      return eval_failure_s{"Integer overflow", node.column};
    }
    out = lhs - rhs;
    break;
  case node_kind_e::MUL:
    if (mul_overflows(lhs, rhs)) {
      return eval_failure_s{"Integer overflow", node.column};
    }
    out = lhs * rhs;
    break;
  case node_kind_e::DIV:
    if (rhs == 0) {
      return eval_failure_s{"Division by zero", node.column};
    }
    if (lhs == I64_MIN && rhs == -1) {
      return eval_failure_s{"Integer overflow", node.column};
    }
    out = lhs / rhs;
    break;
  default:
    break;
  }
  return std::nullopt;
}

void emit(const node_s &node, std::vector<std::string> &listing) {
  switch (node.kind) {
  case node_kind_e::LITERAL:
    listing.push_back(fmt::format("push {}", node.value));
    return;
  case node_kind_e::NAME:
    listing.push_back(fmt::format("load {}", node.name));
    return;
  case node_kind_e::NEGATE:
    emit(*node.lhs, listing);
    listing.push_back("neg");
    return;
  default:
    break;
  }

  emit(*node.lhs, listing);
  emit(*node.rhs, listing);
  switch (node.kind) {
  case node_kind_e::ADD:
    listing.push_back("add");
    break;
  case node_kind_e::SUB:
    listing.push_back("sub");
    break;
  case node_kind_e::MUL:
    listing.push_back("mul");
    break;
  case node_kind_e::DIV:
    listing.push_back("div");
    break;
  default:
    break;
  }
}

} // namespace

line_state_c::line_state_c(std::shared_mutex &lock)
    : lock_(lock), generation_(0) {}

std::shared_mutex &line_state_c::get_lock() { return lock_; }

std::size_t line_state_c::history_size() const { return history_.size(); }

std::int32_t line_state_c::current_generation() const { return generation_; }

const std::vector<engine::code_line_s> &line_state_c::get_history() const {
  return history_;
}

const bindings_t &line_state_c::get_bindings() const { return bindings_; }

line_engine_c::line_engine_c(const engine::engine_config_s &config,
                             engine::logger_t logger)
    : logger_(logger), module_name_(config.module_name) {}

engine::compilation_state_t line_engine_c::create_state(std::shared_mutex &lock) {
  return std::make_unique<line_state_c>(lock);
}

line_state_c &
line_engine_c::as_line_state(engine::compilation_state_if &state) const {
  auto *line_state = dynamic_cast<line_state_c *>(&state);
  if (!line_state) {
    throw engine::illegal_state_exception(
        "state was not created by the line engine");
  }
  return *line_state;
}

std::optional<std::string>
line_engine_c::find_unresolved(const node_s &expr, const bindings_t &bindings,
                               std::int32_t &column) const {
  if (expr.kind == node_kind_e::NAME) {
    if (bindings.find(expr.name) == bindings.end()) {
      column = expr.column;
      return expr.name;
    }
    return std::nullopt;
  }
  if (expr.lhs) {
    if (auto name = find_unresolved(*expr.lhs, bindings, column)) {
      return name;
    }
  }
  if (expr.rhs) {
    return find_unresolved(*expr.rhs, bindings, column);
  }
  return std::nullopt;
}

engine::check_result_s
line_engine_c::check(engine::compilation_state_if &state,
                     const engine::code_line_s &line,
                     diagnostics::diagnostic_sink_if &sink) {
  auto &line_state = as_line_state(state);
  std::shared_lock<std::shared_mutex> lock(line_state.get_lock());

  auto location = [&](std::int32_t column) {
    return diagnostics::location_s{module_name_, line.no, column, line.code};
  };

  auto parsed = parse(line.code);
  if (parsed.status == parse_status_e::INCOMPLETE) {
    return engine::check_result_s::incomplete();
  }
  if (parsed.status == parse_status_e::ERROR) {
    sink.report(diagnostics::severity_e::ERROR, parsed.message,
                location(parsed.column));
    return engine::check_result_s::error(parsed.message,
                                         location(parsed.column));
  }

  std::int32_t column = 0;
  if (auto name = find_unresolved(*parsed.statement.expr,
                                  line_state.bindings_, column)) {
    const std::string message = fmt::format("Unresolved reference: {}", *name);
    sink.report(diagnostics::severity_e::ERROR, message, location(column));
    return engine::check_result_s::error(message, location(column));
  }

  return engine::check_result_s::ok();
}

engine::compile_result_s
line_engine_c::compile(engine::compilation_state_if &state,
                       const engine::code_line_s &line,
                       diagnostics::diagnostic_sink_if &sink) {
  auto &line_state = as_line_state(state);
  std::unique_lock<std::shared_mutex> lock(line_state.get_lock());

  auto location = [&](std::int32_t column) {
    return diagnostics::location_s{module_name_, line.no, column, line.code};
  };

  auto fail = [&](const std::string &message, std::int32_t column) {
    sink.report(diagnostics::severity_e::ERROR, message, location(column));
    return engine::compile_result_s::error(message, location(column));
  };

  auto parsed = parse(line.code);
  if (parsed.status == parse_status_e::INCOMPLETE) {
    return fail("Incomplete code",
                static_cast<std::int32_t>(line.code.size() + 1));
  }
  if (parsed.status == parse_status_e::ERROR) {
    return fail(parsed.message, parsed.column);
  }

  const node_s &expr = *parsed.statement.expr;

  std::int32_t column = 0;
  if (auto name = find_unresolved(expr, line_state.bindings_, column)) {
    return fail(fmt::format("Unresolved reference: {}", *name), column);
  }

  std::int64_t value = 0;
  if (auto failure = evaluate(expr, line_state.bindings_, value)) {
    return fail(failure->message, failure->column);
  }

  engine::compiled_artifact_s artifact;
  artifact.line = line;
  artifact.line.generation = line_state.generation_;
  artifact.referenced_names = collect_names(expr);
  emit(expr, artifact.listing);

  if (parsed.statement.binding.has_value()) {
    artifact.listing.push_back(
        fmt::format("store {}", *parsed.statement.binding));
    line_state.bindings_[*parsed.statement.binding] = value;
  } else {
    artifact.listing.push_back("ret");
    artifact.value = value;
  }

  line_state.history_.push_back(artifact.line);
  ++line_state.generation_;
  artifact.class_name = fmt::format("Line_{}", line_state.history_.size());

  logger_->debug("[line_engine] Compiled {} ({} instructions)",
                 artifact.class_name, artifact.listing.size());

  return engine::compile_result_s::ok(std::move(artifact));
}

const char *line_engine_provider_c::get_name() const { return "lines"; }

engine::engine_t
line_engine_provider_c::make_engine(const engine::engine_config_s &config,
                                    diagnostics::diagnostic_sink_if &sink,
                                    engine::logger_t logger) {
  if (config.module_name.empty()) {
    throw std::invalid_argument("module name must not be empty");
  }
  sink.report(diagnostics::severity_e::LOGGING,
              fmt::format("line engine ready for module '{}'",
                          config.module_name),
              std::nullopt);
  logger->info("[line_engine] Created for module '{}'", config.module_name);
  return std::make_unique<line_engine_c>(config, logger);
}

} // namespace repld::lines
