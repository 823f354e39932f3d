#include "engine/engine.hpp"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fmt/core.h>

namespace repld::engine {

void provider_catalog_c::register_provider(engine_provider_t provider) {
  if (provider) {
    providers_.push_back(std::move(provider));
  }
}

std::vector<engine_provider_t>
provider_catalog_c::discover(const engine_config_s &config) const {
  if (config.enabled_plugins.empty()) {
    return providers_;
  }

  std::vector<engine_provider_t> result;
  for (const auto &provider : providers_) {
    auto it = std::find(config.enabled_plugins.begin(),
                        config.enabled_plugins.end(), provider->get_name());
    if (it != config.enabled_plugins.end()) {
      result.push_back(provider);
    }
  }
  return result;
}

std::size_t provider_catalog_c::size() const { return providers_.size(); }

initialization_error::initialization_error(reason_e reason,
                                           const std::string &cause)
    : std::runtime_error(
          fmt::format("Unable to use scripting/REPL in the daemon: {}", cause)),
      reason_(reason), cause_(cause) {}

initialization_error::reason_e initialization_error::get_reason() const {
  return reason_;
}

const std::string &initialization_error::get_cause() const { return cause_; }

namespace {

void report_failure(diagnostics::diagnostic_sink_if &sink, logger_t logger,
                    const std::string &cause) {
  sink.report(diagnostics::severity_e::ERROR,
              fmt::format("Unable to construct repl compiler: {}", cause),
              std::nullopt);
  logger->error("[engine] Unable to construct repl compiler: {}", cause);
}

std::optional<std::string>
find_missing_entry(const std::vector<std::string> &classpath) {
  for (const auto &entry : classpath) {
    std::error_code ec;
    if (!std::filesystem::exists(entry, ec)) {
      return entry;
    }
  }
  return std::nullopt;
}

} // namespace

engine_t make_engine(const engine_config_s &config,
                     const provider_catalog_c &catalog,
                     diagnostics::diagnostic_sink_if &sink, logger_t logger) {
  auto providers = catalog.discover(config);

  if (providers.empty()) {
    const std::string cause = "no scripting plugin loaded";
    report_failure(sink, logger, cause);
    throw initialization_error(initialization_error::reason_e::NOT_FOUND,
                               cause);
  }

  if (providers.size() > 1) {
    const std::string cause = "several scripting plugins loaded";
    report_failure(sink, logger, cause);
    throw initialization_error(initialization_error::reason_e::AMBIGUOUS,
                               cause);
  }

  auto missing = find_missing_entry(config.compiler_id.compiler_classpath);
  if (!missing) {
    missing = find_missing_entry(config.template_classpath);
  }
  if (missing) {
    const std::string cause =
        fmt::format("{} is not found in the classpath", *missing);
    report_failure(sink, logger, cause);
    throw initialization_error(initialization_error::reason_e::LIBRARY_MISSING,
                               cause);
  }

  auto &provider = providers.front();
  logger->info("[engine] Constructing repl compiler from provider '{}' for "
               "template '{}' (compiler version '{}', {} classpath entries)",
               provider->get_name(), config.template_class_name,
               config.compiler_id.compiler_version,
               config.compiler_id.compiler_classpath.size() +
                   config.template_classpath.size());

  try {
    auto engine = provider->make_engine(config, sink, logger);
    if (!engine) {
      throw std::runtime_error(fmt::format("provider '{}' produced no engine",
                                           provider->get_name()));
    }
    return engine;
  } catch (const std::exception &e) {
    report_failure(sink, logger, e.what());
    std::throw_with_nested(initialization_error(
        initialization_error::reason_e::CONSTRUCTION_FAILED, e.what()));
  }
}

} // namespace repld::engine
