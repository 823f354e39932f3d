#pragma once

#include <cstdint>
#include <engine/engine.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace repld::daemon {
using nlohmann::json;

constexpr std::int32_t DEFAULT_PORT = 17031;
constexpr const char *DEFAULT_LOG_LEVEL = "info";
constexpr const char *DEFAULT_MODULE_NAME = "repl-script";
constexpr const char *DEFAULT_TEMPLATE_CLASS_NAME = "ScriptTemplateWithArgs";

struct options_s {
  std::int32_t port{DEFAULT_PORT};
  std::string log_level{DEFAULT_LOG_LEVEL};
  bool trace_operations{false};
  engine::engine_config_s engine;
};

/*
  Daemon configuration file:

  {
    "daemon": { "port": 17031, "log_level": "info", "trace_operations": false },
    "engine": {
      "module_name": "repl-script",
      "template_class_name": "ScriptTemplateWithArgs",
      "template_classpath": [],
      "compiler_classpath": [],
      "compiler_version": "",
      "enabled_plugins": []
    }
  }

  Every field is optional; missing or mistyped fields fall back to the
  defaults above.
*/
class config_c {
public:
  std::int32_t get_port() const;
  std::string get_log_level() const;
  bool get_trace_operations() const;

  std::string get_module_name() const;
  std::string get_template_class_name() const;
  std::vector<std::string> get_template_classpath() const;
  std::vector<std::string> get_compiler_classpath() const;
  std::string get_compiler_version() const;
  std::vector<std::string> get_enabled_plugins() const;

  options_s to_options() const;

  friend bool load_config(const std::string &path, config_c &config);
  friend bool parse_config(const std::string &text, config_c &config);

private:
  json config_;

  const json *section(const char *name) const;
  std::string get_string(const char *section_name, const char *key,
                         const std::string &fallback) const;
  std::vector<std::string> get_string_list(const char *section_name,
                                           const char *key) const;
};

bool load_config(const std::string &path, config_c &config);
bool parse_config(const std::string &text, config_c &config);

//! \brief Write a config file holding every default
bool new_config(const std::string &path);

} // namespace repld::daemon
