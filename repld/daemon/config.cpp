#include "daemon/config.hpp"
#include <fstream>

namespace repld::daemon {

bool load_config(const std::string &path, config_c &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  try {
    file >> config.config_;
  } catch (const json::exception &) {
    return false;
  }
  return config.config_.is_object();
}

bool parse_config(const std::string &text, config_c &config) {
  try {
    config.config_ = json::parse(text);
  } catch (const json::exception &) {
    return false;
  }
  return config.config_.is_object();
}

bool new_config(const std::string &path) {
  json config;
  config["daemon"]["port"] = DEFAULT_PORT;
  config["daemon"]["log_level"] = DEFAULT_LOG_LEVEL;
  config["daemon"]["trace_operations"] = false;
  config["engine"]["module_name"] = DEFAULT_MODULE_NAME;
  config["engine"]["template_class_name"] = DEFAULT_TEMPLATE_CLASS_NAME;
  config["engine"]["template_classpath"] = json::array();
  config["engine"]["compiler_classpath"] = json::array();
  config["engine"]["compiler_version"] = "";
  config["engine"]["enabled_plugins"] = json::array();
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }
  file << config.dump(4);
  return true;
}

const json *config_c::section(const char *name) const {
  if (!config_.is_object()) {
    return nullptr;
  }
  auto it = config_.find(name);
  if (it == config_.end() || !it->is_object()) {
    return nullptr;
  }
  return &(*it);
}

std::string config_c::get_string(const char *section_name, const char *key,
                                 const std::string &fallback) const {
  const json *s = section(section_name);
  if (!s) {
    return fallback;
  }
  auto it = s->find(key);
  if (it == s->end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

std::vector<std::string>
config_c::get_string_list(const char *section_name, const char *key) const {
  std::vector<std::string> result;
  const json *s = section(section_name);
  if (!s) {
    return result;
  }
  auto it = s->find(key);
  if (it == s->end() || !it->is_array()) {
    return result;
  }
  for (const auto &entry : *it) {
    if (entry.is_string()) {
      result.push_back(entry.get<std::string>());
    }
  }
  return result;
}

std::int32_t config_c::get_port() const {
  const json *s = section("daemon");
  if (!s) {
    return DEFAULT_PORT;
  }
  auto it = s->find("port");
  if (it == s->end() || !(it->is_number_unsigned() || it->is_number_integer())) {
    return DEFAULT_PORT;
  }
  auto value = it->get<std::int64_t>();
  if (value < 0 || value > 65535) {
    return DEFAULT_PORT;
  }
  return static_cast<std::int32_t>(value);
}

std::string config_c::get_log_level() const {
  return get_string("daemon", "log_level", DEFAULT_LOG_LEVEL);
}

bool config_c::get_trace_operations() const {
  const json *s = section("daemon");
  if (!s) {
    return false;
  }
  auto it = s->find("trace_operations");
  if (it == s->end() || !it->is_boolean()) {
    return false;
  }
  return it->get<bool>();
}

std::string config_c::get_module_name() const {
  return get_string("engine", "module_name", DEFAULT_MODULE_NAME);
}

std::string config_c::get_template_class_name() const {
  return get_string("engine", "template_class_name",
                    DEFAULT_TEMPLATE_CLASS_NAME);
}

std::vector<std::string> config_c::get_template_classpath() const {
  return get_string_list("engine", "template_classpath");
}

std::vector<std::string> config_c::get_compiler_classpath() const {
  return get_string_list("engine", "compiler_classpath");
}

std::string config_c::get_compiler_version() const {
  return get_string("engine", "compiler_version", "");
}

std::vector<std::string> config_c::get_enabled_plugins() const {
  return get_string_list("engine", "enabled_plugins");
}

options_s config_c::to_options() const {
  options_s options;
  options.port = get_port();
  options.log_level = get_log_level();
  options.trace_operations = get_trace_operations();
  options.engine.compiler_id.compiler_classpath = get_compiler_classpath();
  options.engine.compiler_id.compiler_version = get_compiler_version();
  options.engine.template_classpath = get_template_classpath();
  options.engine.template_class_name = get_template_class_name();
  options.engine.module_name = get_module_name();
  options.engine.enabled_plugins = get_enabled_plugins();
  return options;
}

} // namespace repld::daemon
