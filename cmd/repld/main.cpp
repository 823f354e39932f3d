#include <cstdlib>
#include <daemon/daemon.hpp>
#include <fmt/core.h>
#include <iostream>
#include <lines/line_engine.hpp>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace {

void print_usage() {
  fmt::print("Usage: repld [options]\n");
  fmt::print("Options:\n");
  fmt::print("  --help, -h\t\t\tPrint this help message\n");
  fmt::print("  --config, -c PATH\t\tLoad a JSON configuration file\n");
  fmt::print("  --new-config, -n PATH\t\tWrite a default configuration file\n");
  fmt::print("  --port, -p NUM\t\tPort reported for new sessions\n");
  fmt::print("  --log-level, -l LEVEL\t\ttrace|debug|info|warn|err|off\n");
  fmt::print("  --trace, -t\t\t\tTrace every check/compile operation\n");
  fmt::print("  --plugin, -P NAME\t\tEnable an engine plugin (repeatable)\n");
  fmt::print("\nEnvironment Variables:\n");
  fmt::print("  REPLD_CONFIG\t\t\tDefault configuration file\n");
  fmt::print("  REPLD_PORT\t\t\tDefault port\n");
  fmt::print("  REPLD_LOG_LEVEL\t\tDefault log level\n");
}

void print_commands() {
  fmt::print("Commands:\n");
  fmt::print("  create [port]\t\tOpen a session\n");
  fmt::print("  check <id> <code>\tCheck a line against a session\n");
  fmt::print("  compile <id> <code>\tCompile a line into a session\n");
  fmt::print("  drop <id>\t\tRelease the handle of a session\n");
  fmt::print("  sessions\t\tList live sessions\n");
  fmt::print("  help\t\t\tShow this list\n");
  fmt::print("  quit\t\t\tExit\n");
}

std::optional<std::string> load_from_env(const std::string &env_var) {
  const char *value = std::getenv(env_var.c_str());
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

const char *check_status_to_string(repld::engine::check_status_e status) {
  switch (status) {
  case repld::engine::check_status_e::OK:
    return "ok";
  case repld::engine::check_status_e::INCOMPLETE:
    return "incomplete";
  case repld::engine::check_status_e::ERROR:
    return "error";
  }
  return "unknown";
}

/*
  Console transport: one command per line, one reply per command. Holds
  the session handles on behalf of the client, so "drop" is what a
  remote client going away looks like to the registry.
*/
class console_c {
public:
  explicit console_c(repld::service::repl_service_c &service)
      : service_(service) {}

  bool handle(const std::string &input) {
    std::istringstream in(input);
    std::string command;
    in >> command;

    if (command.empty()) {
      return true;
    }
    if (command == "quit" || command == "exit") {
      return false;
    }
    if (command == "help") {
      print_commands();
    } else if (command == "create") {
      create(in);
    } else if (command == "check" || command == "compile") {
      run(command, in);
    } else if (command == "drop") {
      drop(in);
    } else if (command == "sessions") {
      for (auto id : service_.get_registry().ids()) {
        fmt::print("{}\n", id);
      }
    } else {
      fmt::print("error: unknown command '{}'\n", command);
    }
    return true;
  }

private:
  repld::service::repl_service_c &service_;
  std::map<repld::session::id_t, repld::session::session_handle_t> handles_;
  std::map<repld::session::id_t, std::int32_t> line_numbers_;

  void create(std::istringstream &in) {
    std::int32_t port = service_.get_port_for_servers();
    in >> port;
    try {
      auto handle = service_.create_session(port);
      const auto id = handle->get_id();
      handles_[id] = std::move(handle);
      fmt::print("session {}\n", id);
    } catch (const std::exception &e) {
      fmt::print("error: {}\n", e.what());
    }
  }

  void drop(std::istringstream &in) {
    repld::session::id_t id = 0;
    if (!(in >> id)) {
      fmt::print("error: drop requires a session id\n");
      return;
    }
    if (handles_.erase(id) == 0) {
      fmt::print("error: no handle for session {}\n", id);
      return;
    }
    line_numbers_.erase(id);
    fmt::print("dropped {}\n", id);
  }

  void run(const std::string &command, std::istringstream &in) {
    repld::session::id_t id = 0;
    if (!(in >> id)) {
      fmt::print("error: {} requires a session id\n", command);
      return;
    }
    std::string code;
    std::getline(in >> std::ws, code);

    repld::engine::code_line_s line{++line_numbers_[id], 0, code};

    if (command == "check") {
      auto result = service_.check(id, line);
      if (result.is_error()) {
        fmt::print("error: {}\n", result.error_message());
        return;
      }
      const auto &checked = result.get();
      if (checked.status == repld::engine::check_status_e::ERROR) {
        fmt::print("error: {}\n", checked.message);
      } else {
        fmt::print("{}\n", check_status_to_string(checked.status));
      }
      return;
    }

    auto result = service_.compile(id, line);
    if (result.is_error()) {
      fmt::print("error: {}\n", result.error_message());
      return;
    }
    const auto &compiled = result.get();
    if (compiled.status == repld::engine::compile_status_e::ERROR) {
      fmt::print("error: {}\n", compiled.message);
      return;
    }
    const auto &artifact = *compiled.artifact;
    if (artifact.value.has_value()) {
      fmt::print("{} = {}\n", artifact.class_name, *artifact.value);
    } else {
      fmt::print("{}\n", artifact.class_name);
    }
  }
};

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv, argv + argc);

  repld::daemon::options_s options;
  std::optional<std::string> config_path = load_from_env("REPLD_CONFIG");

  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--config" || args[i] == "-c") {
      if (i + 1 >= args.size()) {
        fmt::print(stderr, "Error: {} requires a path argument\n", args[i]);
        return 1;
      }
      config_path = args[++i];
    }
  }

  if (config_path) {
    repld::daemon::config_c config;
    if (!repld::daemon::load_config(*config_path, config)) {
      fmt::print(stderr, "Failed to load config file: {}\n", *config_path);
      return 1;
    }
    options = config.to_options();
  }

  if (auto port = load_from_env("REPLD_PORT")) {
    options.port = std::stoi(*port);
  }

  if (auto log_level = load_from_env("REPLD_LOG_LEVEL")) {
    options.log_level = *log_level;
  }

  for (size_t i = 1; i < args.size(); ++i) {
    const auto &arg = args[i];

    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--new-config" || arg == "-n") {
      if (i + 1 >= args.size()) {
        fmt::print(stderr, "Error: {} requires a path argument\n", arg);
        return 1;
      }
      const auto &path = args[++i];
      if (!repld::daemon::new_config(path)) {
        fmt::print(stderr, "Failed to create new config file: {}\n", path);
        return 1;
      }
      fmt::print("Created new config file: {}\n", path);
      return 0;
    } else if (arg == "--port" || arg == "-p") {
      if (i + 1 >= args.size()) {
        fmt::print(stderr, "Error: {} requires a number argument\n", arg);
        return 1;
      }
      options.port = std::stoi(args[++i]);
    } else if (arg == "--log-level" || arg == "-l") {
      if (i + 1 >= args.size()) {
        fmt::print(stderr, "Error: {} requires a level argument\n", arg);
        return 1;
      }
      options.log_level = args[++i];
    } else if (arg == "--trace" || arg == "-t") {
      options.trace_operations = true;
    } else if (arg == "--plugin" || arg == "-P") {
      if (i + 1 >= args.size()) {
        fmt::print(stderr, "Error: {} requires a name argument\n", arg);
        return 1;
      }
      options.engine.enabled_plugins.push_back(args[++i]);
    } else {
      fmt::print(stderr, "Error: Unknown option '{}'\n", arg);
      print_usage();
      return 1;
    }
  }

  repld::engine::provider_catalog_c catalog;
  catalog.register_provider(
      std::make_shared<repld::lines::line_engine_provider_c>());

  try {
    repld::daemon::daemon_c daemon(options, catalog);
    if (!daemon.initialize()) {
      fmt::print(stderr, "Failed to initialize the daemon\n");
      return 1;
    }

    console_c console(*daemon.get_service());
    std::string input;
    while (std::getline(std::cin, input)) {
      if (!console.handle(input)) {
        break;
      }
    }

    daemon.shutdown();
  } catch (const std::exception &e) {
    fmt::print(stderr, "Fatal error: {}\n", e.what());
    return 1;
  }

  return 0;
}
