#include "paneld/cli/commands.hpp"
#include "paneld/config/paths.hpp"
#include "paneld/util/log.hpp"

#include <cstdlib>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("paneld - widget panel daemon");
  std::println("Usage: {} [OPTIONS] <COMMAND>", prog);
  std::println("");
  std::println("Commands:");
  std::println("  daemon                  Start the daemon");
  std::println("  reload                  Reload widget config and stylesheet");
  std::println("  kill                    Stop the running daemon");
  std::println("  update NAME=VALUE...    Set one or more variables");
  std::println("  state                   Print all variables");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <dir>      Config directory "
               "(default: $XDG_CONFIG_HOME/paneld)");
  std::println("  --no-daemonize          Stay in the foreground");
  std::println("  --log-level <level>     trace, debug, info, warn or error");
  std::println("  -v, --version           Show version and exit");
  std::println("  -h, --help              Show this help message");
}

void print_version() {
  std::println("paneld v0.1.0");
}

struct Options {
  std::string config_dir;
  std::string command;
  std::vector<std::string> command_args;
  std::string log_level;
  bool no_daemonize = false;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (!opts.command.empty()) {
      opts.command_args.emplace_back(arg);
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_dir = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        std::println(stderr, "Error: --log-level requires an argument");
        std::exit(1);
      }
      opts.log_level = argv[i];
    } else if (arg == "--no-daemonize") {
      opts.no_daemonize = true;
    } else if (arg.starts_with("-")) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else {
      opts.command = arg;
    }
  }

  if (opts.command.empty()) {
    print_usage(argv[0]);
    std::exit(1);
  }
  return opts;
}

auto parse_assignments(const std::vector<std::string>& args)
    -> std::vector<std::pair<std::string, std::string>> {
  std::vector<std::pair<std::string, std::string>> vars;
  for (const auto& arg : args) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::println(stderr, "Error: expected NAME=VALUE, got '{}'", arg);
      std::exit(1);
    }
    vars.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
  }
  return vars;
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace cli = paneld::cli;

  auto opts = parse_args(argc, argv);
  std::filesystem::path config_dir = opts.config_dir.empty()
                                         ? paneld::default_config_dir()
                                         : std::filesystem::path{opts.config_dir};

  if (!opts.log_level.empty() && !paneld::log::parse_level(opts.log_level)) {
    std::println(stderr, "Error: unknown log level '{}'", opts.log_level);
    return 1;
  }

  if (opts.command != "update" && !opts.command_args.empty()) {
    std::println(stderr, "Error: '{}' takes no arguments", opts.command);
    return 1;
  }

  if (opts.command == "daemon") {
    cli::DaemonOptions daemon_opts{.config_dir = config_dir,
                                   .daemonize = !opts.no_daemonize};
    if (!opts.log_level.empty()) {
      daemon_opts.log_level = opts.log_level;
    }
    return cli::cmd_daemon(daemon_opts);
  }
  if (opts.command == "reload") {
    return cli::cmd_reload({.config_dir = config_dir});
  }
  if (opts.command == "kill") {
    return cli::cmd_kill({.config_dir = config_dir});
  }
  if (opts.command == "state") {
    return cli::cmd_state({.config_dir = config_dir});
  }
  if (opts.command == "update") {
    return cli::cmd_update({.config_dir = config_dir,
                            .vars = parse_assignments(opts.command_args)});
  }

  std::println(stderr, "Unknown command: {}", opts.command);
  print_usage(argv[0]);
  return 1;
}
