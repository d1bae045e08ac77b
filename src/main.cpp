#include "cronfire/cli/commands.hpp"
#include "cronfire/util/log.hpp"
#include "cronfire/util/strings.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  fmt::print("cronfire - next occurrences of cron expressions\n");
  fmt::print("Usage: {} <command> [OPTIONS]\n", prog);
  fmt::print("\n");
  fmt::print("Commands:\n");
  fmt::print("  next <expr>           Print upcoming occurrences of <expr>\n");
  fmt::print("  check <expr>          Validate <expr> and show each field\n");
  fmt::print("\n");
  fmt::print("Options:\n");
  fmt::print("  -c, --config <file>   Print occurrences for every schedule in a YAML file\n");
  fmt::print("  -n, --count <n>       Number of occurrences (default: 9)\n");
  fmt::print("  --from <time>         Search start, YYYY-MM-DD[THH:MM:SS] (default: now)\n");
  fmt::print("  --until <time>        Exclusive search end (default: 9999-12-31T23:59:59)\n");
  fmt::print("  --utc                 Read and print times as UTC instead of local time\n");
  fmt::print("  --log-level <level>   trace, debug, info, warn or error (default: warn)\n");
  fmt::print("  -v, --version         Show version and exit\n");
  fmt::print("  -h, --help            Show this help message\n");
  fmt::print("\n");
  fmt::print("Expressions have 5 or 6 fields: [second] minute hour day-of-month month day-of-week\n");
  fmt::print("\n");
  fmt::print("Examples:\n");
  fmt::print("  {} next \"10 0-8/2 * * SUN,TUE\"\n", prog);
  fmt::print("  {} next \"0 12 * * Mon-Fri\" -n 3 --from 2024-01-01\n", prog);
  fmt::print("  {} -c schedules.yaml\n", prog);
}

void print_version() {
  fmt::print("cronfire v0.1.0\n");
}

enum class Command { None, Next, Check };

struct Options {
  Command command{Command::None};
  std::string expression;
  std::string config_file;
  std::string from;
  std::string until;
  std::string log_level;
  int count{9};
  bool utc{false};
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> const char* {
  if (++i >= argc) {
    fmt::print(stderr, "Error: {} requires an argument\n", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "-n" || arg == "--count") {
      auto count = cronfire::parse_int(require_value(i, argc, argv, arg));
      if (!count || *count < 1) {
        fmt::print(stderr, "Error: --count must be a positive integer\n");
        std::exit(1);
      }
      opts.count = *count;
    } else if (arg == "--from") {
      opts.from = require_value(i, argc, argv, arg);
    } else if (arg == "--until") {
      opts.until = require_value(i, argc, argv, arg);
    } else if (arg == "--utc") {
      opts.utc = true;
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else if (opts.command == Command::None && (arg == "next" || arg == "check")) {
      opts.command = arg == "next" ? Command::Next : Command::Check;
      opts.expression = require_value(i, argc, argv, arg);
    } else {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  cronfire::log::set_level(opts.log_level.empty() ? "warn" : opts.log_level);

  if (!opts.config_file.empty()) {
    return cronfire::cli::cmd_schedule_file({
        .config_file = opts.config_file,
        .log_level = opts.log_level,
    });
  }

  switch (opts.command) {
    case Command::Next:
      return cronfire::cli::cmd_next({
          .expression = opts.expression,
          .from = opts.from,
          .until = opts.until,
          .count = opts.count,
          .utc = opts.utc,
      });
    case Command::Check:
      return cronfire::cli::cmd_check({.expression = opts.expression});
    case Command::None:
      break;
  }

  print_usage(argv[0]);
  return 1;
}
