#pragma once

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <kprint/config.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace kprint::cli_utils {

struct cli_args
{
  std::string sink = "stdout";
  bool verbose = false;
  bool log_bridge = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-s,--sink", args.sink, "Output sink: stdout, stderr, null, failing")
    ->check(CLI::IsMember({ "stdout", "stderr", "null", "failing" }));
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--log-bridge", args.log_bridge, "Route spdlog output through the kprint sink");
  app.add_flag("--version", args.show_version, "Show version information");
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "kprint - panic-free print and debug echo demo", std::string(kprint::cmake::project_name) };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.sink != "stdout" and args.sink != "stderr" and args.sink != "null" and args.sink != "failing") {
    spdlog::error("Invalid sink: {}", args.sink);
    return false;
  }

  return true;
}

}// namespace kprint::cli_utils
