#pragma once

#include <kprint/cli_utils/cli_parser.hpp>
#include <kprint/config.hpp>
#include <kprint/core/sink.hpp>
#include <kprint/sinks/callback_sink.hpp>
#include <kprint/sinks/file_sink.hpp>
#include <kprint/sinks/log_bridge_sink.hpp>
#include <kprint/sinks/null_sink.hpp>

#include <boost/system/error_code.hpp>
#include <cstdio>
#include <memory>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace kprint::cli_utils {

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::cfg::load_env_levels();

  if (args.log_bridge) {
    auto logger = std::make_shared<spdlog::logger>("kprint", std::make_shared<sinks::log_bridge_sink_mt>());
    spdlog::set_default_logger(logger);
  }

  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

/**
 * @brief Creates the sink named on the command line.
 *
 * "failing" rejects every write, which shows that printing carries on
 * regardless.
 *
 * @param name One of stdout, stderr, null, failing
 * @return Owned sink, never null for a validated name
 */
[[nodiscard]] inline auto make_sink(std::string_view name) -> std::unique_ptr<sink>
{
  if (name == "stderr") { return std::make_unique<sinks::file_sink>(stderr); }
  if (name == "null") { return std::make_unique<sinks::null_sink>(); }
  if (name == "failing") {
    return std::make_unique<sinks::callback_sink>([](std::string_view /*data*/) {
      return boost::system::errc::make_error_code(boost::system::errc::io_error);
    });
  }
  return std::make_unique<sinks::file_sink>(stdout);
}

inline auto print_app_banner(const cli_args &args) -> void
{
  spdlog::info("{} v{} ({} mode, sink: {})",
    kprint::cmake::project_name,
    kprint::cmake::project_version,
    kprint::cmake::buffered_mode ? "buffered" : "streaming",
    args.sink);
}

}// namespace kprint::cli_utils
