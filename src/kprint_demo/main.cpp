#include <kprint/cli_utils/app_init.hpp>
#include <kprint/cli_utils/cli_parser.hpp>
#include <kprint/kprint.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

struct frame_info
{
  std::string name;
  unsigned depth = 0;
  std::optional<std::uintptr_t> return_address;
};

}// namespace

template<> struct kprint::pretty_formatter<frame_info>
{
  static constexpr std::string_view name = "frame_info";
  static auto fields(const frame_info &frame)
  {
    return std::tuple{ kprint::field("name", frame.name),
      kprint::field("depth", frame.depth),
      kprint::field("return_address", frame.return_address) };
  }
};

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = kprint::cli_utils::parse_cli_args(argc, argv);

  if (not kprint::cli_utils::validate_cli_args(args)) { return 1; }

  auto demo_sink = kprint::cli_utils::make_sink(args.sink);
  const kprint::scoped_sink sink_guard{ *demo_sink };

  kprint::cli_utils::configure_logging(args);

  if (args.show_version) {
    kprint::println("{} v{}", kprint::cmake::project_name, kprint::cmake::project_version);
    return 0;
  }

  kprint::cli_utils::print_app_banner(args);

  kprint::print("{} + {} = {}", 2, 2, 4);
  kprint::println();
  kprint::println("{} + {} = {}", 2, 2, 2 + 2);

  KPRINT_DBG();
  const auto sum = KPRINT_DBG(2 + 2) * 10;
  auto [cpu, irq] = KPRINT_DBG(3U, std::string("timer"));

  const std::vector<int> pending{ 1, 2, 3 };
  KPRINT_DBG(pending);

  const std::map<std::string, int> counters{ { "faults", 0 }, { "ticks", sum } };
  KPRINT_DBG(counters);

  const frame_info frame{ .name = "kmain", .depth = cpu, .return_address = std::nullopt };
  KPRINT_DBG(frame);

  spdlog::debug("demo finished, irq source {}", irq);

  return 0;
}
