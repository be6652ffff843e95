#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <kprint/core/buffered_formatter.hpp>
#include <kprint/core/debug_echo.hpp>
#include <kprint/core/dispatch.hpp>
#include <kprint/core/streaming_writer.hpp>
#include <string>
#include <string_view>
#include <test_doubles/test_double_sink.hpp>
#include <tuple>
#include <vector>

// Fuzzer that checks streaming and buffered output agree on arbitrary text and
// that a sink failing part way through never escapes the entry points.
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);
  const std::vector<std::string> words{ input, std::string(input.rbegin(), input.rend()) };
  const kprint::echo_site site{ .file = "fuzz.cpp", .line = 1, .expression = "words" };

  kprint::test::test_double_sink streamed_sink;
  kprint::core::streaming_writer writer(streamed_sink);
  kprint::println_to(writer, "{}|{:>8}|{}", input, Size, input);
  std::ignore = kprint::echo_to(writer, site, words);

  kprint::test::test_double_sink buffered_sink;
  kprint::core::buffered_formatter formatter(buffered_sink);
  kprint::println_to(formatter, "{}|{:>8}|{}", input, Size, input);
  std::ignore = kprint::echo_to(formatter, site, words);

  if (streamed_sink.get_output() != buffered_sink.get_output()) { std::abort(); }

  kprint::test::test_double_sink failing_sink;
  failing_sink.set_fail_after_writes(Size % 4);
  kprint::core::streaming_writer failing_writer(failing_sink);
  kprint::println_to(failing_writer, "{}{}{}", input, input, input);

  return 0;
}
