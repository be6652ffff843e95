#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <kprint/core/buffered_formatter.hpp>
#include <kprint/core/debug_echo.hpp>
#include <kprint/core/dispatch.hpp>
#include <kprint/core/streaming_writer.hpp>
#include <kprint/sinks/null_sink.hpp>
#include <string>
#include <vector>

namespace kprint::test {

TEST_CASE("Output channel benchmarks", "[benchmark][dispatch]")
{
  kprint::sinks::null_sink sink;
  const std::string long_text(2048, 'b');

  SECTION("Short message")
  {
    BENCHMARK("streaming println")
    {
      kprint::core::streaming_writer writer(sink);
      kprint::println_to(writer, "{} + {} = {}", 2, 2, 4);
    };

    BENCHMARK("buffered println")
    {
      kprint::core::buffered_formatter formatter(sink);
      kprint::println_to(formatter, "{} + {} = {}", 2, 2, 4);
    };
  }

  SECTION("Long message")
  {
    BENCHMARK("streaming println")
    {
      kprint::core::streaming_writer writer(sink);
      kprint::println_to(writer, "[{}]", long_text);
    };

    BENCHMARK("buffered println")
    {
      kprint::core::buffered_formatter formatter(sink);
      kprint::println_to(formatter, "[{}]", long_text);
    };
  }

  SECTION("Debug echo")
  {
    const echo_site site{ .file = "bench.cpp", .line = 1, .expression = "values" };
    const std::vector<int> values{ 1, 2, 3, 4, 5, 6, 7, 8 };

    BENCHMARK("streaming echo of a vector")
    {
      kprint::core::streaming_writer writer(sink);
      return kprint::echo_to(writer, site, values).size();
    };

    BENCHMARK("buffered echo of a vector")
    {
      kprint::core::buffered_formatter formatter(sink);
      return kprint::echo_to(formatter, site, values).size();
    };
  }
}

}// namespace kprint::test
