#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>
#include <kprint/kprint.hpp>
#include <string>
#include <test_doubles/test_double_sink.hpp>

TEST_CASE("Unprefixed print and println forward to kprint", "[std_names][dispatch]")
{
  STATIC_REQUIRE(kprint::cmake::std_names);

  kprint::test::test_double_sink sink;
  const kprint::scoped_sink guard{ sink };

  print("{}", 1);
  println();
  println("{} + {} = {}", 2, 2, 4);

  CHECK(sink.get_output() == "1\n2 + 2 = 4\n");
}

TEST_CASE("dbg is KPRINT_DBG without the prefix", "[std_names][debug_echo]")
{
  kprint::test::test_double_sink sink;
  const kprint::scoped_sink guard{ sink };

  SECTION("single expression")
  {
    // clang-format off
    const int line = __LINE__; const auto value = dbg(2 + 2);
    // clang-format on

    CHECK(value == 4);
    CHECK(sink.get_output() == fmt::format("[{}:{}] 2 + 2 = 4\n", __FILE__, line));
  }

  SECTION("location only")
  {
    dbg();

    CHECK(sink.get_output().ends_with("]\n"));
  }

  SECTION("several expressions")
  {
    const auto [first, second] = dbg(1, 2);

    CHECK(first == 1);
    CHECK(second == 2);
  }
}
