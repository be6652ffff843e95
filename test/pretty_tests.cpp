#include <array>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <fmt/format.h>
#include <kprint/core/pretty.hpp>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace {

struct page_range
{
  std::uint64_t base = 0;
  std::uint32_t count = 0;
};

struct mapping
{
  std::string name;
  page_range range;
  std::vector<int> flags;
};

// Copying always throws, which leaves a variant that tried to hold it valueless.
struct copy_fails
{
  copy_fails() = default;
  copy_fails(const copy_fails & /*other*/) { throw std::runtime_error("copy_fails"); }
  auto operator=(const copy_fails &) -> copy_fails & = default;
  ~copy_fails() = default;
};

enum class cpu_state : std::uint8_t { halted = 0, running = 1 };

template<typename T> auto render(const T &value) -> std::string { return fmt::format("{}", kprint::pretty(value)); }

}// namespace

template<> struct kprint::pretty_formatter<page_range>
{
  static constexpr std::string_view name = "page_range";
  static auto fields(const page_range &range)
  {
    return std::tuple{ kprint::field("base", range.base), kprint::field("count", range.count) };
  }
};

template<> struct kprint::pretty_formatter<mapping>
{
  static constexpr std::string_view name = "mapping";
  static auto fields(const mapping &value)
  {
    return std::tuple{ kprint::field("name", value.name),
      kprint::field("range", value.range),
      kprint::field("flags", value.flags) };
  }
};

template<> struct kprint::pretty_formatter<copy_fails>
{
  static constexpr std::string_view name = "copy_fails";
  static auto fields(const copy_fails & /*value*/) { return std::tuple{}; }
};

TEST_CASE("pretty renders scalars like fmt", "[pretty]")
{
  CHECK(render(4) == "4");
  CHECK(render(-17L) == "-17");
  CHECK(render(2.5) == "2.5");
  CHECK(render(true) == "true");
  CHECK(render(nullptr) == "nullptr");
  CHECK(render(cpu_state::running) == "1");
}

TEST_CASE("pretty quotes and escapes text", "[pretty]")
{
  CHECK(render(std::string("kmain")) == "\"kmain\"");
  CHECK(render("line\nbreak") == "\"line\\nbreak\"");
  CHECK(render(std::string_view("tab\there")) == "\"tab\\there\"");
  CHECK(render('x') == "'x'");
}

TEST_CASE("pretty renders a null C string as nullptr", "[pretty]")
{
  const char *missing = nullptr;
  char *mutable_missing = nullptr;
  const char *present = "boot";

  CHECK(render(static_cast<const char *>(nullptr)) == "nullptr");
  CHECK(render(missing) == "nullptr");
  CHECK(render(mutable_missing) == "nullptr");
  CHECK(render(present) == "\"boot\"");
}

TEST_CASE("pretty lays out sequences one element per line", "[pretty]")
{
  SECTION("vector")
  {
    CHECK(render(std::vector<int>{ 1, 2, 3 }) == "[\n    1,\n    2,\n    3,\n]");
  }

  SECTION("array")
  {
    CHECK(render(std::array<char, 2>{ 'a', 'b' }) == "[\n    'a',\n    'b',\n]");
  }

  SECTION("empty sequence stays on one line")
  {
    CHECK(render(std::vector<int>{}) == "[]");
  }

  SECTION("nested sequences are indented per level")
  {
    const std::vector<std::vector<int>> nested{ { 1 }, {} };
    CHECK(render(nested) == "[\n    [\n        1,\n    ],\n    [],\n]");
  }
}

TEST_CASE("pretty lays out maps as key: value lines", "[pretty]")
{
  const std::map<std::string, int> counters{ { "faults", 0 }, { "ticks", 40 } };

  CHECK(render(counters) == "{\n    \"faults\": 0,\n    \"ticks\": 40,\n}");
  CHECK(render(std::map<int, int>{}) == "{}");
}

TEST_CASE("pretty lays out tuples and pairs", "[pretty]")
{
  CHECK(render(std::pair{ 1, std::string("one") }) == "(\n    1,\n    \"one\",\n)");
  CHECK(render(std::tuple{ 7 }) == "(\n    7,\n)");
  CHECK(render(std::tuple<>{}) == "()");
}

TEST_CASE("pretty renders smart pointers through their target", "[pretty]")
{
  CHECK(render(std::make_unique<int>(8)) == "8");
  CHECK(render(std::shared_ptr<std::vector<int>>{}) == "nullptr");
}

TEST_CASE("pretty renders optional and variant", "[pretty]")
{
  CHECK(render(std::optional<int>{}) == "nullopt");
  CHECK(render(std::optional<int>{ 5 }) == "optional(\n    5,\n)");

  const std::variant<int, std::string> number = 3;
  const std::variant<int, std::string> text = std::string("three");
  CHECK(render(number) == "3");
  CHECK(render(text) == "\"three\"");

  SECTION("valueless variant")
  {
    std::variant<int, copy_fails> broken = 1;
    const copy_fails source;
    CHECK_THROWS_AS(broken.emplace<copy_fails>(source), std::runtime_error);

    REQUIRE(broken.valueless_by_exception());
    CHECK(render(broken) == "valueless");
  }
}

TEST_CASE("pretty uses pretty_formatter for user types", "[pretty]")
{
  SECTION("flat record")
  {
    CHECK(render(page_range{ .base = 4096, .count = 2 }) == "page_range {\n    base: 4096,\n    count: 2,\n}");
  }

  SECTION("nested record")
  {
    const mapping value{ .name = "stack", .range = { .base = 0, .count = 1 }, .flags = { 3 } };

    CHECK(render(value)
          == "mapping {\n"
             "    name: \"stack\",\n"
             "    range: page_range {\n"
             "        base: 0,\n"
             "        count: 1,\n"
             "    },\n"
             "    flags: [\n"
             "        3,\n"
             "    ],\n"
             "}");
  }
}

TEST_CASE("pretty output composes with surrounding format text", "[pretty]")
{
  CHECK(fmt::format("v = {}!", kprint::pretty(std::vector<int>{ 9 })) == "v = [\n    9,\n]!");
}
