#include <catch2/catch_test_macros.hpp>
#include <kprint/core/sink.hpp>
#include <kprint/sinks/callback_sink.hpp>
#include <kprint/sinks/file_sink.hpp>
#include <kprint/sinks/null_sink.hpp>
#include <string>
#include <test_doubles/test_double_sink.hpp>

TEST_CASE("active_sink defaults to stdout", "[sink]")
{
  auto *stdout_sink = dynamic_cast<kprint::sinks::file_sink *>(&kprint::active_sink());

  REQUIRE(stdout_sink != nullptr);
  CHECK(stdout_sink->stream() == stdout);
}

TEST_CASE("install_sink swaps the active sink", "[sink]")
{
  kprint::test::test_double_sink sink;

  auto &previous = kprint::install_sink(sink);
  CHECK(&kprint::active_sink() == &sink);

  auto &replaced = kprint::install_sink(previous);
  CHECK(&replaced == &sink);
  CHECK(&kprint::active_sink() == &previous);
}

TEST_CASE("scoped_sink restores the previous sink", "[sink]")
{
  auto *original = &kprint::active_sink();
  kprint::test::test_double_sink outer;
  kprint::test::test_double_sink inner;

  {
    const kprint::scoped_sink outer_guard{ outer };
    REQUIRE(&kprint::active_sink() == &outer);

    {
      const kprint::scoped_sink inner_guard{ inner };
      REQUIRE(&kprint::active_sink() == &inner);
    }

    CHECK(&kprint::active_sink() == &outer);
  }

  CHECK(&kprint::active_sink() == original);
}

TEST_CASE("null_sink accepts everything", "[sink][null_sink]")
{
  kprint::sinks::null_sink sink;

  CHECK_FALSE(sink.write("anything"));
  CHECK_FALSE(sink.write(""));
}

TEST_CASE("callback_sink forwards writes and results", "[sink][callback_sink]")
{
  SECTION("data reaches the callback")
  {
    std::string received;
    kprint::sinks::callback_sink sink([&received](std::string_view data) {
      received += data;
      return boost::system::error_code{};
    });

    CHECK_FALSE(sink.write("uart "));
    CHECK_FALSE(sink.write("ready"));
    CHECK(received == "uart ready");
  }

  SECTION("callback failure is returned")
  {
    kprint::sinks::callback_sink sink([](std::string_view /*data*/) {
      return boost::system::errc::make_error_code(boost::system::errc::device_or_resource_busy);
    });

    CHECK(sink.write("x") == boost::system::errc::device_or_resource_busy);
  }

  SECTION("empty callback reports not connected")
  {
    kprint::sinks::callback_sink sink(nullptr);

    CHECK(sink.write("x") == boost::system::errc::not_connected);
  }
}
