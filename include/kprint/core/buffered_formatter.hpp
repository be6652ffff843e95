#pragma once

#include <kprint/core/sink.hpp>

#include <boost/system/error_code.hpp>
#include <fmt/format.h>
#include <string_view>

namespace kprint::core {

/**
 * @brief Builds a whole message in memory and writes it with one sink call.
 *
 * Writing into the buffer never fails; only flush() reaches the sink. The
 * buffer grows through the global allocator and allocation failures are not
 * caught here.
 */
class buffered_formatter
{
public:
  explicit buffered_formatter(sink &target) noexcept : sink_(&target) {}

  auto write_fragment(std::string_view text) -> boost::system::error_code;
  auto write_newline() -> boost::system::error_code;
  auto vwrite_fmt(fmt::string_view format_string, fmt::format_args args) -> boost::system::error_code;

  /**
   * @brief Writes the buffered message to the sink in a single call and
   * empties the buffer.
   *
   * The write happens even for an empty message, so every flush is exactly
   * one sink call.
   *
   * @return Result of the sink write
   */
  auto flush() -> boost::system::error_code;

  [[nodiscard]] auto pending() const -> std::string_view { return { buffer_.data(), buffer_.size() }; }

private:
  sink *sink_;
  fmt::memory_buffer buffer_;
};

}// namespace kprint::core
