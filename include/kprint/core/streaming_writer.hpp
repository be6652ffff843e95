#pragma once

#include <kprint/core/sink.hpp>

#include <boost/system/error_code.hpp>
#include <cstddef>
#include <fmt/core.h>
#include <string_view>

namespace kprint::core {

/**
 * @brief Forwards output to the sink as it is produced.
 *
 * Holds nothing but the sink. Formatted output passes through a fixed stack
 * area of fragment_capacity characters that is written out whenever it fills,
 * so a message of any length is printed without touching the heap. Fragments
 * of one message are separate sink writes and may interleave with other
 * writers of the same sink.
 */
class streaming_writer
{
public:
  static constexpr std::size_t fragment_capacity = 128;

  explicit streaming_writer(sink &target) noexcept : sink_(&target) {}

  /**
   * @brief Writes text to the sink in one call.
   */
  auto write_fragment(std::string_view text) -> boost::system::error_code;

  auto write_newline() -> boost::system::error_code;

  /**
   * @brief Formats into fragments and writes each one as soon as it is full.
   *
   * Stops writing after the first failed fragment and returns that failure.
   *
   * @param format_string fmt format string
   * @param args Type-erased format arguments
   */
  auto vwrite_fmt(fmt::string_view format_string, fmt::format_args args) -> boost::system::error_code;

  /**
   * @brief Nothing is ever held back, so this always succeeds.
   */
  auto flush() -> boost::system::error_code { return {}; }

private:
  sink *sink_;
};

}// namespace kprint::core
