#pragma once

#include <kprint/concepts/output_channel.hpp>
#include <kprint/config.hpp>
#include <kprint/core/buffered_formatter.hpp>
#include <kprint/core/sink.hpp>
#include <kprint/core/streaming_writer.hpp>

#include <fmt/core.h>
#include <tuple>
#include <type_traits>
#include <utility>

namespace kprint {

/**
 * @brief Channel behind print, println and echo, fixed by KPRINT_BUFFERED_MODE.
 */
using default_channel = std::conditional_t<cmake::buffered_mode, core::buffered_formatter, core::streaming_writer>;

static_assert(concepts::output_channel<core::streaming_writer>);
static_assert(concepts::output_channel<core::buffered_formatter>);

/**
 * @brief Formats a message onto a channel and ends it, ignoring sink failures.
 *
 * @param channel Channel to write through
 * @param format_string Format string in fmt library format
 * @param args Arguments to format into the string
 */
template<concepts::output_channel Channel, typename... Args>
auto print_to(Channel &channel, fmt::format_string<Args...> format_string, Args &&...args) -> void
{
  std::ignore = channel.vwrite_fmt(format_string, fmt::make_format_args(args...));
  std::ignore = channel.flush();
}

/**
 * @brief Same as print_to followed by exactly one newline.
 *
 * The newline is attempted even when the formatted part failed to write.
 */
template<concepts::output_channel Channel, typename... Args>
auto println_to(Channel &channel, fmt::format_string<Args...> format_string, Args &&...args) -> void
{
  std::ignore = channel.vwrite_fmt(format_string, fmt::make_format_args(args...));
  std::ignore = channel.write_newline();
  std::ignore = channel.flush();
}

template<concepts::output_channel Channel> auto println_to(Channel &channel) -> void
{
  std::ignore = channel.write_newline();
  std::ignore = channel.flush();
}

/**
 * @brief Prints to the active sink without a trailing newline.
 *
 * Never fails and never throws because of the sink; a failed write is lost.
 */
template<typename... Args> auto print(fmt::format_string<Args...> format_string, Args &&...args) -> void
{
  default_channel channel{ active_sink() };
  print_to(channel, format_string, std::forward<Args>(args)...);
}

/**
 * @brief Prints to the active sink followed by a single newline.
 */
template<typename... Args> auto println(fmt::format_string<Args...> format_string, Args &&...args) -> void
{
  default_channel channel{ active_sink() };
  println_to(channel, format_string, std::forward<Args>(args)...);
}

/**
 * @brief Prints a lone newline to the active sink.
 */
inline auto println() -> void
{
  default_channel channel{ active_sink() };
  println_to(channel);
}

}// namespace kprint
