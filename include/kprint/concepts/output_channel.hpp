#pragma once

#include <boost/system/error_code.hpp>
#include <concepts>
#include <fmt/core.h>
#include <string_view>

namespace kprint::concepts {

/**
 * @brief Concept for the two ways a message can travel to the sink.
 *
 * A channel accepts literal fragments, newlines and fmt-formatted output, and
 * flush() ends the message. Every operation reports the sink's result; the
 * entry points are responsible for discarding it.
 */
template<typename T>
concept output_channel =
  requires(T channel, std::string_view text, fmt::string_view format_string, fmt::format_args args) {
    { channel.write_fragment(text) } -> std::same_as<boost::system::error_code>;
    { channel.write_newline() } -> std::same_as<boost::system::error_code>;
    { channel.vwrite_fmt(format_string, args) } -> std::same_as<boost::system::error_code>;
    { channel.flush() } -> std::same_as<boost::system::error_code>;
  };

}// namespace kprint::concepts
