#pragma once

#include <kprint/core/sink.hpp>

#include <boost/system/error_code.hpp>
#include <functional>
#include <utility>

namespace kprint::sinks {

/**
 * @brief Sink that hands every write to a callable.
 *
 * Lets a platform plug in its write primitive (UART register poke, hypervisor
 * call, framebuffer blit) without defining a sink subclass.
 */
class callback_sink final : public sink
{
public:
  using write_callback_t = std::function<boost::system::error_code(std::string_view)>;

  explicit callback_sink(write_callback_t write_callback) : write_callback_(std::move(write_callback)) {}

  auto write(std::string_view data) -> boost::system::error_code override
  {
    if (not write_callback_) { return boost::system::errc::make_error_code(boost::system::errc::not_connected); }
    return write_callback_(data);
  }

private:
  write_callback_t write_callback_;
};

}// namespace kprint::sinks
