#pragma once

#include <kprint/core/sink.hpp>

namespace kprint::sinks {

/**
 * @brief Sink that accepts and discards everything.
 */
class null_sink final : public sink
{
public:
  auto write(std::string_view /*data*/) -> boost::system::error_code override { return {}; }
};

}// namespace kprint::sinks
