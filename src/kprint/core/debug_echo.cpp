#include <kprint/core/debug_echo.hpp>

namespace kprint {

auto echo_location(const echo_site &site) -> void
{
  default_channel channel{ active_sink() };
  echo_location_to(channel, site);
}

}// namespace kprint
