#include <kprint/core/buffered_formatter.hpp>

#include <iterator>

namespace kprint::core {

auto buffered_formatter::write_fragment(std::string_view text) -> boost::system::error_code
{
  buffer_.append(text.data(), text.data() + text.size());
  return {};
}

auto buffered_formatter::write_newline() -> boost::system::error_code
{
  buffer_.push_back('\n');
  return {};
}

auto buffered_formatter::vwrite_fmt(fmt::string_view format_string, fmt::format_args args)
  -> boost::system::error_code
{
  fmt::vformat_to(std::back_inserter(buffer_), format_string, args);
  return {};
}

auto buffered_formatter::flush() -> boost::system::error_code
{
  auto result = sink_->write(pending());
  buffer_.clear();
  return result;
}

}// namespace kprint::core
