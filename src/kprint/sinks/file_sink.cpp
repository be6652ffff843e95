#include <kprint/sinks/file_sink.hpp>

#include <boost/system/error_code.hpp>
#include <cerrno>

namespace kprint::sinks {

namespace {

  auto last_stream_error() -> boost::system::error_code
  {
    const int error = errno;
    if (error != 0) { return { error, boost::system::generic_category() }; }
    return boost::system::errc::make_error_code(boost::system::errc::io_error);
  }

}// namespace

auto file_sink::write(std::string_view data) -> boost::system::error_code
{
  if (stream_ == nullptr) { return boost::system::errc::make_error_code(boost::system::errc::bad_file_descriptor); }

  errno = 0;
  if (not data.empty() and std::fwrite(data.data(), 1, data.size(), stream_) != data.size()) {
    return last_stream_error();
  }
  if (std::fflush(stream_) != 0) { return last_stream_error(); }

  return {};
}

}// namespace kprint::sinks
