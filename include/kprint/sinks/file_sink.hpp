#pragma once

#include <kprint/core/sink.hpp>

#include <cstdio>

namespace kprint::sinks {

/**
 * @brief Sink over a C stdio stream.
 *
 * Each write is an fwrite followed by fflush so that output is not held back
 * in the stream buffer when the process dies. The stream is borrowed, not
 * closed.
 */
class file_sink final : public sink
{
public:
  explicit file_sink(std::FILE *stream) noexcept : stream_(stream) {}

  auto write(std::string_view data) -> boost::system::error_code override;

  [[nodiscard]] auto stream() const noexcept -> std::FILE * { return stream_; }

private:
  std::FILE *stream_;
};

}// namespace kprint::sinks
