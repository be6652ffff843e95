#pragma once

#include <kprint/core/sink.hpp>

#include <boost/system/error_code.hpp>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace kprint::test {

class test_double_sink final : public kprint::sink
{
public:
  auto write(std::string_view data) -> boost::system::error_code override
  {
    ++write_attempts_;
    if (should_fail_write_) { return boost::system::errc::make_error_code(boost::system::errc::io_error); }
    if (fail_after_writes_ > 0 and writes_.size() >= fail_after_writes_) {
      return boost::system::errc::make_error_code(boost::system::errc::no_space_on_device);
    }
    writes_.emplace_back(data);
    return {};
  }

  auto set_write_failure(bool fail) -> void { should_fail_write_ = fail; }

  /// Accept this many writes, then fail every following one.
  auto set_fail_after_writes(std::size_t count) -> void { fail_after_writes_ = count; }

  [[nodiscard]] auto get_writes() const -> const std::vector<std::string> & { return writes_; }
  [[nodiscard]] auto get_write_attempts() const -> std::size_t { return write_attempts_; }

  [[nodiscard]] auto get_output() const -> std::string
  {
    return std::accumulate(writes_.begin(), writes_.end(), std::string{});
  }

  auto reset() -> void
  {
    writes_.clear();
    write_attempts_ = 0;
    should_fail_write_ = false;
    fail_after_writes_ = 0;
  }

private:
  std::vector<std::string> writes_;
  std::size_t write_attempts_ = 0;
  std::size_t fail_after_writes_ = 0;
  bool should_fail_write_ = false;
};

}// namespace kprint::test
