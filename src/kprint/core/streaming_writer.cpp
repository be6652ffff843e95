#include <kprint/core/streaming_writer.hpp>

#include <array>
#include <cstddef>
#include <iterator>

namespace kprint::core {

namespace {

  // Collects formatted characters and hands them to the sink one full
  // fragment at a time. Once a write fails the rest of the message is dropped.
  class fragment_stage
  {
  public:
    explicit fragment_stage(sink &target) noexcept : sink_(&target) {}

    auto push(char character) -> void
    {
      if (error_) { return; }
      buffer_.at(size_++) = character;
      if (size_ == buffer_.size()) { emit(); }
    }

    [[nodiscard]] auto finish() -> boost::system::error_code
    {
      emit();
      return error_;
    }

  private:
    auto emit() -> void
    {
      if (size_ == 0 or error_) { return; }
      error_ = sink_->write(std::string_view(buffer_.data(), size_));
      size_ = 0;
    }

    sink *sink_;
    std::array<char, streaming_writer::fragment_capacity> buffer_{};
    std::size_t size_ = 0;
    boost::system::error_code error_;
  };

  class fragment_iterator
  {
  public:
    using iterator_category = std::output_iterator_tag;
    using value_type = void;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = void;

    explicit fragment_iterator(fragment_stage &stage) noexcept : stage_(&stage) {}

    auto operator=(char character) -> fragment_iterator &
    {
      stage_->push(character);
      return *this;
    }

    auto operator*() -> fragment_iterator & { return *this; }
    auto operator++() -> fragment_iterator & { return *this; }
    auto operator++(int) -> fragment_iterator { return *this; }

  private:
    fragment_stage *stage_;
  };

}// namespace

auto streaming_writer::write_fragment(std::string_view text) -> boost::system::error_code
{
  if (text.empty()) { return {}; }
  return sink_->write(text);
}

auto streaming_writer::write_newline() -> boost::system::error_code { return sink_->write("\n"); }

auto streaming_writer::vwrite_fmt(fmt::string_view format_string, fmt::format_args args) -> boost::system::error_code
{
  fragment_stage stage{ *sink_ };
  fmt::vformat_to(fragment_iterator{ stage }, format_string, args);
  return stage.finish();
}

}// namespace kprint::core
