#pragma once

#include <kprint/core/sink.hpp>

#include <mutex>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>
#include <string_view>
#include <tuple>

namespace kprint::sinks {

/**
 * @brief spdlog sink that writes formatted log records through the active
 * kprint sink.
 *
 * Each record is formatted by the logger's formatter (pattern plus trailing
 * end-of-line) and handed to the kprint sink in a single write. Write failures
 * are dropped like every other kprint write.
 */
template<typename Mutex> class log_bridge_sink final : public spdlog::sinks::base_sink<Mutex>
{
protected:
  auto sink_it_(const spdlog::details::log_msg &msg) -> void override
  {
    spdlog::memory_buf_t formatted;
    spdlog::sinks::base_sink<Mutex>::formatter_->format(msg, formatted);

    std::ignore = active_sink().write(std::string_view(formatted.data(), formatted.size()));
  }

  auto flush_() -> void override {}
};

using log_bridge_sink_mt = log_bridge_sink<std::mutex>;
using log_bridge_sink_st = log_bridge_sink<spdlog::details::null_mutex>;

}// namespace kprint::sinks
