#include <kprint/core/sink.hpp>
#include <kprint/sinks/file_sink.hpp>

#include <atomic>
#include <cstdio>
#include <spdlog/spdlog.h>

namespace kprint {

namespace {

  auto stdout_sink() -> sink &
  {
    static sinks::file_sink instance{ stdout };
    return instance;
  }

  auto active_slot() -> std::atomic<sink *> &
  {
    static std::atomic<sink *> slot{ &stdout_sink() };
    return slot;
  }

}// namespace

auto install_sink(sink &target) -> sink &
{
  auto *previous = active_slot().exchange(&target, std::memory_order_acq_rel);
  spdlog::debug("kprint: installed sink {}", fmt::ptr(&target));
  return *previous;
}

auto active_sink() -> sink & { return *active_slot().load(std::memory_order_acquire); }

}// namespace kprint
