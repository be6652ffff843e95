#pragma once

#include <boost/system/error_code.hpp>
#include <string_view>

namespace kprint {

/**
 * @brief Low-level output destination behind every print, println and echo.
 *
 * Implementations wrap whatever actually transmits characters (serial port,
 * framebuffer console, log ring, stdout). A sink must tolerate being called
 * from every context diagnostics are issued from and must do its own
 * serialization; kprint adds no lock around write().
 */
class sink
{
public:
  sink() = default;
  sink(const sink &) = delete;
  sink(sink &&) = delete;
  auto operator=(const sink &) -> sink & = delete;
  auto operator=(sink &&) -> sink & = delete;
  virtual ~sink() = default;

  /**
   * @brief Writes raw characters.
   *
   * @param data Characters to transmit, possibly empty
   * @return Empty error code on success, the failure otherwise
   */
  virtual auto write(std::string_view data) -> boost::system::error_code = 0;
};

/**
 * @brief Makes a sink the process-wide destination for the entry points.
 *
 * The sink must outlive its installation. Installing does not wait for writes
 * already in progress on the previous sink.
 *
 * @param target Sink to install
 * @return The previously active sink
 */
auto install_sink(sink &target) -> sink &;

/**
 * @brief Returns the process-wide sink (stdout until something is installed).
 */
[[nodiscard]] auto active_sink() -> sink &;

/**
 * @brief Installs a sink for the lifetime of this object and restores the
 * previous one on destruction.
 */
class scoped_sink
{
public:
  explicit scoped_sink(sink &target) : previous_(&install_sink(target)) {}

  scoped_sink(const scoped_sink &) = delete;
  scoped_sink(scoped_sink &&) = delete;
  auto operator=(const scoped_sink &) -> scoped_sink & = delete;
  auto operator=(scoped_sink &&) -> scoped_sink & = delete;

  ~scoped_sink() { install_sink(*previous_); }

private:
  sink *previous_;
};

}// namespace kprint
