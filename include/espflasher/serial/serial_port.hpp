#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/asio/high_resolution_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>
#include <boost/asio/write.hpp>

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sys/ioctl.h>
#include <termios.h>

#include "espflasher/common/utility.hpp"
#include "espflasher/serial/reset_wiring.hpp"
#include "espflasher/serial/transport.hpp"

namespace espflasher {

/**
 * @brief Transport over a POSIX serial device. EN and boot select are driven through DTR / RTS according to the
 *        board's ResetWiring, the USB-UART auto reset circuit unless told otherwise.
 */
class SerialPort {
  static constexpr std::size_t READ_BUFFER_SIZE = 4096;

  enum class Set : unsigned long { High = TIOCMBIC, Low = TIOCMBIS };

  [[nodiscard]] bool set_line(int t_line, Set const t_set) noexcept {
    int out_val = t_line;
    return ioctl(this->port_.native_handle(), to_underlying(t_set), &out_val) == 0;
  }

  std::string device_;
  ResetWiring wiring_;
  boost::asio::io_context context_{};
  boost::asio::serial_port port_{context_};

 public:
  explicit SerialPort(std::string_view const t_device, ResetWiring const t_wiring = ResetWiring::AutoReset)
    : device_{t_device}, wiring_{t_wiring} {}

  SerialPort(SerialPort const&)            = delete;
  SerialPort& operator=(SerialPort const&) = delete;

  ControlLines open(std::uint32_t const t_baud) {
    boost::system::error_code ec;
    this->port_.open(this->device_, ec);
    if (ec) {
      throw TransportError(fmt::format("Cannot open {}: {}", this->device_, ec.message()));
    }

    using boost::asio::serial_port_base;
    try {
      this->port_.set_option(serial_port_base::baud_rate(t_baud));
      this->port_.set_option(serial_port_base::character_size());
      this->port_.set_option(serial_port_base::parity{serial_port_base::parity::none});
      this->port_.set_option(serial_port_base::stop_bits{serial_port_base::stop_bits::one});
      this->port_.set_option(serial_port_base::flow_control{serial_port_base::flow_control::none});
    } catch (boost::system::system_error const& t_e) {
      throw TransportError(fmt::format("Cannot configure {}: {}", this->device_, t_e.what()));
    }
    spdlog::info("Connection Success: {}, baudrate: {}, 8 bits, parity: none, flow_control: none", this->device_,
                 t_baud);

    int modem_bits = 0;
    if (ioctl(this->port_.native_handle(), TIOCMGET, &modem_bits) != 0) {
      spdlog::warn("{} does not expose modem control lines, automatic reset unavailable", this->device_);
      return ControlLines::Unsupported;
    }

    return ControlLines::Supported;
  }

  void close() noexcept {
    if (this->port_.is_open()) {
      boost::system::error_code ec;
      this->port_.close(ec);
      if (ec) {
        spdlog::warn("Closing {}: {}", this->device_, ec.message());
      }
    }
  }

  /**
   * @brief Wait up to t_timeout for whatever the chip sends. On timeout the pending read is cancelled before it
   *        completed, hence no byte is taken out of the driver's buffer.
   */
  std::optional<std::vector<std::uint8_t>> read_chunk(std::chrono::milliseconds const t_timeout) {
    std::vector<std::uint8_t> buffer(READ_BUFFER_SIZE);

    boost::asio::high_resolution_timer timeout_timer{this->context_, t_timeout};
    timeout_timer.async_wait([this](auto t_err) mutable {
      if (not t_err) {
        this->port_.cancel();
      }
    });

    std::size_t byte_read = 0;
    boost::system::error_code read_err;
    this->port_.async_read_some(boost::asio::buffer(buffer), [&](auto t_err, auto t_byte_read) mutable {
      read_err  = t_err;
      byte_read = t_byte_read;
      timeout_timer.cancel();
    });

    this->context_.run();
    this->context_.restart();

    if (byte_read != 0) {
      buffer.resize(byte_read);
      return buffer;
    }

    if (read_err and read_err != boost::asio::error::operation_aborted) {
      throw TransportError(fmt::format("Reading {} failed: {}", this->device_, read_err.message()));
    }

    return std::nullopt;
  }

  void write(std::span<std::uint8_t const> t_bytes) {
    boost::system::error_code ec;
    boost::asio::write(this->port_, boost::asio::buffer(t_bytes.data(), t_bytes.size()), ec);
    if (ec) {
      throw TransportError(fmt::format("Writing {} failed: {}", this->device_, ec.message()));
    }
  }

  bool set_control_lines(bool const t_en, bool const t_boot) noexcept {
    bool all_set = true;
    for (auto const& [line, high] : modem_levels(this->wiring_, t_en, t_boot)) {
      auto const modem_bit = line == ModemLine::Dtr ? TIOCM_DTR : TIOCM_RTS;
      all_set              = this->set_line(modem_bit, high ? Set::High : Set::Low) and all_set;
    }
    return all_set;
  }

  void flush_input() noexcept { tcflush(this->port_.native_handle(), TCIFLUSH); }

  void delay(std::chrono::milliseconds const t_duration) {
    boost::asio::high_resolution_timer sleep_timer(this->context_);
    sleep_timer.expires_after(t_duration);
    sleep_timer.wait();
  }

  ~SerialPort() { this->close(); }
};

static_assert(Transport<SerialPort>);

}  // namespace espflasher
