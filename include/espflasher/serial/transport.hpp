#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace espflasher {

class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class ControlLines { Supported, Unsupported };

/**
 * @brief Byte oriented, half-duplex link to the chip.
 *
 *        read_chunk returns std::nullopt on timeout without consuming anything, and throws TransportError on I/O
 *        failure. set_control_lines drives EN and the boot select strapping pin (true = released / high) and returns
 *        false if the line could not be written.
 */
template <typename T>
concept Transport = requires(T t_transport, std::uint32_t t_baud, std::chrono::milliseconds t_duration,
                             std::span<std::uint8_t const> t_bytes, bool t_level) {
  { t_transport.open(t_baud) } -> std::same_as<ControlLines>;
  { t_transport.close() } noexcept;
  { t_transport.read_chunk(t_duration) } -> std::same_as<std::optional<std::vector<std::uint8_t>>>;
  t_transport.write(t_bytes);
  { t_transport.set_control_lines(t_level, t_level) } -> std::same_as<bool>;
  t_transport.flush_input();
  t_transport.delay(t_duration);
};

}  // namespace espflasher
