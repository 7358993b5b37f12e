#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "espflasher/common/utility.hpp"
#include "espflasher/serial/slip.hpp"

namespace espflasher {

inline constexpr std::size_t PACKET_HEADER_SIZE      = 8;
inline constexpr std::uint8_t REQUEST_DIRECTION      = 0x00;
inline constexpr std::uint8_t RESPONSE_DIRECTION     = 0x01;
inline constexpr std::size_t DEFAULT_STATUS_LENGTH   = 2;  // ESP8266 ROM and stub loaders
inline constexpr std::size_t ESP32_ROM_STATUS_LENGTH = 4;

/**
 * @brief Error codes the loader puts in the second status byte. 0x05 - 0x0B come from the ROM, 0xC0 and above from
 *        the stub loader.
 */
inline constexpr std::string_view describe(std::uint8_t const t_err) noexcept {
  switch (t_err) {
    case 0x05:
      return "Received message is invalid (parameters or length field is invalid)";
    case 0x06:
      return "Failed to act on received message";
    case 0x07:
      return "Invalid CRC in message";
    case 0x08:
      return "Mismatch in the 8-bit CRC between the value ROM loader reads back and the data read from flash";
    case 0x09:
      return "SPI read failed";
    case 0x0A:
      return "SPI read request length is too long";
    case 0x0B:
      return "Deflate error (compressed uploads only)";
    case 0xC0:
      return "Bad data length";
    case 0xC1:
      return "Bad data checksum";
    case 0xC2:
      return "Bad block size";
    case 0xC3:
      return "Invalid command";
    case 0xC4:
      return "SPI operation failed";
    case 0xC5:
      return "SPI unlock failed";
    case 0xC6:
      return "Not in flash mode";
    case 0xC7:
      return "Inflate error";
    case 0xC8:
      return "Not enough data";
    case 0xC9:
      return "Too much data";
    case 0xFF:
      return "Command not implemented";
    default:
      return "Unknown error";
  }
}

// Codes with which the loader refuses a write because of secure boot / secure download mode, retrying is pointless
inline constexpr std::array<std::uint8_t, 2> SECURE_BOOT_REJECTION_CODES{
  0x06,  // ROM in secure download mode refuses to act on the request
  0xC5,  // flash is write protected and cannot be unlocked
};

struct StatusCode {
  enum class Kind { Success, GenericFailure, SecureBootRejected };

  Kind kind_         = Kind::Success;
  std::uint8_t code_ = 0;

  [[nodiscard]] constexpr bool ok() const noexcept { return this->kind_ == Kind::Success; }
  [[nodiscard]] constexpr bool is_policy_rejection() const noexcept { return this->kind_ == Kind::SecureBootRejected; }

  [[nodiscard]] static constexpr StatusCode classify(std::uint8_t t_status, std::uint8_t t_err) noexcept {
    if (t_status == 0) {
      return StatusCode{Kind::Success, 0};
    }

    if (std::find(SECURE_BOOT_REJECTION_CODES.begin(), SECURE_BOOT_REJECTION_CODES.end(), t_err) !=
        SECURE_BOOT_REJECTION_CODES.end()) {
      return StatusCode{Kind::SecureBootRejected, t_err};
    }

    return StatusCode{Kind::GenericFailure, t_err};
  }

  friend constexpr bool operator==(StatusCode const&, StatusCode const&) = default;
};

struct Response {
  std::uint8_t direction_ = RESPONSE_DIRECTION;
  std::uint8_t command_;            // request command
  std::uint16_t size_;              // data field size, status bytes included
  std::uint32_t value_;             // read_reg command result
  std::vector<std::uint8_t> data_;  // data field without the status bytes
  StatusCode status_;
};

struct MalformedResponse {
  std::string reason_;
};

using ParseResult = std::variant<Response, MalformedResponse>;

/**
 * @brief Build the request frame for a command and SLIP encode it. The command object provides the payload via
 *        operator(), commands carrying data to be written provide check_sum() as well, computed over that data only.
 */
[[nodiscard]] auto generate_packet(auto const& t_cmd) {
  auto const data_content = t_cmd();
  auto const size_of_data = std::size(data_content);

  std::uint32_t const check_sum = [&]() -> std::uint32_t {
    if constexpr (requires { t_cmd.check_sum(); }) {
      return t_cmd.check_sum();
    }

    return 0;
  }();

  std::vector<std::uint8_t> raw{
    REQUEST_DIRECTION,
    t_cmd.COMMAND_BYTE,
    static_cast<std::uint8_t>(size_of_data & 0xFF),
    static_cast<std::uint8_t>(size_of_data >> 8),
  };
  raw.reserve(PACKET_HEADER_SIZE + size_of_data);

  auto const check_sum_arr = word_to_byte_array(check_sum);
  raw.insert(raw.end(), check_sum_arr.begin(), check_sum_arr.end());
  std::transform(std::begin(data_content), std::end(data_content), std::back_inserter(raw), to_byte);

  return SLIP::encode(raw);
}

/**
 * @brief Parse an escaped frame body handed out by FrameAssembler. Pure function, retry and timeout policy is up to
 *        the caller.
 *
 * @param t_frame          frame body, END delimiters are allowed but not required
 * @param t_status_length  number of status bytes the loader appends to the data field (2 or 4)
 */
[[nodiscard]] inline ParseResult parse_response(std::span<std::uint8_t const> t_frame,
                                                std::size_t const t_status_length = DEFAULT_STATUS_LENGTH) {
  auto const decoded = SLIP::decode(t_frame);
  if (decoded.status_ != SLIP::DecodeStatus::Complete) {
    return MalformedResponse{"invalid escape sequence"};
  }

  auto const& vec = decoded.bytes_;
  if (vec.size() < PACKET_HEADER_SIZE + t_status_length) {
    return MalformedResponse{fmt::format("frame too short ({} byte)", vec.size())};
  }

  if (vec.front() != RESPONSE_DIRECTION) {
    return MalformedResponse{fmt::format("unexpected direction byte {:#04x}", vec.front())};
  }

  auto const data_size = static_cast<std::uint16_t>(vec[3] << 8 | vec[2]);
  if (vec.size() != PACKET_HEADER_SIZE + data_size) {
    return MalformedResponse{
      fmt::format("length field says {} byte, frame carries {}", data_size, vec.size() - PACKET_HEADER_SIZE)};
  }

  if (data_size < t_status_length) {
    return MalformedResponse{fmt::format("data field of {} byte cannot hold the status", data_size)};
  }

  auto const status_byte_idx = vec.size() - t_status_length;

  Response resp;
  resp.command_ = vec[1];
  resp.size_    = data_size;
  resp.value_   = byte_array_to_word(vec.begin() + 4);
  resp.data_    = std::vector<std::uint8_t>(vec.begin() + PACKET_HEADER_SIZE, vec.begin() + status_byte_idx);
  resp.status_  = StatusCode::classify(vec[status_byte_idx], vec[status_byte_idx + 1]);

  return resp;
}

}  // namespace espflasher

template <>
struct fmt::formatter<espflasher::StatusCode> : fmt::formatter<std::string_view> {
  auto format(espflasher::StatusCode const& t_status, format_context& t_ctx) const {
    using Kind = espflasher::StatusCode::Kind;
    switch (t_status.kind_) {
      case Kind::Success:
        return fmt::format_to(t_ctx.out(), "success");
      case Kind::SecureBootRejected:
        return fmt::format_to(t_ctx.out(), "rejected by secure boot ({:#04x}: {})", t_status.code_,
                              espflasher::describe(t_status.code_));
      case Kind::GenericFailure:
        break;
    }

    return fmt::format_to(t_ctx.out(), "failed ({:#04x}: {})", t_status.code_, espflasher::describe(t_status.code_));
  }
};
