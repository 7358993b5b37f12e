#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace espflasher {

struct SLIP {
  static constexpr std::uint8_t SLIP_END     = 0xC0;
  static constexpr std::uint8_t SLIP_ESC     = 0xDB;
  static constexpr std::uint8_t SLIP_ESC_END = 0xDC;
  static constexpr std::uint8_t SLIP_ESC_ESC = 0xDD;

  enum class DecodeStatus {
    Complete,
    Truncated,  // input ended right after an ESC byte
    Malformed,  // ESC followed by something other than ESC_END or ESC_ESC
  };

  struct DecodeResult {
    std::vector<std::uint8_t> bytes_;
    DecodeStatus status_ = DecodeStatus::Complete;
  };

  [[nodiscard]] static std::vector<std::uint8_t> encode(std::span<std::uint8_t const> t_raw) {
    std::vector<std::uint8_t> packet;
    packet.reserve(t_raw.size() + 2);  // 2: initial END and end END, at least
    packet.push_back(SLIP_END);
    for (auto byte : t_raw) {
      switch (byte) {
        case SLIP_END:
          packet.push_back(SLIP_ESC);
          packet.push_back(SLIP_ESC_END);
          break;
        case SLIP_ESC:
          packet.push_back(SLIP_ESC);
          packet.push_back(SLIP_ESC_ESC);
          break;
        default:
          packet.push_back(byte);
          break;
      }
    }

    packet.push_back(SLIP_END);
    return packet;
  }

  /**
   * @brief Inverse of encode. END bytes are dropped wherever they appear, so the input can be a complete delimited
   *        span with or without its delimiters. Malformed escapes are passed through as-is and reported in status_.
   */
  [[nodiscard]] static DecodeResult decode(std::span<std::uint8_t const> t_wire) {
    DecodeResult ret;
    ret.bytes_.reserve(t_wire.size());

    bool escaped = false;
    for (auto const curr : t_wire) {
      if (escaped) {
        escaped = false;
        if (curr == SLIP_ESC_END) {
          ret.bytes_.push_back(SLIP_END);
        } else if (curr == SLIP_ESC_ESC) {
          ret.bytes_.push_back(SLIP_ESC);
        } else {
          ret.status_ = DecodeStatus::Malformed;
          ret.bytes_.push_back(SLIP_ESC);
          if (curr != SLIP_END) {
            ret.bytes_.push_back(curr);
          }
        }
      } else if (curr == SLIP_ESC) {
        escaped = true;
      } else if (curr != SLIP_END) {
        ret.bytes_.push_back(curr);
      }
    }

    if (escaped and ret.status_ == DecodeStatus::Complete) {
      ret.status_ = DecodeStatus::Truncated;
    }

    return ret;
  }
};

/**
 * @brief Collects raw reads until a complete END ... END span is available. A typical read may look like following:
 *
 *        DB DC C0 XX |  C0  01 08 04 00 07 07 12 20 DB DC 00 00 C0 | XX C0 XX XX
 *        ^^^^^^^^^^^ |  ^^                          ^^ ^^       ^^ | ^^^^^^^^^^^
 *    redundant bytes | END                         ESC ESC_END END | start of next frame
 *
 *        Bytes before the first END are line noise and get dropped, the trailing part is kept for the next call.
 *        Spans are not validated here, the packet layer rejects the ones that are not responses.
 */
class FrameAssembler {
  std::vector<std::uint8_t> pending_;
  bool in_frame_ = false;
  std::deque<std::vector<std::uint8_t>> frames_;

 public:
  void feed(std::span<std::uint8_t const> t_bytes) {
    for (auto const byte : t_bytes) {
      if (byte != SLIP::SLIP_END) {
        if (this->in_frame_) {
          this->pending_.push_back(byte);
        }
        continue;
      }

      // every END closes the running span and opens the next one, so a stray END in line noise costs us at most
      // one garbage span instead of the real frame behind it
      if (not this->pending_.empty()) {
        this->frames_.push_back(std::move(this->pending_));
        this->pending_.clear();
      }
      this->in_frame_ = true;
    }
  }

  /**
   * @return escaped body of the oldest complete frame, without its END delimiters
   */
  [[nodiscard]] std::optional<std::vector<std::uint8_t>> next_frame() {
    if (this->frames_.empty()) {
      return std::nullopt;
    }

    auto frame = std::move(this->frames_.front());
    this->frames_.pop_front();
    return frame;
  }

  [[nodiscard]] bool has_partial() const noexcept { return this->in_frame_ and not this->pending_.empty(); }

  void reset() noexcept {
    this->pending_.clear();
    this->frames_.clear();
    this->in_frame_ = false;
  }
};

}  // namespace espflasher
