#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "espflasher/common/chip.hpp"
#include "espflasher/common/constants.hpp"
#include "espflasher/common/utility.hpp"
#include "espflasher/serial/boot_cmd.hpp"
#include "espflasher/serial/packet.hpp"
#include "espflasher/serial/reset.hpp"
#include "espflasher/serial/slip.hpp"
#include "espflasher/serial/transport.hpp"
#include "espflasher/session/config.hpp"
#include "espflasher/session/failure.hpp"
#include "espflasher/session/image.hpp"

namespace espflasher {

enum class SessionState {
  Disconnected,
  Connecting,
  Synced,
  RegionBegin,
  RegionTransfer,
  RegionComplete,
  Finalizing,
  Rebooted,
  Failed,
};

inline constexpr std::string_view to_string(SessionState const t_state) noexcept {
  switch (t_state) {
    case SessionState::Disconnected:
      return "Disconnected";
    case SessionState::Connecting:
      return "Connecting";
    case SessionState::Synced:
      return "Synced";
    case SessionState::RegionBegin:
      return "RegionBegin";
    case SessionState::RegionTransfer:
      return "RegionTransfer";
    case SessionState::RegionComplete:
      return "RegionComplete";
    case SessionState::Finalizing:
      return "Finalizing";
    case SessionState::Rebooted:
      return "Rebooted";
    case SessionState::Failed:
      return "Failed";
  }
  return "Unknown";
}

// A sync attempt timing out is the common case while the ROM is still booting, so it is a value, not an exception
enum class SyncResult { Responded, TimedOut, TransportFailed };

enum class ExchangeStatus { Responded, TimedOut, Malformed, TransportFailed };

// The ROM loader has no read-back, a verify request can only report that
enum class Verification { Unavailable };

struct Exchange {
  ExchangeStatus status_;
  Response response_{};
  std::string detail_{};
};

struct SentChunk {
  std::size_t region_;
  std::uint32_t sequence_;

  friend constexpr bool operator==(SentChunk const&, SentChunk const&) = default;
};

// (region index, bytes of that region written so far, region size)
using ProgressCallback = std::function<void(std::size_t, std::size_t, std::size_t)>;

/**
 * @brief Drives one chip through sync, per region begin / data / end, and the final reboot. The session owns its
 *        transport, and there is never more than one request in flight.
 *
 *        Every public operation resolves to a state, device and transport faults never escape as exceptions. Once in
 *        Rebooted or Failed the session is done, failure() tells why it failed.
 */
template <Transport T>
class Session {
  struct Step {
    std::string_view operation_;
    std::optional<std::size_t> region_     = std::nullopt;
    std::optional<std::uint32_t> sequence_ = std::nullopt;
    std::optional<std::uint32_t> offset_   = std::nullopt;
  };

  struct RetryPolicy {
    std::uint32_t attempts_;
    std::chrono::milliseconds timeout_;
    bool resync_between_attempts_;
  };

  using Outcome = std::variant<Response, FailureReason>;

  SessionConfig config_;
  T transport_;
  SessionState state_ = SessionState::Disconnected;
  std::optional<FailureReason> failure_;
  ControlLines lines_ = ControlLines::Unsupported;
  bool opened_        = false;
  FrameAssembler assembler_;
  std::size_t status_length_ = DEFAULT_STATUS_LENGTH;
  ChipInfo chip_             = get_chip_info(0);
  std::uint32_t sequence_    = 0;
  std::vector<SentChunk> history_;

  static FailureReason make_failure(FailureKind const t_kind, Step const& t_step, std::string t_cause,
                                    StatusCode const t_status = {}) {
    return FailureReason{t_kind,           t_step.operation_, t_step.region_, t_step.sequence_,
                         t_step.offset_,   t_status,          std::move(t_cause)};
  }

  SessionState fail(FailureReason t_reason) {
    spdlog::error("Session failed: {}", t_reason);
    this->failure_ = std::move(t_reason);
    this->state_   = SessionState::Failed;
    this->release();
    return this->state_;
  }

  void release() noexcept {
    if (this->opened_) {
      this->transport_.close();
      this->opened_ = false;
    }
  }

  [[nodiscard]] bool is_terminal() const noexcept {
    return this->state_ == SessionState::Failed or this->state_ == SessionState::Rebooted;
  }

  /**
   * @brief Send one command and wait for the response carrying the same command byte. Responses to other commands
   *        (e.g. the extra replies the ROM emits for SYNC) are skipped, malformed frames are remembered and reported
   *        only if nothing valid arrives before the deadline.
   */
  Exchange transceive(auto const& t_cmd, std::chrono::milliseconds const t_timeout) {
    auto const packet = generate_packet(t_cmd);
    try {
      this->transport_.flush_input();  // flush all data sent previously from ESP32
      this->assembler_.reset();
      this->transport_.write(packet);
    } catch (TransportError const& t_e) {
      return Exchange{ExchangeStatus::TransportFailed, {}, t_e.what()};
    }

    spdlog::debug("Sending Packet: {} ({:#04x}), {} byte", t_cmd.NAME, t_cmd.COMMAND_BYTE, packet.size());
    print_byte_stream(packet.begin(), packet.end());

    auto const deadline = std::chrono::steady_clock::now() + t_timeout;
    std::string malformed;
    while (true) {
      while (auto frame = this->assembler_.next_frame()) {
        auto result = parse_response(*frame, this->status_length_);
        if (auto* resp = std::get_if<Response>(&result); resp != nullptr) {
          if (resp->command_ == t_cmd.COMMAND_BYTE) {
            return Exchange{ExchangeStatus::Responded, std::move(*resp)};
          }

          spdlog::debug("Skipping response to {:#04x} while waiting for {}", resp->command_, t_cmd.NAME);
        } else {
          malformed = std::get<MalformedResponse>(result).reason_;
          spdlog::debug("Dropping malformed frame: {}", malformed);
          print_byte_stream(frame->begin(), frame->end());
        }
      }

      auto const now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        break;
      }

      auto const remaining =
        std::max(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now), std::chrono::milliseconds(1));
      std::optional<std::vector<std::uint8_t>> chunk;
      try {
        chunk = this->transport_.read_chunk(remaining);
      } catch (TransportError const& t_e) {
        return Exchange{ExchangeStatus::TransportFailed, {}, t_e.what()};
      }

      if (not chunk) {
        break;
      }
      this->assembler_.feed(*chunk);
    }

    if (not malformed.empty()) {
      return Exchange{ExchangeStatus::Malformed, {}, std::move(malformed)};
    }

    return Exchange{ExchangeStatus::TimedOut, {},
                    fmt::format("no response to {} within {}ms", t_cmd.NAME, t_timeout.count())};
  }

  SyncResult sync_once() {
    auto const exchange = this->transceive(command::SYNC{}, this->config_.sync_timeout_);
    switch (exchange.status_) {
      case ExchangeStatus::Responded:
        if (not exchange.response_.status_.ok()) {
          return SyncResult::TimedOut;
        }

        // the SYNC reply carries nothing but the status, which tells how many status bytes this loader appends
        this->status_length_ =
          exchange.response_.size_ >= ESP32_ROM_STATUS_LENGTH ? ESP32_ROM_STATUS_LENGTH : DEFAULT_STATUS_LENGTH;
        return SyncResult::Responded;
      case ExchangeStatus::TransportFailed:
        spdlog::error("SYNC: {}", exchange.detail_);
        return SyncResult::TransportFailed;
      case ExchangeStatus::TimedOut:
        [[fallthrough]];
      case ExchangeStatus::Malformed:
        break;
    }

    return SyncResult::TimedOut;
  }

  SyncResult sync_burst() {
    for (std::uint32_t attempt = 0; attempt < this->config_.sync_attempts_; ++attempt) {
      if (auto const result = this->sync_once(); result != SyncResult::TimedOut) {
        return result;
      }
    }
    return SyncResult::TimedOut;
  }

  // the ROM answers one SYNC with several replies, swallow the rest of them
  void drain() {
    while (this->transport_.read_chunk(this->config_.sync_drain_)) {
    }
    this->assembler_.reset();
  }

  /**
   * @brief Retry loop shared by every command of the flash sequence. Secure boot rejections and transport failures
   *        end the loop at once, anything else is retried after an increasing backoff.
   */
  Outcome exchange_with_retry(auto const& t_cmd, RetryPolicy const& t_policy, Step const& t_step) {
    FailureReason last = make_failure(FailureKind::Timeout, t_step, "no attempt made");

    for (std::uint32_t attempt = 0; attempt < t_policy.attempts_; ++attempt) {
      if (attempt != 0) {
        spdlog::warn("{}: retrying ({}/{}) after {}", t_cmd.NAME, attempt + 1, t_policy.attempts_, last.cause_);
        this->transport_.delay(std::chrono::milliseconds(this->config_.retry_backoff_ * attempt));

        bool const device_refused = last.kind_ == FailureKind::DeviceStatus;
        if (t_policy.resync_between_attempts_ or device_refused) {
          if (this->sync_burst() == SyncResult::TransportFailed) {
            return make_failure(FailureKind::Transport, t_step, "lost the port during recovery sync");
          }
        }
      }

      auto exchange = this->transceive(t_cmd, t_policy.timeout_);
      switch (exchange.status_) {
        case ExchangeStatus::Responded: {
          auto const status = exchange.response_.status_;
          if (status.ok()) {
            return std::move(exchange.response_);
          }

          if (status.is_policy_rejection()) {
            return make_failure(FailureKind::SecureBootRejected, t_step,
                                "the loader refuses to write this region, retrying cannot change that", status);
          }

          last = make_failure(FailureKind::DeviceStatus, t_step, fmt::format("{}", status), status);
          break;
        }
        case ExchangeStatus::TimedOut:
          last = make_failure(FailureKind::Timeout, t_step, std::move(exchange.detail_));
          break;
        case ExchangeStatus::Malformed:
          last = make_failure(FailureKind::Malformed, t_step, std::move(exchange.detail_));
          break;
        case ExchangeStatus::TransportFailed:
          return make_failure(FailureKind::Transport, t_step, std::move(exchange.detail_));
      }
    }

    last.cause_ = fmt::format("{} (gave up after {} attempts)", last.cause_, t_policy.attempts_);
    return last;
  }

  std::optional<FailureReason> prepare_flash() {
    if (this->config_.detect_chip_) {
      auto const exchange =
        this->transceive(command::READ_REG<CHIP_DETECT_MAGIC_REG>{}, this->config_.command_timeout_);
      if (exchange.status_ == ExchangeStatus::TransportFailed) {
        return make_failure(FailureKind::Transport, Step{command::READ_REG<CHIP_DETECT_MAGIC_REG>::NAME},
                            exchange.detail_);
      }

      if (exchange.status_ == ExchangeStatus::Responded and exchange.response_.status_.ok()) {
        this->chip_ = get_chip_info(exchange.response_.value_);
        spdlog::info("ESP chip detected, (magic, chip name) = ({:#x}, {})", exchange.response_.value_,
                     this->chip_.name_);
      } else {
        spdlog::warn("Cannot identify the chip, continuing with defaults");
      }
    }

    // the ESP8266 ROM has no SPI_ATTACH, and without knowing the chip we leave the flash config as the ROM set it
    bool const attach =
      this->config_.spi_attach_ and this->chip_.id_ != ChipID::Unknown and this->chip_.id_ != ChipID::ESP8266;
    if (not attach) {
      return std::nullopt;
    }

    RetryPolicy const policy{this->config_.end_attempts_, this->config_.command_timeout_, true};
    if (auto result = this->exchange_with_retry(command::SPI_ATTACH{}, policy, Step{command::SPI_ATTACH::NAME});
        std::holds_alternative<FailureReason>(result)) {
      return std::get<FailureReason>(std::move(result));
    }

    command::SPI_SET_PARAMS const set_params{this->config_.flash_size_};
    if (auto result = this->exchange_with_retry(set_params, policy, Step{command::SPI_SET_PARAMS::NAME});
        std::holds_alternative<FailureReason>(result)) {
      return std::get<FailureReason>(std::move(result));
    }

    return std::nullopt;
  }

  std::optional<FailureReason> write_region(std::size_t const t_index, FlashRegion const& t_region,
                                            ProgressCallback const& t_progress) {
    auto const chunk_size  = this->config_.effective_chunk_size();
    auto const chunk_count = t_region.chunk_count(chunk_size);
    auto const erase_size  = t_region.erase_size();

    this->state_    = SessionState::RegionBegin;
    this->sequence_ = 0;
    spdlog::info("Erasing {} bytes in flash at offset {:#x} ({} packets of {} byte)", erase_size, t_region.address_,
                 chunk_count, chunk_size);

    command::FLASH_BEGIN const begin{
      .erase_size_           = erase_size,
      .packet_count_         = chunk_count,
      .data_size_per_packet_ = chunk_size,
      .flash_offset_         = t_region.address_,
      .with_encrypted_field_ = this->chip_.rom_encrypted_write_,
    };
    auto const erase_timeout =
      std::chrono::milliseconds(this->config_.erase_timeout_per_block_ * t_region.erase_blocks());
    RetryPolicy const begin_policy{this->config_.begin_attempts_,
                                   std::max(this->config_.begin_timeout_, erase_timeout), true};
    if (auto result =
          this->exchange_with_retry(begin, begin_policy, Step{command::FLASH_BEGIN::NAME, t_index, std::nullopt,
                                                              t_region.address_});
        std::holds_alternative<FailureReason>(result)) {
      return std::get<FailureReason>(std::move(result));
    }

    this->state_ = SessionState::RegionTransfer;
    auto const data_timeout =
      std::chrono::milliseconds(this->config_.data_timeout_per_kib_ * div_ceil(chunk_size, 1024));
    RetryPolicy const data_policy{this->config_.data_attempts_, std::max(this->config_.data_timeout_, data_timeout),
                                  false};

    // the ROM writes whole packets, the tail of the last one is padded with erased flash content
    std::vector<std::uint8_t> block(chunk_size);
    std::size_t written = 0;
    for (std::uint32_t sequence = 0; sequence < chunk_count; ++sequence) {
      auto const offset = static_cast<std::size_t>(sequence) * chunk_size;
      auto const length = std::min<std::size_t>(chunk_size, t_region.data_.size() - offset);
      auto const source = t_region.data_.subspan(offset, length);
      std::fill(std::copy(source.begin(), source.end(), block.begin()), block.end(), 0xFF);

      Step const step{command::FLASH_DATA::NAME, t_index, sequence,
                      t_region.address_ + static_cast<std::uint32_t>(offset)};
      if (auto result = this->exchange_with_retry(command::FLASH_DATA{sequence, block}, data_policy, step);
          std::holds_alternative<FailureReason>(result)) {
        return std::get<FailureReason>(std::move(result));
      }

      this->history_.push_back(SentChunk{t_index, sequence});
      this->sequence_ = sequence + 1;
      written += length;
      spdlog::debug("Wrote packet {}/{} of region {}", sequence + 1, chunk_count, t_index);
      if (t_progress) {
        t_progress(t_index, written, t_region.data_.size());
      }
    }

    // rebooting here would abandon the regions still to come
    using StayEnd = command::FLASH_END<command::FlashEndOption::StayInLoader>;
    RetryPolicy const end_policy{this->config_.end_attempts_, this->config_.end_timeout_, true};
    if (auto result = this->exchange_with_retry(StayEnd{}, end_policy, Step{StayEnd::NAME, t_index});
        std::holds_alternative<FailureReason>(result)) {
      return std::get<FailureReason>(std::move(result));
    }

    this->state_ = SessionState::RegionComplete;
    spdlog::info("Wrote {} bytes at offset {:#x}", written, t_region.address_);
    return std::nullopt;
  }

  static std::optional<FailureReason> check_regions(std::span<FlashRegion const> t_regions) {
    for (std::size_t i = 0; i < t_regions.size(); ++i) {
      if (t_regions[i].data_.empty()) {
        return make_failure(FailureKind::Provider, Step{"flash", i}, "region has no data");
      }
    }
    return std::nullopt;
  }

  SessionState finalize() {
    this->state_ = SessionState::Finalizing;

    if (this->config_.resync_before_finalize_) {
      if (auto const result = this->sync_burst(); result != SyncResult::Responded) {
        auto const kind = result == SyncResult::TransportFailed ? FailureKind::Transport : FailureKind::SyncTimeout;
        return this->fail(make_failure(kind, Step{command::SYNC::NAME}, "chip stopped answering before reboot"));
      }
    }

    using RebootEnd = command::FLASH_END<command::FlashEndOption::Reboot>;
    auto const exchange = this->transceive(RebootEnd{}, this->config_.end_timeout_);
    switch (exchange.status_) {
      case ExchangeStatus::Responded:
        if (auto const status = exchange.response_.status_; not status.ok()) {
          auto const kind =
            status.is_policy_rejection() ? FailureKind::SecureBootRejected : FailureKind::DeviceStatus;
          return this->fail(make_failure(kind, Step{RebootEnd::NAME}, fmt::format("{}", status), status));
        }
        break;
      case ExchangeStatus::TransportFailed:
        return this->fail(make_failure(FailureKind::Transport, Step{RebootEnd::NAME}, exchange.detail_));
      case ExchangeStatus::TimedOut:
        [[fallthrough]];
      case ExchangeStatus::Malformed:
        // the chip may already be resetting
        spdlog::warn("No acknowledgement for the reboot request: {}", exchange.detail_);
        break;
    }

    if (this->config_.reset_after_flash_) {
      ResetSequencer<T>{this->transport_, this->lines_, this->config_.reset_profiles_}.return_to_normal();
    }

    this->release();
    this->state_ = SessionState::Rebooted;
    spdlog::info("Flash done, chip rebooted");
    return this->state_;
  }

 public:
  template <typename... Args>
  explicit Session(SessionConfig t_config, Args&&... t_args)
    : config_{std::move(t_config)}, transport_(std::forward<Args>(t_args)...) {}

  Session(Session const&)            = delete;
  Session& operator=(Session const&) = delete;

  ~Session() { this->release(); }

  /**
   * @brief Open the transport and sync with the ROM. Each connection cycle resets the chip into download mode with
   *        the next reset profile and then fires a burst of short SYNC attempts, the ROM only listens for a short
   *        while after reset.
   */
  SessionState connect() {
    if (this->is_terminal() or this->state_ == SessionState::Synced) {
      return this->state_;
    }

    this->state_ = SessionState::Connecting;
    if (not this->opened_) {
      try {
        this->lines_  = this->transport_.open(this->config_.baud_rate_);
        this->opened_ = true;
      } catch (TransportError const& t_e) {
        return this->fail(make_failure(FailureKind::Transport, Step{"open"}, t_e.what()));
      }
    }

    ResetSequencer<T> reset{this->transport_, this->lines_, this->config_.reset_profiles_};
    auto result = SyncResult::TimedOut;
    for (std::uint32_t cycle = 0; cycle < this->config_.sync_cycles_ and result == SyncResult::TimedOut; ++cycle) {
      if (this->config_.reset_on_connect_) {
        reset.enter_bootloader(cycle);
      }

      this->transport_.flush_input();
      this->assembler_.reset();
      result = this->sync_burst();
      if (result == SyncResult::TimedOut) {
        spdlog::warn("No answer to SYNC in connection cycle {}/{}", cycle + 1, this->config_.sync_cycles_);
      }
    }

    switch (result) {
      case SyncResult::TimedOut:
        return this->fail(make_failure(
          FailureKind::SyncTimeout, Step{command::SYNC::NAME},
          fmt::format("no answer after {} cycles of {} attempts", this->config_.sync_cycles_,
                      this->config_.sync_attempts_)));
      case SyncResult::TransportFailed:
        return this->fail(make_failure(FailureKind::Transport, Step{command::SYNC::NAME}, "serial port failed"));
      case SyncResult::Responded:
        break;
    }

    try {
      this->drain();
    } catch (TransportError const& t_e) {
      return this->fail(make_failure(FailureKind::Transport, Step{command::SYNC::NAME}, t_e.what()));
    }

    spdlog::info("Connected to the ROM loader ({} status bytes)", this->status_length_);
    if (auto failure = this->prepare_flash(); failure) {
      return this->fail(std::move(*failure));
    }

    this->state_ = SessionState::Synced;
    return this->state_;
  }

  /**
   * @brief Write every region in the given order, then reboot the chip. Regions must stay valid until this returns.
   */
  SessionState flash(std::span<FlashRegion const> t_regions, ProgressCallback const& t_progress = {}) {
    if (this->is_terminal()) {
      return this->state_;
    }

    if (auto failure = check_regions(t_regions); failure) {
      return this->fail(std::move(*failure));
    }

    if (this->state_ != SessionState::Synced) {
      return this->fail(make_failure(FailureKind::InvalidState, Step{"flash"},
                                     fmt::format("cannot flash in state {}", to_string(this->state_))));
    }

    for (std::size_t i = 0; i < t_regions.size(); ++i) {
      if (i != 0 and this->config_.keep_alive_between_regions_) {
        if (auto const result = this->sync_burst(); result != SyncResult::Responded) {
          auto const kind = result == SyncResult::TransportFailed ? FailureKind::Transport : FailureKind::SyncTimeout;
          return this->fail(make_failure(kind, Step{command::SYNC::NAME, i}, "keep-alive check failed"));
        }
      }

      if (auto failure = this->write_region(i, t_regions[i], t_progress); failure) {
        return this->fail(std::move(*failure));
      }
    }

    return this->finalize();
  }

  /**
   * @brief Fetch the image first, a provider failure ends the session before the port is even opened. A session
   *        that is not connected yet connects once the image is in hand, so the chip is only reset into download
   *        mode when there is something to write.
   */
  template <ImageProvider P>
  SessionState flash(P& t_provider, std::string_view const t_version, ProgressCallback const& t_progress = {}) {
    if (this->is_terminal()) {
      return this->state_;
    }

    std::vector<FlashRegion> regions;
    try {
      regions = t_provider.load(t_version);
    } catch (ProviderError const& t_e) {
      return this->fail(make_failure(FailureKind::Provider, Step{"load"}, t_e.what()));
    }

    if (auto failure = check_regions(regions); failure) {
      return this->fail(std::move(*failure));
    }

    if (this->state_ == SessionState::Disconnected and this->connect() != SessionState::Synced) {
      return this->state_;
    }

    return this->flash(std::span<FlashRegion const>{regions}, t_progress);
  }

  /**
   * @brief The ROM loader gives us no way to read the written content back, so there is nothing honest to report
   *        other than that.
   */
  [[nodiscard]] Verification verify() const {
    spdlog::warn("Flash verification is unavailable with the ROM loader");
    return Verification::Unavailable;
  }

  void disconnect() noexcept {
    this->release();
    if (not this->is_terminal()) {
      this->state_ = SessionState::Disconnected;
    }
  }

  [[nodiscard]] SessionState state() const noexcept { return this->state_; }
  [[nodiscard]] std::optional<FailureReason> const& failure() const noexcept { return this->failure_; }
  [[nodiscard]] ChipInfo const& chip() const noexcept { return this->chip_; }
  [[nodiscard]] std::size_t status_length() const noexcept { return this->status_length_; }
  [[nodiscard]] std::uint32_t next_sequence() const noexcept { return this->sequence_; }
  [[nodiscard]] std::vector<SentChunk> const& history() const noexcept { return this->history_; }
  [[nodiscard]] T& transport() noexcept { return this->transport_; }
  [[nodiscard]] T const& transport() const noexcept { return this->transport_; }
};

}  // namespace espflasher
