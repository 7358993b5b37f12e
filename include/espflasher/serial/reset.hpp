#pragma once

#include <chrono>
#include <cstddef>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "espflasher/serial/transport.hpp"

namespace espflasher {

struct ResetProfile {
  std::chrono::milliseconds reset_hold_;    // EN low, boot select low
  std::chrono::milliseconds boot_hold_;     // EN released, boot select still low while the ROM samples it
  std::chrono::milliseconds release_hold_;  // after boot select is released
};

// Boards differ in the RC constant on EN, so the waveform is tried with increasingly generous hold times
inline std::vector<ResetProfile> default_reset_profiles() {
  using namespace std::chrono_literals;
  return {
    ResetProfile{100ms, 50ms, 0ms},
    ResetProfile{100ms, 500ms, 0ms},
    ResetProfile{500ms, 500ms, 50ms},
  };
}

enum class ResetOutcome { Done, Skipped };

template <Transport T>
class ResetSequencer {
  T& transport_;
  ControlLines lines_;
  std::vector<ResetProfile> profiles_;
  std::chrono::milliseconds normal_reset_hold_;

  [[nodiscard]] bool drive(bool const t_en, bool const t_boot) {
    if (this->transport_.set_control_lines(t_en, t_boot)) {
      return true;
    }

    spdlog::warn("Failed to drive EN={} BOOT={}, continuing without hardware reset", t_en, t_boot);
    return false;
  }

 public:
  ResetSequencer(T& t_transport, ControlLines const t_lines, std::vector<ResetProfile> t_profiles,
                 std::chrono::milliseconds const t_normal_reset_hold = std::chrono::milliseconds(100))
    : transport_{t_transport},
      lines_{t_lines},
      profiles_{t_profiles.empty() ? default_reset_profiles() : std::move(t_profiles)},
      normal_reset_hold_{t_normal_reset_hold} {}

  [[nodiscard]] std::size_t profile_count() const noexcept { return this->profiles_.size(); }

  /**
   * @brief The chip samples boot select on the rising edge of EN, holding it low across that edge latches download
   *        mode. t_attempt picks the profile, wrapping around once all of them have been tried.
   */
  ResetOutcome enter_bootloader(std::size_t const t_attempt = 0) {
    if (this->lines_ == ControlLines::Unsupported) {
      spdlog::warn("Control lines unsupported, assuming the chip is already in download mode");
      return ResetOutcome::Skipped;
    }

    auto const& profile = this->profiles_[t_attempt % this->profiles_.size()];
    spdlog::debug("Entering bootloader with hold times {}ms / {}ms / {}ms", profile.reset_hold_.count(),
                  profile.boot_hold_.count(), profile.release_hold_.count());

    if (not this->drive(false, false)) {
      return ResetOutcome::Skipped;
    }
    this->transport_.delay(profile.reset_hold_);

    if (not this->drive(true, false)) {
      return ResetOutcome::Skipped;
    }
    this->transport_.delay(profile.boot_hold_);

    if (not this->drive(true, true)) {
      return ResetOutcome::Skipped;
    }
    this->transport_.delay(profile.release_hold_);

    return ResetOutcome::Done;
  }

  ResetOutcome return_to_normal() {
    if (this->lines_ == ControlLines::Unsupported) {
      spdlog::warn("Control lines unsupported, reset the chip manually to run the new firmware");
      return ResetOutcome::Skipped;
    }

    spdlog::info("Hard resetting via RTS pin");
    if (not this->drive(false, true)) {
      return ResetOutcome::Skipped;
    }
    this->transport_.delay(this->normal_reset_hold_);

    if (not this->drive(true, true)) {
      return ResetOutcome::Skipped;
    }

    return ResetOutcome::Done;
  }
};

}  // namespace espflasher
