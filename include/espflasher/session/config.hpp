#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "espflasher/common/constants.hpp"
#include "espflasher/serial/reset.hpp"

namespace espflasher {

/**
 * @brief Everything that tunes a session. Timeouts are per operation class, the begin and data ones grow with the
 *        amount of flash touched.
 */
struct SessionConfig {
  std::uint32_t baud_rate_  = ESP_ROM_BAUD;
  std::uint32_t chunk_size_ = DEFAULT_CHUNK_SIZE;
  std::uint32_t flash_size_ = 4 * 1024 * 1024;

  // connect
  bool reset_on_connect_                     = true;
  std::vector<ResetProfile> reset_profiles_  = default_reset_profiles();
  std::uint32_t sync_cycles_                 = 7;
  std::uint32_t sync_attempts_               = 5;
  std::chrono::milliseconds sync_timeout_    = std::chrono::milliseconds(100);
  std::chrono::milliseconds sync_drain_      = std::chrono::milliseconds(50);
  bool detect_chip_                          = true;
  bool spi_attach_                           = true;
  std::chrono::milliseconds command_timeout_ = std::chrono::milliseconds(3000);

  // begin, erase time is proportional to the number of blocks
  std::uint32_t begin_attempts_                      = 3;
  std::chrono::milliseconds begin_timeout_           = std::chrono::milliseconds(3000);
  std::chrono::milliseconds erase_timeout_per_block_ = std::chrono::milliseconds(1875);  // 30 s per MiB

  // data
  std::uint32_t data_attempts_                    = 3;
  std::chrono::milliseconds data_timeout_         = std::chrono::milliseconds(3000);
  std::chrono::milliseconds data_timeout_per_kib_ = std::chrono::milliseconds(100);
  std::chrono::milliseconds retry_backoff_        = std::chrono::milliseconds(100);

  // end
  std::uint32_t end_attempts_            = 3;
  std::chrono::milliseconds end_timeout_ = std::chrono::milliseconds(3000);

  bool keep_alive_between_regions_ = false;
  bool resync_before_finalize_     = false;
  bool reset_after_flash_          = true;
  bool verify_                     = false;

  [[nodiscard]] std::uint32_t effective_chunk_size() const noexcept {
    // the ROM loader refuses FLASH_DATA packets above FLASH_WRITE_SIZE_NOSTUB
    if (this->chunk_size_ == 0 or this->chunk_size_ > FLASH_WRITE_SIZE_NOSTUB) {
      return FLASH_WRITE_SIZE_NOSTUB;
    }
    return this->chunk_size_;
  }
};

}  // namespace espflasher
