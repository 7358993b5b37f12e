#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "espflasher/common/constants.hpp"
#include "espflasher/common/utility.hpp"

namespace espflasher::command {

struct SYNC {
  static constexpr std::string_view NAME     = "SYNC";
  static constexpr std::uint8_t COMMAND_BYTE = to_underlying(Opcode::Sync);
  static constexpr std::size_t PACKET_SIZE   = 36;

  constexpr auto operator()() const noexcept {
    constexpr auto v = []() {
      std::array<std::uint8_t, PACKET_SIZE> buff{};
      std::fill(buff.begin(), buff.end(), 0x55);
      buff[0] = 0x07;
      buff[1] = 0x07;
      buff[2] = 0x12;
      buff[3] = 0x20;
      return buff;
    }();
    return v;
  }
};

template <std::uint32_t Addr>
class READ_REG {
  static constexpr auto BYTE_ARRAY = word_to_byte_array(Addr);

 public:
  static constexpr std::string_view NAME     = "READ_REG";
  static constexpr std::uint8_t COMMAND_BYTE = to_underlying(Opcode::ReadRegister);

  constexpr auto operator()() const noexcept { return BYTE_ARRAY; }
};

struct SPI_ATTACH {
  static constexpr std::string_view NAME     = "SPI_ATTACH";
  static constexpr std::uint8_t COMMAND_BYTE = to_underlying(Opcode::SpiAttach);

  // hspi_arg = 0 (default SPI pins), followed by the ROM only "is legacy" word
  constexpr auto operator()() const noexcept { return std::array<std::uint8_t, 8>{}; }
};

struct SPI_SET_PARAMS {
  std::uint32_t flash_size_ = 4 * 1024 * 1024;

  static constexpr std::string_view NAME     = "SPI_SET_PARAMS";
  static constexpr std::uint8_t COMMAND_BYTE = to_underlying(Opcode::SpiSetParams);
  static constexpr std::size_t PACKET_SIZE   = 6 * sizeof(std::uint32_t);

  constexpr auto operator()() const noexcept {
    std::array<std::uint8_t, PACKET_SIZE> v{};
    auto const flash_size_arr  = word_to_byte_array(this->flash_size_);
    auto const block_size_arr  = word_to_byte_array(FLASH_ERASE_BLOCK_SIZE);
    auto const sector_size_arr = word_to_byte_array(4 * 1024);
    auto const page_size_arr   = word_to_byte_array(256);
    auto const status_mask_arr = word_to_byte_array(0xFFFF);

    auto iter = std::fill_n(v.begin(), 4, 0);  // flash id, unused by the ROM
    iter      = std::copy_n(flash_size_arr.begin(), flash_size_arr.size(), iter);
    iter      = std::copy_n(block_size_arr.begin(), block_size_arr.size(), iter);
    iter      = std::copy_n(sector_size_arr.begin(), sector_size_arr.size(), iter);
    iter      = std::copy_n(page_size_arr.begin(), page_size_arr.size(), iter);
    std::copy_n(status_mask_arr.begin(), status_mask_arr.size(), iter);

    return v;
  }
};

struct FLASH_BEGIN {
  std::uint32_t erase_size_{};
  std::uint32_t packet_count_{};
  std::uint32_t data_size_per_packet_{};
  std::uint32_t flash_offset_{};
  bool with_encrypted_field_ = false;  // ROM of ESP32-S2 and later expects a 5th word
  std::uint32_t rom_encrypted_write_ = 0;

  static constexpr std::string_view NAME     = "FLASH_BEGIN";
  static constexpr std::uint8_t COMMAND_BYTE = to_underlying(Opcode::FlashBegin);

  auto operator()() const {
    std::vector<std::uint8_t> ret_val;
    ret_val.reserve(5 * sizeof(std::uint32_t));
    auto const append = [&](std::uint32_t t_word) {
      auto const arr = word_to_byte_array(t_word);
      ret_val.insert(ret_val.end(), arr.begin(), arr.end());
    };

    append(this->erase_size_);
    append(this->packet_count_);
    append(this->data_size_per_packet_);
    append(this->flash_offset_);
    if (this->with_encrypted_field_) {
      append(this->rom_encrypted_write_);
    }

    return ret_val;
  }
};

struct FLASH_DATA {
  static constexpr std::size_t DATA_HEADER_SIZE = 16;
  std::uint32_t sequence_;
  std::span<std::uint8_t const> buffer_;

  static constexpr std::string_view NAME     = "FLASH_DATA";
  static constexpr std::uint8_t COMMAND_BYTE = to_underlying(Opcode::FlashData);

  [[nodiscard]] std::uint8_t check_sum() const noexcept { return espflasher::check_sum(this->buffer_); }

  auto operator()() const {
    std::vector<std::uint8_t> ret_val(DATA_HEADER_SIZE + this->buffer_.size());
    auto const data_size_arr = word_to_byte_array(static_cast<std::uint32_t>(this->buffer_.size()));
    auto const sequence_arr  = word_to_byte_array(this->sequence_);

    auto iter = std::copy_n(data_size_arr.begin(), data_size_arr.size(), ret_val.begin());
    iter      = std::copy_n(sequence_arr.begin(), sequence_arr.size(), iter);
    iter      = std::fill_n(iter, 8, 0);
    std::copy(this->buffer_.begin(), this->buffer_.end(), iter);

    return ret_val;
  }
};

enum class FlashEndOption : std::uint32_t { Reboot = 0, StayInLoader = 1 };

template <FlashEndOption Opt>
struct FLASH_END {
  static constexpr std::string_view NAME     = "FLASH_END";
  static constexpr std::uint8_t COMMAND_BYTE = to_underlying(Opcode::FlashEnd);
  static constexpr std::size_t PACKET_SIZE   = 4;

  constexpr auto operator()() const noexcept { return word_to_byte_array(to_underlying(Opt)); }
};

}  // namespace espflasher::command
