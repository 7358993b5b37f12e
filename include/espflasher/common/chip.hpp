#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

#include "espflasher/common/utility.hpp"

namespace espflasher {

// Values read back from CHIP_DETECT_MAGIC_REG
enum class ChipID : std::uint32_t {
  Unknown       = 0,
  ESP8266       = 0xFFF0'C101U,
  ESP32         = 0x00F0'1D83U,
  ESP32_S2      = 0x0000'07C6U,
  ESP32_S3      = 0x0000'0009U,
  ESP32_C3_ECO1 = 0x6921'506FU,
  ESP32_C3_ECO3 = 0x1B31'506FU,
  ESP32_C2      = 0x6F51'306FU,
  ESP32_C6      = 0x2CE0'806FU,
  ESP32_H2      = 0xD7B7'3E80U,
};

struct ChipInfo {
  ChipID id_;
  std::string_view name_;
  bool rom_encrypted_write_;  // ROM FLASH_BEGIN takes the 5th "encrypted" word
};

inline constexpr ChipInfo get_chip_info(std::uint32_t const t_magic) noexcept {
  constexpr std::array chip_info_table{
    ChipInfo{ChipID::ESP8266, "ESP8266", false},          //
    ChipInfo{ChipID::ESP32, "ESP32", false},              //
    ChipInfo{ChipID::ESP32_S2, "ESP32-S2", true},         //
    ChipInfo{ChipID::ESP32_S3, "ESP32-S3", true},         //
    ChipInfo{ChipID::ESP32_C3_ECO1, "ESP32-C3", true},    //
    ChipInfo{ChipID::ESP32_C3_ECO3, "ESP32-C3", true},    //
    ChipInfo{ChipID::ESP32_C2, "ESP32-C2", true},         //
    ChipInfo{ChipID::ESP32_C6, "ESP32-C6", true},         //
    ChipInfo{ChipID::ESP32_H2, "ESP32-H2", true},         //
  };

  auto const chip_matched = [=](auto const& t_entry) { return to_underlying(t_entry.id_) == t_magic; };
  if (auto const result = std::find_if(chip_info_table.begin(), chip_info_table.end(), chip_matched);
      result != chip_info_table.end()) {
    return *result;
  }

  return ChipInfo{ChipID::Unknown, "Unknown", false};
}

}  // namespace espflasher
