#pragma once

#include <cstdint>

namespace espflasher {

inline constexpr std::uint8_t ESP32_CHECKSUM_MAGIC = 0xEF;

inline constexpr std::uint32_t FLASH_ERASE_BLOCK_SIZE  = 64 * 1024;
inline constexpr std::uint32_t FLASH_WRITE_SIZE_NOSTUB = 0x400;
inline constexpr std::uint32_t DEFAULT_CHUNK_SIZE      = FLASH_WRITE_SIZE_NOSTUB;
inline constexpr std::uint32_t CHIP_DETECT_MAGIC_REG   = 0x4000'1000;
inline constexpr std::uint32_t ESP_ROM_BAUD            = 115200;

enum class Opcode : std::uint8_t {
  FlashBegin      = 0x02,
  FlashData       = 0x03,
  FlashEnd        = 0x04,
  MemBegin        = 0x05,
  MemEnd          = 0x06,
  MemData         = 0x07,
  Sync            = 0x08,
  WriteRegister   = 0x09,
  ReadRegister    = 0x0A,
  SpiSetParams    = 0x0B,
  SpiAttach       = 0x0D,
  ReadFlashSlow   = 0x0E,
  ChangeBaudrate  = 0x0F,
  SpiFlashMd5     = 0x13,
  GetSecurityInfo = 0x14,
};

}  // namespace espflasher
