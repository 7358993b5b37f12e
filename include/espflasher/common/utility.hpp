#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <iterator>
#include <numeric>
#include <span>
#include <type_traits>

#include <fmt/ranges.h>
#include <range/v3/view/subrange.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "espflasher/common/constants.hpp"

namespace espflasher::detail {

template <typename T>
concept is_scoped_enum = std::is_enum_v<T> and not std::is_convertible_v<T, int>;

}  // namespace espflasher::detail

namespace espflasher {

inline constexpr auto word_to_byte_array = [](std::uint32_t const t_v) {
  return std::array<std::uint8_t, 4>{
    static_cast<std::uint8_t>(t_v & 0xFFU),
    static_cast<std::uint8_t>((t_v >> 8U) & 0xFFU),
    static_cast<std::uint8_t>((t_v >> 16U) & 0xFFU),
    static_cast<std::uint8_t>(t_v >> 24U),
  };
};

/**
 * @brief Read a little endian word starting at t_begin, the caller guarantees 4 bytes are available
 */
inline constexpr std::uint32_t byte_array_to_word(auto t_begin) noexcept {
  std::uint32_t ret = 0;
  for (std::uint32_t i = 0; i < 4; ++i, ++t_begin) {
    ret |= static_cast<std::uint32_t>(static_cast<std::uint8_t>(*t_begin)) << (8U * i);
  }
  return ret;
}

inline constexpr auto to_byte = [](auto t_in) { return static_cast<std::uint8_t>(t_in); };

inline constexpr auto padded_size(std::uint32_t t_size, std::uint32_t t_padding) noexcept {
  return ((t_size + t_padding - 1U) / t_padding) * t_padding;
}

inline constexpr auto div_ceil(std::uint32_t t_v, std::uint32_t t_d) noexcept { return (t_v + t_d - 1U) / t_d; }

inline constexpr auto to_underlying(detail::is_scoped_enum auto t_enum) noexcept {
  return static_cast<std::underlying_type_t<decltype(t_enum)>>(t_enum);
}

/**
 * @brief XOR checksum used by FLASH_DATA and MEM_DATA, only the data bytes take part in it
 */
[[nodiscard]] inline std::uint8_t check_sum(std::span<std::uint8_t const> t_data) noexcept {
  return std::accumulate(t_data.begin(), t_data.end(), ESP32_CHECKSUM_MAGIC, std::bit_xor<std::uint8_t>{});
}

inline void print_byte_stream(auto t_begin, auto t_end) noexcept {
  if (not spdlog::should_log(spdlog::level::debug)) {
    return;
  }

  using ranges::subrange;
  using ranges::views::transform;
  constexpr auto byte_per_line = 16;
  auto const byte_stream_size  = t_end - t_begin;
  auto const line_to_print = static_cast<std::size_t>((byte_stream_size + byte_per_line - 1) / byte_per_line);  // ceil
  spdlog::set_pattern("%v");

  for (std::size_t i = 0; i < line_to_print; ++i) {
    auto const curr_end = t_end - t_begin < byte_per_line ? t_end : t_begin + byte_per_line;
    spdlog::debug("{:04X}  {:02X}", i * byte_per_line,
                  fmt::join(subrange(t_begin, curr_end) | transform(to_byte), " "));
    t_begin = curr_end;
  }

  spdlog::debug("");
  spdlog::set_pattern("%+");
}

}  // namespace espflasher
