#include "catch2/catch_test_macros.hpp"
#include "espflasher/serial/boot_cmd.hpp"
#include "espflasher/serial/packet.hpp"
#include "mock_transport.hpp"
#include <algorithm>
#include <array>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/sliding.hpp>
#include <variant>
#include <vector>

using espflasher::MalformedResponse;
using espflasher::Response;
using espflasher::SLIP;
using espflasher::StatusCode;

namespace {

// undo SLIP on a generated request and hand back the raw frame
std::vector<std::uint8_t> unwrap(std::vector<std::uint8_t> const& t_packet) { return SLIP::decode(t_packet).bytes_; }

}  // namespace

TEST_CASE("READ_REG address bytes are escaped on the wire", "[Packet]") {
  constexpr auto contain_esc_and_esc_end = [](auto const& t_view) {
    return t_view[0] == SLIP::SLIP_ESC and t_view[1] == SLIP::SLIP_ESC_END;
  };
  constexpr auto contain_esc_and_esc_esc = [](auto const& t_view) {
    return t_view[0] == SLIP::SLIP_ESC and t_view[1] == SLIP::SLIP_ESC_ESC;
  };

  // register address whose bytes need escaping
  constexpr std::uint32_t value = 0xC0DB'0000;
  auto const read_reg_packet    = espflasher::generate_packet(espflasher::command::READ_REG<value>{});

  auto rng = read_reg_packet | ranges::views::sliding(2);
  CHECK(ranges::find_if(rng, contain_esc_and_esc_esc) != rng.end());
  CHECK(ranges::find_if(rng, contain_esc_and_esc_end) != rng.end());
  CHECK(read_reg_packet.front() == SLIP::SLIP_END);
  CHECK(read_reg_packet.back() == SLIP::SLIP_END);

  auto const raw = unwrap(read_reg_packet);
  CHECK(raw == std::vector<std::uint8_t>{0x00, 0x0A, 0x04, 0x00, 0, 0, 0, 0, 0x00, 0x00, 0xDB, 0xC0});
}

TEST_CASE("SYNC carries the fixed 36 byte pattern", "[Packet]") {
  auto const raw = unwrap(espflasher::generate_packet(espflasher::command::SYNC{}));
  REQUIRE(raw.size() == 8 + 36);
  CHECK(raw[1] == 0x08);
  CHECK(raw[2] == 36);
  CHECK(std::vector<std::uint8_t>(raw.begin() + 8, raw.begin() + 12) == std::vector<std::uint8_t>{0x07, 0x07, 0x12, 0x20});
  CHECK(std::all_of(raw.begin() + 12, raw.end(), [](auto t_b) { return t_b == 0x55; }));
}

TEST_CASE("FLASH_DATA checksum covers the firmware bytes only", "[Packet]") {
  std::array<std::uint8_t, 8> const data{0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80};
  std::uint8_t const expected = 0xEF ^ 0xFF;

  auto const first  = unwrap(espflasher::generate_packet(espflasher::command::FLASH_DATA{0, data}));
  auto const second = unwrap(espflasher::generate_packet(espflasher::command::FLASH_DATA{7, data}));

  CHECK(first[4] == expected);
  CHECK(second[4] == expected);
  CHECK(first[5] == 0);
  CHECK(espflasher::check_sum(data) == expected);

  SECTION("payload is length, sequence, two zero words, data") {
    REQUIRE(second.size() == 8 + 16 + data.size());
    CHECK(espflasher::byte_array_to_word(second.begin() + 8) == data.size());
    CHECK(espflasher::byte_array_to_word(second.begin() + 12) == 7);
    CHECK(espflasher::byte_array_to_word(second.begin() + 16) == 0);
    CHECK(espflasher::byte_array_to_word(second.begin() + 20) == 0);
    CHECK(std::equal(data.begin(), data.end(), second.begin() + 24));
  }

  SECTION("an empty buffer checksums to the seed") {
    CHECK(espflasher::check_sum({}) == espflasher::ESP32_CHECKSUM_MAGIC);
  }
}

TEST_CASE("FLASH_BEGIN and FLASH_END payload layout", "[Packet]") {
  espflasher::command::FLASH_BEGIN begin{
    .erase_size_ = 0x20000, .packet_count_ = 100, .data_size_per_packet_ = 0x400, .flash_offset_ = 0x10000};

  auto payload = begin();
  REQUIRE(payload.size() == 16);
  CHECK(espflasher::byte_array_to_word(payload.begin()) == 0x20000);
  CHECK(espflasher::byte_array_to_word(payload.begin() + 4) == 100);
  CHECK(espflasher::byte_array_to_word(payload.begin() + 8) == 0x400);
  CHECK(espflasher::byte_array_to_word(payload.begin() + 12) == 0x10000);

  begin.with_encrypted_field_ = true;
  payload                     = begin();
  REQUIRE(payload.size() == 20);
  CHECK(espflasher::byte_array_to_word(payload.begin() + 16) == 0);

  using espflasher::command::FLASH_END;
  using espflasher::command::FlashEndOption;
  CHECK(FLASH_END<FlashEndOption::Reboot>{}() == std::array<std::uint8_t, 4>{0, 0, 0, 0});
  CHECK(FLASH_END<FlashEndOption::StayInLoader>{}() == std::array<std::uint8_t, 4>{1, 0, 0, 0});
}

TEST_CASE("response fields are extracted from an escaped frame", "[Packet]") {
  std::vector<std::uint8_t> const buffer{
    0xC0, 0x1,  0xE, 0x8, 0, 0x6F, 0x50, 0x31, 0x1B, SLIP::SLIP_ESC, SLIP::SLIP_ESC_END, SLIP::SLIP_ESC,
    SLIP::SLIP_ESC_ESC, 0, 0, 0, 0, 0, 0, 0xC0,
  };

  auto const result = espflasher::parse_response(buffer, 4);
  REQUIRE(std::holds_alternative<Response>(result));

  auto const& resp = std::get<Response>(result);
  CHECK(resp.command_ == 0xE);
  CHECK(resp.size_ == 8);
  CHECK(resp.value_ == 0x1B31'506FU);
  CHECK(resp.data_ == std::vector<std::uint8_t>{SLIP::SLIP_END, SLIP::SLIP_ESC, 0, 0});
  CHECK(resp.status_.ok());
}

TEST_CASE("status bytes are classified", "[Packet]") {
  using Kind = StatusCode::Kind;
  auto const status_of = [](std::uint8_t t_status, std::uint8_t t_err, std::size_t t_len) {
    auto const frame  = espflasher::test::make_response(0x02, t_status, t_err, t_len);
    auto const result = espflasher::parse_response(frame, t_len);
    REQUIRE(std::holds_alternative<Response>(result));
    return std::get<Response>(result).status_;
  };

  for (std::size_t len : {std::size_t{2}, std::size_t{4}}) {
    CHECK(status_of(0, 0, len).kind_ == Kind::Success);
    CHECK(status_of(1, 0x05, len) == StatusCode{Kind::GenericFailure, 0x05});
    CHECK(status_of(1, 0xC1, len) == StatusCode{Kind::GenericFailure, 0xC1});
    CHECK(status_of(1, 0x06, len) == StatusCode{Kind::SecureBootRejected, 0x06});
    CHECK(status_of(1, 0xC5, len).is_policy_rejection());
  }

  CHECK(fmt::format("{}", StatusCode{Kind::GenericFailure, 0x07}) == "failed (0x07: Invalid CRC in message)");
  CHECK(espflasher::describe(0x42) == "Unknown error");
}

TEST_CASE("frames that are not valid responses are rejected", "[Packet]") {
  auto const is_malformed = [](std::vector<std::uint8_t> const& t_frame, std::size_t t_len = 2) {
    return std::holds_alternative<MalformedResponse>(espflasher::parse_response(t_frame, t_len));
  };

  SECTION("too short") { CHECK(is_malformed(SLIP::encode(std::vector<std::uint8_t>{0x01, 0x08, 0x02}))); }

  SECTION("request direction") {
    auto frame = SLIP::decode(espflasher::test::make_response(0x08, 0, 0)).bytes_;
    frame[0]   = 0x00;
    CHECK(is_malformed(SLIP::encode(frame)));
  }

  SECTION("length field disagrees with the frame") {
    auto frame = SLIP::decode(espflasher::test::make_response(0x08, 0, 0)).bytes_;
    frame[2]   = 0x08;
    CHECK(is_malformed(SLIP::encode(frame)));
  }

  SECTION("data field cannot hold a 4 byte status") {
    CHECK(is_malformed(espflasher::test::make_response(0x08, 0, 0, 2), 4));
  }

  SECTION("broken escape") {
    std::vector<std::uint8_t> const frame{0xC0, 0x01, 0x08, 0x02, 0x00, 0, 0, 0, 0, 0xDB, 0x00, 0x00, 0xC0};
    CHECK(is_malformed(frame));
  }
}
