#include "catch2/catch_test_macros.hpp"
#include "catch2/generators/catch_generators.hpp"
#include "catch2/generators/catch_generators_adapters.hpp"
#include "catch2/generators/catch_generators_random.hpp"
#include "espflasher/serial/slip.hpp"
#include <algorithm>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/sliding.hpp>
#include <vector>

using espflasher::FrameAssembler;
using espflasher::SLIP;

constexpr auto contain_esc_and_esc_esc = [](auto const& t_view) {
  return t_view[0] == SLIP::SLIP_ESC and t_view[1] == SLIP::SLIP_ESC_ESC;
};

constexpr auto contain_esc_and_esc_end = [](auto const& t_view) {
  return t_view[0] == SLIP::SLIP_ESC and t_view[1] == SLIP::SLIP_ESC_END;
};

TEST_CASE("slip encoding escapes END and ESC and delimits the frame", "[SLIP]") {
  std::vector<std::uint8_t> const raw{0x01, SLIP::SLIP_END, 0x02, SLIP::SLIP_ESC, SLIP::SLIP_ESC_END, 0x03};
  auto const encoded = SLIP::encode(raw);

  CHECK(encoded.front() == SLIP::SLIP_END);
  CHECK(encoded.back() == SLIP::SLIP_END);
  CHECK(std::count(encoded.begin(), encoded.end(), SLIP::SLIP_END) == 2);

  auto rng = encoded | ranges::views::sliding(2);
  CHECK(ranges::find_if(rng, contain_esc_and_esc_esc) != rng.end());
  CHECK(ranges::find_if(rng, contain_esc_and_esc_end) != rng.end());
  CHECK(encoded == std::vector<std::uint8_t>{0xC0, 0x01, 0xDB, 0xDC, 0x02, 0xDB, 0xDD, 0xDC, 0x03, 0xC0});
}

TEST_CASE("slip decoding restores the original bytes", "[SLIP]") {
  SECTION("escape sequences are resolved") {
    std::vector<std::uint8_t> const wire{0xC0, 0x01, 0xDB, 0xDC, 0xDB, 0xDD, 0x02, 0xC0};
    auto const result = SLIP::decode(wire);
    CHECK(result.status_ == SLIP::DecodeStatus::Complete);
    CHECK(result.bytes_ == std::vector<std::uint8_t>{0x01, SLIP::SLIP_END, SLIP::SLIP_ESC, 0x02});
    CHECK(ranges::find(result.bytes_, SLIP::SLIP_END) != result.bytes_.end());
  }

  SECTION("delimiters are optional") {
    std::vector<std::uint8_t> const body{0x01, 0xDB, 0xDC};
    CHECK(SLIP::decode(body).bytes_ == std::vector<std::uint8_t>{0x01, SLIP::SLIP_END});
  }

  SECTION("random payloads survive a round trip") {
    auto const bytes = GENERATE(take(50, chunk(257, random(0, 255))));
    std::vector<std::uint8_t> raw(bytes.begin(), bytes.end());
    raw[0] = SLIP::SLIP_END;
    raw[1] = SLIP::SLIP_ESC;

    auto const result = SLIP::decode(SLIP::encode(raw));
    CHECK(result.status_ == SLIP::DecodeStatus::Complete);
    CHECK(result.bytes_ == raw);
  }
}

TEST_CASE("broken escapes are flagged instead of silently dropped", "[SLIP]") {
  SECTION("input ends inside an escape") {
    std::vector<std::uint8_t> const wire{0xC0, 0x01, 0xDB};
    CHECK(SLIP::decode(wire).status_ == SLIP::DecodeStatus::Truncated);
  }

  SECTION("escape followed by an ordinary byte") {
    std::vector<std::uint8_t> const wire{0xC0, 0x01, 0xDB, 0x42, 0xC0};
    auto const result = SLIP::decode(wire);
    CHECK(result.status_ == SLIP::DecodeStatus::Malformed);
    CHECK(result.bytes_ == std::vector<std::uint8_t>{0x01, SLIP::SLIP_ESC, 0x42});
  }
}

TEST_CASE("frame assembler waits for the closing END", "[SLIP]") {
  FrameAssembler assembler;
  auto const frame = SLIP::encode(std::vector<std::uint8_t>{0x01, 0x08, SLIP::SLIP_END, 0x00});

  SECTION("frame split over several reads") {
    for (std::size_t i = 0; i + 1 < frame.size(); ++i) {
      assembler.feed(std::span{frame}.subspan(i, 1));
      CHECK_FALSE(assembler.next_frame().has_value());
    }
    assembler.feed(std::span{frame}.last(1));

    auto const body = assembler.next_frame();
    REQUIRE(body.has_value());
    CHECK(SLIP::decode(*body).bytes_ == std::vector<std::uint8_t>{0x01, 0x08, SLIP::SLIP_END, 0x00});
    CHECK_FALSE(assembler.has_partial());
  }

  SECTION("noise before the first END is dropped") {
    std::vector<std::uint8_t> stream{0x55, 0xDB, 0xDC};
    stream.insert(stream.end(), frame.begin(), frame.end());
    assembler.feed(stream);

    auto const body = assembler.next_frame();
    REQUIRE(body.has_value());
    CHECK(body->front() == 0x01);
    CHECK_FALSE(assembler.next_frame().has_value());
  }

  SECTION("back to back frames come out in order") {
    auto const second = SLIP::encode(std::vector<std::uint8_t>{0x01, 0x02});
    std::vector<std::uint8_t> stream(frame);
    stream.insert(stream.end(), second.begin(), second.end());
    stream.push_back(0x77);  // start of something not finished yet
    assembler.feed(stream);

    REQUIRE(assembler.next_frame().has_value());
    auto const next = assembler.next_frame();
    REQUIRE(next.has_value());
    CHECK(*next == std::vector<std::uint8_t>{0x01, 0x02});
    CHECK_FALSE(assembler.next_frame().has_value());
    CHECK(assembler.has_partial());

    assembler.reset();
    CHECK_FALSE(assembler.has_partial());
  }
}
