#include "catch2/catch_test_macros.hpp"
#include "espflasher/serial/reset.hpp"
#include "espflasher/serial/reset_wiring.hpp"
#include "espflasher/serial/serial_port.hpp"
#include "mock_transport.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <poll.h>
#include <pty.h>
#include <unistd.h>

using namespace std::chrono_literals;
using espflasher::ControlLines;
using espflasher::ModemLine;
using espflasher::ResetOutcome;
using espflasher::ResetProfile;
using espflasher::ResetSequencer;
using espflasher::ResetWiring;

namespace {

// (EN, IO0) pin levels
using Pins = std::pair<bool, bool>;

/**
 * @brief A board behind DTR / RTS. Line levels go through the same table SerialPort uses, the pins are worked out
 *        from the board's wiring, and the pin state is sampled whenever the sequencer holds it.
 */
class Board : public espflasher::test::MockTransport {
  ResetWiring wiring_;
  bool dtr_high_ = true;
  bool rts_high_ = true;

 public:
  std::vector<Pins> held_;

  explicit Board(ResetWiring const t_wiring) : wiring_{t_wiring} {}

  [[nodiscard]] Pins pins() const noexcept {
    if (this->wiring_ == ResetWiring::Direct) {
      return {this->rts_high_, this->dtr_high_};
    }

    // each transistor only conducts while its own line is low and the other one is high
    bool const en  = not(not this->rts_high_ and this->dtr_high_);
    bool const io0 = not(not this->dtr_high_ and this->rts_high_);
    return {en, io0};
  }

  bool set_control_lines(bool const t_en, bool const t_boot) noexcept {
    for (auto const& [line, high] : espflasher::modem_levels(this->wiring_, t_en, t_boot)) {
      (line == ModemLine::Dtr ? this->dtr_high_ : this->rts_high_) = high;
    }
    return true;
  }

  void delay(std::chrono::milliseconds const /*t_duration*/) { this->held_.push_back(this->pins()); }
};

static_assert(espflasher::Transport<Board>);

class PseudoTerminal {
  int master_ = -1;
  int slave_  = -1;
  std::string name_;

 public:
  PseudoTerminal() {
    std::array<char, 128> name{};
    if (openpty(&this->master_, &this->slave_, name.data(), nullptr, nullptr) != 0) {
      throw std::runtime_error("openpty failed");
    }
    this->name_ = name.data();
  }

  PseudoTerminal(PseudoTerminal const&)            = delete;
  PseudoTerminal& operator=(PseudoTerminal const&) = delete;

  ~PseudoTerminal() {
    ::close(this->slave_);
    ::close(this->master_);
  }

  [[nodiscard]] std::string const& name() const noexcept { return this->name_; }

  void send(std::vector<std::uint8_t> const& t_bytes) const {
    REQUIRE(::write(this->master_, t_bytes.data(), t_bytes.size()) == static_cast<ssize_t>(t_bytes.size()));
  }

  [[nodiscard]] std::vector<std::uint8_t> receive(std::size_t const t_count) const {
    std::vector<std::uint8_t> ret;
    pollfd fd{this->master_, POLLIN, 0};
    while (ret.size() < t_count and ::poll(&fd, 1, 1000) > 0) {
      std::array<std::uint8_t, 64> buffer{};
      auto const byte_read = ::read(this->master_, buffer.data(), buffer.size());
      if (byte_read <= 0) {
        break;
      }
      ret.insert(ret.end(), buffer.begin(), buffer.begin() + byte_read);
    }
    return ret;
  }
};

}  // namespace

TEST_CASE("auto reset circuit latches download mode", "[SerialPort]") {
  Board board{ResetWiring::AutoReset};
  ResetSequencer<Board> reset{board, ControlLines::Supported, {ResetProfile{100ms, 50ms, 0ms}}};

  REQUIRE(reset.enter_bootloader() == ResetOutcome::Done);
  // chip held in reset, then released while IO0 is low, then IO0 released
  CHECK(board.held_ == std::vector<Pins>{{false, true}, {true, false}, {true, true}});

  SECTION("normal reset releases EN with IO0 high") {
    board.held_.clear();
    REQUIRE(reset.return_to_normal() == ResetOutcome::Done);
    CHECK(board.held_ == std::vector<Pins>{{false, true}});
    CHECK(board.pins() == Pins{true, true});
  }
}

TEST_CASE("directly wired board follows the lines one to one", "[SerialPort]") {
  Board board{ResetWiring::Direct};
  ResetSequencer<Board> reset{board, ControlLines::Supported, {ResetProfile{100ms, 50ms, 0ms}}};

  REQUIRE(reset.enter_bootloader() == ResetOutcome::Done);
  CHECK(board.held_ == std::vector<Pins>{{false, false}, {true, false}, {true, true}});
}

TEST_CASE("auto reset never asserts both lines for a held state", "[SerialPort]") {
  for (bool const en : {false, true}) {
    for (bool const boot : {false, true}) {
      auto const levels = espflasher::modem_levels(ResetWiring::AutoReset, en, boot);
      CHECK(levels[0].line_ == ModemLine::Dtr);
      CHECK(levels[1].line_ == ModemLine::Rts);
      CHECK((levels[0].high_ or levels[1].high_));
    }
  }
}

TEST_CASE("serial port reads over a pseudo terminal", "[SerialPort]") {
  PseudoTerminal pty;
  espflasher::SerialPort port{pty.name()};
  REQUIRE_NOTHROW(port.open(115200));

  SECTION("a timed out read takes nothing") {
    CHECK_FALSE(port.read_chunk(50ms).has_value());

    std::vector<std::uint8_t> const reply{0xC0, 0x01, 0x08, 0xDB, 0xC0};
    pty.send(reply);

    std::vector<std::uint8_t> received;
    for (int i = 0; i < 10 and received.size() < reply.size(); ++i) {
      if (auto chunk = port.read_chunk(500ms); chunk) {
        received.insert(received.end(), chunk->begin(), chunk->end());
      }
    }
    CHECK(received == reply);
    CHECK_FALSE(port.read_chunk(20ms).has_value());
  }

  SECTION("written bytes reach the other end unchanged") {
    std::vector<std::uint8_t> const request{0xC0, 0x00, 0x08, 0x24, 0x00, 0x0A, 0x0D, 0xC0};
    port.write(request);
    CHECK(pty.receive(request.size()) == request);
  }

  SECTION("unread input is flushed") {
    pty.send({0x55, 0x55, 0x55});
    port.delay(50ms);
    port.flush_input();
    CHECK_FALSE(port.read_chunk(50ms).has_value());
  }

  port.close();
}
