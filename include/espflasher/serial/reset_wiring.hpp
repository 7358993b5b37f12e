#pragma once

#include <array>

namespace espflasher {

/**
 * @brief How DTR and RTS reach EN and the boot select pin.
 *
 *        AutoReset is the two transistor circuit found on most dev boards, line levels (0 = asserted):
 *
 *        DTR  RTS  -->  EN  IO0
 *         1    1        1    1
 *         0    0        1    1
 *         1    0        0    1
 *         0    1        1    0
 *
 *        Direct wires RTS to EN and DTR to the boot select pin, asserting a line pulls its pin low.
 */
enum class ResetWiring { AutoReset, Direct };

enum class ModemLine { Dtr, Rts };

struct LineLevel {
  ModemLine line_;
  bool high_;  // high = deasserted
};

/**
 * @brief Line levels that put EN and boot select into the requested state, in the order they are to be written.
 *        DTR goes first, as a reset driver usually settles boot select before it moves EN.
 */
inline constexpr std::array<LineLevel, 2> modem_levels(ResetWiring const t_wiring, bool const t_en,
                                                       bool const t_boot) noexcept {
  if (t_wiring == ResetWiring::Direct) {
    return {LineLevel{ModemLine::Dtr, t_boot}, LineLevel{ModemLine::Rts, t_en}};
  }

  if (not t_en) {
    return {LineLevel{ModemLine::Dtr, true}, LineLevel{ModemLine::Rts, false}};
  }

  if (not t_boot) {
    return {LineLevel{ModemLine::Dtr, false}, LineLevel{ModemLine::Rts, true}};
  }

  return {LineLevel{ModemLine::Dtr, true}, LineLevel{ModemLine::Rts, true}};
}

}  // namespace espflasher
