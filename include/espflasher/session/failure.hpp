#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "espflasher/serial/packet.hpp"

namespace espflasher {

enum class FailureKind {
  SyncTimeout,
  Transport,
  Timeout,
  Malformed,
  DeviceStatus,
  SecureBootRejected,
  Provider,
  InvalidState,
};

inline constexpr std::string_view to_string(FailureKind const t_kind) noexcept {
  switch (t_kind) {
    case FailureKind::SyncTimeout:
      return "sync timeout";
    case FailureKind::Transport:
      return "transport error";
    case FailureKind::Timeout:
      return "timeout";
    case FailureKind::Malformed:
      return "malformed response";
    case FailureKind::DeviceStatus:
      return "device error";
    case FailureKind::SecureBootRejected:
      return "secure boot rejected";
    case FailureKind::Provider:
      return "firmware unavailable";
    case FailureKind::InvalidState:
      return "invalid state";
  }
  return "unknown";
}

/**
 * @brief Why a session ended in Failed. Enough context for the caller to decide whether running the whole session
 *        again is worth it.
 */
struct FailureReason {
  FailureKind kind_;
  std::string_view operation_;
  std::optional<std::size_t> region_;
  std::optional<std::uint32_t> sequence_;
  std::optional<std::uint32_t> offset_;
  StatusCode status_{};
  std::string cause_;
};

}  // namespace espflasher

template <>
struct fmt::formatter<espflasher::FailureReason> : fmt::formatter<std::string_view> {
  auto format(espflasher::FailureReason const& t_reason, format_context& t_ctx) const {
    auto out = fmt::format_to(t_ctx.out(), "{}", espflasher::to_string(t_reason.kind_));
    if (not t_reason.operation_.empty()) {
      out = fmt::format_to(out, " during {}", t_reason.operation_);
    }
    if (t_reason.region_) {
      out = fmt::format_to(out, ", region {}", *t_reason.region_);
    }
    if (t_reason.sequence_) {
      out = fmt::format_to(out, ", sequence {}", *t_reason.sequence_);
    }
    if (t_reason.offset_) {
      out = fmt::format_to(out, ", flash offset {:#x}", *t_reason.offset_);
    }
    if (not t_reason.status_.ok()) {
      out = fmt::format_to(out, ", status {}", t_reason.status_);
    }
    if (not t_reason.cause_.empty()) {
      out = fmt::format_to(out, ": {}", t_reason.cause_);
    }
    return out;
  }
};
