#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace booking::model {

enum class PayoutStatus : std::uint8_t {
  kScheduled  = 1,
  kProcessing = 2,
  kCompleted  = 3,
  kFailed     = 4,
  kCancelled  = 5,
};

constexpr bool IsTerminal(PayoutStatus status) {
  return status == PayoutStatus::kCompleted || status == PayoutStatus::kFailed || status == PayoutStatus::kCancelled;
}

constexpr std::string_view ToString(PayoutStatus status) {
  switch (status) {
    case PayoutStatus::kScheduled:
      return "scheduled";
    case PayoutStatus::kProcessing:
      return "processing";
    case PayoutStatus::kCompleted:
      return "completed";
    case PayoutStatus::kFailed:
      return "failed";
    case PayoutStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

constexpr std::optional<PayoutStatus> ParsePayoutStatus(std::string_view value) {
  for (auto status : {PayoutStatus::kScheduled, PayoutStatus::kProcessing, PayoutStatus::kCompleted, PayoutStatus::kFailed,
                      PayoutStatus::kCancelled}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace booking::model
