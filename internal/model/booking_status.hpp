#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace booking::model {

enum class BookingStatus : std::uint8_t {
  kPending       = 1,
  kConfirmed     = 2,
  kInProgress    = 3,
  kCompleted     = 4,
  kCancelled     = 5,
  kNoShow        = 6,
  kRefunded      = 7,
  kPaymentFailed = 8,
};

constexpr bool IsTerminal(BookingStatus status) {
  return status == BookingStatus::kRefunded;
}

// Statuses that hold the provider's time. Everything else frees the slot.
constexpr bool OccupiesSlot(BookingStatus status) {
  return status != BookingStatus::kCancelled && status != BookingStatus::kNoShow && status != BookingStatus::kRefunded;
}

constexpr bool CanTransition(BookingStatus from, BookingStatus to) {
  switch (from) {
    case BookingStatus::kPending:
      return to == BookingStatus::kPaymentFailed || to == BookingStatus::kConfirmed || to == BookingStatus::kCancelled;
    case BookingStatus::kPaymentFailed:
      return to == BookingStatus::kPending || to == BookingStatus::kCancelled;
    case BookingStatus::kConfirmed:
      return to == BookingStatus::kInProgress || to == BookingStatus::kCancelled || to == BookingStatus::kNoShow;
    case BookingStatus::kInProgress:
      return to == BookingStatus::kCompleted || to == BookingStatus::kCancelled;
    case BookingStatus::kCompleted:
    case BookingStatus::kCancelled:
    case BookingStatus::kNoShow:
      return to == BookingStatus::kRefunded;
    case BookingStatus::kRefunded:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(BookingStatus status) {
  switch (status) {
    case BookingStatus::kPending:
      return "pending";
    case BookingStatus::kConfirmed:
      return "confirmed";
    case BookingStatus::kInProgress:
      return "in_progress";
    case BookingStatus::kCompleted:
      return "completed";
    case BookingStatus::kCancelled:
      return "cancelled";
    case BookingStatus::kNoShow:
      return "no_show";
    case BookingStatus::kRefunded:
      return "refunded";
    case BookingStatus::kPaymentFailed:
      return "payment_failed";
  }
  return "unknown";
}

constexpr std::optional<BookingStatus> ParseBookingStatus(std::string_view value) {
  for (auto status : {BookingStatus::kPending, BookingStatus::kConfirmed, BookingStatus::kInProgress, BookingStatus::kCompleted,
                      BookingStatus::kCancelled, BookingStatus::kNoShow, BookingStatus::kRefunded, BookingStatus::kPaymentFailed}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace booking::model
