#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "booking_options.hpp"
#include "fee_policy.hpp"
#include "internal/availability/availability_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/lock/slot_lock_manager.hpp"
#include "internal/util/time.hpp"

namespace booking::core {

struct CreateBookingRequest {
  std::string provider_id;

  // Exactly one of these.
  std::string customer_id;
  std::string guest_email;

  util::Date date{};
  uint32_t   start_minute = 0;
  uint32_t   end_minute   = 0;

  // Explicit breakdown; when absent it is computed from base_price_cents.
  std::optional<PriceBreakdown> price;
  int64_t                       base_price_cents = 0;

  std::string confirmation_code; // generated when empty
  std::string slot_lock_id;      // released after commit
  std::string triggered_by;
};

/*
  The only way a booking row comes into existence.

  Check and insert run in one transaction serialized per provider/date.
  The store's overlap constraint backs the check, so of two coordinators
  racing for one interval exactly one commits and the other gets a
  ConflictError.
*/
class BookingCoordinator {
 public:
  BookingCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<availability::AvailabilityService> availability,
                     std::shared_ptr<lock::SlotLockManager> locks, FeePolicy fees, std::shared_ptr<events::EventSink> events,
                     BookingOptions options);

  // Throws ValidationError, NotFound, AlreadyExists (supplied code taken)
  // or ConflictError carrying the blocking booking and alternatives.
  db::model::BookingRecord CreateBooking(const CreateBookingRequest& request, util::TimePoint now);

  std::optional<db::model::BookingRecord> GetBooking(const std::string& booking_id);
  std::optional<db::model::BookingRecord> GetByConfirmationCode(const std::string& code);

 private:
  PriceBreakdown ResolvePrice(const CreateBookingRequest& request) const;
  void           Validate(const CreateBookingRequest& request) const;
  std::string    UniqueConfirmationCode(db::Transaction& tx) const;

  std::shared_ptr<db::Repository>                    repository_;
  std::shared_ptr<availability::AvailabilityService> availability_;
  std::shared_ptr<lock::SlotLockManager>             locks_;
  FeePolicy                                          fees_;
  std::shared_ptr<events::EventSink>                 events_;
  BookingOptions                                     options_;
};

} // namespace booking::core
