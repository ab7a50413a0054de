#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "booking_options.hpp"
#include "internal/availability/availability_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/model/booking_status.hpp"
#include "internal/payout/payout_scheduler.hpp"
#include "internal/util/time.hpp"

namespace booking::core {

/*
  Every booking status change goes through here.

  A transition, its audit record and its financial side effects
  (cancellation fee ledger entry, payout on COMPLETED) commit together.
  Writes are guarded by the booking version, so of two concurrent
  transitions from the same state only one applies; the loser re-reads
  and usually fails with InvalidTransitionError.
*/
class BookingStateMachine {
 public:
  BookingStateMachine(std::shared_ptr<db::Repository> repository, std::shared_ptr<availability::AvailabilityService> availability,
                      std::shared_ptr<payout::PayoutScheduler> payouts, std::shared_ptr<events::EventSink> events, BookingOptions options);

  db::model::BookingRecord Transition(const std::string& booking_id, model::BookingStatus target, const std::string& triggered_by,
                                      const std::string& reason, util::TimePoint now);

  // Oldest first.
  std::vector<db::model::TransitionRecord>  History(const std::string& booking_id);
  std::vector<db::model::LedgerEntryRecord> Ledger(const std::string& booking_id);

  // Fee owed when `booking` is cancelled at `now`. Only CONFIRMED bookings
  // inside the late-cancel window pay.
  int64_t CancellationFee(const db::model::BookingRecord& booking, int32_t utc_offset_minutes, util::TimePoint now) const;

 private:
  std::shared_ptr<db::Repository>                    repository_;
  std::shared_ptr<availability::AvailabilityService> availability_;
  std::shared_ptr<payout::PayoutScheduler>           payouts_;
  std::shared_ptr<events::EventSink>                 events_;
  BookingOptions                                     options_;
};

} // namespace booking::core
