#pragma once

#include "booking/engine/v1/types.pb.h"
#include "internal/db/model/availability_window_record.hpp"
#include "internal/db/model/blocked_slot_record.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/payout_record.hpp"
#include "internal/db/model/provider_record.hpp"
#include "internal/db/model/slot_lock_record.hpp"
#include "internal/db/model/transition_record.hpp"
#include "internal/model/booking_status.hpp"
#include "internal/model/payout_status.hpp"
#include "internal/model/time_slot.hpp"

namespace booking::service {

/*
  Record <-> wire conversions shared by the services.
  Zero timestamps stay unset on the wire.
*/

booking::engine::v1::BookingStatus ToProto(model::BookingStatus status);
booking::engine::v1::PayoutStatus  ToProto(model::PayoutStatus status);

// Throw ValidationError for UNSPECIFIED or unknown values.
model::BookingStatus FromProto(booking::engine::v1::BookingStatus status);
model::PayoutStatus  FromProto(booking::engine::v1::PayoutStatus status);

booking::engine::v1::TimeSlot          ToProto(const model::TimeSlot& slot);
booking::engine::v1::Booking           ToProto(const db::model::BookingRecord& record);
booking::engine::v1::BookingTransition ToProto(const db::model::TransitionRecord& record);
booking::engine::v1::SlotLock          ToProto(const db::model::SlotLockRecord& record);
booking::engine::v1::Payout            ToProto(const db::model::PayoutRecord& record);
booking::engine::v1::Provider          ToProto(const db::model::ProviderRecord& record);
booking::engine::v1::AvailabilityWindow ToProto(const db::model::AvailabilityWindowRecord& record);
booking::engine::v1::BlockedSlot       ToProto(const db::model::BlockedSlotRecord& record);

} // namespace booking::service
