#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/booking_status.hpp"
#include "internal/model/time_slot.hpp"

namespace booking::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operator action on a record whose current state does not allow it.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Requested interval collides with an existing booking.

  blocking_booking_id is empty when the collision was detected by the
  store constraint rather than by the pre-insert check.
*/
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg, std::string blocking_booking_id = {}, std::vector<model::TimeSlot> alternatives = {})
      : std::runtime_error(msg), blocking_booking_id_(std::move(blocking_booking_id)), alternatives_(std::move(alternatives)) {
  }

  const std::string& BlockingBookingId() const {
    return blocking_booking_id_;
  }

  const std::vector<model::TimeSlot>& Alternatives() const {
    return alternatives_;
  }

 private:
  std::string                  blocking_booking_id_;
  std::vector<model::TimeSlot> alternatives_;
};

class InvalidTransitionError : public std::runtime_error {
 public:
  InvalidTransitionError(model::BookingStatus current, model::BookingStatus requested)
      : std::runtime_error("invalid booking transition: " + std::string(model::ToString(current)) + " -> " +
                           std::string(model::ToString(requested))),
        current_(current),
        requested_(requested) {
  }

  model::BookingStatus Current() const {
    return current_;
  }

  model::BookingStatus Requested() const {
    return requested_;
  }

 private:
  model::BookingStatus current_;
  model::BookingStatus requested_;
};

// Payment provider failures. Transient ones are retried by the payout scheduler.
class TransientProviderError : public std::runtime_error {
 public:
  explicit TransientProviderError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermanentProviderError : public std::runtime_error {
 public:
  explicit PermanentProviderError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace booking::util
