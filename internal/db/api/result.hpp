#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace booking::db {

/*
  Outcome of a repository write.

  Backends map their native failures onto these codes so the booking
  and payout layers never see pqxx or sqlite3 types. Reads return
  optionals or vectors instead and throw only on store failure.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // booking, payout, provider or lock id is unknown
  AlreadyExists, // duplicate id, confirmation code or payout for a booking
  Conflict,      // optimistic version check on a booking failed

  // The overlap guard: a slot-occupying booking already covers part of
  // the interval for the same provider and date.
  ConstraintViolation,

  // Lock timeouts and serialization failures. The whole transaction may
  // be retried.
  Busy,
  SerializationFailure,

  StorageError, // I/O failure or a damaged database file
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "version_conflict";
    case ErrorCode::ConstraintViolation:
      return "slot_overlap";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::StorageError:
      return "storage_error";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool Is(ErrorCode c) const {
    return code == c;
  }

  // True when rerunning the whole transaction may succeed.
  bool Retryable() const {
    return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace booking::db
