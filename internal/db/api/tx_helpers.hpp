#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace booking::db {

// Maps a failed Result onto the service exception taxonomy.
// Retryable store outcomes surface as CommitConflict.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.Retryable()) {
    throw CommitConflict(message);
  }
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw booking::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw booking::util::NotFound(message);
    default:
      throw std::runtime_error(message + " (" + std::string(ToString(result.code)) + ")");
  }
}

/*
  Runs fn (which opens and commits its own transaction) until it gets
  through without a CommitConflict, at most max_attempts times.
*/
template <typename Fn>
auto RetryOnCommitConflict(std::uint32_t max_attempts, Fn&& fn) -> decltype(fn()) {
  if (max_attempts == 0) {
    max_attempts = 1;
  }
  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const CommitConflict&) {
      if (attempt >= max_attempts) {
        throw;
      }
    }
  }
}

} // namespace booking::db
