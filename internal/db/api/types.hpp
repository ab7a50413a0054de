#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/payout_status.hpp"

namespace booking::db {

// Inclusive range of YYYY-MM-DD dates. Lexicographic order is calendar order.
struct DateRange {
  std::string from;
  std::string to;
};

struct Pagination {
  // 0 = unbounded
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

struct PayoutFilter {
  std::string                               provider_id; // empty = all providers
  std::vector<booking::model::PayoutStatus> statuses;    // empty = every status
  Pagination                                page;
};

} // namespace booking::db
