#pragma once

#include <cstdint>
#include <string>

namespace booking::core {

struct FeeOptions {
  uint32_t    platform_fee_percent    = 10;
  uint32_t    guest_surcharge_percent = 10;
  int64_t     min_price_cents         = 100;
  int64_t     max_price_cents         = 1'000'000;
  std::string currency                = "USD";
};

// Minor currency units.
struct PriceBreakdown {
  int64_t     total_cents           = 0;
  int64_t     platform_fee_cents    = 0;
  int64_t     provider_payout_cents = 0;
  std::string currency;
};

/*
  Turns a provider's base price into what the customer pays and what the
  provider receives.

    platform fee    = base * platform_fee_percent
    guest surcharge = base * guest_surcharge_percent (guest bookings only)
    provider payout = base - platform fee
    total           = base + guest surcharge
*/
class FeePolicy {
 public:
  explicit FeePolicy(FeeOptions options);

  // Throws ValidationError when the base price is outside the configured bounds.
  PriceBreakdown Compute(int64_t base_price_cents, bool guest) const;

  // Checks a caller-supplied breakdown; fills the currency when empty.
  PriceBreakdown Normalize(PriceBreakdown breakdown) const;

  // percent of amount, rounded half-up.
  static int64_t PercentOf(int64_t amount_cents, uint32_t percent);

  const FeeOptions& Options() const {
    return options_;
  }

 private:
  FeeOptions options_;
};

} // namespace booking::core
