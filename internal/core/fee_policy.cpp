#include "fee_policy.hpp"

#include "internal/util/errors.hpp"

namespace booking::core {

FeePolicy::FeePolicy(FeeOptions options) : options_(std::move(options)) {
  if (options_.currency.empty()) {
    options_.currency = "USD";
  }
}

int64_t FeePolicy::PercentOf(int64_t amount_cents, uint32_t percent) {
  return (amount_cents * static_cast<int64_t>(percent) + 50) / 100;
}

PriceBreakdown FeePolicy::Compute(int64_t base_price_cents, bool guest) const {
  if (base_price_cents < options_.min_price_cents) {
    throw util::ValidationError("base price below minimum of " + std::to_string(options_.min_price_cents) + " cents");
  }
  if (options_.max_price_cents > 0 && base_price_cents > options_.max_price_cents) {
    throw util::ValidationError("base price above maximum of " + std::to_string(options_.max_price_cents) + " cents");
  }

  const int64_t platform_fee = PercentOf(base_price_cents, options_.platform_fee_percent);
  const int64_t surcharge    = guest ? PercentOf(base_price_cents, options_.guest_surcharge_percent) : 0;

  PriceBreakdown breakdown;
  breakdown.total_cents           = base_price_cents + surcharge;
  breakdown.platform_fee_cents    = platform_fee;
  breakdown.provider_payout_cents = base_price_cents - platform_fee;
  breakdown.currency              = options_.currency;
  return breakdown;
}

PriceBreakdown FeePolicy::Normalize(PriceBreakdown breakdown) const {
  if (breakdown.provider_payout_cents < 0 || breakdown.platform_fee_cents < 0) {
    throw util::ValidationError("price components must not be negative");
  }
  if (breakdown.total_cents < breakdown.provider_payout_cents) {
    throw util::ValidationError("total is less than the provider payout");
  }
  if (breakdown.currency.empty()) {
    breakdown.currency = options_.currency;
  }
  if (breakdown.currency.size() != 3) {
    throw util::ValidationError("currency must be a three-letter code");
  }
  return breakdown;
}

} // namespace booking::core
