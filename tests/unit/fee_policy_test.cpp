#include "internal/core/fee_policy.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using booking::core::FeeOptions;
using booking::core::FeePolicy;
using booking::core::PriceBreakdown;

void TestRegisteredCustomerBreakdown() {
  FeePolicy  policy(FeeOptions{});
  const auto price = policy.Compute(10'000, false);

  assert(price.total_cents == 10'000);
  assert(price.platform_fee_cents == 1'000);
  assert(price.provider_payout_cents == 9'000);
  assert(price.currency == "USD");
}

void TestGuestPaysSurcharge() {
  FeePolicy  policy(FeeOptions{});
  const auto price = policy.Compute(10'000, true);

  assert(price.total_cents == 11'000);
  assert(price.provider_payout_cents == 9'000);
}

void TestPriceBounds() {
  FeeOptions options;
  options.min_price_cents = 500;
  options.max_price_cents = 1'000;
  FeePolicy policy(options);

  bool threw = false;
  try {
    (void)policy.Compute(499, false);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)policy.Compute(1'001, false);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestNormalizeRejectsInconsistentBreakdown() {
  FeePolicy policy(FeeOptions{});

  PriceBreakdown ok{5'000, 500, 4'500, ""};
  assert(policy.Normalize(ok).currency == "USD");

  bool threw = false;
  try {
    (void)policy.Normalize(PriceBreakdown{4'000, 500, 4'500, "USD"});
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw && "total below provider payout must be rejected");
}

void TestPercentRoundsHalfUp() {
  assert(FeePolicy::PercentOf(1'002, 25) == 251);
  assert(FeePolicy::PercentOf(1'000, 25) == 250);
  assert(FeePolicy::PercentOf(0, 25) == 0);
}

} // namespace

int main() {
  TestRegisteredCustomerBreakdown();
  TestGuestPaysSurcharge();
  TestPriceBounds();
  TestNormalizeRejectsInconsistentBreakdown();
  TestPercentRoundsHalfUp();

  std::cout << "booking_engine_unit_fee_policy: pass\n";
  return 0;
}
