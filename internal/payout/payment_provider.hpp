#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace booking::payout {

struct TransferRequest {
  // Same key for every attempt of one payout, so a retried call never pays twice.
  std::string               idempotency_key;
  std::string               payout_id;
  std::string               provider_id;
  int64_t                   amount_cents = 0;
  std::string               currency;
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

struct TransferResult {
  std::string transfer_id;
};

/*
  Money movement to a provider's account.

  Implementations throw util::TransientProviderError for failures worth
  retrying (network, timeout, rate limit, provider 5xx) and
  util::PermanentProviderError for everything else.
*/
class PaymentProvider {
 public:
  virtual ~PaymentProvider() = default;

  virtual TransferResult Transfer(const TransferRequest& request) = 0;
};

} // namespace booking::payout
