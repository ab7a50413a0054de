#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace {

using booking::observability::InstantField;
using booking::observability::IntField;
using booking::observability::MoneyField;
using booking::observability::StringField;

// Routes the default logger into a string with the bare message pattern.
class CapturedLog {
 public:
  CapturedLog() : previous_(spdlog::default_logger()) {
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
    auto logger = std::make_shared<spdlog::logger>("booking-engine-test", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
  }

  // The sink writes into out_, so it must not outlive this object.
  ~CapturedLog() {
    spdlog::set_default_logger(previous_);
  }

  std::string Text() {
    spdlog::default_logger()->flush();
    return out_.str();
  }

 private:
  std::shared_ptr<spdlog::logger> previous_;
  std::ostringstream              out_;
};

void TestMoneyAndInstantFormatting() {
  assert(MoneyField("amount", 9'000, "USD").value == "90.00USD");
  assert(MoneyField("fee", 5, "EUR").value == "0.05EUR");
  assert(MoneyField("refund", -1'250, "USD").value == "-12.50USD");

  // 2030-01-14T10:00:00.250Z
  assert(InstantField("scheduled_at", 1'894'615'200'250ULL).value == "2030-01-14T10:00:00.250Z");
  assert(InstantField("processed_at", 0).value == "unset");
}

void TestFieldsAreAppendedAsKeyValuePairs() {
  CapturedLog log;
  BOOKING_LOG_INFO("booking created", {StringField("booking_id", "b-1"), IntField("start_minute", 600)});
  assert(log.Text() == "booking created booking_id=b-1 start_minute=600\n");
}

void TestFreeTextValuesAreQuoted() {
  CapturedLog log;
  BOOKING_LOG_WARN("payout cancelled", {StringField("reason", "customer asked \"twice\""), StringField("performed_by", "")});
  assert(log.Text() == "payout cancelled reason=\"customer asked \\\"twice\\\"\" performed_by=\"\"\n");
}

void TestLevelFilterSkipsDebug() {
  CapturedLog log;
  spdlog::default_logger()->set_level(spdlog::level::info);
  BOOKING_LOG_DEBUG("payout pass skipped, no payment provider");
  assert(log.Text().empty());
}

} // namespace

int main() {
  TestMoneyAndInstantFormatting();
  TestFieldsAreAppendedAsKeyValuePairs();
  TestFreeTextValuesAreQuoted();
  TestLevelFilterSkipsDebug();

  spdlog::shutdown();
  std::cout << "booking_engine_unit_logging: pass\n";
  return 0;
}
