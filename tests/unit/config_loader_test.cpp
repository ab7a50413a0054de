#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/observability/spans.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "booking_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)booking::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\booking\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = booking::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\booking\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = booking::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
}

void TestEngineSectionsAreParsed() {
  auto config = booking::config::ConfigLoader::LoadFromYamlString(R"(availability:
  slot_granularity_minutes: 30
  cache_ttl: "45s"
  min_lead_time: "7200s"
slot_locks:
  default_ttl: "600s"
  max_ttl: "1800s"
bookings:
  late_cancel_window: "86400s"
  late_cancel_fee_percent: 25
fees:
  platform_fee_percent: 12
  currency: "EUR"
payouts:
  escrow_days: 5
  retry_backoff: ["3600s", "21600s", "86400s"]
  max_retries: 3
payment_gateway:
  target: "payments.internal:443"
)");

  assert(config.availability().slot_granularity_minutes() == 30);
  assert(config.availability().cache_ttl().seconds() == 45);
  assert(config.availability().min_lead_time().seconds() == 7200);
  assert(config.slot_locks().max_ttl().seconds() == 1800);
  assert(config.bookings().late_cancel_window().seconds() == 86400);
  assert(config.bookings().late_cancel_fee_percent() == 25);
  assert(config.fees().platform_fee_percent() == 12);
  assert(config.fees().currency() == "EUR");
  assert(config.payouts().escrow_days() == 5);
  assert(config.payouts().retry_backoff_size() == 3);
  assert(config.payouts().retry_backoff(1).seconds() == 21600);
  assert(config.payment_gateway().target() == "payments.internal:443");
}

void TestObservabilitySectionFeedsExporters() {
  auto config = booking::config::ConfigLoader::LoadFromYamlString(R"(observability:
  tracing_enabled: true
  otlp_endpoint: "http://collector:4318/v1/traces"
  transport: OTLP_TRANSPORT_HTTP
  environment: "staging"
  trace_sample_ratio: 0.25
)");

  assert(config.observability().trace_sample_ratio() == 0.25);

  const auto otlp = booking::observability::ToOtlpConfig(config);
  assert(otlp.transport == booking::observability::OtlpTransport::kHttpProtobuf);
  assert(otlp.endpoint == "http://collector:4318/v1/traces");
  assert(otlp.service_name == "booking-engine");
  assert(otlp.environment == "staging");

  auto named = booking::config::ConfigLoader::LoadFromYamlString(R"(observability:
  service_name: "booking-engine-eu"
)");
  assert(booking::observability::ToOtlpConfig(named).service_name == "booking-engine-eu");
  assert(booking::observability::ToOtlpConfig(named).transport == booking::observability::OtlpTransport::kGrpc);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)booking::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects(R"(slot_locks:
  default_ttl: "3600s"
  max_ttl: "600s"
)"));
  assert(Rejects(R"(bookings:
  late_cancel_fee_percent: 150
)"));
  assert(Rejects(R"(fees:
  min_price_cents: 5000
  max_price_cents: 100
)"));
  assert(Rejects(R"(payouts:
  retry_backoff: ["0s"]
)"));
  assert(Rejects(R"(observability:
  trace_sample_ratio: 1.5
)"));
  assert(Rejects(R"(database:
  postgres:
    max_connections: 4
)"));
  assert(!Rejects(R"(bookings:
  late_cancel_fee_percent: 100
)"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestEngineSectionsAreParsed();
  TestObservabilitySectionFeedsExporters();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeValuesAreRejected();

  std::cout << "booking_engine_unit_config_loader: pass\n";
  return 0;
}
