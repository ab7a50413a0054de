#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace booking::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

namespace {

booking::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  booking::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: " + message);
  }
}

} // namespace

booking::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

booking::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

// Zero means "use the default" for every numeric knob, so only explicit
// out-of-range values are rejected here.
void ConfigLoader::Validate(const booking::runtime::config::RuntimeConfig& config) {
  const auto& availability = config.availability();
  Require(availability.slot_granularity_minutes() <= 24 * 60, "availability.slot_granularity_minutes exceeds one day");
  Require(availability.cache_ttl().seconds() >= 0, "availability.cache_ttl must not be negative");
  Require(availability.min_lead_time().seconds() >= 0, "availability.min_lead_time must not be negative");

  const auto& locks = config.slot_locks();
  Require(locks.default_ttl().seconds() >= 0 && locks.max_ttl().seconds() >= 0, "slot_locks ttl must not be negative");
  if (locks.max_ttl().seconds() > 0 && locks.default_ttl().seconds() > 0) {
    Require(locks.default_ttl().seconds() <= locks.max_ttl().seconds(), "slot_locks.default_ttl exceeds slot_locks.max_ttl");
  }

  const auto& bookings = config.bookings();
  Require(bookings.late_cancel_fee_percent() <= 100, "bookings.late_cancel_fee_percent must be within 0..100");
  Require(bookings.confirmation_code_length() <= 32, "bookings.confirmation_code_length must be at most 32");

  const auto& fees = config.fees();
  Require(fees.platform_fee_percent() <= 100, "fees.platform_fee_percent must be within 0..100");
  Require(fees.guest_surcharge_percent() <= 100, "fees.guest_surcharge_percent must be within 0..100");
  Require(fees.min_price_cents() >= 0 && fees.max_price_cents() >= 0, "fees price bounds must not be negative");
  if (fees.max_price_cents() > 0) {
    Require(fees.min_price_cents() <= fees.max_price_cents(), "fees.min_price_cents exceeds fees.max_price_cents");
  }

  const auto ratio = config.observability().trace_sample_ratio();
  Require(ratio >= 0.0 && ratio <= 1.0, "observability.trace_sample_ratio must be within 0..1");

  for (const auto& backoff : config.payouts().retry_backoff()) {
    Require(backoff.seconds() > 0, "payouts.retry_backoff entries must be positive");
  }

  if (config.database().has_postgres()) {
    Require(!config.database().postgres().connection_uri().empty(), "database.postgres.connection_uri is required");
  }
}

} // namespace booking::config
