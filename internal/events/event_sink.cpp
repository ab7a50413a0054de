#include "event_sink.hpp"

#include "internal/observability/logging.hpp"

namespace booking::events {

namespace {

std::string Describe(const Event& event) {
  std::string out = event.type + " id=" + event.subject_id;
  for (const auto& [key, value] : event.attributes) {
    out += ' ';
    out += key;
    out += '=';
    out += value;
  }
  return out;
}

} // namespace

void LoggingEventSink::Publish(const Event& event) {
  BOOKING_LOG_INFO("event", {observability::StringField("detail", Describe(event))});
}

void LoggingEventSink::Alert(const Event& event) {
  BOOKING_LOG_ERROR("operator alert", {observability::StringField("detail", Describe(event))});
}

} // namespace booking::events
