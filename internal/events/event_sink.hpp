#pragma once

#include <string>
#include <utility>
#include <vector>

namespace booking::events {

/*
  Fire-and-forget notification for collaborators outside the engine
  (messaging, operator paging). Publishing never fails the caller.
*/
struct Event {
  std::string                                      type;       // e.g. "booking.created"
  std::string                                      subject_id; // booking or payout id
  std::vector<std::pair<std::string, std::string>> attributes;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const Event& event) = 0;

  // Needs a human: terminal payout failures and similar.
  virtual void Alert(const Event& event) = 0;
};

// Default sink: writes every event to the service log.
class LoggingEventSink final : public EventSink {
 public:
  void Publish(const Event& event) override;
  void Alert(const Event& event) override;
};

} // namespace booking::events
