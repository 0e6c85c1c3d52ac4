#include "etude/events.hpp"

#include "debug_log.hpp"

namespace etude {
namespace {

bool events_debug_enabled() {
  static const bool enabled = debug_enabled("events");
  return enabled;
}

} // namespace

void EventLog::publish(const LibraryEvent& event) {
  debug_log(events_debug_enabled(), "events", event.type + " " + event.data.dump());
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<LibraryEvent> EventLog::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<LibraryEvent> EventLog::events_of_type(const std::string& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LibraryEvent> out;
  for (const auto& event : events_) {
    if (event.type == type) {
      out.push_back(event);
    }
  }
  return out;
}

void EventLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

} // namespace etude
