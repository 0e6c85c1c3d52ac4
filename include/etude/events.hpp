#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace etude {

inline constexpr const char* kEventExerciseGenerated = "sheet-music:exercise-generated";
inline constexpr const char* kEventExerciseDeleted = "sheet-music:exercise-deleted";
inline constexpr const char* kEventScoreSaved = "sheet-music:score-saved";
inline constexpr const char* kEventRepertoireStatusChanged = "sheet-music:repertoire-status-changed";
inline constexpr const char* kEventPracticeSessionRecorded = "sheet-music:practice-session-recorded";

struct LibraryEvent {
  std::string source = "sheet-music";
  std::string type;
  nlohmann::json data = nlohmann::json::object();
  Timestamp timestamp{};
};

// Fire-and-forget notification sink. Delivery and ordering belong to the
// implementation.
class EventBus {
public:
  virtual ~EventBus() = default;

  virtual void publish(const LibraryEvent& event) = 0;
};

// Records every published event; used in-process and by tests.
class EventLog : public EventBus {
public:
  void publish(const LibraryEvent& event) override;

  std::vector<LibraryEvent> events() const;
  std::vector<LibraryEvent> events_of_type(const std::string& type) const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<LibraryEvent> events_;
};

} // namespace etude
