#include "etude/score.hpp"
#include "etude/sheet_music.hpp"

namespace etude {

double note_duration(const Note& note) { return dotted_value(note.duration, note.dots); }

double note_duration(const VoiceNote& note) { return dotted_value(note.duration, note.dots); }

double measure_duration(const std::vector<Note>& notes) {
  double total = 0.0;
  for (const auto& note : notes) {
    total += note_duration(note);
  }
  return total;
}

Note make_rest(NoteDuration duration, double time) {
  Note rest;
  rest.keys = {kRestKey};
  rest.duration = duration;
  rest.time = time;
  rest.rest = true;
  return rest;
}

} // namespace etude
