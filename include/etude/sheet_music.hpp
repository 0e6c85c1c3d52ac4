#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace etude {

//====================================================================
// LEGACY FLAT FORMAT
//====================================================================
// Single-voice notation consumed by older renderers. A chord is one Note
// with several keys; time is in quarter notes from the start of the measure.

struct Note {
  std::vector<std::string> keys; // pitch keys, "c/4"
  NoteDuration duration = NoteDuration::Quarter;
  double time = 0.0;
  std::optional<std::string> accidental;
  int dots = 0;
  std::optional<StemDirection> stem;
  bool beam = false;
  std::optional<Articulation> articulation;
  std::optional<DynamicMarking> dynamic;
  std::optional<std::string> fingering;
  bool rest = false;
  std::optional<TieType> tie;
};

struct Measure {
  int number = 1;
  std::vector<Note> notes;
  std::optional<TimeSignature> time_signature;
  std::optional<KeySignature> key_signature;
  std::optional<Clef> clef;
  std::optional<int> tempo;
  std::optional<DynamicMarking> dynamics;
  std::optional<std::string> rehearsal_mark;
  std::optional<BarLineType> bar_line;
  std::optional<int> repeat_count;
};

struct SheetMusic {
  std::string id;
  std::string title;
  std::string composer;
  std::optional<std::string> opus;
  Instrument instrument = Instrument::Piano;
  int difficulty_level = 5;
  int duration_seconds = 60;
  TimeSignature time_signature{4, 4};
  KeySignature key_signature = KeySignature::CMajor;
  int suggested_tempo = 120;
  std::vector<std::string> tags;
  std::vector<Measure> measures;
};

// Placeholder used for rests; renderers position it on the middle line.
inline constexpr const char* kRestKey = "b/4";

double note_duration(const Note& note);
double measure_duration(const std::vector<Note>& notes);

Note make_rest(NoteDuration duration, double time);

} // namespace etude
