#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace etude {

//====================================================================
// MULTI-VOICE SCORE
//====================================================================

struct GraceNote {
  bool slash = false;
  bool small = true;
};

struct Ornament {
  std::string type; // "trill", "mordent", "turn", ...
  std::optional<std::string> accidental;
};

struct VoiceNote {
  std::vector<std::string> keys;
  NoteDuration duration = NoteDuration::Quarter;
  double time = 0.0;
  std::string voice_id;
  std::optional<std::string> staff_id;
  std::optional<std::string> accidental;
  int dots = 0;
  std::optional<StemDirection> stem;
  bool beam = false;
  std::optional<Articulation> articulation;
  std::optional<DynamicMarking> dynamic;
  std::optional<std::string> fingering;
  bool rest = false;
  std::optional<TieType> tie;
  std::optional<GraceNote> grace;
  std::vector<Ornament> ornaments;
};

struct Voice {
  std::string id;
  std::optional<std::string> name;
  std::optional<StemDirection> stem_direction;
  std::vector<VoiceNote> notes;
};

struct Staff {
  std::string id;
  Clef clef = Clef::Treble;
  std::optional<std::string> name;
  std::vector<Voice> voices;
};

struct Part {
  std::string id;
  std::string name;
  std::string instrument;
  std::vector<std::string> staves; // staff ids, top to bottom
  std::optional<int> midi_program;
  std::optional<int> volume;
  std::optional<int> pan;
};

struct Volta {
  int number = 1;
  bool start = true;
  bool end = true;
};

struct ScoreMeasure {
  int number = 1;
  std::vector<Staff> staves;
  std::optional<TimeSignature> time_signature;
  std::optional<KeySignature> key_signature;
  std::optional<int> tempo;
  std::optional<DynamicMarking> dynamics;
  std::optional<std::string> rehearsal_mark;
  std::optional<BarLineType> bar_line;
  std::optional<int> repeat_count;
  std::optional<Volta> volta;
};

struct ScoreMetadata {
  std::optional<std::string> id;
  Timestamp created_at{};
  Timestamp modified_at{};
  std::string source;
  std::optional<std::string> original_filename;
  std::optional<std::string> encoding_software;
  std::vector<std::string> tags;
  std::optional<std::string> performance_notes;
  std::optional<int> difficulty;
  std::optional<int> duration_seconds;
  std::vector<std::string> muted_voices;
  std::optional<std::string> solo_voice;
};

struct Score {
  std::string title;
  std::string composer;
  std::optional<std::string> arranger;
  std::optional<std::string> copyright;
  std::vector<Part> parts;
  std::vector<ScoreMeasure> measures;
  ScoreMetadata metadata;
};

double note_duration(const VoiceNote& note);

} // namespace etude
