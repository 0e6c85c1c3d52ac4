#include "etude/converters.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "etude/pitch.hpp"
#include "debug_log.hpp"

namespace etude {
namespace {

constexpr double kSimultaneityTolerance = 1e-6;

bool convert_debug_enabled() {
  static const bool enabled = debug_enabled("convert");
  return enabled;
}

void warn(std::vector<std::string>& warnings, std::string message) {
  debug_log(convert_debug_enabled(), "convert", message);
  warnings.push_back(std::move(message));
}

std::string lower(std::string text) {
  for (char& c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

std::string upper(std::string text) {
  for (char& c : text) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return text;
}

// Empty string when the note can be carried over, otherwise the reason.
template <typename N>
std::string malformed_reason(const N& note) {
  if (note.keys.empty()) {
    return "note has no keys";
  }
  if (note.rest) {
    return "";
  }
  for (const auto& key : note.keys) {
    if (!is_valid_pitch_key(key)) {
      return "malformed pitch '" + key + "'";
    }
  }
  return "";
}

Note to_flat_note(const VoiceNote& note) {
  Note out;
  out.keys = note.keys;
  out.duration = note.duration;
  out.time = note.time;
  out.accidental = note.accidental;
  out.dots = note.dots;
  out.stem = note.stem;
  out.beam = note.beam;
  out.articulation = note.articulation;
  out.dynamic = note.dynamic;
  out.fingering = note.fingering;
  out.rest = note.rest;
  out.tie = note.tie;
  return out;
}

void copy_measure_overrides(const Measure& from, ScoreMeasure& to) {
  to.tempo = from.tempo;
  to.dynamics = from.dynamics;
  to.rehearsal_mark = from.rehearsal_mark;
  to.bar_line = from.bar_line;
  to.repeat_count = from.repeat_count;
}

// Merges notes sharing a start time into one chord note. The first note of
// a group supplies duration and decorations.
std::vector<Note> group_simultaneous(std::vector<Note> notes, int measure_number,
                                     std::vector<std::string>& warnings) {
  std::stable_sort(notes.begin(), notes.end(),
                   [](const Note& a, const Note& b) { return a.time < b.time; });
  std::vector<Note> grouped;
  for (auto& note : notes) {
    if (grouped.empty() || std::abs(grouped.back().time - note.time) > kSimultaneityTolerance) {
      grouped.push_back(std::move(note));
      continue;
    }
    Note& chord = grouped.back();
    if (chord.duration != note.duration || chord.dots != note.dots) {
      warn(warnings, "measure " + std::to_string(measure_number) +
                         ": simultaneous notes at beat " + std::to_string(note.time) +
                         " differ in duration; keeping " + to_string(chord.duration));
    }
    if (note.rest) {
      continue;
    }
    if (chord.rest) {
      chord.keys.clear();
      chord.rest = false;
    }
    for (const auto& key : note.keys) {
      if (std::find(chord.keys.begin(), chord.keys.end(), key) == chord.keys.end()) {
        chord.keys.push_back(key);
      }
    }
  }
  return grouped;
}

Clef derive_clef(const ScoreMeasure& measure) {
  if (measure.staves.size() == 2 && measure.staves[0].clef == Clef::Treble &&
      measure.staves[1].clef == Clef::Bass) {
    return Clef::GrandStaff;
  }
  if (!measure.staves.empty()) {
    return measure.staves.front().clef;
  }
  return Clef::Treble;
}

Measure placeholder_measure() {
  Measure measure;
  measure.number = 1;
  measure.notes.push_back(make_rest(NoteDuration::Whole, 0.0));
  measure.time_signature = TimeSignature{4, 4};
  measure.key_signature = KeySignature::CMajor;
  measure.clef = Clef::Treble;
  return measure;
}

} // namespace

VoiceNote to_voice_note(const Note& note, const std::string& voice_id, const std::string& staff_id) {
  VoiceNote out;
  out.keys = note.keys;
  out.duration = note.duration;
  out.time = note.time;
  out.voice_id = voice_id;
  out.staff_id = staff_id;
  out.accidental = note.accidental;
  out.dots = note.dots;
  out.stem = note.stem;
  out.beam = note.beam;
  out.articulation = note.articulation;
  out.dynamic = note.dynamic;
  out.fingering = note.fingering;
  out.rest = note.rest;
  out.tie = note.tie;
  return out;
}

//====================================================================
// FLAT -> MULTI-VOICE
//====================================================================

Converted<Score> flat_to_multi_voice_with_report(const SheetMusic& sheet, Timestamp now) {
  Converted<Score> out;
  Score& score = out.value;
  const bool grand_staff = std::any_of(sheet.measures.begin(), sheet.measures.end(),
                                       [](const Measure& m) { return m.clef == Clef::GrandStaff; });

  Part part;
  part.id = "main";
  part.name = to_string(sheet.instrument);
  part.instrument = lower(to_string(sheet.instrument));
  part.staves = grand_staff ? std::vector<std::string>{"treble", "bass"}
                            : std::vector<std::string>{"main"};

  Clef current_clef = Clef::Treble;
  for (const auto& measure : sheet.measures) {
    ScoreMeasure converted;
    converted.number = measure.number;
    converted.time_signature = measure.time_signature.value_or(sheet.time_signature);
    converted.key_signature = measure.key_signature.value_or(sheet.key_signature);
    copy_measure_overrides(measure, converted);

    if (grand_staff) {
      Voice right{"rightHand", std::string("Right Hand"), StemDirection::Auto, {}};
      Voice left{"leftHand", std::string("Left Hand"), StemDirection::Auto, {}};
      for (const auto& note : measure.notes) {
        const std::string reason = malformed_reason(note);
        if (!reason.empty()) {
          warn(out.warnings, "measure " + std::to_string(measure.number) + ": skipped note, " + reason);
          continue;
        }
        const bool treble = note.rest || parse_pitch_key(note.keys.front()).octave >= 4;
        if (treble) {
          right.notes.push_back(to_voice_note(note, "rightHand", "treble"));
        } else {
          left.notes.push_back(to_voice_note(note, "leftHand", "bass"));
        }
      }
      Staff treble{"treble", Clef::Treble, std::nullopt, {}};
      Staff bass{"bass", Clef::Bass, std::nullopt, {}};
      if (!right.notes.empty()) {
        treble.voices.push_back(std::move(right));
      }
      if (!left.notes.empty()) {
        bass.voices.push_back(std::move(left));
      }
      converted.staves = {std::move(treble), std::move(bass)};
    } else {
      if (measure.clef) {
        current_clef = *measure.clef;
      }
      Voice voice{"main", std::string("Main Voice"), std::nullopt, {}};
      for (const auto& note : measure.notes) {
        const std::string reason = malformed_reason(note);
        if (!reason.empty()) {
          warn(out.warnings, "measure " + std::to_string(measure.number) + ": skipped note, " + reason);
          continue;
        }
        voice.notes.push_back(to_voice_note(note, "main", "main"));
      }
      Staff staff{"main", current_clef, std::nullopt, {}};
      staff.voices.push_back(std::move(voice));
      converted.staves.push_back(std::move(staff));
    }
    score.measures.push_back(std::move(converted));
  }

  score.title = sheet.title;
  score.composer = sheet.composer;
  score.parts.push_back(std::move(part));
  score.metadata.id = sheet.id.empty() ? std::nullopt : std::optional<std::string>(sheet.id);
  score.metadata.created_at = now;
  score.metadata.modified_at = now;
  score.metadata.source = "Legacy format conversion";
  score.metadata.tags = sheet.tags;
  score.metadata.difficulty = sheet.difficulty_level;
  score.metadata.duration_seconds = sheet.duration_seconds;
  return out;
}

Score flat_to_multi_voice(const SheetMusic& sheet, Timestamp now) {
  return flat_to_multi_voice_with_report(sheet, now).value;
}

//====================================================================
// MULTI-VOICE -> FLAT
//====================================================================

Converted<SheetMusic> multi_voice_to_flat_with_report(const Score& score) {
  Converted<SheetMusic> out;
  SheetMusic& sheet = out.value;

  std::optional<TimeSignature> current_time;
  std::optional<KeySignature> current_key;
  for (const auto& source : score.measures) {
    std::vector<Note> collected;
    for (const auto& staff : source.staves) {
      for (const auto& voice : staff.voices) {
        for (const auto& note : voice.notes) {
          const std::string prefix = "measure " + std::to_string(source.number) + ", voice " +
                                     voice.id + ": ";
          if (note.grace) {
            warn(out.warnings, prefix + "dropped grace note");
            continue;
          }
          const std::string reason = malformed_reason(note);
          if (!reason.empty()) {
            warn(out.warnings, prefix + "skipped note, " + reason);
            continue;
          }
          collected.push_back(to_flat_note(note));
        }
      }
    }

    Measure measure;
    measure.number = source.number;
    measure.notes = group_simultaneous(std::move(collected), source.number, out.warnings);
    if (!measure.notes.empty()) {
      const double origin = measure.notes.front().time;
      for (auto& note : measure.notes) {
        note.time -= origin;
      }
    } else {
      measure.notes.push_back(make_rest(NoteDuration::Whole, 0.0));
    }

    if (source.time_signature) {
      current_time = source.time_signature;
    }
    if (source.key_signature) {
      current_key = source.key_signature;
    }
    measure.time_signature = current_time;
    measure.key_signature = current_key;
    measure.clef = derive_clef(source);
    measure.tempo = source.tempo;
    measure.dynamics = source.dynamics;
    measure.rehearsal_mark = source.rehearsal_mark;
    measure.bar_line = source.bar_line;
    measure.repeat_count = source.repeat_count;
    sheet.measures.push_back(std::move(measure));
  }

  if (sheet.measures.empty()) {
    warn(out.warnings, "score has no measures; substituted a whole-rest placeholder");
    sheet.measures.push_back(placeholder_measure());
  }

  const Measure& first = sheet.measures.front();
  sheet.id = score.metadata.id.value_or("converted-" + lower(score.title));
  std::replace(sheet.id.begin(), sheet.id.end(), ' ', '-');
  sheet.title = score.title;
  sheet.composer = score.composer;
  sheet.instrument = score.parts.empty() || upper(score.parts.front().instrument) == "PIANO"
                         ? Instrument::Piano
                         : Instrument::Guitar;
  sheet.difficulty_level = score.metadata.difficulty.value_or(5);
  sheet.duration_seconds = score.metadata.duration_seconds.value_or(60);
  sheet.time_signature = first.time_signature.value_or(TimeSignature{4, 4});
  sheet.key_signature = first.key_signature.value_or(KeySignature::CMajor);
  sheet.suggested_tempo = first.tempo.value_or(120);
  sheet.tags = score.metadata.tags;
  return out;
}

SheetMusic multi_voice_to_flat(const Score& score) {
  return multi_voice_to_flat_with_report(score).value;
}

} // namespace etude
