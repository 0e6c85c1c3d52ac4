#include "etude/validation.hpp"

#include "etude/pitch.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace etude {
namespace {

std::string join_path(const std::string& parent, const std::string& child) {
  return parent.empty() ? child : parent + "/" + child;
}

std::string format_beats(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

constexpr int kMinMeasureTempo = 20;
constexpr int kMaxMeasureTempo = 300;

} // namespace

void ValidationResult::add_error(std::string entity, std::string message) {
  valid = false;
  errors.push_back(Finding{std::move(entity), std::move(message)});
}

void ValidationResult::add_warning(std::string entity, std::string message) {
  warnings.push_back(Finding{std::move(entity), std::move(message)});
}

void ValidationResult::merge(const ValidationResult& other) {
  if (!other.valid) {
    valid = false;
  }
  errors.insert(errors.end(), other.errors.begin(), other.errors.end());
  warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

//====================================================================
// NOTE / VOICE / STAFF
//====================================================================

ValidationResult validate_note(const VoiceNote& note, const std::string& entity) {
  ValidationResult result;
  if (note.keys.empty()) {
    result.add_error(entity, "Note must have at least one key");
  }
  if (!std::isfinite(note.time) || note.time < 0.0) {
    result.add_error(entity, "Note must have a valid time position");
  }
  if (note.voice_id.empty()) {
    result.add_error(entity, "Note must have a voiceId");
  }
  if (note.dots < 0) {
    result.add_error(entity, "Note dots must not be negative");
  }
  for (const auto& key : note.keys) {
    if (!is_valid_pitch_key(key)) {
      result.add_error(entity, "Invalid key format: " + key);
    }
  }
  if (note.stem && !is_known(*note.stem)) {
    result.add_error(entity, "Invalid stem direction");
  }
  if (note.tie && !is_known(*note.tie)) {
    result.add_error(entity, "Invalid tie type");
  }
  return result;
}

VoiceDuration calculate_voice_duration(const Voice& voice, const TimeSignature& time_signature) {
  VoiceDuration out;
  out.expected = expected_measure_duration(time_signature);
  for (const auto& note : voice.notes) {
    if (note.grace) {
      continue;
    }
    out.actual += note_duration(note);
  }
  return out;
}

ValidationResult validate_voice(const Voice& voice, const std::optional<TimeSignature>& governing,
                                const std::string& entity) {
  ValidationResult result;
  const std::string path = join_path(entity, "voice " + voice.id);
  if (voice.id.empty()) {
    result.add_error(path, "Voice must have an id");
  }
  if (voice.stem_direction && !is_known(*voice.stem_direction)) {
    result.add_error(path, "Invalid voice stem direction");
  }
  for (std::size_t i = 0; i < voice.notes.size(); ++i) {
    result.merge(validate_note(voice.notes[i], join_path(path, "note " + std::to_string(i))));
  }
  for (std::size_t i = 1; i < voice.notes.size(); ++i) {
    if (voice.notes[i].time < voice.notes[i - 1].time) {
      result.add_warning(path, "Notes in voice " + voice.id + " may not be in chronological order");
      break;
    }
  }
  if (governing && !voice.notes.empty()) {
    const auto duration = calculate_voice_duration(voice, *governing);
    if (std::abs(duration.expected - duration.actual) > kDurationTolerance) {
      result.add_error(path, "Voice " + voice.id + ": expected " +
                                 format_beats(duration.expected) + " beats, got " +
                                 format_beats(duration.actual) + " beats");
    }
  }
  return result;
}

ValidationResult validate_staff(const Staff& staff, const std::optional<TimeSignature>& governing,
                                const std::string& entity) {
  ValidationResult result;
  const std::string path = join_path(entity, "staff " + staff.id);
  if (staff.id.empty()) {
    result.add_error(path, "Staff must have an id");
  }
  if (!is_known(staff.clef)) {
    result.add_error(path, "Invalid clef: " + std::to_string(static_cast<int>(staff.clef)));
  }
  std::unordered_set<std::string> seen;
  bool duplicate = false;
  for (const auto& voice : staff.voices) {
    result.merge(validate_voice(voice, governing, path));
    if (!seen.insert(voice.id).second) {
      duplicate = true;
    }
  }
  if (duplicate) {
    result.add_error(path, "Staff contains duplicate voice IDs");
  }
  return result;
}

//====================================================================
// PART / MEASURE / SCORE
//====================================================================

ValidationResult validate_part(const Part& part) {
  ValidationResult result;
  const std::string path = "part " + part.id;
  if (part.id.empty()) {
    result.add_error(path, "Part must have an id");
  }
  if (part.name.empty()) {
    result.add_error(path, "Part must have a name");
  }
  if (part.instrument.empty()) {
    result.add_error(path, "Part must have an instrument");
  }
  if (part.staves.empty()) {
    result.add_error(path, "Part must have at least one staff");
  }
  if (part.midi_program && (*part.midi_program < 0 || *part.midi_program > 127)) {
    result.add_error(path, "MIDI program must be between 0 and 127");
  }
  if (part.volume && (*part.volume < 0 || *part.volume > 127)) {
    result.add_error(path, "Volume must be between 0 and 127");
  }
  if (part.pan && (*part.pan < -64 || *part.pan > 63)) {
    result.add_error(path, "Pan must be between -64 and 63");
  }
  return result;
}

ValidationResult validate_measure(const ScoreMeasure& measure,
                                  const std::optional<TimeSignature>& governing) {
  ValidationResult result;
  const std::string path = "measure " + std::to_string(measure.number);
  if (measure.number < 1) {
    result.add_error(path, "Measure must have a positive number");
  }
  const std::optional<TimeSignature> effective =
      measure.time_signature ? measure.time_signature : governing;
  for (const auto& staff : measure.staves) {
    result.merge(validate_staff(staff, effective, path));
  }
  if (measure.time_signature && !is_standard(*measure.time_signature)) {
    result.add_warning(path, "Non-standard time signature: " + to_string(*measure.time_signature));
  }
  if (measure.tempo && (*measure.tempo < kMinMeasureTempo || *measure.tempo > kMaxMeasureTempo)) {
    result.add_warning(path, "Tempo should be between 20 and 300 BPM");
  }
  if (measure.bar_line && !is_known(*measure.bar_line)) {
    result.add_error(path, "Invalid bar line type: " +
                               std::to_string(static_cast<int>(*measure.bar_line)));
  }
  return result;
}

ValidationResult validate_score(const Score& score) {
  ValidationResult result;
  if (score.title.empty()) {
    result.add_error("score", "Score must have a title");
  }
  if (score.composer.empty()) {
    result.add_error("score", "Score must have a composer");
  }
  if (score.parts.empty()) {
    result.add_error("score", "Score must have at least one part");
  }
  if (score.measures.empty()) {
    result.add_error("score", "Score must have at least one measure");
  }
  for (const auto& part : score.parts) {
    result.merge(validate_part(part));
  }

  TimeSignature governing{4, 4};
  for (const auto& measure : score.measures) {
    if (measure.time_signature) {
      governing = *measure.time_signature;
    }
    result.merge(validate_measure(measure, governing));
  }

  // Every staff a part owns must be present in every measure.
  for (const auto& part : score.parts) {
    for (const auto& staff_id : part.staves) {
      for (const auto& measure : score.measures) {
        const bool present = std::any_of(measure.staves.begin(), measure.staves.end(),
                                         [&](const Staff& s) { return s.id == staff_id; });
        if (!present) {
          result.add_error("part " + part.id, "Part " + part.id +
                                                  " references non-existent staff " + staff_id +
                                                  " in measure " +
                                                  std::to_string(measure.number));
          break;
        }
      }
    }
  }

  for (std::size_t i = 1; i < score.measures.size(); ++i) {
    if (score.measures[i].number < score.measures[i - 1].number) {
      result.add_warning("score", "Measures may not be in sequential order");
      break;
    }
  }
  return result;
}

ValidationResult validate_measure_timing(const ScoreMeasure& measure,
                                         const TimeSignature& time_signature) {
  ValidationResult result;
  const std::string path = "measure " + std::to_string(measure.number);
  for (const auto& staff : measure.staves) {
    for (const auto& voice : staff.voices) {
      const auto duration = calculate_voice_duration(voice, time_signature);
      if (std::abs(duration.expected - duration.actual) > kDurationTolerance) {
        result.add_error(join_path(path, "staff " + staff.id),
                         "Voice " + voice.id + " in measure " + std::to_string(measure.number) +
                             ": Expected " + format_beats(duration.expected) + " beats, got " +
                             format_beats(duration.actual) + " beats");
      }
    }
  }
  return result;
}

ValidationResult validate_legacy_measures(const std::vector<Measure>& measures,
                                          const TimeSignature& initial_time_signature) {
  ValidationResult result;
  TimeSignature governing = initial_time_signature;
  for (std::size_t m = 0; m < measures.size(); ++m) {
    const auto& measure = measures[m];
    const std::string path = "measure " + std::to_string(measure.number);
    if (measure.number != static_cast<int>(m) + 1) {
      result.add_warning(path, "Measures may not be in sequential order");
    }
    if (measure.time_signature) {
      governing = *measure.time_signature;
    }
    for (std::size_t i = 0; i < measure.notes.size(); ++i) {
      const auto& note = measure.notes[i];
      const std::string note_path = join_path(path, "note " + std::to_string(i));
      if (note.keys.empty()) {
        result.add_error(note_path, "Note must have at least one key");
      }
      for (const auto& key : note.keys) {
        if (!is_valid_pitch_key(key)) {
          result.add_error(note_path, "Invalid key format: " + key);
        }
      }
    }
    const double expected = expected_measure_duration(governing);
    const double actual = measure_duration(measure.notes);
    if (std::abs(expected - actual) > kDurationTolerance) {
      result.add_error(path, "Expected " + format_beats(expected) + " beats, got " +
                                 format_beats(actual) + " beats");
    }
  }
  return result;
}

} // namespace etude
