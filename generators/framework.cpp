#include "framework.hpp"

#include <algorithm>
#include <stdexcept>

#include "etude/errors.hpp"
#include "etude/theory.hpp"

namespace etude::generators {
namespace {

constexpr NoteDuration kRestDurations[] = {
    NoteDuration::Whole,  NoteDuration::Half,      NoteDuration::Quarter,
    NoteDuration::Eighth, NoteDuration::Sixteenth, NoteDuration::ThirtySecond,
};

int root_midi_at(const Pitch& root, int octave) {
  return (octave + 1) * 12 + natural_semitone(root.letter) + root.alter;
}

} // namespace

void validate_parameters(const ExerciseParameters& params) {
  auto errors = validate_exercise_parameters(params);
  if (!errors.empty()) {
    throw ValidationError(std::move(errors));
  }
}

NoteRange clef_range(Clef clef) {
  switch (clef) {
    case Clef::Treble: return {"C4", "C7"};
    case Clef::Bass: return {"C2", "C5"};
    case Clef::Alto: return {"G3", "G6"};
    case Clef::Tenor: return {"C3", "C6"};
    case Clef::GrandStaff: return {"C2", "C7"};
  }
  return {"C3", "C6"};
}

ExerciseParameters constrain_to_clef_range(const ExerciseParameters& params) {
  const NoteRange natural = clef_range(params.clef);
  ExerciseParameters out = params;
  if (note_to_midi(params.range.lowest) < note_to_midi(natural.lowest)) {
    out.range.lowest = natural.lowest;
  }
  if (note_to_midi(params.range.highest) > note_to_midi(natural.highest)) {
    out.range.highest = natural.highest;
  }
  if (note_to_midi(out.range.lowest) > note_to_midi(out.range.highest)) {
    throw ValidationError({"Note range " + params.range.lowest + "-" + params.range.highest +
                           " does not overlap the " + to_string(params.clef) + " clef range " +
                           natural.lowest + "-" + natural.highest});
  }
  return out;
}

ExerciseParameters prepare_parameters(const ExerciseParameters& params) {
  validate_parameters(params);
  return constrain_to_clef_range(params);
}

PitchBounds pitch_bounds(const ExerciseParameters& params) {
  return PitchBounds{note_to_midi(params.range.lowest), note_to_midi(params.range.highest)};
}

int starting_octave(const ExerciseParameters& params, const std::string& root) {
  const Pitch tonic = parse_note_name(root + "4");
  const PitchBounds bounds = pitch_bounds(params);
  for (int octave = 0; octave <= 9; ++octave) {
    if (bounds.contains(root_midi_at(tonic, octave))) {
      return octave;
    }
  }
  return parse_note_name(params.range.lowest).octave;
}

void apply_first_measure_metadata(Measure& measure, const ExerciseParameters& params) {
  measure.time_signature = params.time_signature;
  measure.key_signature = params.key_signature;
  measure.clef = params.clef;
  measure.tempo = params.tempo;
}

void clear_measure_metadata(Measure& measure) {
  measure.time_signature.reset();
  measure.key_signature.reset();
  measure.clef.reset();
  measure.tempo.reset();
  measure.dynamics.reset();
}

void apply_key_signature(Note& note, KeySignature key) {
  if (note.rest || note.keys.empty() || !is_valid_pitch_key(note.keys.front())) {
    return;
  }
  const Pitch pitch = parse_pitch_key(note.keys.front());
  const KeyAlterations alterations = get_key_signature_alterations(key);
  if (pitch.alter == 0) {
    if (alterations.sharpens(pitch.letter)) {
      note.accidental = "#";
    } else if (alterations.flattens(pitch.letter)) {
      note.accidental = "b";
    }
  } else if (pitch.alter > 0 && !alterations.sharpens(pitch.letter)) {
    note.accidental = "#";
  } else if (pitch.alter < 0 && !alterations.flattens(pitch.letter)) {
    note.accidental = "b";
  }
}

Note make_note(const Pitch& pitch, NoteDuration duration) {
  Note note;
  note.keys = {format_pitch_key(pitch)};
  note.duration = duration;
  return note;
}

void add_rests_to_complete_measure(std::vector<Note>& notes, double capacity) {
  double filled = measure_duration(notes);
  for (NoteDuration duration : kRestDurations) {
    const double value = duration_value(duration);
    while (capacity - filled >= value - kDurationTolerance) {
      notes.push_back(make_rest(duration, filled));
      filled += value;
    }
  }
}

NoteDuration scale_duration_for(int difficulty) {
  if (difficulty <= 3) return NoteDuration::Quarter;
  if (difficulty <= 6) return NoteDuration::Eighth;
  return NoteDuration::Sixteenth;
}

NoteDuration arpeggio_duration_for(int difficulty) {
  if (difficulty <= 4) return NoteDuration::Quarter;
  if (difficulty <= 7) return NoteDuration::Eighth;
  return NoteDuration::Sixteenth;
}

std::vector<NoteDuration> sight_reading_durations(int difficulty) {
  if (difficulty <= 3) {
    return {NoteDuration::Whole, NoteDuration::Half, NoteDuration::Quarter};
  }
  if (difficulty <= 6) {
    return {NoteDuration::Half, NoteDuration::Quarter, NoteDuration::Eighth};
  }
  return {NoteDuration::Quarter, NoteDuration::Eighth, NoteDuration::Sixteenth};
}

//====================================================================
// MEASURE ACCUMULATOR
//====================================================================

MeasureAccumulator::MeasureAccumulator(const TimeSignature& time_signature)
    : capacity_(expected_measure_duration(time_signature)) {
  if (capacity_ <= 0.0) {
    throw std::invalid_argument("MeasureAccumulator: time signature " +
                                to_string(time_signature) + " has no capacity");
  }
}

void MeasureAccumulator::add(Note note) {
  const double length = note_duration(note);
  if (length > capacity_ + kDurationTolerance) {
    throw std::logic_error("MeasureAccumulator: note of " + std::to_string(length) +
                           " beats exceeds measure of " + std::to_string(capacity_));
  }
  if (filled_ + length > capacity_ + kDurationTolerance) {
    close_current();
  }
  note.time = filled_;
  current_.push_back(std::move(note));
  filled_ += length;
  if (remaining() <= kDurationTolerance) {
    closed_.push_back(std::move(current_));
    current_.clear();
    filled_ = 0.0;
  }
}

void MeasureAccumulator::close_current() {
  if (current_.empty()) {
    return;
  }
  add_rests_to_complete_measure(current_, capacity_);
  closed_.push_back(std::move(current_));
  current_.clear();
  filled_ = 0.0;
}

std::vector<Measure> MeasureAccumulator::finish(int measure_count, int first_number) {
  close_current();
  std::vector<Measure> measures;
  measures.reserve(static_cast<std::size_t>(std::max(measure_count, 0)));
  for (int i = 0; i < measure_count; ++i) {
    Measure measure;
    measure.number = first_number + i;
    if (static_cast<std::size_t>(i) < closed_.size()) {
      measure.notes = closed_[static_cast<std::size_t>(i)];
    } else {
      add_rests_to_complete_measure(measure.notes, capacity_);
    }
    measures.push_back(std::move(measure));
  }
  return measures;
}

} // namespace etude::generators
