#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "etude/exercise.hpp"
#include "etude/pitch.hpp"
#include "etude/sheet_music.hpp"

namespace etude::generators {

// A pitch together with its position inside the governing scale or chord,
// which indexes the fingering tables.
struct PatternTone {
  Pitch pitch;
  std::size_t degree = 0;
};

struct PitchBounds {
  int lowest_midi = 0;
  int highest_midi = 127;

  bool contains(int midi) const { return midi >= lowest_midi && midi <= highest_midi; }
};

// Throws ValidationError listing every violated constraint.
void validate_parameters(const ExerciseParameters& params);

NoteRange clef_range(Clef clef);

// Intersects the requested range with the clef's natural range. An empty
// intersection is a ValidationError.
ExerciseParameters constrain_to_clef_range(const ExerciseParameters& params);

// validate_parameters followed by constrain_to_clef_range.
ExerciseParameters prepare_parameters(const ExerciseParameters& params);

PitchBounds pitch_bounds(const ExerciseParameters& params);

// Tonic of the key at the lowest octave whose root lies inside the bounds;
// the lowest octave of the range when none does.
int starting_octave(const ExerciseParameters& params, const std::string& root);

void apply_first_measure_metadata(Measure& measure, const ExerciseParameters& params);

// Marks a natural note whose letter the key alters, and a chromatic note the
// key does not account for.
void apply_key_signature(Note& note, KeySignature key);

Note make_note(const Pitch& pitch, NoteDuration duration);

// Greedy whole/half/quarter/eighth/sixteenth/thirty-second rests from the
// current fill up to capacity.
void add_rests_to_complete_measure(std::vector<Note>& notes, double capacity);

NoteDuration scale_duration_for(int difficulty);
NoteDuration arpeggio_duration_for(int difficulty);
std::vector<NoteDuration> sight_reading_durations(int difficulty);

//====================================================================
// MEASURE ACCUMULATOR
//====================================================================
// Collects notes into measures. A note that would cross the bar line closes
// the current measure (rest padded) and starts the next one.
class MeasureAccumulator {
public:
  explicit MeasureAccumulator(const TimeSignature& time_signature);

  void add(Note note);
  // Pads and closes the current measure when it holds anything.
  void close_current();

  std::size_t completed() const { return closed_.size(); }
  double remaining() const { return capacity_ - filled_; }
  double capacity() const { return capacity_; }

  // Exactly measure_count measures numbered first_number.., padded with
  // rest-filled measures or truncated. Metadata is not applied.
  std::vector<Measure> finish(int measure_count, int first_number = 1);

private:
  double capacity_;
  double filled_ = 0.0;
  std::vector<Note> current_;
  std::vector<std::vector<Note>> closed_;
};

// Strips notation metadata from a measure that is not the first of a piece.
void clear_measure_metadata(Measure& measure);

} // namespace etude::generators
