#include "technical.hpp"

#include <string>

#include "fingering.hpp"
#include "framework.hpp"
#include "etude/theory.hpp"

namespace etude::generators {
namespace {

const std::vector<int>& default_hanon_pattern() {
  static const std::vector<int> pattern{1, 3, 5, 6, 5, 3};
  return pattern;
}

} // namespace

std::vector<Measure> build_hanon_measures(const ExerciseParameters& prepared, int count,
                                          int first_number) {
  const std::string root = key_root(prepared.key_signature);
  const ScaleType type = prepared.scale_type.value_or(default_scale_type(prepared.key_signature));
  const auto scale = get_scale_notes(root + std::to_string(starting_octave(prepared, root)), type);
  const auto& pattern = prepared.hanon_pattern ? *prepared.hanon_pattern : default_hanon_pattern();
  const auto& fingers = piano_scale_fingering(type);
  const PitchBounds bounds = pitch_bounds(prepared);
  const int size = static_cast<int>(scale.size());

  MeasureAccumulator accumulator(prepared.time_signature);
  for (int start = 0; start < size; ++start) {
    for (int step : pattern) {
      if (accumulator.completed() >= static_cast<std::size_t>(count)) {
        return accumulator.finish(count, first_number);
      }
      const int index = start + step - 1;
      const int degree = index % size;
      Pitch pitch = parse_note_name(scale[static_cast<std::size_t>(degree)]);
      pitch.octave += index / size;
      if (pitch.octave > 9) {
        continue;
      }
      const int midi = (pitch.octave + 1) * 12 + natural_semitone(pitch.letter) + pitch.alter;
      if (!bounds.contains(midi)) {
        continue;
      }
      Note note = make_note(pitch, NoteDuration::Sixteenth);
      apply_key_signature(note, prepared.key_signature);
      if (prepared.fingering.enabled) {
        note.fingering =
            fingering_for(prepared.fingering, fingers, static_cast<std::size_t>(degree), midi);
      }
      accumulator.add(std::move(note));
    }
  }
  return accumulator.finish(count, first_number);
}

std::vector<Measure> generate_hanon(const ExerciseParameters& params) {
  const ExerciseParameters prepared = prepare_parameters(params);
  auto measures = build_hanon_measures(prepared, prepared.measures);
  if (!measures.empty()) {
    apply_first_measure_metadata(measures.front(), prepared);
  }
  return measures;
}

} // namespace etude::generators
