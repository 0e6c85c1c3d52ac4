#include "technical.hpp"

#include <algorithm>
#include <functional>
#include <string>

#include "fingering.hpp"
#include "framework.hpp"
#include "etude/theory.hpp"

namespace etude::generators {
namespace {

using Speller = std::function<std::vector<std::string>(const std::string&)>;

int unchecked_midi(const Pitch& pitch) {
  return (pitch.octave + 1) * 12 + natural_semitone(pitch.letter) + pitch.alter;
}

// Ascending tones over the requested octaves, plus the upper root, kept
// inside the clamped range.
std::vector<PatternTone> ascending_tones(const ExerciseParameters& params, const Speller& spell) {
  const std::string root = key_root(params.key_signature);
  const PitchBounds bounds = pitch_bounds(params);
  const int start = starting_octave(params, root);
  const int octaves = params.octaves.value_or(1);

  std::vector<PatternTone> tones;
  for (int o = 0; o <= octaves; ++o) {
    const int octave = start + o;
    if (octave > 9) {
      break;
    }
    Pitch tonic = parse_note_name(root + std::to_string(octave));
    if (unchecked_midi(tonic) > bounds.highest_midi) {
      break;
    }
    if (o == octaves) {
      if (bounds.contains(unchecked_midi(tonic))) {
        tones.push_back(PatternTone{tonic, 0});
      }
      break;
    }
    const auto names = spell(root + std::to_string(octave));
    for (std::size_t i = 0; i < names.size(); ++i) {
      const Pitch pitch = parse_note_name(names[i]);
      if (bounds.contains(unchecked_midi(pitch))) {
        tones.push_back(PatternTone{pitch, i});
      }
    }
  }
  return tones;
}

std::vector<Measure> emit(const ExerciseParameters& params, std::vector<PatternTone> tones,
                          NoteDuration duration, const std::vector<int>& piano_pattern, int count,
                          int first_number) {
  if (params.include_descending.value_or(true) && tones.size() > 1) {
    std::vector<PatternTone> descending(tones.rbegin() + 1, tones.rend());
    tones.insert(tones.end(), descending.begin(), descending.end());
  }

  MeasureAccumulator accumulator(params.time_signature);
  for (const auto& tone : tones) {
    if (accumulator.completed() >= static_cast<std::size_t>(count)) {
      break;
    }
    Note note = make_note(tone.pitch, duration);
    apply_key_signature(note, params.key_signature);
    if (params.fingering.enabled) {
      note.fingering =
          fingering_for(params.fingering, piano_pattern, tone.degree, unchecked_midi(tone.pitch));
    }
    accumulator.add(std::move(note));
  }
  return accumulator.finish(count, first_number);
}

std::vector<Measure> with_metadata(std::vector<Measure> measures, const ExerciseParameters& params) {
  if (!measures.empty()) {
    apply_first_measure_metadata(measures.front(), params);
  }
  return measures;
}

} // namespace

std::vector<Measure> build_scale_measures(const ExerciseParameters& prepared, int count,
                                          int first_number) {
  const ScaleType type = prepared.scale_type.value_or(default_scale_type(prepared.key_signature));
  auto tones = ascending_tones(prepared, [type](const std::string& root) {
    return get_scale_notes(root, type);
  });
  return emit(prepared, std::move(tones), scale_duration_for(prepared.difficulty),
              piano_scale_fingering(type), count, first_number);
}

std::vector<Measure> build_arpeggio_measures(const ExerciseParameters& prepared, int count,
                                             int first_number) {
  const ChordType type =
      prepared.arpeggio_type.value_or(default_chord_type(prepared.key_signature));
  auto tones = ascending_tones(prepared, [type](const std::string& root) {
    return get_chord_notes(root, type);
  });
  return emit(prepared, std::move(tones), arpeggio_duration_for(prepared.difficulty),
              piano_arpeggio_fingering(type), count, first_number);
}

std::vector<Measure> generate_scale(const ExerciseParameters& params) {
  const ExerciseParameters prepared = prepare_parameters(params);
  return with_metadata(build_scale_measures(prepared, prepared.measures), prepared);
}

std::vector<Measure> generate_arpeggio(const ExerciseParameters& params) {
  const ExerciseParameters prepared = prepare_parameters(params);
  return with_metadata(build_arpeggio_measures(prepared, prepared.measures), prepared);
}

} // namespace etude::generators
