#include "sight_reading.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include "framework.hpp"
#include "etude/theory.hpp"
#include "../src/debug_log.hpp"
#include "../src/rng.hpp"

namespace etude::generators {
namespace {

bool generate_debug_enabled() {
  static const bool enabled = debug_enabled("generate");
  return enabled;
}

struct KeyTone {
  Pitch pitch;
  int midi = 0;
};

int unchecked_midi(const Pitch& pitch) {
  return (pitch.octave + 1) * 12 + natural_semitone(pitch.letter) + pitch.alter;
}

// Every diatonic tone of the key inside the bounds, ascending.
std::vector<KeyTone> key_tones(const ExerciseParameters& params, const PitchBounds& bounds) {
  const std::string root = key_root(params.key_signature);
  const ScaleType type = default_scale_type(params.key_signature);
  std::vector<KeyTone> tones;
  for (int octave = 0; octave <= 9; ++octave) {
    const Pitch tonic = parse_note_name(root + std::to_string(octave));
    if (unchecked_midi(tonic) > bounds.highest_midi) {
      break;
    }
    for (const auto& name : get_scale_notes(root + std::to_string(octave), type)) {
      const Pitch pitch = parse_note_name(name);
      const int midi = unchecked_midi(pitch);
      if (bounds.contains(midi)) {
        tones.push_back(KeyTone{pitch, midi});
      }
    }
  }
  std::sort(tones.begin(), tones.end(),
            [](const KeyTone& a, const KeyTone& b) { return a.midi < b.midi; });
  tones.erase(std::unique(tones.begin(), tones.end(),
                          [](const KeyTone& a, const KeyTone& b) { return a.midi == b.midi; }),
              tones.end());
  return tones;
}

std::size_t nearest_index(const std::vector<KeyTone>& tones, int target) {
  std::size_t best = 0;
  int best_distance = 128;
  for (std::size_t i = 0; i < tones.size(); ++i) {
    const int distance = std::abs(tones[i].midi - target);
    if (distance < best_distance) {
      best_distance = distance;
      best = i;
    }
  }
  return best;
}

class MelodyWalker {
public:
  MelodyWalker(const std::vector<KeyTone>& tones, const PitchBounds& bounds, MelodicMotion motion,
               std::uint64_t& rng)
      : tones_(tones), bounds_(bounds), motion_(motion), rng_(rng) {}

  // Next phrase starts again from the middle of the range.
  void restart() { started_ = false; }

  const KeyTone& next() {
    if (!started_) {
      current_ = nearest_index(tones_, (bounds_.lowest_midi + bounds_.highest_midi) / 2);
      started_ = true;
      return tones_[current_];
    }
    switch (motion_) {
      case MelodicMotion::Stepwise:
        step();
        break;
      case MelodicMotion::Leaps:
        leap();
        break;
      case MelodicMotion::Mixed:
        if (chance(rng_, 0.7)) {
          step();
        } else {
          leap();
        }
        break;
    }
    return tones_[current_];
  }

private:
  void step() {
    if (tones_.size() < 2) {
      return;
    }
    const bool up = !chance(rng_, 0.5);
    if (up) {
      current_ = current_ + 1 < tones_.size() ? current_ + 1 : current_ - 1;
    } else {
      current_ = current_ > 0 ? current_ - 1 : current_ + 1;
    }
  }

  void leap() {
    static const std::vector<int> kLeapDegrees{3, 4, 5, 7};
    const int degrees = pick(rng_, kLeapDegrees);
    const int midi = tones_[current_].midi;
    int direction;
    if (midi < bounds_.lowest_midi + 12) {
      direction = 1;
    } else if (midi > bounds_.highest_midi - 12) {
      direction = -1;
    } else {
      direction = chance(rng_, 0.5) ? -1 : 1;
    }
    const int target =
        std::clamp(midi + direction * degrees * 2, bounds_.lowest_midi, bounds_.highest_midi);
    current_ = nearest_index(tones_, target);
  }

  const std::vector<KeyTone>& tones_;
  PitchBounds bounds_;
  MelodicMotion motion_;
  std::uint64_t& rng_;
  std::size_t current_ = 0;
  bool started_ = false;
};

bool is_key_tone(const std::vector<KeyTone>& tones, int midi) {
  return std::any_of(tones.begin(), tones.end(),
                     [midi](const KeyTone& tone) { return tone.midi == midi; });
}

NoteDuration choose_duration(const std::vector<NoteDuration>& available, double remaining,
                             std::uint64_t& rng, bool& fits) {
  std::vector<NoteDuration> candidates;
  for (NoteDuration duration : available) {
    if (duration_value(duration) <= remaining + kDurationTolerance) {
      candidates.push_back(duration);
    }
  }
  fits = !candidates.empty();
  if (!fits) {
    return NoteDuration::Eighth;
  }
  // Prefer variety over always taking the longest value.
  if (candidates.size() > 1 && chance(rng, 0.7)) {
    candidates.erase(candidates.begin());
  }
  return pick(rng, candidates);
}

void fill_with_rest(MeasureAccumulator& accumulator) {
  for (NoteDuration duration : {NoteDuration::Whole, NoteDuration::Half, NoteDuration::Quarter,
                                NoteDuration::Eighth, NoteDuration::Sixteenth,
                                NoteDuration::ThirtySecond}) {
    if (duration_value(duration) <= accumulator.remaining() + kDurationTolerance) {
      accumulator.add(make_rest(duration, 0.0));
      return;
    }
  }
  accumulator.close_current();
}

} // namespace

ResolvedSightReading resolve_sight_reading(const ExerciseParameters& params) {
  const auto& options = params.sight_reading;
  const int difficulty = params.difficulty;
  ResolvedSightReading out;
  out.include_accidentals = options.include_accidentals.value_or(difficulty > 3);
  out.melodic_motion = options.melodic_motion.value_or(
      difficulty <= 3 ? MelodicMotion::Stepwise : MelodicMotion::Mixed);
  out.include_dynamics = options.include_dynamics.value_or(difficulty > 5);
  out.include_articulations = options.include_articulations.value_or(difficulty > 6);
  out.phrase_length = options.phrase_length;
  return out;
}

std::vector<Articulation> articulations_for(int difficulty) {
  std::vector<Articulation> out{Articulation::Staccato, Articulation::Accent};
  if (difficulty > 7) {
    out.push_back(Articulation::Tenuto);
    out.push_back(Articulation::Marcato);
  }
  return out;
}

std::vector<DynamicMarking> dynamics_for(int difficulty) {
  std::vector<DynamicMarking> out{DynamicMarking::MF};
  if (difficulty > 4) {
    out.push_back(DynamicMarking::F);
    out.push_back(DynamicMarking::P);
  }
  if (difficulty > 7) {
    out.push_back(DynamicMarking::FF);
    out.push_back(DynamicMarking::PP);
  }
  return out;
}

std::vector<Measure> generate_sight_reading(const ExerciseParameters& params) {
  const ExerciseParameters prepared = prepare_parameters(params);
  const ResolvedSightReading options = resolve_sight_reading(prepared);
  const PitchBounds bounds = pitch_bounds(prepared);
  const auto tones = key_tones(prepared, bounds);
  const auto durations = sight_reading_durations(prepared.difficulty);
  const int difficulty = prepared.difficulty;

  std::uint64_t rng = prepared.seed;
  MeasureAccumulator accumulator(prepared.time_signature);

  if (tones.empty()) {
    debug_log(generate_debug_enabled(), "generate",
              "no key tones between " + prepared.range.lowest + " and " +
                  prepared.range.highest + "; emitting rests");
  } else {
    MelodyWalker walker(tones, bounds, options.melodic_motion, rng);
    for (int m = 0; m < prepared.measures; ++m) {
      if (m % options.phrase_length == 0) {
        walker.restart();
      }
      while (accumulator.completed() == static_cast<std::size_t>(m)) {
        bool fits = false;
        const NoteDuration chosen = choose_duration(durations, accumulator.remaining(), rng, fits);
        if (!fits) {
          fill_with_rest(accumulator);
          continue;
        }
        int dots = 0;
        if (difficulty >= 5 && chance(rng, 0.3) &&
            dotted_value(chosen, 1) <= accumulator.remaining() + kDurationTolerance) {
          dots = 1;
        }

        // Long values are sometimes split into two notes of half the length.
        std::vector<NoteDuration> events{chosen};
        if (dots == 0 && difficulty > 3 && chosen == NoteDuration::Whole &&
            chance(rng, 0.3)) {
          events = {NoteDuration::Half, NoteDuration::Half};
        } else if (dots == 0 && difficulty > 5 && chosen == NoteDuration::Half &&
                   chance(rng, 0.3)) {
          events = {NoteDuration::Quarter, NoteDuration::Quarter};
        }

        for (NoteDuration duration : events) {
          const KeyTone& tone = walker.next();
          Note note = make_note(tone.pitch, duration);
          note.dots = dots;
          if (options.include_accidentals && tone.midi + 1 <= bounds.highest_midi &&
              !is_key_tone(tones, tone.midi + 1) && chance(rng, 0.1)) {
            note = make_note(pitch_from_midi(tone.midi + 1), duration);
            note.dots = dots;
          }
          apply_key_signature(note, prepared.key_signature);
          if (options.include_articulations && chance(rng, 0.3)) {
            note.articulation = pick(rng, articulations_for(difficulty));
          }
          accumulator.add(std::move(note));
        }
      }
    }
  }

  auto measures = accumulator.finish(prepared.measures);
  if (!measures.empty()) {
    apply_first_measure_metadata(measures.front(), prepared);
    if (options.include_dynamics) {
      measures.front().dynamics = pick(rng, dynamics_for(difficulty));
    }
  }
  return measures;
}

} // namespace etude::generators
