#pragma once

#include <vector>

#include "etude/exercise.hpp"
#include "etude/sheet_music.hpp"

namespace etude::generators {

// Options left unset in params.sight_reading, filled in from difficulty.
struct ResolvedSightReading {
  bool include_accidentals = false;
  MelodicMotion melodic_motion = MelodicMotion::Stepwise;
  bool include_dynamics = false;
  bool include_articulations = false;
  int phrase_length = 4;
};

ResolvedSightReading resolve_sight_reading(const ExerciseParameters& params);

std::vector<Articulation> articulations_for(int difficulty);
std::vector<DynamicMarking> dynamics_for(int difficulty);

// Deterministic for a given params.seed.
std::vector<Measure> generate_sight_reading(const ExerciseParameters& params);

} // namespace etude::generators
