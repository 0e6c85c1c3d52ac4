#pragma once

#include <vector>

#include "etude/exercise.hpp"
#include "etude/sheet_music.hpp"

namespace etude::generators {

// Entry points: validate, clamp to the clef range, build, then put the
// notation metadata on measure 1.
std::vector<Measure> generate_scale(const ExerciseParameters& params);
std::vector<Measure> generate_arpeggio(const ExerciseParameters& params);
std::vector<Measure> generate_hanon(const ExerciseParameters& params);
// floor(n/2) scale measures, the rest arpeggio.
std::vector<Measure> generate_mixed(const ExerciseParameters& params);

// Builders on already prepared parameters. They return exactly count
// measures numbered from first_number, without metadata.
std::vector<Measure> build_scale_measures(const ExerciseParameters& prepared, int count,
                                          int first_number = 1);
std::vector<Measure> build_arpeggio_measures(const ExerciseParameters& prepared, int count,
                                             int first_number = 1);
std::vector<Measure> build_hanon_measures(const ExerciseParameters& prepared, int count,
                                          int first_number = 1);

} // namespace etude::generators
