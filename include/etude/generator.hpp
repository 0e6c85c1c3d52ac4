#pragma once

#include <string>
#include <vector>

#include "exercise.hpp"
#include "sheet_music.hpp"

namespace etude {

enum class GeneratorKind { Scale, Arpeggio, Hanon, Mixed, SightReading };

using GenerateFn = std::vector<Measure> (*)(const ExerciseParameters&);

struct GeneratorEntry {
  GeneratorKind kind;
  const char* name;
  GenerateFn generate;
};

// Fixed dispatch table; every entry validates, clamps and fills exactly
// params.measures measures.
const std::vector<GeneratorEntry>& generator_table();

const GeneratorEntry& generator_entry(GeneratorKind kind);

std::string to_string(GeneratorKind kind);

// Sight reading for SIGHT_READING, the technical type (scale when unset) for
// TECHNICAL. RHYTHM and HARMONY raise NotImplemented.
GeneratorKind generator_kind_for(ExerciseType type, const ExerciseParameters& params);

std::vector<Measure> generate_measures(GeneratorKind kind, const ExerciseParameters& params);

std::vector<Measure> generate_exercise_measures(ExerciseType type,
                                                const ExerciseParameters& params);

} // namespace etude
