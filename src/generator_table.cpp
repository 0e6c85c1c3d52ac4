#include "etude/generator.hpp"

#include <stdexcept>

#include "etude/errors.hpp"
#include "../generators/sight_reading.hpp"
#include "../generators/technical.hpp"

namespace etude {

const std::vector<GeneratorEntry>& generator_table() {
  static const std::vector<GeneratorEntry> table{
      {GeneratorKind::Scale, "scale", &generators::generate_scale},
      {GeneratorKind::Arpeggio, "arpeggio", &generators::generate_arpeggio},
      {GeneratorKind::Hanon, "hanon", &generators::generate_hanon},
      {GeneratorKind::Mixed, "mixed", &generators::generate_mixed},
      {GeneratorKind::SightReading, "sight_reading", &generators::generate_sight_reading},
  };
  return table;
}

const GeneratorEntry& generator_entry(GeneratorKind kind) {
  for (const auto& entry : generator_table()) {
    if (entry.kind == kind) {
      return entry;
    }
  }
  throw std::runtime_error("generator_table: kind not registered: " +
                           std::to_string(static_cast<int>(kind)));
}

std::string to_string(GeneratorKind kind) { return generator_entry(kind).name; }

GeneratorKind generator_kind_for(ExerciseType type, const ExerciseParameters& params) {
  switch (type) {
    case ExerciseType::SightReading:
      return GeneratorKind::SightReading;
    case ExerciseType::Technical:
      switch (params.technical_type.value_or(TechnicalType::Scale)) {
        case TechnicalType::Scale: return GeneratorKind::Scale;
        case TechnicalType::Arpeggio: return GeneratorKind::Arpeggio;
        case TechnicalType::Hanon: return GeneratorKind::Hanon;
        case TechnicalType::Mixed: return GeneratorKind::Mixed;
      }
      return GeneratorKind::Scale;
    case ExerciseType::Rhythm:
      throw NotImplemented("Rhythm exercise generation");
    case ExerciseType::Harmony:
      throw NotImplemented("Harmony exercise generation");
  }
  throw std::invalid_argument("generator_kind_for: unknown exercise type");
}

std::vector<Measure> generate_measures(GeneratorKind kind, const ExerciseParameters& params) {
  return generator_entry(kind).generate(params);
}

std::vector<Measure> generate_exercise_measures(ExerciseType type,
                                                const ExerciseParameters& params) {
  return generate_measures(generator_kind_for(type, params), params);
}

} // namespace etude
