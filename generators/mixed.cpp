#include "technical.hpp"

#include "framework.hpp"

namespace etude::generators {

std::vector<Measure> generate_mixed(const ExerciseParameters& params) {
  const ExerciseParameters prepared = prepare_parameters(params);
  const int half = prepared.measures / 2;

  std::vector<Measure> measures = build_scale_measures(prepared, half);
  auto arpeggios = build_arpeggio_measures(prepared, prepared.measures - half, half + 1);
  measures.insert(measures.end(), arpeggios.begin(), arpeggios.end());

  if (!measures.empty()) {
    apply_first_measure_metadata(measures.front(), prepared);
  }
  return measures;
}

} // namespace etude::generators
