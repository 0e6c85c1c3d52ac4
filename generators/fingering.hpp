#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "etude/exercise.hpp"

namespace etude::generators {

// Right-hand piano fingerings, indexed by position within the scale/chord.
const std::vector<int>& piano_scale_fingering(ScaleType type);
const std::vector<int>& piano_arpeggio_fingering(ChordType type);

// Fret = (midi - 40) mod 12 above low E; finger cycles across the four
// fingers from the given position.
int fret_position_finger(int midi, int position);

// Advisory fingering for one tone. Piano uses the pattern table, every
// other instrument the fret/position heuristic.
std::string fingering_for(const FingeringOptions& options, const std::vector<int>& piano_pattern,
                          std::size_t degree, int midi);

} // namespace etude::generators
