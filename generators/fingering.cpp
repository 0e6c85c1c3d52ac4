#include "fingering.hpp"

namespace etude::generators {
namespace {

int positive_mod(int value, int modulus) { return ((value % modulus) + modulus) % modulus; }

} // namespace

const std::vector<int>& piano_scale_fingering(ScaleType type) {
  static const std::vector<int> standard{1, 2, 3, 1, 2, 3, 4, 5};
  static const std::vector<int> pentatonic{1, 2, 3, 1, 2};
  static const std::vector<int> blues{1, 2, 3, 4, 1, 3};
  static const std::vector<int> chromatic{1, 3, 1, 3, 1, 2, 3, 1, 3, 1, 3, 2};
  switch (type) {
    case ScaleType::PentatonicMajor:
    case ScaleType::PentatonicMinor:
      return pentatonic;
    case ScaleType::Blues:
      return blues;
    case ScaleType::Chromatic:
      return chromatic;
    default:
      return standard;
  }
}

const std::vector<int>& piano_arpeggio_fingering(ChordType type) {
  static const std::vector<int> triad{1, 3, 5};
  static const std::vector<int> diminished{1, 2, 4};
  static const std::vector<int> seventh{1, 2, 3, 5};
  switch (type) {
    case ChordType::Diminished:
      return diminished;
    case ChordType::Dominant7:
    case ChordType::Major7:
    case ChordType::Minor7:
      return seventh;
    default:
      return triad;
  }
}

int fret_position_finger(int midi, int position) {
  const int fret = positive_mod(midi - 40, 12);
  return positive_mod(fret - position + 1, 4) + 1;
}

std::string fingering_for(const FingeringOptions& options, const std::vector<int>& piano_pattern,
                          std::size_t degree, int midi) {
  if (options.instrument == Instrument::Piano) {
    if (piano_pattern.empty()) {
      return "1";
    }
    return std::to_string(piano_pattern[degree % piano_pattern.size()]);
  }
  return std::to_string(fret_position_finger(midi, options.position));
}

} // namespace etude::generators
