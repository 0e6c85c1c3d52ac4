#pragma once

#include <string>
#include <vector>

#include "score.hpp"

namespace etude {

struct VoiceComplexityAnalysis {
  std::string voice_id;
  int note_count = 0;
  double average_interval = 0.0; // semitones between consecutive pitches
  double rhythmic_complexity = 0.0; // 0..1
  int range_span = 0; // semitones
  int difficulty = 0; // 1..10, 0 when the voice has no notes
  std::vector<std::string> technical_elements;
};

enum class VoiceMotion { Parallel, Contrary, Oblique, Similar };

struct VoiceLeadingAnalysis {
  int from_measure = 0;
  int to_measure = 0;
  std::string voice_id;
  VoiceMotion motion = VoiceMotion::Similar;
  std::vector<int> intervals;
};

enum class PolyphonicPatternType { Canon, Fugue, Sequence, Imitation };

struct PolyphonicPattern {
  PolyphonicPatternType type = PolyphonicPatternType::Sequence;
  std::vector<int> measures;
  std::vector<std::string> voices;
  std::string description;
};

VoiceComplexityAnalysis analyze_voice_complexity(const Score& score, const std::string& voice_id);

// Harmonic analysis is out of scope; both always return an empty list.
std::vector<VoiceLeadingAnalysis> identify_voice_leading(const Score& score);
std::vector<PolyphonicPattern> detect_polyphonic_patterns(const Score& score);

} // namespace etude
