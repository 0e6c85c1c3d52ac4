#include "etude/analysis.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <set>

#include "etude/pitch.hpp"

namespace etude {
namespace {

constexpr int kDefaultPitch = 60;

// Unreadable keys count as middle C so one bad note does not sink the
// whole analysis.
int key_pitch(const std::string& key) {
  if (!is_valid_pitch_key(key)) {
    return kDefaultPitch;
  }
  const Pitch pitch = parse_pitch_key(key);
  return (pitch.octave + 1) * 12 + natural_semitone(pitch.letter) + pitch.alter;
}

double rhythmic_complexity(const std::vector<VoiceNote>& notes) {
  std::set<NoteDuration> kinds;
  bool dots = false;
  bool ties = false;
  for (const auto& note : notes) {
    kinds.insert(note.duration);
    dots = dots || note.dots > 0;
    ties = ties || note.tie.has_value();
  }
  double complexity = static_cast<double>(kinds.size()) / 8.0;
  if (dots) complexity += 0.2;
  if (ties) complexity += 0.3;
  return std::min(1.0, complexity);
}

std::vector<std::string> technical_elements(const std::vector<VoiceNote>& notes) {
  std::vector<std::string> out;
  auto any = [&](auto predicate) { return std::any_of(notes.begin(), notes.end(), predicate); };
  if (any([](const VoiceNote& n) { return n.keys.size() > 1; })) out.push_back("chords");
  if (any([](const VoiceNote& n) { return n.grace.has_value(); })) out.push_back("grace notes");
  if (any([](const VoiceNote& n) { return !n.ornaments.empty(); })) out.push_back("ornaments");
  if (any([](const VoiceNote& n) { return n.articulation.has_value(); })) {
    out.push_back("articulations");
  }

  int widest = 0;
  for (std::size_t i = 1; i < notes.size(); ++i) {
    const VoiceNote& previous = notes[i - 1];
    const VoiceNote& current = notes[i];
    if (current.rest || previous.rest || current.keys.empty() || previous.keys.empty()) {
      continue;
    }
    widest = std::max(widest, std::abs(key_pitch(current.keys.front()) -
                                       key_pitch(previous.keys.front())));
  }
  if (widest > 12) out.push_back("large intervals");
  if (widest > 7) out.push_back("octaves");
  return out;
}

} // namespace

VoiceComplexityAnalysis analyze_voice_complexity(const Score& score, const std::string& voice_id) {
  std::vector<VoiceNote> notes;
  for (const auto& measure : score.measures) {
    for (const auto& staff : measure.staves) {
      for (const auto& voice : staff.voices) {
        if (voice.id == voice_id) {
          notes.insert(notes.end(), voice.notes.begin(), voice.notes.end());
        }
      }
    }
  }

  VoiceComplexityAnalysis out;
  out.voice_id = voice_id;
  if (notes.empty()) {
    return out;
  }

  std::vector<int> pitches;
  for (const auto& note : notes) {
    if (note.rest) {
      continue;
    }
    for (const auto& key : note.keys) {
      pitches.push_back(key_pitch(key));
    }
  }
  double interval_sum = 0.0;
  for (std::size_t i = 1; i < pitches.size(); ++i) {
    interval_sum += std::abs(pitches[i] - pitches[i - 1]);
  }

  out.note_count = static_cast<int>(notes.size());
  out.average_interval =
      pitches.size() > 1 ? interval_sum / static_cast<double>(pitches.size() - 1) : 0.0;
  if (!pitches.empty()) {
    const auto [lowest, highest] = std::minmax_element(pitches.begin(), pitches.end());
    out.range_span = *highest - *lowest;
  }
  out.rhythmic_complexity = rhythmic_complexity(notes);
  out.technical_elements = technical_elements(notes);

  const double raw = out.average_interval / 4.0 + out.range_span / 12.0 +
                     out.rhythmic_complexity * 3.0 +
                     static_cast<double>(out.technical_elements.size()) / 2.0;
  out.difficulty = static_cast<int>(std::lround(std::clamp(raw, 1.0, 10.0)));
  return out;
}

std::vector<VoiceLeadingAnalysis> identify_voice_leading(const Score&) {
  return {};
}

std::vector<PolyphonicPattern> detect_polyphonic_patterns(const Score&) {
  return {};
}

} // namespace etude
