#pragma once

#include <optional>
#include <string>
#include <vector>

#include "score.hpp"
#include "sheet_music.hpp"
#include "types.hpp"

namespace etude {

struct Finding {
  std::string entity; // "measure 2/staff treble/voice rightHand/note 0"
  std::string message;
};

// Errors make the data unusable; warnings are stylistic oddities.
struct ValidationResult {
  bool valid = true;
  std::vector<Finding> errors;
  std::vector<Finding> warnings;

  void add_error(std::string entity, std::string message);
  void add_warning(std::string entity, std::string message);
  void merge(const ValidationResult& other);
};

// Validators never throw. The optional time signature is the one governing
// the enclosing measure; when present each non-empty voice must fill it.
ValidationResult validate_note(const VoiceNote& note, const std::string& entity = "note");
ValidationResult validate_voice(const Voice& voice,
                                const std::optional<TimeSignature>& governing = std::nullopt,
                                const std::string& entity = "");
ValidationResult validate_staff(const Staff& staff,
                                const std::optional<TimeSignature>& governing = std::nullopt,
                                const std::string& entity = "");
ValidationResult validate_part(const Part& part);
ValidationResult validate_measure(const ScoreMeasure& measure,
                                  const std::optional<TimeSignature>& governing = std::nullopt);
ValidationResult validate_score(const Score& score);

struct VoiceDuration {
  double expected = 0.0;
  double actual = 0.0;
};

// Grace notes take no time.
VoiceDuration calculate_voice_duration(const Voice& voice, const TimeSignature& time_signature);

ValidationResult validate_measure_timing(const ScoreMeasure& measure,
                                         const TimeSignature& time_signature);

// Generator output: pitch keys well formed, every measure filled exactly.
ValidationResult validate_legacy_measures(const std::vector<Measure>& measures,
                                          const TimeSignature& initial_time_signature);

} // namespace etude
