#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "param_schema.hpp"
#include "sheet_music.hpp"
#include "theory.hpp"
#include "types.hpp"

namespace etude {

enum class TechnicalType { Scale, Arpeggio, Hanon, Mixed };

enum class TechnicalElement {
  Scales,
  Arpeggios,
  Thirds,
  Sixths,
  Octaves,
  Chords,
  Trills,
  Tremolo,
  AlbertiBass,
};

enum class MelodicMotion { Stepwise, Leaps, Mixed };

std::string to_string(TechnicalType type);
TechnicalType technical_type_from_string(const std::string& token);

std::string to_string(TechnicalElement element);
TechnicalElement technical_element_from_string(const std::string& token);

std::string to_string(MelodicMotion motion);
MelodicMotion melodic_motion_from_string(const std::string& token);

struct NoteRange {
  std::string lowest = "C4"; // scientific names
  std::string highest = "C6";
};

struct FingeringOptions {
  bool enabled = false;
  Instrument instrument = Instrument::Piano;
  int position = 1; // fretboard position for fretted instruments
};

// Unset fields are derived from difficulty at generation time.
struct SightReadingOptions {
  std::optional<bool> include_accidentals;
  std::optional<MelodicMotion> melodic_motion;
  std::optional<bool> include_dynamics;
  std::optional<bool> include_articulations;
  int phrase_length = 4; // measures between melodic restarts
};

struct ExerciseParameters {
  KeySignature key_signature = KeySignature::CMajor;
  TimeSignature time_signature{4, 4};
  Clef clef = Clef::Treble;
  NoteRange range;
  int difficulty = 5;
  int measures = 4;
  int tempo = 120;
  std::vector<TechnicalElement> technical_elements;

  std::optional<TechnicalType> technical_type;
  std::optional<ScaleType> scale_type;
  std::optional<ChordType> arpeggio_type;
  std::optional<std::vector<int>> hanon_pattern;
  std::optional<bool> include_descending;
  std::optional<int> octaves;

  FingeringOptions fingering;
  SightReadingOptions sight_reading;
  std::uint64_t seed = 1;
};

struct ExerciseMetadata {
  std::string title;
  std::string description;
  std::vector<std::string> focus_areas;
  std::vector<std::string> tags;
  int estimated_duration_seconds = 0;
  std::vector<std::string> prerequisites;
};

struct GeneratedExercise {
  std::string id;
  std::string user_id;
  ExerciseType type = ExerciseType::SightReading;
  ExerciseParameters parameters;
  std::vector<Measure> measures;
  ExerciseMetadata metadata;
  Timestamp created_at{};
  std::optional<Timestamp> expires_at;
};

constexpr int kMinDifficulty = 1;
constexpr int kMaxDifficulty = 10;
constexpr int kMinMeasures = 1;
constexpr int kMaxMeasures = 100;
constexpr int kMinTempo = 20;
constexpr int kMaxTempo = 300;
constexpr int kMaxOctaves = 4;
constexpr int kMaxHanonStep = 15;

// Every violated constraint, in field order. Empty when valid.
std::vector<std::string> validate_exercise_parameters(const ExerciseParameters& params);

// ceil(measures * beats * 60 / tempo)
int estimate_duration_seconds(const ExerciseParameters& params);

ExerciseMetadata derive_exercise_metadata(ExerciseType type, const ExerciseParameters& params);

// Field descriptions for client-side parameter forms.
Schema exercise_schema();

} // namespace etude
