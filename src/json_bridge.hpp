#pragma once

#include <nlohmann/json.hpp>

#include "etude/analysis.hpp"
#include "etude/events.hpp"
#include "etude/exercise.hpp"
#include "etude/exercise_library.hpp"
#include "etude/score.hpp"
#include "etude/sheet_music.hpp"
#include "etude/validation.hpp"

namespace etude::bridge {

nlohmann::json to_json(const Note& note);
Note note_from_json(const nlohmann::json& json_note);

nlohmann::json to_json(const Measure& measure);
Measure measure_from_json(const nlohmann::json& json_measure);

nlohmann::json to_json(const SheetMusic& sheet);
SheetMusic sheet_music_from_json(const nlohmann::json& json_sheet);

nlohmann::json to_json(const VoiceNote& note);
VoiceNote voice_note_from_json(const nlohmann::json& json_note);

nlohmann::json to_json(const Voice& voice);
Voice voice_from_json(const nlohmann::json& json_voice);

nlohmann::json to_json(const Staff& staff);
Staff staff_from_json(const nlohmann::json& json_staff);

nlohmann::json to_json(const Part& part);
Part part_from_json(const nlohmann::json& json_part);

nlohmann::json to_json(const ScoreMeasure& measure);
ScoreMeasure score_measure_from_json(const nlohmann::json& json_measure);

nlohmann::json to_json(const ScoreMetadata& metadata);
ScoreMetadata score_metadata_from_json(const nlohmann::json& json_metadata);

nlohmann::json to_json(const Score& score);
Score score_from_json(const nlohmann::json& json_score);

// Collects every malformed or out-of-range field into one ValidationError.
nlohmann::json to_json(const ExerciseParameters& params);
ExerciseParameters exercise_parameters_from_json(const nlohmann::json& json_params);

nlohmann::json to_json(const ExerciseMetadata& metadata);
ExerciseMetadata exercise_metadata_from_json(const nlohmann::json& json_metadata);

nlohmann::json to_json(const GeneratedExercise& exercise);
GeneratedExercise generated_exercise_from_json(const nlohmann::json& json_exercise);

nlohmann::json to_json(const PerformanceEntry& entry);
PerformanceEntry performance_entry_from_json(const nlohmann::json& json_entry);

nlohmann::json to_json(const UserRepertoire& repertoire);
UserRepertoire user_repertoire_from_json(const nlohmann::json& json_repertoire);

// Exercise parameter keys plus voicePreset, voiceCount and customVoices.
MultiVoiceParameters multi_voice_parameters_from_json(const nlohmann::json& json_params);

// Missing keys keep their defaults.
nlohmann::json to_json(const LibraryConfig& config);
LibraryConfig library_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const ScoreSearchCriteria& criteria);
ScoreSearchCriteria score_search_criteria_from_json(const nlohmann::json& json_criteria);

nlohmann::json to_json(const ScoreSearchResults& results);
nlohmann::json to_json(const LibraryHealth& health);
nlohmann::json to_json(const LibraryEvent& event);
nlohmann::json to_json(const ValidationResult& result);
nlohmann::json to_json(const VoiceComplexityAnalysis& analysis);

} // namespace etude::bridge
