#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "events.hpp"
#include "exercise.hpp"
#include "score.hpp"
#include "sheet_music.hpp"
#include "storage.hpp"

namespace etude {

//====================================================================
// CONFIGURATION
//====================================================================

struct LibraryConfig {
  int max_exercises_per_user = 100;
  int exercise_expiration_days = 30;
  int cache_expiration_minutes = 60; // score search results
  int initial_load_limit = 50;       // exercises preloaded by initialize()
  std::uint64_t id_seed = 0;          // 0 seeds ids from std::random_device
};

//====================================================================
// REPERTOIRE
//====================================================================

enum class RepertoireStatus { Learning, Memorized, Forgotten, Dropped, Wishlist };

std::string to_string(RepertoireStatus status);
RepertoireStatus repertoire_status_from_string(const std::string& token);

struct PerformanceEntry {
  Timestamp date{};
  int tempo = 0;
  double accuracy = 0.0; // 0..1
  int quality = 3;       // 1..5
  std::optional<std::string> notes;
};

struct UserRepertoire {
  std::string id; // "<user>-<score>"
  std::string user_id;
  std::string score_id;
  RepertoireStatus status = RepertoireStatus::Learning;
  std::optional<Timestamp> date_started;
  std::optional<Timestamp> date_memorized;
  std::optional<Timestamp> date_last_played;
  int total_practice_minutes = 0;
  std::optional<std::string> personal_notes;
  std::optional<int> difficulty_rating; // 1..5
  std::vector<PerformanceEntry> performance_history;
};

//====================================================================
// SEARCH / RECOMMENDATIONS
//====================================================================

struct ScoreSearchCriteria {
  std::optional<std::string> query; // case-insensitive, title/composer/tags
  std::optional<std::string> composer;
  std::optional<int> min_difficulty;
  std::optional<int> max_difficulty;
  std::vector<std::string> tags; // all must be present
  std::optional<int> max_duration_seconds;
};

struct ScoreSearchResults {
  std::vector<Score> scores; // ordered by title
  int total_count = 0;
  std::vector<std::pair<std::string, int>> composers; // facet counts
};

struct MusicRecommendation {
  std::string id;
  std::string user_id;
  std::string score_id;
  double score = 0.0;
  std::string reasoning;
  Timestamp created_at{};
};

struct DifficultyAssessment {
  std::string score_id;
  std::string user_id;
  int overall_difficulty = 0;
  std::vector<std::string> challenges;
};

struct LibraryHealth {
  bool healthy = false;
  std::string message;
  Timestamp last_check{};
};

//====================================================================
// MULTI-VOICE EXERCISES
//====================================================================

enum class VoicePreset { Piano, Satb, Duet, Custom };

std::string to_string(VoicePreset preset);
VoicePreset voice_preset_from_string(const std::string& token);

struct VoiceSpec {
  std::string id;
  std::string name;
  NoteRange range;
  Clef clef = Clef::Treble;
};

struct MultiVoiceParameters {
  ExerciseParameters base; // key, meter, tempo, difficulty, measures, seed
  VoicePreset preset = VoicePreset::Piano;
  int voice_count = 2;           // satb and custom presets only
  std::vector<VoiceSpec> voices; // replaces the preset's voices when set
};

constexpr int kMaxVoices = 8;

// Voices of a preset, top to bottom. Throws ValidationError when the preset
// cannot supply `voice_count` voices.
std::vector<VoiceSpec> preset_voices(VoicePreset preset, int voice_count);

// Piano puts every voice on a treble/bass grand staff in one part; the other
// presets give each voice its own part and staff. Each voice is a
// sight-reading line within its range. Deterministic for base.seed.
Score build_multi_voice_score(const MultiVoiceParameters& params);

//====================================================================
// LIBRARY
//====================================================================

// Generates, caches and persists exercises and scores, and publishes a
// lifecycle event for every mutation. Safe to call from several threads;
// storage and event calls happen synchronously on the caller's thread.
class ExerciseLibrary {
public:
  using Clock = std::function<Timestamp()>;

  ExerciseLibrary(Storage& storage, EventBus& events, LibraryConfig config = {},
                  Clock clock = [] { return std::chrono::system_clock::now(); });

  // Preloads up to config.initial_load_limit stored exercises. Idempotent.
  void initialize();
  // Drops every cache; storage is untouched.
  void dispose();
  bool initialized() const;
  LibraryHealth health();

  // Removes exercises whose expiry has passed from cache and storage.
  // Returns the number removed; a second call finds nothing.
  std::size_t sweep_expired();
  void clear_search_cache();

  const LibraryConfig& config() const { return config_; }

  // Exercises ----------------------------------------------------------

  // Generates, stamps (id, owner, created/expiry) and saves.
  GeneratedExercise generate_exercise(const std::string& user_id, ExerciseType type,
                                      const ExerciseParameters& params);
  void save_exercise(const GeneratedExercise& exercise);
  // Expired exercises load as absent.
  std::optional<GeneratedExercise> load_exercise(const std::string& exercise_id);
  // Unexpired exercises, newest first.
  std::vector<GeneratedExercise> list_user_exercises(const std::string& user_id);
  bool delete_exercise(const std::string& user_id, const std::string& exercise_id);

  // Scores -------------------------------------------------------------

  std::optional<Score> get_score(const std::string& score_id);
  // Assigns a fresh id and returns it. Throws ValidationError when the score
  // has structural errors.
  std::string save_score(const Score& score);
  ScoreSearchResults search_scores(const ScoreSearchCriteria& criteria);
  // Builds a multi-voice score and saves it; metadata.id holds the new id.
  Score generate_multi_voice_exercise(const MultiVoiceParameters& params);

  // Repertoire ---------------------------------------------------------

  std::vector<UserRepertoire> get_user_repertoire(const std::string& user_id);
  void update_repertoire_status(const std::string& user_id, const std::string& score_id,
                                RepertoireStatus status);
  void record_practice_session(const std::string& user_id, const std::string& score_id,
                               const PerformanceEntry& entry);

  std::vector<MusicRecommendation> get_recommendations(const std::string& user_id);
  void refresh_recommendations(const std::string& user_id);

  // Not implemented; these throw NotImplemented.
  DifficultyAssessment assess_difficulty(const std::string& score_id, const std::string& user_id);
  SheetMusic import_music_xml(const std::string& document);
  std::string export_music_xml(const std::string& score_id);

private:
  struct CachedSearch {
    ScoreSearchResults results;
    Timestamp stored_at{};
  };

  // Draws ids until `taken` accepts one.
  std::string next_id_locked(const std::string& prefix,
                             const std::function<bool(const std::string&)>& taken);
  bool exercise_id_taken_locked(const std::string& exercise_id);
  void save_exercise_locked(const GeneratedExercise& exercise, std::vector<LibraryEvent>& out);
  void prune_user_exercises_locked(const std::string& user_id, std::vector<LibraryEvent>& out);
  std::optional<GeneratedExercise> read_exercise_locked(const std::string& key);
  std::optional<UserRepertoire> read_repertoire_locked(const std::string& key);
  void cache_repertoire_locked(const UserRepertoire& entry);
  void publish(std::vector<LibraryEvent> events);

  Storage& storage_;
  EventBus& events_;
  LibraryConfig config_;
  Clock clock_;

  mutable std::mutex mutex_;
  bool initialized_ = false;
  Timestamp last_health_check_{};
  std::uint64_t id_rng_state_;
  std::map<std::string, GeneratedExercise> exercises_;
  std::map<std::string, CachedSearch> search_cache_;
  std::map<std::string, std::vector<MusicRecommendation>> recommendations_;
  std::map<std::string, std::vector<UserRepertoire>> repertoire_;
};

std::string exercise_key(const std::string& user_id, const std::string& exercise_id);
std::string score_key(const std::string& score_id);
std::string repertoire_key(const std::string& user_id, const std::string& score_id);

} // namespace etude
