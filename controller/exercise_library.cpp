#include "etude/exercise_library.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

#include "etude/converters.hpp"
#include "etude/errors.hpp"
#include "etude/generator.hpp"
#include "etude/validation.hpp"
#include "../src/debug_log.hpp"
#include "../src/json_bridge.hpp"
#include "../src/rng.hpp"

namespace etude {
namespace {

constexpr const char* kExercisePrefix = "exercise:";
constexpr const char* kScorePrefix = "score:";
constexpr const char* kRepertoirePrefix = "repertoire:";

bool library_debug_enabled() {
  static const bool enabled = debug_enabled("library");
  return enabled;
}

void library_log(const std::string& message) {
  debug_log(library_debug_enabled(), "library", message);
}

std::string lower(std::string text) {
  for (char& c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
  return lower(haystack).find(lower(needle)) != std::string::npos;
}

bool expired(const GeneratedExercise& exercise, Timestamp now) {
  return exercise.expires_at.has_value() && *exercise.expires_at <= now;
}

bool ends_with(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool matches(const Score& score, const ScoreSearchCriteria& criteria) {
  const auto& metadata = score.metadata;
  if (criteria.query) {
    const bool hit = contains_ci(score.title, *criteria.query) ||
                     contains_ci(score.composer, *criteria.query) ||
                     std::any_of(metadata.tags.begin(), metadata.tags.end(),
                                 [&](const std::string& tag) {
                                   return contains_ci(tag, *criteria.query);
                                 });
    if (!hit) {
      return false;
    }
  }
  if (criteria.composer && !contains_ci(score.composer, *criteria.composer)) {
    return false;
  }
  if (criteria.min_difficulty &&
      (!metadata.difficulty || *metadata.difficulty < *criteria.min_difficulty)) {
    return false;
  }
  if (criteria.max_difficulty &&
      (!metadata.difficulty || *metadata.difficulty > *criteria.max_difficulty)) {
    return false;
  }
  for (const auto& tag : criteria.tags) {
    if (std::find(metadata.tags.begin(), metadata.tags.end(), tag) == metadata.tags.end()) {
      return false;
    }
  }
  if (criteria.max_duration_seconds &&
      (!metadata.duration_seconds || *metadata.duration_seconds > *criteria.max_duration_seconds)) {
    return false;
  }
  return true;
}

LibraryEvent make_event(const char* type, nlohmann::json data, Timestamp now) {
  data["timestamp"] = to_epoch_ms(now);
  LibraryEvent event;
  event.type = type;
  event.data = std::move(data);
  event.timestamp = now;
  return event;
}

LibraryEvent exercise_deleted_event(const std::string& user_id, const std::string& exercise_id,
                                    const char* reason, Timestamp now) {
  nlohmann::json data = nlohmann::json::object();
  data["userId"] = user_id;
  data["exerciseId"] = exercise_id;
  data["reason"] = reason;
  return make_event(kEventExerciseDeleted, std::move(data), now);
}

std::uint64_t random_seed() {
  std::random_device device;
  std::uint64_t seed = (static_cast<std::uint64_t>(device()) << 32) ^ device();
  seed ^= static_cast<std::uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  return seed == 0 ? 1 : seed;
}

} // namespace

std::string to_string(RepertoireStatus status) {
  switch (status) {
    case RepertoireStatus::Learning: return "LEARNING";
    case RepertoireStatus::Memorized: return "MEMORIZED";
    case RepertoireStatus::Forgotten: return "FORGOTTEN";
    case RepertoireStatus::Dropped: return "DROPPED";
    case RepertoireStatus::Wishlist: return "WISHLIST";
  }
  return "LEARNING";
}

RepertoireStatus repertoire_status_from_string(const std::string& token) {
  if (token == "LEARNING") return RepertoireStatus::Learning;
  if (token == "MEMORIZED") return RepertoireStatus::Memorized;
  if (token == "FORGOTTEN") return RepertoireStatus::Forgotten;
  if (token == "DROPPED") return RepertoireStatus::Dropped;
  if (token == "WISHLIST") return RepertoireStatus::Wishlist;
  throw FormatError("Unknown repertoire status: " + token);
}

std::string exercise_key(const std::string& user_id, const std::string& exercise_id) {
  return kExercisePrefix + user_id + ":" + exercise_id;
}

std::string score_key(const std::string& score_id) {
  return kScorePrefix + score_id;
}

std::string repertoire_key(const std::string& user_id, const std::string& score_id) {
  return kRepertoirePrefix + user_id + ":" + score_id;
}

//====================================================================
// MULTI-VOICE EXERCISES
//====================================================================

namespace {

constexpr int kChoirProgram = 52;
constexpr int kDefaultVolume = 100;

void check_voices(const std::vector<VoiceSpec>& voices) {
  std::vector<std::string> errors;
  if (voices.empty() || voices.size() > static_cast<std::size_t>(kMaxVoices)) {
    errors.push_back("Voice count must be between 1 and " + std::to_string(kMaxVoices));
  }
  std::set<std::string> seen;
  for (const auto& voice : voices) {
    if (voice.id.empty()) {
      errors.push_back("Voice must have an id");
    } else if (!seen.insert(voice.id).second) {
      errors.push_back("Duplicate voice id: " + voice.id);
    }
  }
  if (!errors.empty()) {
    throw ValidationError(std::move(errors));
  }
}

Part voice_part(const VoiceSpec& voice, VoicePreset preset) {
  Part part;
  part.id = voice.id;
  part.name = voice.name.empty() ? voice.id : voice.name;
  part.instrument = preset == VoicePreset::Satb ? "voice" : "instrument";
  part.staves = {voice.id + "-staff"};
  part.midi_program = preset == VoicePreset::Satb ? kChoirProgram : 0;
  part.volume = kDefaultVolume;
  return part;
}

} // namespace

std::string to_string(VoicePreset preset) {
  switch (preset) {
    case VoicePreset::Piano: return "piano";
    case VoicePreset::Satb: return "satb";
    case VoicePreset::Duet: return "duet";
    case VoicePreset::Custom: return "custom";
  }
  return "custom";
}

VoicePreset voice_preset_from_string(const std::string& token) {
  if (token == "piano") return VoicePreset::Piano;
  if (token == "satb") return VoicePreset::Satb;
  if (token == "duet") return VoicePreset::Duet;
  if (token == "custom") return VoicePreset::Custom;
  throw FormatError("Unknown voice preset: " + token);
}

std::vector<VoiceSpec> preset_voices(VoicePreset preset, int voice_count) {
  switch (preset) {
    case VoicePreset::Piano:
      return {{"rightHand", "Right Hand", {"C4", "C7"}, Clef::Treble},
              {"leftHand", "Left Hand", {"A1", "C5"}, Clef::Bass}};
    case VoicePreset::Duet:
      return {{"voice1", "Voice 1", {"C4", "G5"}, Clef::Treble},
              {"voice2", "Voice 2", {"G3", "E5"}, Clef::Treble}};
    case VoicePreset::Satb: {
      const std::vector<VoiceSpec> choir{{"soprano", "Soprano", {"C4", "A5"}, Clef::Treble},
                                         {"alto", "Alto", {"G3", "D5"}, Clef::Treble},
                                         {"tenor", "Tenor", {"C3", "G4"}, Clef::Bass},
                                         {"bass", "Bass", {"E2", "C4"}, Clef::Bass}};
      if (voice_count < 1 || voice_count > static_cast<int>(choir.size())) {
        throw ValidationError({"SATB voice count must be between 1 and 4"});
      }
      return std::vector<VoiceSpec>(choir.begin(), choir.begin() + voice_count);
    }
    case VoicePreset::Custom: {
      if (voice_count < 1 || voice_count > kMaxVoices) {
        throw ValidationError({"Voice count must be between 1 and " + std::to_string(kMaxVoices)});
      }
      std::vector<VoiceSpec> voices;
      for (int i = 1; i <= voice_count; ++i) {
        const std::string number = std::to_string(i);
        voices.push_back({"voice" + number, "Voice " + number, {"C3", "C6"}, Clef::Treble});
      }
      return voices;
    }
  }
  throw std::invalid_argument("preset_voices: unknown preset");
}

Score build_multi_voice_score(const MultiVoiceParameters& params) {
  const std::vector<VoiceSpec> voices =
      params.voices.empty() ? preset_voices(params.preset, params.voice_count) : params.voices;
  check_voices(voices);
  const bool grand_staff = params.preset == VoicePreset::Piano;

  // Staff layout shared by every measure, and the staff each voice sits on.
  std::vector<Staff> layout;
  std::vector<std::size_t> staff_of;
  if (grand_staff) {
    layout = {Staff{"treble-staff", Clef::Treble, std::nullopt, {}},
              Staff{"bass-staff", Clef::Bass, std::nullopt, {}}};
    for (const auto& voice : voices) {
      staff_of.push_back(voice.clef == Clef::Bass ? 1 : 0);
    }
  } else {
    for (const auto& voice : voices) {
      staff_of.push_back(layout.size());
      layout.push_back(Staff{voice.id + "-staff", voice.clef, voice.name, {}});
    }
  }

  std::vector<std::vector<Measure>> lines;
  for (std::size_t i = 0; i < voices.size(); ++i) {
    ExerciseParameters line = params.base;
    line.range = voices[i].range;
    line.clef = layout[staff_of[i]].clef;
    line.seed = params.base.seed + i;
    lines.push_back(generate_measures(GeneratorKind::SightReading, line));
  }

  Score score;
  score.title = "Multi-Voice Exercise";
  score.composer = "Etude Exercise Generator";
  if (grand_staff) {
    Part piano;
    piano.id = "piano";
    piano.name = "Piano";
    piano.instrument = "piano";
    piano.staves = {"treble-staff", "bass-staff"};
    piano.midi_program = 0;
    piano.volume = kDefaultVolume;
    score.parts.push_back(std::move(piano));
  } else {
    for (const auto& voice : voices) {
      score.parts.push_back(voice_part(voice, params.preset));
    }
  }

  for (int m = 0; m < params.base.measures; ++m) {
    ScoreMeasure measure;
    measure.number = m + 1;
    if (m == 0) {
      measure.time_signature = params.base.time_signature;
      measure.key_signature = params.base.key_signature;
      measure.tempo = params.base.tempo;
    }
    measure.staves = layout;
    for (std::size_t i = 0; i < voices.size(); ++i) {
      Staff& staff = measure.staves[staff_of[i]];
      Voice voice;
      voice.id = voices[i].id;
      voice.name = voices[i].name;
      for (const auto& note : lines[i][static_cast<std::size_t>(m)].notes) {
        voice.notes.push_back(to_voice_note(note, voice.id, staff.id));
      }
      staff.voices.push_back(std::move(voice));
    }
    score.measures.push_back(std::move(measure));
  }

  score.metadata.source = "Exercise generator";
  score.metadata.tags = {"exercise", "multi-voice"};
  score.metadata.difficulty = params.base.difficulty;
  score.metadata.duration_seconds = estimate_duration_seconds(params.base);
  return score;
}

//====================================================================
// LIFECYCLE
//====================================================================

ExerciseLibrary::ExerciseLibrary(Storage& storage, EventBus& events, LibraryConfig config,
                                 Clock clock)
    : storage_(storage),
      events_(events),
      config_(config),
      clock_(std::move(clock)),
      id_rng_state_(config.id_seed != 0 ? config.id_seed : random_seed()) {
  if (!clock_) {
    throw std::invalid_argument("ExerciseLibrary requires a clock");
  }
  if (config_.max_exercises_per_user < 1) {
    throw std::invalid_argument("ExerciseLibrary: max_exercises_per_user must be at least 1");
  }
  last_health_check_ = clock_();
}

void ExerciseLibrary::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) {
    return;
  }
  try {
    const auto keys = storage_.list_keys(kExercisePrefix);
    const auto limit = std::min(keys.size(),
                                static_cast<std::size_t>(std::max(config_.initial_load_limit, 0)));
    for (std::size_t i = 0; i < limit; ++i) {
      if (auto exercise = read_exercise_locked(keys[i])) {
        exercises_[exercise->id] = std::move(*exercise);
      }
    }
  } catch (const std::exception& error) {
    throw std::runtime_error(std::string("Failed to initialize ExerciseLibrary: ") + error.what());
  }
  initialized_ = true;
  library_log("initialized with " + std::to_string(exercises_.size()) + " cached exercises");
}

void ExerciseLibrary::dispose() {
  std::lock_guard<std::mutex> lock(mutex_);
  exercises_.clear();
  search_cache_.clear();
  recommendations_.clear();
  repertoire_.clear();
  initialized_ = false;
}

bool ExerciseLibrary::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

LibraryHealth ExerciseLibrary::health() {
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp now = clock_();
  const auto since = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_health_check_);
  last_health_check_ = now;
  LibraryHealth report;
  report.healthy = initialized_;
  report.last_check = now;
  report.message = initialized_ ? "Library is healthy (last check was " +
                                      std::to_string(since.count()) + "ms ago)"
                                : "Library not initialized";
  return report;
}

std::size_t ExerciseLibrary::sweep_expired() {
  std::vector<LibraryEvent> pending;
  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_();
    for (const auto& key : storage_.list_keys(kExercisePrefix)) {
      const auto exercise = read_exercise_locked(key);
      if (!exercise || !expired(*exercise, now)) {
        continue;
      }
      if (storage_.remove(key)) {
        ++removed;
        pending.push_back(exercise_deleted_event(exercise->user_id, exercise->id, "expired", now));
      }
      exercises_.erase(exercise->id);
    }
    std::erase_if(exercises_, [&](const auto& entry) { return expired(entry.second, now); });
  }
  if (removed > 0) {
    library_log("swept " + std::to_string(removed) + " expired exercises");
  }
  publish(std::move(pending));
  return removed;
}

void ExerciseLibrary::clear_search_cache() {
  std::lock_guard<std::mutex> lock(mutex_);
  search_cache_.clear();
}

//====================================================================
// EXERCISES
//====================================================================

GeneratedExercise ExerciseLibrary::generate_exercise(const std::string& user_id, ExerciseType type,
                                                     const ExerciseParameters& params) {
  if (user_id.empty()) {
    throw std::invalid_argument("generate_exercise: user id is required");
  }
  GeneratedExercise exercise;
  exercise.user_id = user_id;
  exercise.type = type;
  exercise.parameters = params;
  exercise.measures = generate_exercise_measures(type, params);
  exercise.metadata = derive_exercise_metadata(type, params);

  std::vector<LibraryEvent> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    exercise.id = next_id_locked("ex-", [this](const std::string& id) {
      return exercise_id_taken_locked(id);
    });
    exercise.created_at = clock_();
    exercise.expires_at =
        exercise.created_at + std::chrono::hours(24) * config_.exercise_expiration_days;
    save_exercise_locked(exercise, pending);
  }
  library_log("generated " + exercise.id + " (" + to_string(type) + ") for " + user_id);
  publish(std::move(pending));
  return exercise;
}

void ExerciseLibrary::save_exercise(const GeneratedExercise& exercise) {
  if (exercise.id.empty() || exercise.user_id.empty()) {
    throw std::invalid_argument("save_exercise: exercise id and user id are required");
  }
  std::vector<LibraryEvent> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    save_exercise_locked(exercise, pending);
  }
  publish(std::move(pending));
}

std::optional<GeneratedExercise> ExerciseLibrary::load_exercise(const std::string& exercise_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp now = clock_();
  auto cached = exercises_.find(exercise_id);
  if (cached != exercises_.end()) {
    if (expired(cached->second, now)) {
      return std::nullopt;
    }
    return cached->second;
  }
  const std::string suffix = ":" + exercise_id;
  for (const auto& key : storage_.list_keys(kExercisePrefix)) {
    if (!ends_with(key, suffix)) {
      continue;
    }
    auto exercise = read_exercise_locked(key);
    if (exercise && exercise->id == exercise_id) {
      if (expired(*exercise, now)) {
        return std::nullopt;
      }
      exercises_[exercise_id] = *exercise;
      return exercise;
    }
  }
  return std::nullopt;
}

std::vector<GeneratedExercise> ExerciseLibrary::list_user_exercises(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp now = clock_();
  std::vector<GeneratedExercise> out;
  for (const auto& key : storage_.list_keys(exercise_key(user_id, ""))) {
    auto exercise = read_exercise_locked(key);
    if (exercise && !expired(*exercise, now)) {
      out.push_back(std::move(*exercise));
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const GeneratedExercise& a, const GeneratedExercise& b) {
    return a.created_at > b.created_at;
  });
  return out;
}

bool ExerciseLibrary::delete_exercise(const std::string& user_id, const std::string& exercise_id) {
  std::vector<LibraryEvent> pending;
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = storage_.remove(exercise_key(user_id, exercise_id));
    auto cached = exercises_.find(exercise_id);
    if (cached != exercises_.end() && cached->second.user_id == user_id) {
      exercises_.erase(cached);
      removed = true;
    }
    if (removed) {
      pending.push_back(exercise_deleted_event(user_id, exercise_id, "deleted", clock_()));
    }
  }
  publish(std::move(pending));
  return removed;
}

void ExerciseLibrary::save_exercise_locked(const GeneratedExercise& exercise,
                                           std::vector<LibraryEvent>& out) {
  storage_.write(exercise_key(exercise.user_id, exercise.id), bridge::to_json(exercise));
  exercises_[exercise.id] = exercise;

  nlohmann::json data = nlohmann::json::object();
  data["exercise"] = bridge::to_json(exercise);
  out.push_back(make_event(kEventExerciseGenerated, std::move(data), clock_()));

  prune_user_exercises_locked(exercise.user_id, out);
}

void ExerciseLibrary::prune_user_exercises_locked(const std::string& user_id,
                                                  std::vector<LibraryEvent>& out) {
  const auto keys = storage_.list_keys(exercise_key(user_id, ""));
  if (keys.size() <= static_cast<std::size_t>(config_.max_exercises_per_user)) {
    return;
  }
  std::vector<std::pair<GeneratedExercise, std::string>> stored;
  for (const auto& key : keys) {
    if (auto exercise = read_exercise_locked(key)) {
      stored.emplace_back(std::move(*exercise), key);
    }
  }
  std::stable_sort(stored.begin(), stored.end(), [](const auto& a, const auto& b) {
    return a.first.created_at < b.first.created_at;
  });
  const Timestamp now = clock_();
  const auto cap = static_cast<std::size_t>(config_.max_exercises_per_user);
  for (std::size_t i = 0; i + cap < stored.size(); ++i) {
    const auto& [exercise, key] = stored[i];
    storage_.remove(key);
    exercises_.erase(exercise.id);
    out.push_back(exercise_deleted_event(user_id, exercise.id, "limit", now));
    library_log("pruned " + exercise.id + " for " + user_id);
  }
}

std::optional<GeneratedExercise> ExerciseLibrary::read_exercise_locked(const std::string& key) {
  const auto stored = storage_.read(key);
  if (!stored) {
    return std::nullopt;
  }
  try {
    return bridge::generated_exercise_from_json(*stored);
  } catch (const std::invalid_argument& error) {
    library_log("skipping unreadable exercise at " + key + ": " + error.what());
    return std::nullopt;
  }
}

//====================================================================
// SCORES
//====================================================================

std::optional<Score> ExerciseLibrary::get_score(const std::string& score_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto stored = storage_.read(score_key(score_id));
  if (!stored) {
    return std::nullopt;
  }
  try {
    return bridge::score_from_json(*stored);
  } catch (const std::invalid_argument& error) {
    library_log("score " + score_id + " is not a valid score: " + error.what());
    return std::nullopt;
  }
}

std::string ExerciseLibrary::save_score(const Score& score) {
  const ValidationResult result = validate_score(score);
  if (!result.valid) {
    std::vector<std::string> errors;
    for (const auto& finding : result.errors) {
      errors.push_back(finding.entity.empty() ? finding.message
                                              : finding.entity + ": " + finding.message);
    }
    throw ValidationError(std::move(errors));
  }

  std::vector<LibraryEvent> pending;
  std::string id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_();
    id = next_id_locked("score-", [this](const std::string& candidate) {
      return storage_.read(score_key(candidate)).has_value();
    });
    Score stored = score;
    stored.metadata.id = id;
    stored.metadata.modified_at = now;
    if (stored.metadata.created_at == Timestamp{}) {
      stored.metadata.created_at = now;
    }
    storage_.write(score_key(id), bridge::to_json(stored));
    search_cache_.clear();

    nlohmann::json data = nlohmann::json::object();
    data["scoreId"] = id;
    data["title"] = score.title;
    data["partCount"] = score.parts.size();
    data["measureCount"] = score.measures.size();
    pending.push_back(make_event(kEventScoreSaved, std::move(data), now));
  }
  publish(std::move(pending));
  return id;
}

Score ExerciseLibrary::generate_multi_voice_exercise(const MultiVoiceParameters& params) {
  Score score = build_multi_voice_score(params);
  score.metadata.created_at = clock_();
  score.metadata.id = save_score(score);
  library_log("generated multi-voice score " + *score.metadata.id + " (" +
              to_string(params.preset) + ", " + std::to_string(score.parts.size()) + " parts)");
  return score;
}

ScoreSearchResults ExerciseLibrary::search_scores(const ScoreSearchCriteria& criteria) {
  const std::string cache_key = bridge::to_json(criteria).dump();
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp now = clock_();
  auto cached = search_cache_.find(cache_key);
  if (cached != search_cache_.end()) {
    if (now - cached->second.stored_at < std::chrono::minutes(config_.cache_expiration_minutes)) {
      return cached->second.results;
    }
    search_cache_.erase(cached);
  }

  ScoreSearchResults results;
  std::map<std::string, int> composers;
  for (const auto& key : storage_.list_keys(kScorePrefix)) {
    const auto stored = storage_.read(key);
    if (!stored) {
      continue;
    }
    try {
      Score score = bridge::score_from_json(*stored);
      if (matches(score, criteria)) {
        ++composers[score.composer];
        results.scores.push_back(std::move(score));
      }
    } catch (const std::invalid_argument& error) {
      library_log("search skipped " + key + ": " + error.what());
    }
  }
  std::stable_sort(results.scores.begin(), results.scores.end(),
                   [](const Score& a, const Score& b) { return a.title < b.title; });
  results.total_count = static_cast<int>(results.scores.size());
  results.composers.assign(composers.begin(), composers.end());
  search_cache_[cache_key] = CachedSearch{results, now};
  return results;
}

//====================================================================
// REPERTOIRE
//====================================================================

std::vector<UserRepertoire> ExerciseLibrary::get_user_repertoire(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto cached = repertoire_.find(user_id);
  if (cached != repertoire_.end()) {
    return cached->second;
  }
  std::vector<UserRepertoire> entries;
  for (const auto& key : storage_.list_keys(repertoire_key(user_id, ""))) {
    if (auto entry = read_repertoire_locked(key)) {
      entries.push_back(std::move(*entry));
    }
  }
  repertoire_[user_id] = entries;
  return entries;
}

void ExerciseLibrary::update_repertoire_status(const std::string& user_id,
                                               const std::string& score_id,
                                               RepertoireStatus status) {
  std::vector<LibraryEvent> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_();
    const std::string key = repertoire_key(user_id, score_id);
    auto entry = read_repertoire_locked(key);
    std::optional<RepertoireStatus> old_status;
    if (entry) {
      old_status = entry->status;
      entry->status = status;
    } else {
      entry = UserRepertoire{};
      entry->id = user_id + "-" + score_id;
      entry->user_id = user_id;
      entry->score_id = score_id;
      entry->status = status;
      entry->date_started = now;
    }
    if (status == RepertoireStatus::Memorized && !entry->date_memorized) {
      entry->date_memorized = now;
    }
    storage_.write(key, bridge::to_json(*entry));
    cache_repertoire_locked(*entry);

    nlohmann::json data = nlohmann::json::object();
    data["userId"] = user_id;
    data["scoreId"] = score_id;
    data["oldStatus"] = old_status ? nlohmann::json(to_string(*old_status)) : nlohmann::json();
    data["newStatus"] = to_string(status);
    pending.push_back(make_event(kEventRepertoireStatusChanged, std::move(data), now));
  }
  publish(std::move(pending));
}

void ExerciseLibrary::record_practice_session(const std::string& user_id,
                                              const std::string& score_id,
                                              const PerformanceEntry& entry) {
  std::vector<LibraryEvent> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_();
    const std::string key = repertoire_key(user_id, score_id);
    auto repertoire = read_repertoire_locked(key);
    if (!repertoire) {
      repertoire = UserRepertoire{};
      repertoire->id = user_id + "-" + score_id;
      repertoire->user_id = user_id;
      repertoire->score_id = score_id;
      repertoire->status = RepertoireStatus::Learning;
      repertoire->date_started = now;
    }
    repertoire->performance_history.push_back(entry);
    repertoire->date_last_played = entry.date;
    storage_.write(key, bridge::to_json(*repertoire));
    cache_repertoire_locked(*repertoire);

    nlohmann::json data = nlohmann::json::object();
    data["userId"] = user_id;
    data["scoreId"] = score_id;
    data["entry"] = bridge::to_json(entry);
    pending.push_back(make_event(kEventPracticeSessionRecorded, std::move(data), now));
  }
  publish(std::move(pending));
}

std::optional<UserRepertoire> ExerciseLibrary::read_repertoire_locked(const std::string& key) {
  const auto stored = storage_.read(key);
  if (!stored) {
    return std::nullopt;
  }
  try {
    return bridge::user_repertoire_from_json(*stored);
  } catch (const std::invalid_argument& error) {
    library_log("skipping unreadable repertoire entry at " + key + ": " + error.what());
    return std::nullopt;
  }
}

// Only users already loaded are updated; others are read from storage on
// their next lookup.
void ExerciseLibrary::cache_repertoire_locked(const UserRepertoire& entry) {
  auto cached = repertoire_.find(entry.user_id);
  if (cached == repertoire_.end()) {
    return;
  }
  auto& entries = cached->second;
  auto it = std::find_if(entries.begin(), entries.end(), [&](const UserRepertoire& existing) {
    return existing.score_id == entry.score_id;
  });
  if (it != entries.end()) {
    *it = entry;
  } else {
    entries.push_back(entry);
  }
}

std::vector<MusicRecommendation> ExerciseLibrary::get_recommendations(const std::string& user_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = recommendations_.find(user_id);
    if (cached != recommendations_.end()) {
      return cached->second;
    }
  }
  refresh_recommendations(user_id);
  std::lock_guard<std::mutex> lock(mutex_);
  return recommendations_[user_id];
}

void ExerciseLibrary::refresh_recommendations(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  recommendations_[user_id] = {};
}

//====================================================================
// NOT IMPLEMENTED
//====================================================================

DifficultyAssessment ExerciseLibrary::assess_difficulty(const std::string&, const std::string&) {
  throw NotImplemented("assess_difficulty");
}

SheetMusic ExerciseLibrary::import_music_xml(const std::string&) {
  throw NotImplemented("import_music_xml");
}

std::string ExerciseLibrary::export_music_xml(const std::string&) {
  throw NotImplemented("export_music_xml");
}

//====================================================================
// INTERNALS
//====================================================================

std::string ExerciseLibrary::next_id_locked(const std::string& prefix,
                                            const std::function<bool(const std::string&)>& taken) {
  for (;;) {
    std::ostringstream oss;
    oss << prefix << std::hex << std::setw(16) << std::setfill('0')
        << advance_rng(id_rng_state_);
    std::string id = oss.str();
    if (!taken(id)) {
      return id;
    }
    library_log("id " + id + " is already in use; drawing another");
  }
}

bool ExerciseLibrary::exercise_id_taken_locked(const std::string& exercise_id) {
  if (exercises_.count(exercise_id) > 0) {
    return true;
  }
  const std::string suffix = ":" + exercise_id;
  const auto keys = storage_.list_keys(kExercisePrefix);
  return std::any_of(keys.begin(), keys.end(),
                     [&](const std::string& key) { return ends_with(key, suffix); });
}

void ExerciseLibrary::publish(std::vector<LibraryEvent> events) {
  for (const auto& event : events) {
    events_.publish(event);
  }
}

} // namespace etude
