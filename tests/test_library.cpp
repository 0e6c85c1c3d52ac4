#include "etude/errors.hpp"
#include "etude/events.hpp"
#include "etude/exercise_library.hpp"
#include "etude/pitch.hpp"
#include "etude/storage.hpp"
#include "etude/validation.hpp"

#include "../src/json_bridge.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using etude::testing::TestSuite;
using etude::testing::throws;
using namespace std::chrono_literals;

const etude::Timestamp kStart = etude::from_epoch_ms(1700000000000);

// Storage, event log and a hand-driven clock around one library.
struct Fixture {
  etude::InMemoryStorage storage;
  etude::EventLog events;
  etude::Timestamp now = kStart;
  etude::ExerciseLibrary library;

  explicit Fixture(etude::LibraryConfig config = {})
      : library(storage, events, config, [this] { return now; }) {
    library.initialize();
  }
};

etude::ExerciseParameters scale_params() {
  etude::ExerciseParameters params;
  params.key_signature = etude::KeySignature::DMajor;
  params.range = {"C4", "C6"};
  params.difficulty = 3;
  params.measures = 4;
  params.technical_type = etude::TechnicalType::Scale;
  return params;
}

etude::Score small_score(const std::string& title, const std::string& composer, int difficulty,
                         std::vector<std::string> tags) {
  etude::VoiceNote note;
  note.keys = {"c/4"};
  note.duration = etude::NoteDuration::Whole;
  note.voice_id = "main";

  etude::Voice voice;
  voice.id = "main";
  voice.notes = {note};

  etude::Staff staff;
  staff.id = "main";
  staff.voices = {voice};

  etude::ScoreMeasure measure;
  measure.number = 1;
  measure.time_signature = etude::TimeSignature{4, 4};
  measure.staves = {staff};

  etude::Part part;
  part.id = "main";
  part.name = "Piano";
  part.instrument = "piano";
  part.staves = {"main"};

  etude::Score score;
  score.title = title;
  score.composer = composer;
  score.parts = {part};
  score.measures = {measure};
  score.metadata.difficulty = difficulty;
  score.metadata.tags = std::move(tags);
  return score;
}

std::vector<std::string> ids_of(const std::vector<etude::GeneratedExercise>& exercises) {
  std::vector<std::string> ids;
  for (const auto& exercise : exercises) {
    ids.push_back(exercise.id);
  }
  return ids;
}

//====================================================================
// LIFECYCLE
//====================================================================

void test_lifecycle(TestSuite& suite) {
  etude::InMemoryStorage storage;
  etude::EventLog events;
  etude::Timestamp now = kStart;
  etude::ExerciseLibrary library(storage, events, {}, [&now] { return now; });

  const auto before = library.health();
  suite.require(!before.healthy && before.message == "Library not initialized",
                "library is unhealthy before initialize");

  library.initialize();
  library.initialize();
  suite.require(library.initialized(), "initialize is idempotent");
  now += 250ms;
  const auto after = library.health();
  suite.require(after.healthy, "initialized library is healthy");
  suite.require(after.message == "Library is healthy (last check was 250ms ago)",
                "health reports time since the previous check");
  suite.require(after.last_check == now, "health stamps the check time");

  library.dispose();
  suite.require(!library.initialized() && !library.health().healthy,
                "dispose returns the library to uninitialized");

  suite.require(throws<std::invalid_argument>([&] {
                  etude::LibraryConfig bad;
                  bad.max_exercises_per_user = 0;
                  etude::ExerciseLibrary rejected(storage, events, bad);
                }),
                "a per-user cap below 1 is rejected");
}

//====================================================================
// EXERCISES
//====================================================================

void test_generate_and_load(TestSuite& suite) {
  Fixture fixture;
  auto& library = fixture.library;

  const auto exercise =
      library.generate_exercise("alice", etude::ExerciseType::Technical, scale_params());
  suite.require(exercise.id.rfind("ex-", 0) == 0 && exercise.id.size() == 19,
                "exercise ids are ex- plus 16 hex digits");
  suite.require(exercise.user_id == "alice", "exercise is owned by the caller");
  suite.require(exercise.created_at == kStart, "creation time comes from the clock");
  suite.require(exercise.expires_at == kStart + std::chrono::hours(24) * 30,
                "exercises expire after the configured days");
  suite.require(exercise.measures.size() == 4, "exercise carries the generated measures");
  suite.require(exercise.metadata.title == "D Major Scale", "metadata is derived");
  suite.require(fixture.storage.read(etude::exercise_key("alice", exercise.id)).has_value(),
                "exercise is persisted under the user's key");

  const auto generated = fixture.events.events_of_type(etude::kEventExerciseGenerated);
  suite.require(generated.size() == 1, "one exercise-generated event");
  suite.require(generated[0].source == "sheet-music", "events come from sheet-music");
  suite.require(generated[0].data["exercise"]["id"] == exercise.id, "event carries the exercise");
  suite.require(generated[0].data["timestamp"] == etude::to_epoch_ms(kStart),
                "event data is stamped in epoch milliseconds");

  const auto loaded = library.load_exercise(exercise.id);
  suite.require(loaded.has_value() && loaded->measures.size() == 4, "cached exercise loads");

  // A fresh library over the same storage finds it without preloading.
  etude::EventLog other_events;
  etude::ExerciseLibrary cold(fixture.storage, other_events, {}, [&] { return fixture.now; });
  const auto from_storage = cold.load_exercise(exercise.id);
  suite.require(from_storage.has_value(), "exercise loads from storage");
  suite.require(from_storage && from_storage->parameters.key_signature ==
                                    etude::KeySignature::DMajor,
                "stored parameters survive the round trip");
  suite.require(from_storage && from_storage->measures[0].notes.front().keys ==
                                    exercise.measures[0].notes.front().keys,
                "stored measures survive the round trip");
  suite.require(!cold.load_exercise("ex-missing").has_value(), "unknown id loads nothing");

  etude::ExerciseLibrary warm(fixture.storage, other_events, {}, [&] { return fixture.now; });
  warm.initialize();
  suite.require(warm.load_exercise(exercise.id).has_value(), "initialize preloads stored exercises");

  const auto before = fixture.events.events().size();
  suite.require(throws<etude::ValidationError>([&] {
                  auto params = scale_params();
                  params.tempo = 5;
                  library.generate_exercise("alice", etude::ExerciseType::Technical, params);
                }),
                "invalid parameters raise ValidationError");
  suite.require(throws<etude::NotImplemented>([&] {
                  library.generate_exercise("alice", etude::ExerciseType::Rhythm, scale_params());
                }),
                "rhythm exercises are not implemented");
  suite.require(fixture.events.events().size() == before, "failed generation publishes nothing");
  suite.require(throws<std::invalid_argument>([&] {
                  library.generate_exercise("", etude::ExerciseType::Technical, scale_params());
                }),
                "a user id is required");
}

void test_listing_and_limits(TestSuite& suite) {
  etude::LibraryConfig config;
  config.max_exercises_per_user = 2;
  Fixture fixture(config);
  auto& library = fixture.library;

  const auto first = library.generate_exercise("alice", etude::ExerciseType::Technical,
                                               scale_params());
  fixture.now += 1min;
  const auto second = library.generate_exercise("alice", etude::ExerciseType::SightReading,
                                                scale_params());
  fixture.now += 1min;
  library.generate_exercise("bob", etude::ExerciseType::Technical, scale_params());

  suite.require(ids_of(library.list_user_exercises("alice")) ==
                    std::vector<std::string>{second.id, first.id},
                "exercises are listed newest first");
  suite.require(library.list_user_exercises("bob").size() == 1, "users are listed separately");

  fixture.now += 1min;
  const auto third = library.generate_exercise("alice", etude::ExerciseType::Technical,
                                               scale_params());
  suite.require(ids_of(library.list_user_exercises("alice")) ==
                    std::vector<std::string>{third.id, second.id},
                "the oldest exercise is pruned at the cap");
  suite.require(!library.load_exercise(first.id).has_value(), "pruned exercise is gone");

  const auto deleted = fixture.events.events_of_type(etude::kEventExerciseDeleted);
  suite.require(deleted.size() == 1 && deleted[0].data["reason"] == "limit" &&
                    deleted[0].data["exerciseId"] == first.id,
                "pruning publishes an exercise-deleted event");

  suite.require(library.delete_exercise("alice", second.id), "delete removes an exercise");
  suite.require(!library.delete_exercise("alice", second.id), "second delete finds nothing");
  suite.require(!library.delete_exercise("bob", third.id), "users cannot delete others' exercises");
  const auto after_delete = fixture.events.events_of_type(etude::kEventExerciseDeleted);
  suite.require(after_delete.size() == 2 && after_delete[1].data["reason"] == "deleted",
                "delete publishes one event");
}

void test_expiry(TestSuite& suite) {
  etude::LibraryConfig config;
  config.exercise_expiration_days = 1;
  Fixture fixture(config);
  auto& library = fixture.library;

  const auto old = library.generate_exercise("alice", etude::ExerciseType::Technical,
                                             scale_params());
  fixture.now += 36h;
  const auto fresh = library.generate_exercise("alice", etude::ExerciseType::Technical,
                                               scale_params());

  suite.require(ids_of(library.list_user_exercises("alice")) ==
                    std::vector<std::string>{fresh.id},
                "expired exercises are not listed");
  suite.require(!library.load_exercise(old.id).has_value(), "expired cached exercise is not loaded");
  etude::EventLog cold_events;
  etude::ExerciseLibrary cold(fixture.storage, cold_events, config, [&] { return fixture.now; });
  suite.require(!cold.load_exercise(old.id).has_value(), "expired stored exercise is not loaded");
  suite.require(cold.load_exercise(fresh.id).has_value(), "unexpired exercise still loads");

  suite.require(library.sweep_expired() == 1, "sweep removes the expired exercise");
  suite.require(library.sweep_expired() == 0, "second sweep finds nothing");
  suite.require(!fixture.storage.read(etude::exercise_key("alice", old.id)).has_value(),
                "swept exercise is removed from storage");
  const auto deleted = fixture.events.events_of_type(etude::kEventExerciseDeleted);
  suite.require(deleted.size() == 1 && deleted[0].data["reason"] == "expired",
                "sweep publishes an expired event");
}

void test_shared_storage(TestSuite& suite) {
  // Two libraries seeded alike draw the same candidate ids.
  etude::LibraryConfig config;
  config.id_seed = 42;
  etude::InMemoryStorage storage;
  etude::EventLog events;
  etude::Timestamp now = kStart;
  etude::ExerciseLibrary first(storage, events, config, [&now] { return now; });
  etude::ExerciseLibrary second(storage, events, config, [&now] { return now; });

  const auto a = first.generate_exercise("alice", etude::ExerciseType::Technical, scale_params());
  const auto b = second.generate_exercise("alice", etude::ExerciseType::Technical, scale_params());
  suite.require(a.id != b.id, "a second library does not reuse a stored exercise id");
  suite.require(storage.list_keys(etude::exercise_key("alice", "")).size() == 2,
                "both exercises are stored");

  etude::InMemoryStorage score_storage;
  etude::ExerciseLibrary left(score_storage, events, config, [&now] { return now; });
  etude::ExerciseLibrary right(score_storage, events, config, [&now] { return now; });
  const auto first_id = left.save_score(small_score("First", "Anon", 1, {}));
  const auto second_id = right.save_score(small_score("Second", "Anon", 1, {}));
  suite.require(first_id != second_id, "a second library does not reuse a stored score id");
  suite.require(score_storage.list_keys("score:").size() == 2, "both scores are stored");
  const auto kept = left.get_score(first_id);
  suite.require(kept && kept->title == "First", "the first score is not overwritten");

  etude::ExerciseLibrary unseeded_a(storage, events, {}, [&now] { return now; });
  etude::ExerciseLibrary unseeded_b(score_storage, events, {}, [&now] { return now; });
  suite.require(unseeded_a.save_score(small_score("A", "Anon", 1, {})) !=
                    unseeded_b.save_score(small_score("B", "Anon", 1, {})),
                "unseeded libraries draw different ids");
}

void test_unreadable_records(TestSuite& suite) {
  Fixture fixture;
  fixture.storage.write(etude::exercise_key("alice", "ex-junk"), "not an exercise");
  const auto kept = fixture.library.generate_exercise("alice", etude::ExerciseType::Technical,
                                                      scale_params());
  suite.require(ids_of(fixture.library.list_user_exercises("alice")) ==
                    std::vector<std::string>{kept.id},
                "unreadable records are skipped");
  suite.require(!fixture.library.load_exercise("ex-junk").has_value(),
                "unreadable record loads as absent");
}

//====================================================================
// SCORES
//====================================================================

void test_scores(TestSuite& suite) {
  Fixture fixture;
  auto& library = fixture.library;

  const auto id = library.save_score(small_score("Nocturne", "Chopin", 7, {"romantic"}));
  suite.require(id.rfind("score-", 0) == 0, "score ids are prefixed");
  const auto stored = library.get_score(id);
  suite.require(stored.has_value() && stored->title == "Nocturne", "saved score is readable");
  suite.require(stored && stored->metadata.id == id, "saved score records its id");
  suite.require(stored && stored->metadata.modified_at == kStart, "save stamps modification time");
  suite.require(!library.get_score("score-missing").has_value(), "unknown score is absent");

  const auto saved = fixture.events.events_of_type(etude::kEventScoreSaved);
  suite.require(saved.size() == 1 && saved[0].data["scoreId"] == id &&
                    saved[0].data["partCount"] == 1 && saved[0].data["measureCount"] == 1,
                "score-saved event describes the score");

  bool threw = false;
  try {
    library.save_score(small_score("", "Nobody", 1, {}));
  } catch (const etude::ValidationError& error) {
    threw = true;
    const auto& errors = error.errors();
    suite.require(std::find(errors.begin(), errors.end(), "score: Score must have a title") !=
                      errors.end(),
                  "validation errors name the entity");
  }
  suite.require(threw, "invalid scores are rejected");

  library.save_score(small_score("Invention", "Bach", 4, {"baroque", "counterpoint"}));

  etude::ScoreSearchCriteria everything;
  const auto all = library.search_scores(everything);
  suite.require(all.total_count == 2, "empty criteria match every score");
  suite.require(all.scores.size() == 2 && all.scores[0].title == "Invention" &&
                    all.scores[1].title == "Nocturne",
                "results are ordered by title");
  suite.require(all.composers == std::vector<std::pair<std::string, int>>{{"Bach", 1},
                                                                          {"Chopin", 1}},
                "composer facets count the matches");

  etude::ScoreSearchCriteria query;
  query.query = "CHOP";
  suite.require(library.search_scores(query).total_count == 1, "query is case-insensitive");

  etude::ScoreSearchCriteria tagged;
  tagged.tags = {"baroque", "counterpoint"};
  suite.require(library.search_scores(tagged).total_count == 1, "every tag must be present");

  etude::ScoreSearchCriteria hard;
  hard.min_difficulty = 5;
  const auto hard_results = library.search_scores(hard);
  suite.require(hard_results.total_count == 1 && hard_results.scores[0].composer == "Chopin",
                "difficulty filter applies");

  // Written behind the library's back: cached results hide it until expiry.
  auto hidden = small_score("Etude", "Liszt", 9, {});
  fixture.storage.write(etude::score_key("manual"), etude::bridge::to_json(hidden));
  suite.require(library.search_scores(everything).total_count == 2, "search results are cached");
  fixture.now += 61min;
  suite.require(library.search_scores(everything).total_count == 3, "cached results expire");

  fixture.storage.write(etude::score_key("manual-2"), etude::bridge::to_json(hidden));
  library.clear_search_cache();
  suite.require(library.search_scores(everything).total_count == 4,
                "clearing the cache forces a fresh search");
}

//====================================================================
// MULTI-VOICE EXERCISES
//====================================================================

etude::MultiVoiceParameters multi_voice_params(etude::VoicePreset preset, int voice_count) {
  etude::MultiVoiceParameters params;
  params.base.key_signature = etude::KeySignature::GMajor;
  params.base.difficulty = 4;
  params.base.measures = 3;
  params.base.seed = 9;
  params.preset = preset;
  params.voice_count = voice_count;
  return params;
}

bool voice_within(const etude::Score& score, const std::string& voice_id, const std::string& lowest,
                  const std::string& highest) {
  for (const auto& measure : score.measures) {
    for (const auto& staff : measure.staves) {
      for (const auto& voice : staff.voices) {
        if (voice.id != voice_id) {
          continue;
        }
        for (const auto& note : voice.notes) {
          if (note.rest) {
            continue;
          }
          for (const auto& key : note.keys) {
            const int midi = etude::pitch_key_to_midi(key);
            if (midi < etude::note_to_midi(lowest) || midi > etude::note_to_midi(highest)) {
              return false;
            }
          }
        }
      }
    }
  }
  return true;
}

void test_voice_presets(TestSuite& suite) {
  const auto piano = etude::preset_voices(etude::VoicePreset::Piano, 2);
  suite.require(piano.size() == 2 && piano[0].id == "rightHand" && piano[1].id == "leftHand" &&
                    piano[1].clef == etude::Clef::Bass,
                "piano preset has a right and a left hand");
  const auto trio = etude::preset_voices(etude::VoicePreset::Satb, 3);
  suite.require(trio.size() == 3 && trio[2].id == "tenor", "satb takes the top voices");
  const auto custom = etude::preset_voices(etude::VoicePreset::Custom, 3);
  suite.require(custom.size() == 3 && custom[2].id == "voice3" && custom[2].name == "Voice 3",
                "custom preset numbers its voices");
  suite.require(throws<etude::ValidationError>([] {
                  etude::preset_voices(etude::VoicePreset::Satb, 5);
                }),
                "satb has at most four voices");
  suite.require(throws<etude::ValidationError>([] {
                  etude::preset_voices(etude::VoicePreset::Custom, 0);
                }),
                "a custom preset needs at least one voice");
  suite.require(etude::voice_preset_from_string("duet") == etude::VoicePreset::Duet,
                "presets parse from their names");
  suite.require(throws<etude::FormatError>([] { etude::voice_preset_from_string("trio"); }),
                "unknown presets are rejected");
}

void test_multi_voice_generation(TestSuite& suite) {
  Fixture fixture;
  auto& library = fixture.library;

  const auto piano = library.generate_multi_voice_exercise(
      multi_voice_params(etude::VoicePreset::Piano, 2));
  suite.require(validate_score(piano).valid, "piano exercise is a valid score");
  suite.require(piano.parts.size() == 1 && piano.parts[0].id == "piano" &&
                    piano.parts[0].staves ==
                        std::vector<std::string>{"treble-staff", "bass-staff"},
                "piano exercise is one part on a grand staff");
  suite.require(piano.parts[0].midi_program == 0 && piano.parts[0].volume == 100,
                "piano part carries program and volume");
  suite.require(piano.measures.size() == 3 && piano.measures[0].time_signature &&
                    piano.measures[0].key_signature == etude::KeySignature::GMajor &&
                    !piano.measures[1].time_signature,
                "signatures are set on the first measure only");
  const auto& first = piano.measures[0];
  suite.require(first.staves.size() == 2 && first.staves[0].voices[0].id == "rightHand" &&
                    first.staves[1].voices[0].id == "leftHand" &&
                    first.staves[1].clef == etude::Clef::Bass,
                "each hand sits on its own staff");
  suite.require(first.staves[1].voices[0].notes.front().staff_id == "bass-staff" &&
                    first.staves[1].voices[0].notes.front().voice_id == "leftHand",
                "notes name their voice and staff");
  suite.require(piano.metadata.tags == std::vector<std::string>{"exercise", "multi-voice"} &&
                    piano.metadata.difficulty == 4,
                "generated scores are tagged");

  suite.require(piano.metadata.id.has_value(), "the saved id is returned");
  const auto stored = library.get_score(piano.metadata.id.value_or(""));
  suite.require(stored && stored->title == "Multi-Voice Exercise" && stored->measures.size() == 3,
                "generated score is saved");
  const auto saved = fixture.events.events_of_type(etude::kEventScoreSaved);
  suite.require(saved.size() == 1 && saved[0].data["partCount"] == 1,
                "generation publishes one score-saved event");

  const auto choir = library.generate_multi_voice_exercise(
      multi_voice_params(etude::VoicePreset::Satb, 4));
  suite.require(validate_score(choir).valid, "satb exercise is a valid score");
  suite.require(choir.parts.size() == 4 && choir.parts[3].id == "bass" &&
                    choir.parts[3].staves == std::vector<std::string>{"bass-staff"} &&
                    choir.parts[3].instrument == "voice" && choir.parts[3].midi_program == 52,
                "satb voices get choir parts");
  suite.require(voice_within(choir, "soprano", "C4", "A5") && voice_within(choir, "bass", "E2", "C4"),
                "each voice stays in its range");

  const auto duet = etude::build_multi_voice_score(multi_voice_params(etude::VoicePreset::Duet, 2));
  suite.require(validate_score(duet).valid && duet.parts.size() == 2 &&
                    duet.parts[1].instrument == "instrument",
                "duet voices get their own parts");
  suite.require(etude::bridge::to_json(duet) ==
                    etude::bridge::to_json(etude::build_multi_voice_score(
                        multi_voice_params(etude::VoicePreset::Duet, 2))),
                "generation is repeatable for a seed");

  auto custom = multi_voice_params(etude::VoicePreset::Custom, 2);
  custom.voices = {{"flute", "Flute", {"C5", "C6"}, etude::Clef::Treble},
                   {"cello", "Cello", {"C2", "C4"}, etude::Clef::Bass}};
  const auto pair = etude::build_multi_voice_score(custom);
  suite.require(validate_score(pair).valid && pair.parts[1].id == "cello" &&
                    pair.measures[0].staves[1].clef == etude::Clef::Bass,
                "explicit voices replace the preset");
  custom.voices[1].id = "flute";
  suite.require(throws<etude::ValidationError>([&] { etude::build_multi_voice_score(custom); }),
                "duplicate voice ids are rejected");

  const auto parsed = etude::bridge::multi_voice_parameters_from_json(
      {{"voicePreset", "satb"}, {"voiceCount", 2}, {"measures", 2},
       {"customVoices", nlohmann::json::array()}});
  suite.require(parsed.preset == etude::VoicePreset::Satb && parsed.voice_count == 2 &&
                    parsed.base.measures == 2 && parsed.voices.empty(),
                "multi-voice parameters parse from JSON");
}

//====================================================================
// REPERTOIRE
//====================================================================

void test_repertoire(TestSuite& suite) {
  Fixture fixture;
  auto& library = fixture.library;

  suite.require(library.get_user_repertoire("alice").empty(), "no repertoire yet");

  library.update_repertoire_status("alice", "score-1", etude::RepertoireStatus::Learning);
  auto entries = library.get_user_repertoire("alice");
  suite.require(entries.size() == 1 && entries[0].status == etude::RepertoireStatus::Learning,
                "status update creates an entry for a loaded user");
  suite.require(entries.size() == 1 && entries[0].date_started == kStart,
                "new entries record when they were started");

  fixture.now += 24h;
  library.update_repertoire_status("alice", "score-1", etude::RepertoireStatus::Memorized);
  entries = library.get_user_repertoire("alice");
  suite.require(entries.size() == 1 && entries[0].date_memorized == fixture.now,
                "memorizing records the date");

  const auto changes = fixture.events.events_of_type(etude::kEventRepertoireStatusChanged);
  suite.require(changes.size() == 2, "each status change publishes an event");
  suite.require(changes.size() == 2 && changes[0].data["oldStatus"].is_null() &&
                    changes[1].data["oldStatus"] == "LEARNING" &&
                    changes[1].data["newStatus"] == "MEMORIZED",
                "events carry old and new status");

  etude::PerformanceEntry entry;
  entry.date = fixture.now;
  entry.tempo = 90;
  entry.accuracy = 0.9;
  library.record_practice_session("alice", "score-1", entry);
  entries = library.get_user_repertoire("alice");
  suite.require(entries.size() == 1 && entries[0].performance_history.size() == 1 &&
                    entries[0].date_last_played == entry.date,
                "practice sessions are appended to the history");

  library.record_practice_session("bob", "score-2", entry);
  const auto bob = library.get_user_repertoire("bob");
  suite.require(bob.size() == 1 && bob[0].status == etude::RepertoireStatus::Learning &&
                    bob[0].performance_history.size() == 1 && bob[0].id == "bob-score-2",
                "practice on an unknown piece starts learning it");
  suite.require(fixture.events.events_of_type(etude::kEventPracticeSessionRecorded).size() == 2,
                "practice sessions publish events");

  suite.require(library.get_recommendations("alice").empty(), "no recommendations yet");
  suite.require(etude::repertoire_status_from_string("WISHLIST") ==
                    etude::RepertoireStatus::Wishlist,
                "repertoire status tokens parse");
  suite.require(throws<etude::FormatError>([] { etude::repertoire_status_from_string("KNOWN"); }),
                "unknown repertoire status raises FormatError");
}

void test_unimplemented(TestSuite& suite) {
  Fixture fixture;
  auto& library = fixture.library;
  suite.require(throws<etude::NotImplemented>([&] { library.assess_difficulty("s", "u"); }),
                "difficulty assessment is not implemented");
  suite.require(throws<etude::NotImplemented>([&] { library.import_music_xml("<score/>"); }),
                "MusicXML import is not implemented");
  suite.require(throws<etude::NotImplemented>([&] { library.export_music_xml("s"); }),
                "MusicXML export is not implemented");
}

//====================================================================
// STORAGE AND WIRE FORMAT
//====================================================================

void test_storage(TestSuite& suite) {
  etude::InMemoryStorage storage;
  storage.write("b:2", 2);
  storage.write("a:1", 1);
  storage.write("b:1", 1);
  storage.write("c", 3);
  suite.require(storage.list_keys("b:") == std::vector<std::string>{"b:1", "b:2"},
                "keys are listed by prefix in order");
  suite.require(storage.list_keys("").size() == 4, "empty prefix lists everything");
  suite.require(storage.remove("b:1") && !storage.remove("b:1"), "remove reports presence");
  const auto c = storage.read("c");
  suite.require(!storage.read("b:1").has_value() && c && c->get<int>() == 3,
                "reads see removals and writes");
  suite.require(storage.size() == 3, "size counts entries");

  etude::EventLog log;
  etude::LibraryEvent event;
  event.type = etude::kEventScoreSaved;
  log.publish(event);
  suite.require(log.events().size() == 1 &&
                    log.events_of_type(etude::kEventExerciseDeleted).empty(),
                "event log filters by type");
  log.clear();
  suite.require(log.events().empty(), "event log clears");
}

void test_wire_format(TestSuite& suite) {
  nlohmann::json request = {
      {"keySignature", "D_MAJOR"},
      {"timeSignature", "3/4"},
      {"difficulty", 4},
      {"technicalType", "arpeggio"},
      {"range", {{"lowest", "D4"}, {"highest", "D6"}}},
      {"hanonPattern", {1, 2, 3}},
      {"instrumentParams", {{"instrument", "GUITAR"}, {"position", 5}}},
  };
  const auto params = etude::bridge::exercise_parameters_from_json(request);
  suite.require(params.key_signature == etude::KeySignature::DMajor, "key signature parsed");
  suite.require(params.time_signature == etude::TimeSignature{3, 4}, "time signature parsed");
  suite.require(params.technical_type == etude::TechnicalType::Arpeggio, "technical type parsed");
  suite.require(params.range.lowest == "D4" && params.range.highest == "D6", "range parsed");
  suite.require(params.hanon_pattern == std::vector<int>{1, 2, 3}, "hanon pattern parsed");
  suite.require(params.fingering.instrument == etude::Instrument::Guitar &&
                    params.fingering.position == 5,
                "instrument parameters parsed");
  suite.require(params.measures == 4 && params.tempo == 120, "missing fields keep defaults");

  const auto echoed = etude::bridge::exercise_parameters_from_json(etude::bridge::to_json(params));
  suite.require(echoed.hanon_pattern == params.hanon_pattern &&
                    echoed.technical_type == params.technical_type &&
                    echoed.fingering.position == params.fingering.position,
                "parameters survive serialization");

  bool threw = false;
  try {
    etude::bridge::exercise_parameters_from_json(
        {{"difficulty", "hard"}, {"measures", 0}, {"clef", "soprano"}});
  } catch (const etude::ValidationError& error) {
    threw = true;
    const auto& errors = error.errors();
    suite.require(errors.size() == 3, "every bad field is reported");
    suite.require(std::find(errors.begin(), errors.end(),
                            "Expected integer for field 'difficulty'") != errors.end(),
                  "type errors name the field");
    suite.require(std::find(errors.begin(), errors.end(), "Measures must be between 1 and 100") !=
                      errors.end(),
                  "range errors are included");
  }
  suite.require(threw, "bad parameters raise ValidationError");

  const auto config = etude::bridge::library_config_from_json(
      {{"maxExercisesPerUser", 10}, {"cacheExpirationMinutes", 5}});
  suite.require(config.max_exercises_per_user == 10 && config.cache_expiration_minutes == 5 &&
                    config.exercise_expiration_days == 30,
                "library config keeps defaults for missing keys");
  suite.require(throws<std::invalid_argument>([] {
                  etude::bridge::library_config_from_json({{"exerciseExpirationDays", 0}});
                }),
                "non-positive expiry is rejected");

  const auto score = small_score("Prelude", "Bach", 3, {"baroque"});
  const auto parsed = etude::bridge::score_from_json(etude::bridge::to_json(score));
  suite.require(parsed.title == "Prelude" && parsed.metadata.difficulty == 3 &&
                    parsed.measures.size() == 1 &&
                    parsed.measures[0].staves[0].voices[0].notes[0].keys ==
                        std::vector<std::string>{"c/4"},
                "score survives serialization");
  suite.require(throws<std::invalid_argument>([] {
                  etude::bridge::score_from_json(nlohmann::json{{"composer", "Nobody"}});
                }),
                "a score without a title is rejected");
}

} // namespace

int main() {
  TestSuite suite;

  test_lifecycle(suite);
  test_generate_and_load(suite);
  test_listing_and_limits(suite);
  test_expiry(suite);
  test_shared_storage(suite);
  test_unreadable_records(suite);
  test_scores(suite);
  test_voice_presets(suite);
  test_multi_voice_generation(suite);
  test_repertoire(suite);
  test_unimplemented(suite);
  test_storage(suite);
  test_wire_format(suite);

  return etude::testing::finish(suite, "Etude library");
}
