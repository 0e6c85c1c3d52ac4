#include "etude/analysis.hpp"
#include "etude/converters.hpp"
#include "etude/errors.hpp"
#include "etude/score_ops.hpp"
#include "etude/validation.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using etude::testing::TestSuite;
using etude::testing::throws;

const etude::Timestamp kNow = etude::from_epoch_ms(1700000000000);

etude::VoiceNote voice_note(std::vector<std::string> keys, etude::NoteDuration duration, double time,
                            const std::string& voice_id) {
  etude::VoiceNote note;
  note.keys = std::move(keys);
  note.duration = duration;
  note.time = time;
  note.voice_id = voice_id;
  return note;
}

etude::Voice voice(const std::string& id, std::vector<etude::VoiceNote> notes) {
  etude::Voice out;
  out.id = id;
  out.notes = std::move(notes);
  return out;
}

etude::Staff staff(const std::string& id, etude::Clef clef, std::vector<etude::Voice> voices) {
  etude::Staff out;
  out.id = id;
  out.clef = clef;
  out.voices = std::move(voices);
  return out;
}

// Two-measure piano duet: soprano and alto on the treble staff, bass below.
etude::Score sample_score() {
  using etude::NoteDuration;
  etude::Score score;
  score.title = "Duet";
  score.composer = "Anon";

  etude::Part part;
  part.id = "piano";
  part.name = "Piano";
  part.instrument = "piano";
  part.staves = {"treble", "bass"};
  score.parts.push_back(part);

  etude::ScoreMeasure first;
  first.number = 1;
  first.time_signature = etude::TimeSignature{4, 4};
  first.key_signature = etude::KeySignature::CMajor;
  first.staves = {
      staff("treble", etude::Clef::Treble,
            {voice("soprano", {voice_note({"c/5"}, NoteDuration::Half, 0.0, "soprano"),
                               voice_note({"e/5"}, NoteDuration::Half, 2.0, "soprano")}),
             voice("alto", {voice_note({"g/4"}, NoteDuration::Whole, 0.0, "alto")})}),
      staff("bass", etude::Clef::Bass,
            {voice("bass", {voice_note({"c/3"}, NoteDuration::Whole, 0.0, "bass")})}),
  };
  score.measures.push_back(first);

  etude::ScoreMeasure second;
  second.number = 2;
  second.staves = {
      staff("treble", etude::Clef::Treble,
            {voice("soprano", {voice_note({"d/5"}, NoteDuration::Whole, 0.0, "soprano")}),
             voice("alto", {voice_note({"f/4"}, NoteDuration::Whole, 0.0, "alto")})}),
      staff("bass", etude::Clef::Bass,
            {voice("bass", {voice_note({"g/2"}, NoteDuration::Whole, 0.0, "bass")})}),
  };
  score.measures.push_back(second);
  return score;
}

bool has_error(const etude::ValidationResult& result, const std::string& fragment) {
  return std::any_of(result.errors.begin(), result.errors.end(), [&](const etude::Finding& f) {
    return f.message.find(fragment) != std::string::npos;
  });
}

bool has_tag(const etude::Score& score, const std::string& tag) {
  const auto& tags = score.metadata.tags;
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::vector<std::string> keys_of(const etude::Voice& v) {
  std::vector<std::string> keys;
  for (const auto& note : v.notes) {
    keys.push_back(note.keys.front());
  }
  return keys;
}

//====================================================================
// VALIDATION
//====================================================================

void test_validation(TestSuite& suite) {
  const auto clean = etude::validate_score(sample_score());
  suite.require(clean.valid, "sample score should validate");
  suite.require(clean.errors.empty() && clean.warnings.empty(), "sample score has no findings");

  auto untitled = sample_score();
  untitled.title.clear();
  untitled.composer.clear();
  const auto missing = etude::validate_score(untitled);
  suite.require(!missing.valid, "missing title should invalidate the score");
  suite.require(has_error(missing, "Score must have a title") &&
                    has_error(missing, "Score must have a composer"),
                "title and composer errors are both reported");

  auto short_voice = sample_score();
  short_voice.measures[0].staves[0].voices[0].notes.pop_back();
  const auto timing = etude::validate_score(short_voice);
  suite.require(has_error(timing, "Voice soprano: expected 4 beats, got 2 beats"),
                "underfull voice is reported with expected and actual beats");

  auto with_grace = sample_score();
  auto grace = voice_note({"b/4"}, etude::NoteDuration::Eighth, 0.0, "soprano");
  grace.grace = etude::GraceNote{};
  auto& soprano = with_grace.measures[0].staves[0].voices[0].notes;
  soprano.insert(soprano.begin(), grace);
  suite.require(etude::validate_score(with_grace).valid, "grace notes take no time");
  suite.require(etude::calculate_voice_duration(with_grace.measures[0].staves[0].voices[0],
                                                {4, 4})
                        .actual == 4.0,
                "grace note excluded from voice duration");

  auto bad_key = sample_score();
  bad_key.measures[1].staves[1].voices[0].notes[0].keys = {"h/4"};
  suite.require(has_error(etude::validate_score(bad_key), "Invalid key format: h/4"),
                "malformed pitch key is reported");

  auto duplicate = sample_score();
  duplicate.measures[0].staves[0].voices[1].id = "soprano";
  for (auto& note : duplicate.measures[0].staves[0].voices[1].notes) {
    note.voice_id = "soprano";
  }
  suite.require(has_error(etude::validate_score(duplicate), "Staff contains duplicate voice IDs"),
                "duplicate voice ids are reported");

  auto dangling = sample_score();
  dangling.parts[0].staves.push_back("pedal");
  suite.require(has_error(etude::validate_score(dangling),
                          "Part piano references non-existent staff pedal in measure 1"),
                "parts must reference staves present in every measure");

  auto loud = sample_score();
  loud.parts[0].midi_program = 200;
  loud.parts[0].pan = -65;
  const auto part_result = etude::validate_part(loud.parts[0]);
  suite.require(part_result.errors.size() == 2, "MIDI program and pan are range checked");

  auto fast = sample_score();
  fast.measures[0].tempo = 400;
  const auto tempo_result = etude::validate_score(fast);
  suite.require(tempo_result.valid && tempo_result.warnings.size() == 1,
                "out-of-range tempo is a warning only");

  etude::ScoreMeasure odd;
  odd.number = 1;
  odd.time_signature = etude::TimeSignature{11, 8};
  const auto odd_result = etude::validate_measure(odd);
  suite.require(odd_result.valid && odd_result.warnings.size() == 1,
                "non-standard meter is a warning");

  auto waltz = sample_score();
  waltz.measures[0].time_signature = etude::TimeSignature{3, 4};
  for (auto& measure : waltz.measures) {
    for (auto& s : measure.staves) {
      for (auto& v : s.voices) {
        v.notes = {voice_note({s.id == "bass" ? "c/3" : "c/5"}, etude::NoteDuration::Half, 0.0,
                              v.id)};
        v.notes[0].dots = 1;
      }
    }
  }
  suite.require(etude::validate_score(waltz).valid,
                "time signature carries forward to later measures");

  const auto strict = etude::validate_measure_timing(short_voice.measures[0], {4, 4});
  suite.require(!strict.valid && strict.errors.size() == 1, "measure timing flags the short voice");

  etude::VoiceNote orphan = voice_note({"c/4"}, etude::NoteDuration::Quarter, -1.0, "");
  const auto note_result = etude::validate_note(orphan);
  suite.require(note_result.errors.size() == 2, "negative time and missing voice id are errors");

  auto reordered = sample_score();
  std::swap(reordered.measures[0].number, reordered.measures[1].number);
  suite.require(etude::validate_score(reordered).warnings.size() == 1,
                "out of order measures are a warning");
}

//====================================================================
// CONVERSION
//====================================================================

etude::Note flat_note(const std::string& key, etude::NoteDuration duration, double time) {
  etude::Note note;
  note.keys = {key};
  note.duration = duration;
  note.time = time;
  return note;
}

etude::SheetMusic minuet() {
  using etude::NoteDuration;
  etude::SheetMusic sheet;
  sheet.id = "s1";
  sheet.title = "Minuet";
  sheet.composer = "Petzold";
  sheet.time_signature = {3, 4};
  sheet.key_signature = etude::KeySignature::GMajor;
  sheet.tags = {"baroque"};

  etude::Measure first;
  first.number = 1;
  first.clef = etude::Clef::Treble;
  first.notes = {flat_note("d/5", NoteDuration::Quarter, 0.0),
                 flat_note("g/4", NoteDuration::Quarter, 1.0),
                 flat_note("a/4", NoteDuration::Quarter, 2.0)};
  etude::Measure second;
  second.number = 2;
  second.notes = {flat_note("b/4", NoteDuration::Half, 0.0),
                  etude::make_rest(NoteDuration::Quarter, 2.0)};
  sheet.measures = {first, second};
  return sheet;
}

void test_flat_to_multi_voice(TestSuite& suite) {
  const auto converted = etude::flat_to_multi_voice_with_report(minuet(), kNow);
  const auto& score = converted.value;
  suite.require(converted.warnings.empty(), "clean sheet converts without warnings");
  suite.require(score.parts.size() == 1 && score.parts[0].id == "main",
                "single part named main");
  suite.require(score.parts[0].instrument == "piano", "instrument is lower cased");
  suite.require(score.parts[0].staves == std::vector<std::string>{"main"}, "single main staff");
  suite.require(score.measures.size() == 2, "measure count is kept");

  const auto& main_voice = score.measures[0].staves[0].voices[0];
  suite.require(main_voice.id == "main" && main_voice.notes.size() == 3, "one main voice");
  suite.require(main_voice.notes[1].voice_id == "main" &&
                    main_voice.notes[1].staff_id == std::string("main"),
                "notes are tagged with voice and staff");
  suite.require(score.measures[1].time_signature == etude::TimeSignature{3, 4},
                "sheet time signature fills measures without their own");
  suite.require(score.measures[1].key_signature == etude::KeySignature::GMajor,
                "sheet key signature fills measures without their own");
  suite.require(score.metadata.source == "Legacy format conversion", "conversion source recorded");
  suite.require(score.metadata.created_at == kNow, "creation time comes from the caller");
  suite.require(score.metadata.id == std::string("s1"), "sheet id is kept");
  suite.require(etude::validate_score(score).valid, "converted score validates");

  auto broken = minuet();
  broken.measures[0].notes.push_back(flat_note("zz", etude::NoteDuration::Quarter, 2.0));
  const auto partial = etude::flat_to_multi_voice_with_report(broken, kNow);
  suite.require(partial.warnings.size() == 1, "malformed note produces one warning");
  suite.require(partial.value.measures[0].staves[0].voices[0].notes.size() == 3,
                "malformed note is skipped");

  etude::SheetMusic piano;
  piano.title = "Chorale";
  piano.composer = "Anon";
  etude::Measure grand;
  grand.number = 1;
  grand.clef = etude::Clef::GrandStaff;
  grand.notes = {flat_note("c/5", etude::NoteDuration::Whole, 0.0),
                 flat_note("c/3", etude::NoteDuration::Whole, 0.0)};
  piano.measures = {grand};
  const auto split = etude::flat_to_multi_voice(piano, kNow);
  suite.require(split.parts[0].staves == std::vector<std::string>{"treble", "bass"},
                "grand staff becomes treble and bass");
  const auto& staves = split.measures[0].staves;
  suite.require(staves.size() == 2 && staves[0].clef == etude::Clef::Treble &&
                    staves[1].clef == etude::Clef::Bass,
                "grand staff measure has both staves");
  suite.require(staves[0].voices.size() == 1 && staves[0].voices[0].id == "rightHand" &&
                    keys_of(staves[0].voices[0]) == std::vector<std::string>{"c/5"},
                "high notes go to the right hand");
  suite.require(staves[1].voices.size() == 1 && staves[1].voices[0].id == "leftHand" &&
                    keys_of(staves[1].voices[0]) == std::vector<std::string>{"c/3"},
                "low notes go to the left hand");
}

void test_multi_voice_to_flat(TestSuite& suite) {
  const auto converted = etude::multi_voice_to_flat_with_report(sample_score());
  const auto& sheet = converted.value;
  suite.require(sheet.id == "converted-duet", "id derived from the title");
  suite.require(sheet.instrument == etude::Instrument::Piano, "piano part gives a piano sheet");
  suite.require(sheet.measures.size() == 2, "measure count is kept");

  const auto& first = sheet.measures[0];
  suite.require(first.notes.size() == 2, "simultaneous notes merge into one chord");
  suite.require(first.notes[0].keys == std::vector<std::string>{"c/5", "g/4", "c/3"},
                "chord unions the pitches in voice order");
  suite.require(first.notes[0].duration == etude::NoteDuration::Half,
                "chord keeps the first note's duration");
  suite.require(!converted.warnings.empty(), "duration mismatch is reported");
  suite.require(first.clef == etude::Clef::GrandStaff, "treble over bass is a grand staff");
  suite.require(sheet.measures[1].time_signature == etude::TimeSignature{4, 4},
                "time signature carries forward");
  suite.require(sheet.measures[1].notes.size() == 1 && sheet.measures[1].notes[0].keys.size() == 3,
                "second measure is one three-note chord");

  auto with_grace = sample_score();
  auto grace = voice_note({"b/4"}, etude::NoteDuration::Eighth, 0.0, "soprano");
  grace.grace = etude::GraceNote{};
  with_grace.measures[1].staves[0].voices[0].notes.insert(
      with_grace.measures[1].staves[0].voices[0].notes.begin(), grace);
  const auto dropped = etude::multi_voice_to_flat_with_report(with_grace);
  suite.require(dropped.value.measures[1].notes[0].keys.size() == 3,
                "grace notes are left out of the flat measure");
  suite.require(dropped.warnings.size() == converted.warnings.size() + 1,
                "dropped grace note is reported");

  etude::Score empty;
  empty.title = "Empty";
  const auto placeholder = etude::multi_voice_to_flat_with_report(empty);
  suite.require(placeholder.value.measures.size() == 1, "empty score gets one placeholder measure");
  suite.require(placeholder.value.measures[0].notes[0].rest, "placeholder is a whole rest");
  suite.require(placeholder.warnings.size() == 1, "placeholder substitution is reported");

  auto silent = sample_score();
  silent.measures[1].staves.clear();
  const auto rested = etude::multi_voice_to_flat(silent);
  suite.require(rested.measures[1].notes.size() == 1 && rested.measures[1].notes[0].rest &&
                    rested.measures[1].notes[0].duration == etude::NoteDuration::Whole,
                "empty measure becomes a whole rest");

  const auto back = etude::multi_voice_to_flat(etude::flat_to_multi_voice(minuet(), kNow));
  suite.require(back.id == "s1" && back.title == "Minuet", "round trip keeps identity");
  suite.require(back.key_signature == etude::KeySignature::GMajor &&
                    back.time_signature == etude::TimeSignature{3, 4},
                "round trip keeps signatures");
  suite.require(back.measures[0].notes.size() == 3 &&
                    back.measures[0].notes[2].keys == std::vector<std::string>{"a/4"},
                "round trip keeps single-voice notes");
}

// Sorted non-rest pitches of a flat measure.
std::vector<std::string> sounding_pitches(const etude::Measure& measure) {
  std::vector<std::string> pitches;
  for (const auto& note : measure.notes) {
    if (!note.rest) {
      pitches.insert(pitches.end(), note.keys.begin(), note.keys.end());
    }
  }
  std::sort(pitches.begin(), pitches.end());
  return pitches;
}

void test_grand_staff_round_trip(TestSuite& suite) {
  using etude::NoteDuration;
  etude::SheetMusic sheet;
  sheet.id = "invention";
  sheet.title = "Invention";
  sheet.composer = "Anon";

  etude::Measure first;
  first.number = 1;
  first.clef = etude::Clef::GrandStaff;
  auto opening = flat_note("c/5", NoteDuration::Half, 0.0);
  opening.keys.push_back("e/3");
  first.notes = {opening, flat_note("d/5", NoteDuration::Quarter, 2.0),
                 flat_note("b/2", NoteDuration::Quarter, 3.0)};

  etude::Measure second;
  second.number = 2;
  auto cadence = flat_note("g/4", NoteDuration::Half, 2.0);
  cadence.keys.push_back("g/2");
  second.notes = {etude::make_rest(NoteDuration::Half, 0.0), cadence};

  etude::Measure third;
  third.number = 3;
  third.notes = {flat_note("a/3", NoteDuration::Half, 0.0), flat_note("f/4", NoteDuration::Half, 2.0)};
  sheet.measures = {first, second, third};

  const auto score = etude::flat_to_multi_voice(sheet, kNow);
  suite.require(score.parts[0].staves == std::vector<std::string>{"treble", "bass"},
                "grand staff sheet splits into two staves");

  const auto back = etude::multi_voice_to_flat_with_report(score);
  suite.require(back.value.measures.size() == sheet.measures.size(),
                "round trip keeps the measure count");
  for (std::size_t i = 0; i < sheet.measures.size() && i < back.value.measures.size(); ++i) {
    const auto& before = sheet.measures[i];
    const auto& after = back.value.measures[i];
    const std::string label = "measure " + std::to_string(before.number);
    suite.require(sounding_pitches(after) == sounding_pitches(before),
                  label + " keeps its pitches through the grand staff");
    suite.require(after.notes.size() >= before.notes.size(),
                  label + " has no fewer notes after the round trip");
    suite.require(etude::measure_duration(after.notes) == 4.0, label + " still holds 4 beats");
  }
  suite.require(back.value.measures[0].clef == etude::Clef::GrandStaff,
                "treble over bass rejoins as a grand staff");
  suite.require(back.warnings.empty(), "clean grand staff round trip has no warnings");
}

//====================================================================
// SCORE OPERATIONS
//====================================================================

void test_extract(TestSuite& suite) {
  const auto soprano = etude::extract_voice(sample_score(), "soprano", kNow);
  suite.require(soprano.title == "Duet - soprano", "extracted title names the voice");
  suite.require(soprano.measures[0].staves.size() == 1 &&
                    soprano.measures[0].staves[0].voices.size() == 1,
                "only the soprano voice remains");
  suite.require(soprano.parts.size() == 1 &&
                    soprano.parts[0].staves == std::vector<std::string>{"treble"},
                "part keeps only the staff that still has music");
  suite.require(has_tag(soprano, "extracted-voice"), "extraction is tagged");
  suite.require(soprano.metadata.modified_at == kNow, "extraction updates modification time");
  suite.require(etude::validate_score(soprano).valid, "extracted voice still validates");

  const auto nothing = etude::extract_voice(sample_score(), "tenor", kNow);
  suite.require(nothing.parts.empty(), "extracting an unknown voice leaves no parts");

  const auto bass = etude::extract_staff(sample_score(), "bass", kNow);
  suite.require(bass.title == "Duet - Staff bass", "extracted staff title");
  suite.require(bass.measures[1].staves.size() == 1 && bass.measures[1].staves[0].id == "bass",
                "only the bass staff remains");
  suite.require(bass.parts[0].staves == std::vector<std::string>{"bass"},
                "part references only the extracted staff");
}

// One part whose staves each hold a single whole note.
etude::Score staves_score(const std::string& title, const std::vector<std::string>& staff_ids) {
  etude::Score score;
  score.title = title;
  score.composer = "Anon";
  etude::Part part;
  part.id = "piano";
  part.name = "Piano";
  part.instrument = "piano";
  part.staves = staff_ids;
  score.parts = {part};

  etude::ScoreMeasure measure;
  measure.number = 1;
  measure.time_signature = etude::TimeSignature{4, 4};
  for (const auto& id : staff_ids) {
    etude::Staff staff;
    staff.id = id;
    staff.voices = {etude::Voice{id + "-voice", std::nullopt, std::nullopt,
                                 {voice_note({"c/4"}, etude::NoteDuration::Whole, 0.0,
                                             id + "-voice")}}};
    measure.staves.push_back(staff);
  }
  score.measures = {measure};
  return score;
}

void test_merge(TestSuite& suite) {
  suite.require(throws<std::invalid_argument>([] { etude::merge_scores({}); }),
                "merging nothing raises invalid_argument");

  const auto single = etude::merge_scores({sample_score()});
  suite.require(single.title == "Duet", "merging one score returns it unchanged");

  auto shorter = sample_score();
  shorter.title = "Echo";
  shorter.measures.pop_back();
  const auto merged = etude::merge_scores({sample_score(), shorter}, std::nullopt, kNow);
  suite.require(merged.title == "Duet + Echo", "merged title joins the inputs");
  suite.require(merged.parts.size() == 2 && merged.parts[0].id == "part0" &&
                    merged.parts[1].id == "part1",
                "parts are renumbered");
  suite.require(merged.parts[1].staves == std::vector<std::string>{"treble-1", "bass-1"},
                "colliding staff ids are suffixed with the score index");
  suite.require(merged.measures.size() == 2, "merged score is as long as the longest input");
  suite.require(merged.measures[0].staves.size() == 4, "first measure unions every staff");
  suite.require(merged.measures[1].staves.size() == 2, "shorter score contributes nothing later");
  suite.require(merged.measures[0].time_signature == etude::TimeSignature{4, 4},
                "first declared time signature wins");
  suite.require(has_tag(merged, "merged") && has_tag(merged, "ensemble"), "merge tags");
  suite.require(merged.metadata.source == "Merged scores", "merge source recorded");

  const auto crowded = etude::merge_scores(
      {staves_score("First", {"a", "a-1"}), staves_score("Second", {"a"})}, std::nullopt, kNow);
  std::vector<std::string> crowded_ids;
  for (const auto& staff : crowded.measures[0].staves) {
    crowded_ids.push_back(staff.id);
  }
  suite.require(crowded_ids == std::vector<std::string>{"a", "a-1", "a-2"},
                "a renamed staff skips ids that are already taken");
  suite.require(crowded.parts[1].staves == std::vector<std::string>{"a-2"},
                "the part follows its renamed staff");
  suite.require(etude::validate_score(crowded).valid, "merged staves stay unambiguous");

  const auto titled = etude::merge_scores({sample_score(), shorter}, std::string("Suite"), kNow);
  suite.require(titled.title == "Suite", "explicit title is used");

  const auto voices = etude::merge_voices(sample_score(), {"soprano", "alto"}, kNow);
  const auto& treble = voices.measures[0].staves[0];
  suite.require(treble.voices.size() == 1 && treble.voices[0].id == "soprano-alto",
                "merged voice replaces its sources");
  suite.require(treble.voices[0].name == std::string("Merged (soprano, alto)"),
                "merged voice name lists the sources");
  suite.require(keys_of(treble.voices[0]) == std::vector<std::string>{"c/5", "g/4", "e/5"},
                "merged notes are ordered by time");
  suite.require(std::all_of(treble.voices[0].notes.begin(), treble.voices[0].notes.end(),
                            [](const etude::VoiceNote& n) { return n.voice_id == "soprano-alto"; }),
                "merged notes carry the new voice id");
  suite.require(voices.measures[0].staves[1].voices[0].id == "bass",
                "staves without the listed voices are untouched");
}

void test_playback_and_transpose(TestSuite& suite) {
  const auto muted = etude::mute_voice(etude::mute_voice(sample_score(), "alto"), "alto");
  suite.require(muted.metadata.muted_voices == std::vector<std::string>{"alto"},
                "muting twice records the voice once");

  const auto solo = etude::solo_voice(sample_score(), "soprano");
  suite.require(solo.metadata.solo_voice == std::string("soprano"), "solo voice recorded");
  suite.require(solo.metadata.muted_voices == std::vector<std::string>{"alto", "bass"},
                "every other voice is muted");

  const auto up = etude::transpose_voice(sample_score(), "bass", 12, kNow);
  suite.require(keys_of(up.measures[0].staves[1].voices[0]) == std::vector<std::string>{"c/4"},
                "bass moves up an octave");
  suite.require(keys_of(up.measures[0].staves[0].voices[0]) ==
                    std::vector<std::string>{"c/5", "e/5"},
                "other voices are untouched");
  suite.require(has_tag(up, "transposed-bass"), "transposition is tagged");

  suite.require(throws<etude::FormatError>(
                    [] { etude::transpose_voice(sample_score(), "bass", -40); }),
                "transposing below the named range raises FormatError");
}

void test_analysis(TestSuite& suite) {
  const auto soprano = etude::analyze_voice_complexity(sample_score(), "soprano");
  suite.require(soprano.note_count == 3, "soprano has three notes");
  suite.require(soprano.range_span == 4, "soprano spans a major third");
  suite.require(soprano.average_interval == 3.0, "average of a third and a step");
  suite.require(soprano.rhythmic_complexity == 0.25, "two note values");
  suite.require(soprano.technical_elements.empty(), "no technical elements");
  suite.require(soprano.difficulty == 2, "gentle melody rates 2");

  auto leaping = sample_score();
  leaping.measures[1].staves[1].voices[0].notes[0].keys = {"g/4"};
  const auto bass = etude::analyze_voice_complexity(leaping, "bass");
  suite.require(bass.technical_elements ==
                    std::vector<std::string>{"large intervals", "octaves"},
                "a leap beyond the octave is flagged");

  const auto missing = etude::analyze_voice_complexity(sample_score(), "tenor");
  suite.require(missing.note_count == 0 && missing.difficulty == 0, "unknown voice scores zero");

  suite.require(etude::identify_voice_leading(sample_score()).empty(), "no voice leading yet");
  suite.require(etude::detect_polyphonic_patterns(sample_score()).empty(), "no patterns yet");
}

} // namespace

int main() {
  TestSuite suite;

  test_validation(suite);
  test_flat_to_multi_voice(suite);
  test_multi_voice_to_flat(suite);
  test_grand_staff_round_trip(suite);
  test_extract(suite);
  test_merge(suite);
  test_playback_and_transpose(suite);
  test_analysis(suite);

  return etude::testing::finish(suite, "Etude score");
}
