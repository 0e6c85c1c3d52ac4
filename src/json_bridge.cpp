#include "json_bridge.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "etude/errors.hpp"

namespace etude::bridge {
namespace {

using nlohmann::json;

template <typename Setter>
bool assign_if_present(const json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

const json& require(const json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return obj[key];
}

void require_object(const json& value, std::string_view what) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for " + std::string(what));
  }
}

int json_to_int(const json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    return static_cast<std::int64_t>(std::llround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

double json_to_double(const json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<int> json_to_int_vector(const json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<int> for field '" + std::string(key) + "'");
  }
  std::vector<int> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_int(entry, key));
  }
  return out;
}

std::vector<std::string> json_to_string_vector(const json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_string(entry, key));
  }
  return out;
}

Timestamp json_to_timestamp(const json& value, std::string_view key) {
  return from_epoch_ms(json_to_int64(value, key));
}

// Enum tokens are parsed by the *_from_string functions; the field name is
// added to their message.
template <typename Parse>
auto json_to_enum(const json& value, std::string_view key, Parse&& parse) {
  const std::string token = json_to_string(value, key);
  try {
    return parse(token);
  } catch (const FormatError& error) {
    throw FormatError("Invalid value for field '" + std::string(key) + "': " + error.what());
  }
}

template <typename Item, typename Parse>
std::vector<Item> json_to_list(const json& value, std::string_view key, Parse&& parse) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array for field '" + std::string(key) + "'");
  }
  std::vector<Item> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(parse(entry));
  }
  return out;
}

template <typename T, typename Convert>
void put_optional(json& obj, const char* key, const std::optional<T>& value, Convert&& convert) {
  if (value.has_value()) {
    obj[key] = convert(*value);
  }
}

template <typename T>
void put_optional(json& obj, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    obj[key] = *value;
  }
}

template <typename T, typename Convert>
json list_to_json(const std::vector<T>& items, Convert&& convert) {
  json arr = json::array();
  for (const auto& item : items) {
    arr.push_back(convert(item));
  }
  return arr;
}

json strings_to_json(const std::vector<std::string>& values) {
  json arr = json::array();
  for (const auto& v : values) {
    arr.push_back(v);
  }
  return arr;
}

json ints_to_json_array(const std::vector<int>& values) {
  json arr = json::array();
  for (int v : values) {
    arr.push_back(v);
  }
  return arr;
}

json timestamp_to_json(Timestamp time) {
  return to_epoch_ms(time);
}

// Fields shared by flat and multi-voice notes.
template <typename N>
void note_fields_to_json(const N& note, json& json_note) {
  json_note["keys"] = strings_to_json(note.keys);
  json_note["duration"] = to_string(note.duration);
  json_note["time"] = note.time;
  put_optional(json_note, "accidental", note.accidental);
  if (note.dots > 0) {
    json_note["dots"] = note.dots;
  }
  put_optional(json_note, "stem", note.stem, [](StemDirection s) { return to_string(s); });
  if (note.beam) {
    json_note["beam"] = true;
  }
  put_optional(json_note, "articulation", note.articulation,
               [](Articulation a) { return to_string(a); });
  put_optional(json_note, "dynamic", note.dynamic, [](DynamicMarking d) { return to_string(d); });
  put_optional(json_note, "fingering", note.fingering);
  if (note.rest) {
    json_note["rest"] = true;
  }
  put_optional(json_note, "tie", note.tie, [](TieType t) { return to_string(t); });
}

template <typename N>
void note_fields_from_json(const json& json_note, N& note) {
  require_object(json_note, "note");
  note.keys = json_to_string_vector(require(json_note, "keys"), "keys");
  note.duration = json_to_enum(require(json_note, "duration"), "duration", note_duration_from_string);
  note.time = json_to_double(require(json_note, "time"), "time");
  assign_if_present(json_note, "accidental", [&](const json& value) {
    note.accidental = json_to_string(value, "accidental");
  });
  assign_if_present(json_note, "dots", [&](const json& value) {
    note.dots = json_to_int(value, "dots");
  });
  assign_if_present(json_note, "stem", [&](const json& value) {
    note.stem = json_to_enum(value, "stem", stem_direction_from_string);
  });
  assign_if_present(json_note, "beam", [&](const json& value) {
    note.beam = json_to_bool(value, "beam");
  });
  assign_if_present(json_note, "articulation", [&](const json& value) {
    note.articulation = json_to_enum(value, "articulation", articulation_from_string);
  });
  assign_if_present(json_note, "dynamic", [&](const json& value) {
    note.dynamic = json_to_enum(value, "dynamic", dynamic_marking_from_string);
  });
  assign_if_present(json_note, "fingering", [&](const json& value) {
    note.fingering = value.is_number() ? std::to_string(json_to_int(value, "fingering"))
                                       : json_to_string(value, "fingering");
  });
  assign_if_present(json_note, "rest", [&](const json& value) {
    note.rest = json_to_bool(value, "rest");
  });
  assign_if_present(json_note, "tie", [&](const json& value) {
    note.tie = json_to_enum(value, "tie", tie_type_from_string);
  });
}

// Per-measure overrides shared by both measure shapes.
template <typename M>
void measure_overrides_to_json(const M& measure, json& json_measure) {
  put_optional(json_measure, "timeSignature", measure.time_signature,
               [](const TimeSignature& ts) { return to_string(ts); });
  put_optional(json_measure, "keySignature", measure.key_signature,
               [](KeySignature k) { return to_string(k); });
  put_optional(json_measure, "tempo", measure.tempo);
  put_optional(json_measure, "dynamics", measure.dynamics,
               [](DynamicMarking d) { return to_string(d); });
  put_optional(json_measure, "rehearsalMark", measure.rehearsal_mark);
  put_optional(json_measure, "barLine", measure.bar_line, [](BarLineType b) { return to_string(b); });
  put_optional(json_measure, "repeatCount", measure.repeat_count);
}

template <typename M>
void measure_overrides_from_json(const json& json_measure, M& measure) {
  assign_if_present(json_measure, "timeSignature", [&](const json& value) {
    measure.time_signature = json_to_enum(value, "timeSignature", time_signature_from_string);
  });
  assign_if_present(json_measure, "keySignature", [&](const json& value) {
    measure.key_signature = json_to_enum(value, "keySignature", key_signature_from_string);
  });
  assign_if_present(json_measure, "tempo", [&](const json& value) {
    measure.tempo = json_to_int(value, "tempo");
  });
  assign_if_present(json_measure, "dynamics", [&](const json& value) {
    measure.dynamics = json_to_enum(value, "dynamics", dynamic_marking_from_string);
  });
  assign_if_present(json_measure, "rehearsalMark", [&](const json& value) {
    measure.rehearsal_mark = json_to_string(value, "rehearsalMark");
  });
  assign_if_present(json_measure, "barLine", [&](const json& value) {
    measure.bar_line = json_to_enum(value, "barLine", bar_line_type_from_string);
  });
  assign_if_present(json_measure, "repeatCount", [&](const json& value) {
    measure.repeat_count = json_to_int(value, "repeatCount");
  });
}

json finding_to_json(const Finding& finding) {
  json out = json::object();
  out["entity"] = finding.entity;
  out["message"] = finding.message;
  return out;
}

} // namespace

//====================================================================
// LEGACY FLAT FORMAT
//====================================================================

json to_json(const Note& note) {
  json json_note = json::object();
  note_fields_to_json(note, json_note);
  return json_note;
}

Note note_from_json(const json& json_note) {
  Note note;
  note_fields_from_json(json_note, note);
  return note;
}

json to_json(const Measure& measure) {
  json json_measure = json::object();
  json_measure["number"] = measure.number;
  json_measure["notes"] = list_to_json(measure.notes, [](const Note& n) { return to_json(n); });
  measure_overrides_to_json(measure, json_measure);
  put_optional(json_measure, "clef", measure.clef, [](Clef c) { return to_string(c); });
  return json_measure;
}

Measure measure_from_json(const json& json_measure) {
  require_object(json_measure, "measure");
  Measure measure;
  measure.number = json_to_int(require(json_measure, "number"), "number");
  measure.notes = json_to_list<Note>(require(json_measure, "notes"), "notes", note_from_json);
  measure_overrides_from_json(json_measure, measure);
  assign_if_present(json_measure, "clef", [&](const json& value) {
    measure.clef = json_to_enum(value, "clef", clef_from_string);
  });
  return measure;
}

json to_json(const SheetMusic& sheet) {
  json json_sheet = json::object();
  json_sheet["id"] = sheet.id;
  json_sheet["title"] = sheet.title;
  json_sheet["composer"] = sheet.composer;
  put_optional(json_sheet, "opus", sheet.opus);
  json_sheet["instrument"] = to_string(sheet.instrument);
  json_sheet["difficultyLevel"] = sheet.difficulty_level;
  json_sheet["durationSeconds"] = sheet.duration_seconds;
  json_sheet["timeSignature"] = to_string(sheet.time_signature);
  json_sheet["keySignature"] = to_string(sheet.key_signature);
  json_sheet["suggestedTempo"] = sheet.suggested_tempo;
  json_sheet["tags"] = strings_to_json(sheet.tags);
  json_sheet["measures"] = list_to_json(sheet.measures, [](const Measure& m) { return to_json(m); });
  return json_sheet;
}

SheetMusic sheet_music_from_json(const json& json_sheet) {
  require_object(json_sheet, "sheet music");
  SheetMusic sheet;
  assign_if_present(json_sheet, "id", [&](const json& value) {
    sheet.id = json_to_string(value, "id");
  });
  assign_if_present(json_sheet, "title", [&](const json& value) {
    sheet.title = json_to_string(value, "title");
  });
  assign_if_present(json_sheet, "composer", [&](const json& value) {
    sheet.composer = json_to_string(value, "composer");
  });
  assign_if_present(json_sheet, "opus", [&](const json& value) {
    sheet.opus = json_to_string(value, "opus");
  });
  assign_if_present(json_sheet, "instrument", [&](const json& value) {
    sheet.instrument = json_to_enum(value, "instrument", instrument_from_string);
  });
  assign_if_present(json_sheet, "difficultyLevel", [&](const json& value) {
    sheet.difficulty_level = json_to_int(value, "difficultyLevel");
  });
  assign_if_present(json_sheet, "durationSeconds", [&](const json& value) {
    sheet.duration_seconds = json_to_int(value, "durationSeconds");
  });
  assign_if_present(json_sheet, "timeSignature", [&](const json& value) {
    sheet.time_signature = json_to_enum(value, "timeSignature", time_signature_from_string);
  });
  assign_if_present(json_sheet, "keySignature", [&](const json& value) {
    sheet.key_signature = json_to_enum(value, "keySignature", key_signature_from_string);
  });
  assign_if_present(json_sheet, "suggestedTempo", [&](const json& value) {
    sheet.suggested_tempo = json_to_int(value, "suggestedTempo");
  });
  assign_if_present(json_sheet, "tags", [&](const json& value) {
    sheet.tags = json_to_string_vector(value, "tags");
  });
  sheet.measures = json_to_list<Measure>(require(json_sheet, "measures"), "measures",
                                         measure_from_json);
  return sheet;
}

//====================================================================
// MULTI-VOICE SCORE
//====================================================================

json to_json(const VoiceNote& note) {
  json json_note = json::object();
  note_fields_to_json(note, json_note);
  json_note["voiceId"] = note.voice_id;
  put_optional(json_note, "staffId", note.staff_id);
  if (note.grace) {
    json grace = json::object();
    grace["slash"] = note.grace->slash;
    grace["small"] = note.grace->small;
    json_note["grace"] = grace;
  }
  if (!note.ornaments.empty()) {
    json_note["ornaments"] = list_to_json(note.ornaments, [](const Ornament& ornament) {
      json out = json::object();
      out["type"] = ornament.type;
      put_optional(out, "accidental", ornament.accidental);
      return out;
    });
  }
  return json_note;
}

VoiceNote voice_note_from_json(const json& json_note) {
  VoiceNote note;
  note_fields_from_json(json_note, note);
  assign_if_present(json_note, "voiceId", [&](const json& value) {
    note.voice_id = json_to_string(value, "voiceId");
  });
  assign_if_present(json_note, "staffId", [&](const json& value) {
    note.staff_id = json_to_string(value, "staffId");
  });
  assign_if_present(json_note, "grace", [&](const json& value) {
    GraceNote grace;
    if (value.is_object()) {
      assign_if_present(value, "slash", [&](const json& v) { grace.slash = json_to_bool(v, "grace.slash"); });
      assign_if_present(value, "small", [&](const json& v) { grace.small = json_to_bool(v, "grace.small"); });
      note.grace = grace;
    } else if (json_to_bool(value, "grace")) {
      note.grace = grace;
    }
  });
  assign_if_present(json_note, "ornaments", [&](const json& value) {
    note.ornaments = json_to_list<Ornament>(value, "ornaments", [](const json& entry) {
      require_object(entry, "ornament");
      Ornament ornament;
      ornament.type = json_to_string(require(entry, "type"), "type");
      assign_if_present(entry, "accidental", [&](const json& v) {
        ornament.accidental = json_to_string(v, "accidental");
      });
      return ornament;
    });
  });
  return note;
}

json to_json(const Voice& voice) {
  json json_voice = json::object();
  json_voice["id"] = voice.id;
  put_optional(json_voice, "name", voice.name);
  put_optional(json_voice, "stemDirection", voice.stem_direction,
               [](StemDirection s) { return to_string(s); });
  json_voice["notes"] = list_to_json(voice.notes, [](const VoiceNote& n) { return to_json(n); });
  return json_voice;
}

Voice voice_from_json(const json& json_voice) {
  require_object(json_voice, "voice");
  Voice voice;
  voice.id = json_to_string(require(json_voice, "id"), "id");
  assign_if_present(json_voice, "name", [&](const json& value) {
    voice.name = json_to_string(value, "name");
  });
  assign_if_present(json_voice, "stemDirection", [&](const json& value) {
    voice.stem_direction = json_to_enum(value, "stemDirection", stem_direction_from_string);
  });
  voice.notes = json_to_list<VoiceNote>(require(json_voice, "notes"), "notes", voice_note_from_json);
  return voice;
}

json to_json(const Staff& staff) {
  json json_staff = json::object();
  json_staff["id"] = staff.id;
  json_staff["clef"] = to_string(staff.clef);
  put_optional(json_staff, "name", staff.name);
  json_staff["voices"] = list_to_json(staff.voices, [](const Voice& v) { return to_json(v); });
  return json_staff;
}

Staff staff_from_json(const json& json_staff) {
  require_object(json_staff, "staff");
  Staff staff;
  staff.id = json_to_string(require(json_staff, "id"), "id");
  staff.clef = json_to_enum(require(json_staff, "clef"), "clef", clef_from_string);
  assign_if_present(json_staff, "name", [&](const json& value) {
    staff.name = json_to_string(value, "name");
  });
  staff.voices = json_to_list<Voice>(require(json_staff, "voices"), "voices", voice_from_json);
  return staff;
}

json to_json(const Part& part) {
  json json_part = json::object();
  json_part["id"] = part.id;
  json_part["name"] = part.name;
  json_part["instrument"] = part.instrument;
  json_part["staves"] = strings_to_json(part.staves);
  put_optional(json_part, "midiProgram", part.midi_program);
  put_optional(json_part, "volume", part.volume);
  put_optional(json_part, "pan", part.pan);
  return json_part;
}

Part part_from_json(const json& json_part) {
  require_object(json_part, "part");
  Part part;
  part.id = json_to_string(require(json_part, "id"), "id");
  assign_if_present(json_part, "name", [&](const json& value) {
    part.name = json_to_string(value, "name");
  });
  assign_if_present(json_part, "instrument", [&](const json& value) {
    part.instrument = json_to_string(value, "instrument");
  });
  part.staves = json_to_string_vector(require(json_part, "staves"), "staves");
  assign_if_present(json_part, "midiProgram", [&](const json& value) {
    part.midi_program = json_to_int(value, "midiProgram");
  });
  assign_if_present(json_part, "volume", [&](const json& value) {
    part.volume = json_to_int(value, "volume");
  });
  assign_if_present(json_part, "pan", [&](const json& value) {
    part.pan = json_to_int(value, "pan");
  });
  return part;
}

json to_json(const ScoreMeasure& measure) {
  json json_measure = json::object();
  json_measure["number"] = measure.number;
  json_measure["staves"] = list_to_json(measure.staves, [](const Staff& s) { return to_json(s); });
  measure_overrides_to_json(measure, json_measure);
  if (measure.volta) {
    json volta = json::object();
    volta["number"] = measure.volta->number;
    volta["start"] = measure.volta->start;
    volta["end"] = measure.volta->end;
    json_measure["volta"] = volta;
  }
  return json_measure;
}

ScoreMeasure score_measure_from_json(const json& json_measure) {
  require_object(json_measure, "measure");
  ScoreMeasure measure;
  measure.number = json_to_int(require(json_measure, "number"), "number");
  measure.staves = json_to_list<Staff>(require(json_measure, "staves"), "staves", staff_from_json);
  measure_overrides_from_json(json_measure, measure);
  assign_if_present(json_measure, "volta", [&](const json& value) {
    require_object(value, "volta");
    Volta volta;
    volta.number = json_to_int(require(value, "number"), "volta.number");
    assign_if_present(value, "start", [&](const json& v) { volta.start = json_to_bool(v, "volta.start"); });
    assign_if_present(value, "end", [&](const json& v) { volta.end = json_to_bool(v, "volta.end"); });
    measure.volta = volta;
  });
  return measure;
}

json to_json(const ScoreMetadata& metadata) {
  json json_metadata = json::object();
  put_optional(json_metadata, "id", metadata.id);
  json_metadata["createdAt"] = timestamp_to_json(metadata.created_at);
  json_metadata["modifiedAt"] = timestamp_to_json(metadata.modified_at);
  json_metadata["source"] = metadata.source;
  put_optional(json_metadata, "originalFilename", metadata.original_filename);
  put_optional(json_metadata, "encodingSoftware", metadata.encoding_software);
  json_metadata["tags"] = strings_to_json(metadata.tags);
  put_optional(json_metadata, "performanceNotes", metadata.performance_notes);
  put_optional(json_metadata, "difficulty", metadata.difficulty);
  put_optional(json_metadata, "duration", metadata.duration_seconds);
  if (!metadata.muted_voices.empty()) {
    json_metadata["mutedVoices"] = strings_to_json(metadata.muted_voices);
  }
  put_optional(json_metadata, "soloVoice", metadata.solo_voice);
  return json_metadata;
}

ScoreMetadata score_metadata_from_json(const json& json_metadata) {
  require_object(json_metadata, "metadata");
  ScoreMetadata metadata;
  assign_if_present(json_metadata, "id", [&](const json& value) {
    metadata.id = json_to_string(value, "id");
  });
  assign_if_present(json_metadata, "createdAt", [&](const json& value) {
    metadata.created_at = json_to_timestamp(value, "createdAt");
  });
  assign_if_present(json_metadata, "modifiedAt", [&](const json& value) {
    metadata.modified_at = json_to_timestamp(value, "modifiedAt");
  });
  assign_if_present(json_metadata, "source", [&](const json& value) {
    metadata.source = json_to_string(value, "source");
  });
  assign_if_present(json_metadata, "originalFilename", [&](const json& value) {
    metadata.original_filename = json_to_string(value, "originalFilename");
  });
  assign_if_present(json_metadata, "encodingSoftware", [&](const json& value) {
    metadata.encoding_software = json_to_string(value, "encodingSoftware");
  });
  assign_if_present(json_metadata, "tags", [&](const json& value) {
    metadata.tags = json_to_string_vector(value, "tags");
  });
  assign_if_present(json_metadata, "performanceNotes", [&](const json& value) {
    metadata.performance_notes = json_to_string(value, "performanceNotes");
  });
  assign_if_present(json_metadata, "difficulty", [&](const json& value) {
    metadata.difficulty = json_to_int(value, "difficulty");
  });
  assign_if_present(json_metadata, "duration", [&](const json& value) {
    metadata.duration_seconds = json_to_int(value, "duration");
  });
  assign_if_present(json_metadata, "mutedVoices", [&](const json& value) {
    metadata.muted_voices = json_to_string_vector(value, "mutedVoices");
  });
  assign_if_present(json_metadata, "soloVoice", [&](const json& value) {
    metadata.solo_voice = json_to_string(value, "soloVoice");
  });
  return metadata;
}

json to_json(const Score& score) {
  json json_score = json::object();
  json_score["title"] = score.title;
  json_score["composer"] = score.composer;
  put_optional(json_score, "arranger", score.arranger);
  put_optional(json_score, "copyright", score.copyright);
  json_score["parts"] = list_to_json(score.parts, [](const Part& p) { return to_json(p); });
  json_score["measures"] =
      list_to_json(score.measures, [](const ScoreMeasure& m) { return to_json(m); });
  json_score["metadata"] = to_json(score.metadata);
  return json_score;
}

Score score_from_json(const json& json_score) {
  require_object(json_score, "score");
  Score score;
  score.title = json_to_string(require(json_score, "title"), "title");
  assign_if_present(json_score, "composer", [&](const json& value) {
    score.composer = json_to_string(value, "composer");
  });
  assign_if_present(json_score, "arranger", [&](const json& value) {
    score.arranger = json_to_string(value, "arranger");
  });
  assign_if_present(json_score, "copyright", [&](const json& value) {
    score.copyright = json_to_string(value, "copyright");
  });
  score.parts = json_to_list<Part>(require(json_score, "parts"), "parts", part_from_json);
  score.measures = json_to_list<ScoreMeasure>(require(json_score, "measures"), "measures",
                                              score_measure_from_json);
  assign_if_present(json_score, "metadata", [&](const json& value) {
    score.metadata = score_metadata_from_json(value);
  });
  return score;
}

//====================================================================
// EXERCISES
//====================================================================

json to_json(const ExerciseParameters& params) {
  json json_params = json::object();
  json_params["keySignature"] = to_string(params.key_signature);
  json_params["timeSignature"] = to_string(params.time_signature);
  json_params["clef"] = to_string(params.clef);
  json range = json::object();
  range["lowest"] = params.range.lowest;
  range["highest"] = params.range.highest;
  json_params["range"] = range;
  json_params["difficulty"] = params.difficulty;
  json_params["measures"] = params.measures;
  json_params["tempo"] = params.tempo;
  if (!params.technical_elements.empty()) {
    json_params["technicalElements"] = list_to_json(
        params.technical_elements, [](TechnicalElement e) { return to_string(e); });
  }
  put_optional(json_params, "technicalType", params.technical_type,
               [](TechnicalType t) { return to_string(t); });
  put_optional(json_params, "scaleType", params.scale_type, [](ScaleType t) { return to_string(t); });
  put_optional(json_params, "arpeggioType", params.arpeggio_type,
               [](ChordType t) { return to_string(t); });
  put_optional(json_params, "hanonPattern", params.hanon_pattern, ints_to_json_array);
  put_optional(json_params, "includeDescending", params.include_descending);
  put_optional(json_params, "octaves", params.octaves);

  json_params["includeFingerings"] = params.fingering.enabled;
  json instrument = json::object();
  instrument["instrument"] = to_string(params.fingering.instrument);
  instrument["position"] = params.fingering.position;
  json_params["instrumentParams"] = instrument;

  const auto& sight = params.sight_reading;
  put_optional(json_params, "includeAccidentals", sight.include_accidentals);
  put_optional(json_params, "melodicMotion", sight.melodic_motion,
               [](MelodicMotion m) { return to_string(m); });
  put_optional(json_params, "includeDynamics", sight.include_dynamics);
  put_optional(json_params, "includeArticulations", sight.include_articulations);
  json_params["phraseLength"] = sight.phrase_length;
  json_params["seed"] = static_cast<std::int64_t>(params.seed);
  return json_params;
}

ExerciseParameters exercise_parameters_from_json(const json& json_params) {
  if (!json_params.is_object()) {
    throw ValidationError({"Expected object for exercise parameters"});
  }
  ExerciseParameters params;
  std::vector<std::string> errors;
  auto field = [&](const char* key, auto&& setter) {
    try {
      assign_if_present(json_params, key, setter);
    } catch (const std::invalid_argument& error) {
      errors.push_back(error.what());
    }
  };

  field("keySignature", [&](const json& value) {
    params.key_signature = json_to_enum(value, "keySignature", key_signature_from_string);
  });
  field("timeSignature", [&](const json& value) {
    params.time_signature = json_to_enum(value, "timeSignature", time_signature_from_string);
  });
  field("clef", [&](const json& value) {
    params.clef = json_to_enum(value, "clef", clef_from_string);
  });
  field("range", [&](const json& value) {
    require_object(value, "field 'range'");
    assign_if_present(value, "lowest", [&](const json& v) {
      params.range.lowest = json_to_string(v, "range.lowest");
    });
    assign_if_present(value, "highest", [&](const json& v) {
      params.range.highest = json_to_string(v, "range.highest");
    });
  });
  field("difficulty", [&](const json& value) { params.difficulty = json_to_int(value, "difficulty"); });
  field("measures", [&](const json& value) { params.measures = json_to_int(value, "measures"); });
  field("tempo", [&](const json& value) { params.tempo = json_to_int(value, "tempo"); });
  field("technicalElements", [&](const json& value) {
    params.technical_elements =
        json_to_list<TechnicalElement>(value, "technicalElements", [](const json& entry) {
          return json_to_enum(entry, "technicalElements", technical_element_from_string);
        });
  });
  field("technicalType", [&](const json& value) {
    params.technical_type = json_to_enum(value, "technicalType", technical_type_from_string);
  });
  field("scaleType", [&](const json& value) {
    params.scale_type = json_to_enum(value, "scaleType", scale_type_from_string);
  });
  field("arpeggioType", [&](const json& value) {
    params.arpeggio_type = json_to_enum(value, "arpeggioType", chord_type_from_string);
  });
  field("hanonPattern", [&](const json& value) {
    params.hanon_pattern = json_to_int_vector(value, "hanonPattern");
  });
  field("includeDescending", [&](const json& value) {
    params.include_descending = json_to_bool(value, "includeDescending");
  });
  field("octaves", [&](const json& value) { params.octaves = json_to_int(value, "octaves"); });
  field("includeFingerings", [&](const json& value) {
    params.fingering.enabled = json_to_bool(value, "includeFingerings");
  });
  field("instrumentParams", [&](const json& value) {
    require_object(value, "field 'instrumentParams'");
    assign_if_present(value, "instrument", [&](const json& v) {
      params.fingering.instrument = json_to_enum(v, "instrumentParams.instrument",
                                                 instrument_from_string);
    });
    assign_if_present(value, "position", [&](const json& v) {
      params.fingering.position = json_to_int(v, "instrumentParams.position");
    });
  });
  field("includeAccidentals", [&](const json& value) {
    params.sight_reading.include_accidentals = json_to_bool(value, "includeAccidentals");
  });
  field("melodicMotion", [&](const json& value) {
    params.sight_reading.melodic_motion =
        json_to_enum(value, "melodicMotion", melodic_motion_from_string);
  });
  field("includeDynamics", [&](const json& value) {
    params.sight_reading.include_dynamics = json_to_bool(value, "includeDynamics");
  });
  field("includeArticulations", [&](const json& value) {
    params.sight_reading.include_articulations = json_to_bool(value, "includeArticulations");
  });
  field("phraseLength", [&](const json& value) {
    params.sight_reading.phrase_length = json_to_int(value, "phraseLength");
  });
  field("seed", [&](const json& value) {
    params.seed = static_cast<std::uint64_t>(json_to_int64(value, "seed"));
  });

  // Fields that failed to parse kept their defaults, so these are genuine
  // domain violations only.
  for (auto& message : validate_exercise_parameters(params)) {
    errors.push_back(std::move(message));
  }
  if (!errors.empty()) {
    throw ValidationError(std::move(errors));
  }
  return params;
}

json to_json(const ExerciseMetadata& metadata) {
  json json_metadata = json::object();
  json_metadata["title"] = metadata.title;
  json_metadata["description"] = metadata.description;
  json_metadata["focusAreas"] = strings_to_json(metadata.focus_areas);
  json_metadata["tags"] = strings_to_json(metadata.tags);
  json_metadata["estimatedDuration"] = metadata.estimated_duration_seconds;
  json_metadata["prerequisites"] = strings_to_json(metadata.prerequisites);
  return json_metadata;
}

ExerciseMetadata exercise_metadata_from_json(const json& json_metadata) {
  require_object(json_metadata, "exercise metadata");
  ExerciseMetadata metadata;
  metadata.title = json_to_string(require(json_metadata, "title"), "title");
  assign_if_present(json_metadata, "description", [&](const json& value) {
    metadata.description = json_to_string(value, "description");
  });
  assign_if_present(json_metadata, "focusAreas", [&](const json& value) {
    metadata.focus_areas = json_to_string_vector(value, "focusAreas");
  });
  assign_if_present(json_metadata, "tags", [&](const json& value) {
    metadata.tags = json_to_string_vector(value, "tags");
  });
  assign_if_present(json_metadata, "estimatedDuration", [&](const json& value) {
    metadata.estimated_duration_seconds = json_to_int(value, "estimatedDuration");
  });
  assign_if_present(json_metadata, "prerequisites", [&](const json& value) {
    metadata.prerequisites = json_to_string_vector(value, "prerequisites");
  });
  return metadata;
}

json to_json(const GeneratedExercise& exercise) {
  json json_exercise = json::object();
  json_exercise["id"] = exercise.id;
  json_exercise["userId"] = exercise.user_id;
  json_exercise["type"] = to_string(exercise.type);
  json_exercise["parameters"] = to_json(exercise.parameters);
  json_exercise["measures"] =
      list_to_json(exercise.measures, [](const Measure& m) { return to_json(m); });
  json_exercise["metadata"] = to_json(exercise.metadata);
  json_exercise["createdAt"] = timestamp_to_json(exercise.created_at);
  put_optional(json_exercise, "expiresAt", exercise.expires_at, timestamp_to_json);
  return json_exercise;
}

GeneratedExercise generated_exercise_from_json(const json& json_exercise) {
  require_object(json_exercise, "exercise");
  GeneratedExercise exercise;
  exercise.id = json_to_string(require(json_exercise, "id"), "id");
  exercise.user_id = json_to_string(require(json_exercise, "userId"), "userId");
  exercise.type = json_to_enum(require(json_exercise, "type"), "type", exercise_type_from_string);
  exercise.parameters = exercise_parameters_from_json(require(json_exercise, "parameters"));
  exercise.measures = json_to_list<Measure>(require(json_exercise, "measures"), "measures",
                                            measure_from_json);
  exercise.metadata = exercise_metadata_from_json(require(json_exercise, "metadata"));
  exercise.created_at = json_to_timestamp(require(json_exercise, "createdAt"), "createdAt");
  assign_if_present(json_exercise, "expiresAt", [&](const json& value) {
    exercise.expires_at = json_to_timestamp(value, "expiresAt");
  });
  return exercise;
}

//====================================================================
// LIBRARY RECORDS
//====================================================================

json to_json(const PerformanceEntry& entry) {
  json json_entry = json::object();
  json_entry["date"] = timestamp_to_json(entry.date);
  json_entry["tempo"] = entry.tempo;
  json_entry["accuracy"] = entry.accuracy;
  json_entry["quality"] = entry.quality;
  put_optional(json_entry, "notes", entry.notes);
  return json_entry;
}

PerformanceEntry performance_entry_from_json(const json& json_entry) {
  require_object(json_entry, "performance entry");
  PerformanceEntry entry;
  entry.date = json_to_timestamp(require(json_entry, "date"), "date");
  assign_if_present(json_entry, "tempo", [&](const json& value) {
    entry.tempo = json_to_int(value, "tempo");
  });
  assign_if_present(json_entry, "accuracy", [&](const json& value) {
    entry.accuracy = json_to_double(value, "accuracy");
  });
  assign_if_present(json_entry, "quality", [&](const json& value) {
    entry.quality = json_to_int(value, "quality");
  });
  assign_if_present(json_entry, "notes", [&](const json& value) {
    entry.notes = json_to_string(value, "notes");
  });
  return entry;
}

json to_json(const UserRepertoire& repertoire) {
  json json_repertoire = json::object();
  json_repertoire["id"] = repertoire.id;
  json_repertoire["userId"] = repertoire.user_id;
  json_repertoire["scoreId"] = repertoire.score_id;
  json_repertoire["status"] = to_string(repertoire.status);
  put_optional(json_repertoire, "dateStarted", repertoire.date_started, timestamp_to_json);
  put_optional(json_repertoire, "dateMemorized", repertoire.date_memorized, timestamp_to_json);
  put_optional(json_repertoire, "dateLastPlayed", repertoire.date_last_played, timestamp_to_json);
  json_repertoire["totalPracticeMinutes"] = repertoire.total_practice_minutes;
  put_optional(json_repertoire, "personalNotes", repertoire.personal_notes);
  put_optional(json_repertoire, "difficultyRating", repertoire.difficulty_rating);
  json_repertoire["performanceHistory"] = list_to_json(
      repertoire.performance_history, [](const PerformanceEntry& e) { return to_json(e); });
  return json_repertoire;
}

UserRepertoire user_repertoire_from_json(const json& json_repertoire) {
  require_object(json_repertoire, "repertoire entry");
  UserRepertoire repertoire;
  repertoire.id = json_to_string(require(json_repertoire, "id"), "id");
  repertoire.user_id = json_to_string(require(json_repertoire, "userId"), "userId");
  repertoire.score_id = json_to_string(require(json_repertoire, "scoreId"), "scoreId");
  repertoire.status =
      json_to_enum(require(json_repertoire, "status"), "status", repertoire_status_from_string);
  assign_if_present(json_repertoire, "dateStarted", [&](const json& value) {
    repertoire.date_started = json_to_timestamp(value, "dateStarted");
  });
  assign_if_present(json_repertoire, "dateMemorized", [&](const json& value) {
    repertoire.date_memorized = json_to_timestamp(value, "dateMemorized");
  });
  assign_if_present(json_repertoire, "dateLastPlayed", [&](const json& value) {
    repertoire.date_last_played = json_to_timestamp(value, "dateLastPlayed");
  });
  assign_if_present(json_repertoire, "totalPracticeMinutes", [&](const json& value) {
    repertoire.total_practice_minutes = json_to_int(value, "totalPracticeMinutes");
  });
  assign_if_present(json_repertoire, "personalNotes", [&](const json& value) {
    repertoire.personal_notes = json_to_string(value, "personalNotes");
  });
  assign_if_present(json_repertoire, "difficultyRating", [&](const json& value) {
    repertoire.difficulty_rating = json_to_int(value, "difficultyRating");
  });
  assign_if_present(json_repertoire, "performanceHistory", [&](const json& value) {
    repertoire.performance_history = json_to_list<PerformanceEntry>(
        value, "performanceHistory", performance_entry_from_json);
  });
  return repertoire;
}

MultiVoiceParameters multi_voice_parameters_from_json(const json& json_params) {
  MultiVoiceParameters params;
  params.base = exercise_parameters_from_json(json_params);
  assign_if_present(json_params, "voicePreset", [&](const json& value) {
    params.preset = json_to_enum(value, "voicePreset", voice_preset_from_string);
  });
  assign_if_present(json_params, "voiceCount", [&](const json& value) {
    params.voice_count = json_to_int(value, "voiceCount");
  });
  assign_if_present(json_params, "customVoices", [&](const json& value) {
    params.voices = json_to_list<VoiceSpec>(value, "customVoices", [](const json& entry) {
      require_object(entry, "customVoices entry");
      VoiceSpec voice;
      voice.id = json_to_string(require(entry, "id"), "customVoices.id");
      assign_if_present(entry, "name", [&](const json& v) {
        voice.name = json_to_string(v, "customVoices.name");
      });
      assign_if_present(entry, "range", [&](const json& v) {
        require_object(v, "customVoices.range");
        assign_if_present(v, "lowest", [&](const json& bound) {
          voice.range.lowest = json_to_string(bound, "customVoices.range.lowest");
        });
        assign_if_present(v, "highest", [&](const json& bound) {
          voice.range.highest = json_to_string(bound, "customVoices.range.highest");
        });
      });
      assign_if_present(entry, "clef", [&](const json& v) {
        voice.clef = json_to_enum(v, "customVoices.clef", clef_from_string);
      });
      return voice;
    });
  });
  return params;
}

json to_json(const LibraryConfig& config) {
  json json_config = json::object();
  json_config["maxExercisesPerUser"] = config.max_exercises_per_user;
  json_config["exerciseExpirationDays"] = config.exercise_expiration_days;
  json_config["cacheExpirationMinutes"] = config.cache_expiration_minutes;
  json_config["initialLoadLimit"] = config.initial_load_limit;
  json_config["idSeed"] = static_cast<std::int64_t>(config.id_seed);
  return json_config;
}

LibraryConfig library_config_from_json(const json& json_config) {
  require_object(json_config, "library config");
  LibraryConfig config;
  assign_if_present(json_config, "maxExercisesPerUser", [&](const json& value) {
    config.max_exercises_per_user = json_to_int(value, "maxExercisesPerUser");
  });
  assign_if_present(json_config, "exerciseExpirationDays", [&](const json& value) {
    config.exercise_expiration_days = json_to_int(value, "exerciseExpirationDays");
  });
  assign_if_present(json_config, "cacheExpirationMinutes", [&](const json& value) {
    config.cache_expiration_minutes = json_to_int(value, "cacheExpirationMinutes");
  });
  assign_if_present(json_config, "initialLoadLimit", [&](const json& value) {
    config.initial_load_limit = json_to_int(value, "initialLoadLimit");
  });
  assign_if_present(json_config, "idSeed", [&](const json& value) {
    config.id_seed = static_cast<std::uint64_t>(json_to_int64(value, "idSeed"));
  });
  if (config.max_exercises_per_user < 1) {
    throw std::invalid_argument("maxExercisesPerUser must be at least 1");
  }
  if (config.exercise_expiration_days < 1) {
    throw std::invalid_argument("exerciseExpirationDays must be at least 1");
  }
  return config;
}

json to_json(const ScoreSearchCriteria& criteria) {
  json json_criteria = json::object();
  put_optional(json_criteria, "query", criteria.query);
  put_optional(json_criteria, "composer", criteria.composer);
  put_optional(json_criteria, "minDifficulty", criteria.min_difficulty);
  put_optional(json_criteria, "maxDifficulty", criteria.max_difficulty);
  if (!criteria.tags.empty()) {
    json_criteria["tags"] = strings_to_json(criteria.tags);
  }
  put_optional(json_criteria, "maxDuration", criteria.max_duration_seconds);
  return json_criteria;
}

ScoreSearchCriteria score_search_criteria_from_json(const json& json_criteria) {
  require_object(json_criteria, "search criteria");
  ScoreSearchCriteria criteria;
  assign_if_present(json_criteria, "query", [&](const json& value) {
    criteria.query = json_to_string(value, "query");
  });
  assign_if_present(json_criteria, "composer", [&](const json& value) {
    criteria.composer = json_to_string(value, "composer");
  });
  assign_if_present(json_criteria, "minDifficulty", [&](const json& value) {
    criteria.min_difficulty = json_to_int(value, "minDifficulty");
  });
  assign_if_present(json_criteria, "maxDifficulty", [&](const json& value) {
    criteria.max_difficulty = json_to_int(value, "maxDifficulty");
  });
  assign_if_present(json_criteria, "tags", [&](const json& value) {
    criteria.tags = json_to_string_vector(value, "tags");
  });
  assign_if_present(json_criteria, "maxDuration", [&](const json& value) {
    criteria.max_duration_seconds = json_to_int(value, "maxDuration");
  });
  return criteria;
}

json to_json(const ScoreSearchResults& results) {
  json json_results = json::object();
  json_results["scores"] = list_to_json(results.scores, [](const Score& s) { return to_json(s); });
  json_results["totalCount"] = results.total_count;
  json composers = json::array();
  for (const auto& [name, count] : results.composers) {
    json facet = json::object();
    facet["name"] = name;
    facet["count"] = count;
    composers.push_back(facet);
  }
  json facets = json::object();
  facets["composers"] = composers;
  json_results["facets"] = facets;
  return json_results;
}

json to_json(const LibraryHealth& health) {
  json json_health = json::object();
  json_health["status"] = health.healthy ? "green" : "red";
  json_health["message"] = health.message;
  json_health["lastCheck"] = timestamp_to_json(health.last_check);
  return json_health;
}

json to_json(const LibraryEvent& event) {
  json json_event = json::object();
  json_event["source"] = event.source;
  json_event["type"] = event.type;
  json_event["data"] = event.data;
  json_event["timestamp"] = timestamp_to_json(event.timestamp);
  return json_event;
}

json to_json(const ValidationResult& result) {
  json json_result = json::object();
  json_result["valid"] = result.valid;
  json_result["errors"] = list_to_json(result.errors, finding_to_json);
  json_result["warnings"] = list_to_json(result.warnings, finding_to_json);
  return json_result;
}

json to_json(const VoiceComplexityAnalysis& analysis) {
  json json_analysis = json::object();
  json_analysis["voiceId"] = analysis.voice_id;
  json_analysis["noteCount"] = analysis.note_count;
  json_analysis["averageInterval"] = analysis.average_interval;
  json_analysis["rhythmicComplexity"] = analysis.rhythmic_complexity;
  json_analysis["rangeSpan"] = analysis.range_span;
  json_analysis["difficulty"] = analysis.difficulty;
  json_analysis["technicalElements"] = strings_to_json(analysis.technical_elements);
  return json_analysis;
}

} // namespace etude::bridge
