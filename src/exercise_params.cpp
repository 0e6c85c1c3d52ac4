#include "etude/exercise.hpp"

#include "etude/errors.hpp"
#include "etude/pitch.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace etude {
namespace {

constexpr std::array<TechnicalElement, 9> kAllElements{
    TechnicalElement::Scales, TechnicalElement::Arpeggios, TechnicalElement::Thirds,
    TechnicalElement::Sixths, TechnicalElement::Octaves,   TechnicalElement::Chords,
    TechnicalElement::Trills, TechnicalElement::Tremolo,   TechnicalElement::AlbertiBass};

constexpr int kKeySignatureCount = 30;

std::string title_case(std::string text) {
  bool start = true;
  for (char& c : text) {
    if (c == '_') {
      c = ' ';
      start = true;
      continue;
    }
    if (start) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    start = c == ' ';
  }
  return text;
}

std::string chord_display_name(ChordType type) {
  switch (type) {
    case ChordType::Major: return "Major";
    case ChordType::Minor: return "Minor";
    case ChordType::Diminished: return "Diminished";
    case ChordType::Augmented: return "Augmented";
    case ChordType::Dominant7: return "Dominant Seventh";
    case ChordType::Major7: return "Major Seventh";
    case ChordType::Minor7: return "Minor Seventh";
  }
  return "Major";
}

std::string slug(std::string text) {
  for (char& c : text) {
    if (c == '_' || c == ' ') {
      c = '-';
    } else {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  return text;
}

void push_unique(std::vector<std::string>& out, const std::string& value) {
  if (std::find(out.begin(), out.end(), value) == out.end()) {
    out.push_back(value);
  }
}

std::string exercise_kind_label(ExerciseType type, const ExerciseParameters& params) {
  if (type != ExerciseType::Technical) {
    return slug(to_string(type));
  }
  return to_string(params.technical_type.value_or(TechnicalType::Scale));
}

} // namespace

std::string to_string(TechnicalType type) {
  switch (type) {
    case TechnicalType::Scale: return "scale";
    case TechnicalType::Arpeggio: return "arpeggio";
    case TechnicalType::Hanon: return "hanon";
    case TechnicalType::Mixed: return "mixed";
  }
  return "scale";
}

TechnicalType technical_type_from_string(const std::string& token) {
  if (token == "scale") return TechnicalType::Scale;
  if (token == "arpeggio") return TechnicalType::Arpeggio;
  if (token == "hanon") return TechnicalType::Hanon;
  if (token == "mixed") return TechnicalType::Mixed;
  throw FormatError("Unknown technical type: '" + token + "'");
}

std::string to_string(TechnicalElement element) {
  switch (element) {
    case TechnicalElement::Scales: return "scales";
    case TechnicalElement::Arpeggios: return "arpeggios";
    case TechnicalElement::Thirds: return "thirds";
    case TechnicalElement::Sixths: return "sixths";
    case TechnicalElement::Octaves: return "octaves";
    case TechnicalElement::Chords: return "chords";
    case TechnicalElement::Trills: return "trills";
    case TechnicalElement::Tremolo: return "tremolo";
    case TechnicalElement::AlbertiBass: return "alberti_bass";
  }
  return "scales";
}

TechnicalElement technical_element_from_string(const std::string& token) {
  for (TechnicalElement element : kAllElements) {
    if (to_string(element) == token) {
      return element;
    }
  }
  throw FormatError("Unknown technical element: '" + token + "'");
}

std::string to_string(MelodicMotion motion) {
  switch (motion) {
    case MelodicMotion::Stepwise: return "stepwise";
    case MelodicMotion::Leaps: return "leaps";
    case MelodicMotion::Mixed: return "mixed";
  }
  return "mixed";
}

MelodicMotion melodic_motion_from_string(const std::string& token) {
  if (token == "stepwise") return MelodicMotion::Stepwise;
  if (token == "leaps") return MelodicMotion::Leaps;
  if (token == "mixed") return MelodicMotion::Mixed;
  throw FormatError("Unknown melodic motion: '" + token + "'");
}

//====================================================================
// PARAMETER VALIDATION
//====================================================================

std::vector<std::string> validate_exercise_parameters(const ExerciseParameters& params) {
  std::vector<std::string> errors;

  const bool lowest_ok = is_valid_note_name(params.range.lowest);
  const bool highest_ok = is_valid_note_name(params.range.highest);
  if (!lowest_ok || !highest_ok) {
    errors.push_back("Invalid note range format");
  } else if (note_to_midi(params.range.lowest) > note_to_midi(params.range.highest)) {
    errors.push_back("Lowest note must not be above highest note");
  }

  if (params.difficulty < kMinDifficulty || params.difficulty > kMaxDifficulty) {
    errors.push_back("Difficulty must be between 1 and 10");
  }
  if (params.measures < kMinMeasures || params.measures > kMaxMeasures) {
    errors.push_back("Measures must be between 1 and 100");
  }
  if (params.tempo < kMinTempo || params.tempo > kMaxTempo) {
    errors.push_back("Tempo must be between 20 and 300 BPM");
  }
  // Generators size their notes against these meters; 3/8 is the smallest.
  if (!is_standard(params.time_signature)) {
    errors.push_back("Unsupported time signature: " + to_string(params.time_signature));
  }
  if (params.octaves && (*params.octaves < 1 || *params.octaves > kMaxOctaves)) {
    errors.push_back("Octaves must be between 1 and 4");
  }
  if (params.hanon_pattern) {
    if (params.hanon_pattern->empty()) {
      errors.push_back("Hanon pattern must not be empty");
    } else if (std::any_of(params.hanon_pattern->begin(), params.hanon_pattern->end(),
                           [](int step) { return step < 1 || step > kMaxHanonStep; })) {
      errors.push_back("Hanon pattern entries must be between 1 and 15");
    }
  }
  if (params.sight_reading.phrase_length < 1) {
    errors.push_back("Phrase length must be at least 1");
  }
  if (params.fingering.position < 1 || params.fingering.position > 12) {
    errors.push_back("Fingering position must be between 1 and 12");
  }
  return errors;
}

//====================================================================
// METADATA
//====================================================================

int estimate_duration_seconds(const ExerciseParameters& params) {
  if (params.tempo <= 0) {
    return 0;
  }
  const double seconds = static_cast<double>(params.measures) * params.time_signature.beats *
                         60.0 / static_cast<double>(params.tempo);
  return static_cast<int>(std::ceil(seconds - 1e-9));
}

ExerciseMetadata derive_exercise_metadata(ExerciseType type, const ExerciseParameters& params) {
  ExerciseMetadata meta;
  const std::string key_name = key_display_name(params.key_signature);
  const std::string root = key_root(params.key_signature);
  const TechnicalType technical = params.technical_type.value_or(TechnicalType::Scale);

  switch (type) {
    case ExerciseType::SightReading:
      meta.title = "Sight-Reading in " + key_name;
      meta.focus_areas = {"note reading", "rhythm reading"};
      if (params.difficulty > 3) meta.focus_areas.push_back("accidentals");
      if (params.difficulty > 5) meta.focus_areas.push_back("dynamics");
      if (params.difficulty > 6) meta.focus_areas.push_back("articulation");
      break;
    case ExerciseType::Technical:
      switch (technical) {
        case TechnicalType::Scale:
          meta.title = root + " " +
                       title_case(to_string(params.scale_type.value_or(
                           default_scale_type(params.key_signature)))) +
                       " Scale";
          meta.focus_areas = {"scales", "finger technique"};
          break;
        case TechnicalType::Arpeggio:
          meta.title = root + " " +
                       chord_display_name(params.arpeggio_type.value_or(
                           default_chord_type(params.key_signature))) +
                       " Arpeggio";
          meta.focus_areas = {"arpeggios", "hand position"};
          break;
        case TechnicalType::Hanon:
          meta.title = "Hanon Pattern in " + key_name;
          meta.focus_areas = {"finger independence", "evenness"};
          break;
        case TechnicalType::Mixed:
          meta.title = "Scales and Arpeggios in " + key_name;
          meta.focus_areas = {"scales", "arpeggios"};
          break;
      }
      break;
    case ExerciseType::Rhythm:
      meta.title = "Rhythm Exercise in " + to_string(params.time_signature);
      meta.focus_areas = {"rhythm"};
      break;
    case ExerciseType::Harmony:
      meta.title = "Harmony Exercise in " + key_name;
      meta.focus_areas = {"harmony"};
      break;
  }
  for (TechnicalElement element : params.technical_elements) {
    push_unique(meta.focus_areas, title_case(to_string(element)));
  }

  const std::string kind = exercise_kind_label(type, params);
  meta.description = std::to_string(params.measures) + "-measure " + kind +
                     " exercise in " + key_name + ", " + to_string(params.time_signature) +
                     " at " + std::to_string(params.tempo) + " BPM (difficulty " +
                     std::to_string(params.difficulty) + "/10)";

  push_unique(meta.tags, slug(to_string(type)));
  if (type == ExerciseType::Technical) {
    push_unique(meta.tags, to_string(technical));
  }
  push_unique(meta.tags, slug(to_string(params.key_signature)));
  push_unique(meta.tags, to_string(params.time_signature));
  push_unique(meta.tags, to_string(params.clef));
  push_unique(meta.tags, "difficulty-" + std::to_string(params.difficulty));

  if (params.difficulty >= 6) {
    meta.prerequisites.push_back("Comfort reading " + key_name);
  }
  meta.estimated_duration_seconds = estimate_duration_seconds(params);
  return meta;
}

//====================================================================
// FORM SCHEMA
//====================================================================

Schema exercise_schema() {
  std::vector<Choice> keys;
  for (int i = 0; i < kKeySignatureCount; ++i) {
    const auto key = static_cast<KeySignature>(i);
    keys.push_back({key_display_name(key), to_string(key)});
  }
  std::vector<Choice> meters;
  for (const auto& meter : standard_time_signatures()) {
    meters.push_back({to_string(meter), to_string(meter)});
  }
  std::vector<Choice> clefs;
  for (Clef clef : {Clef::Treble, Clef::Bass, Clef::Alto, Clef::Tenor, Clef::GrandStaff}) {
    clefs.push_back({title_case(to_string(clef)), to_string(clef)});
  }
  std::vector<Choice> technical_types;
  for (TechnicalType type : {TechnicalType::Scale, TechnicalType::Arpeggio, TechnicalType::Hanon,
                             TechnicalType::Mixed}) {
    technical_types.push_back({title_case(to_string(type)), to_string(type)});
  }
  std::vector<Choice> scale_types;
  for (int i = 0; i <= static_cast<int>(ScaleType::Chromatic); ++i) {
    const auto type = static_cast<ScaleType>(i);
    scale_types.push_back({title_case(to_string(type)), to_string(type)});
  }
  std::vector<Choice> chord_types;
  for (int i = 0; i <= static_cast<int>(ChordType::Minor7); ++i) {
    const auto type = static_cast<ChordType>(i);
    chord_types.push_back({chord_display_name(type), to_string(type)});
  }

  Schema schema;
  schema.id = "exercise_parameters";
  schema.version = 1;
  schema.fields = {
      Field{.key = "keySignature", .label = "Key signature", .kind = Kind::kEnum,
            .def = std::string("C_MAJOR"), .choices = keys},
      Field{.key = "timeSignature", .label = "Time signature", .kind = Kind::kEnum,
            .def = std::string("4/4"), .choices = meters},
      Field{.key = "clef", .label = "Clef", .kind = Kind::kEnum, .def = std::string("treble"),
            .choices = clefs},
      Field{.key = "range.lowest", .label = "Lowest note", .kind = Kind::kString,
            .def = std::string("C4"), .help = "Scientific pitch name, e.g. C4"},
      Field{.key = "range.highest", .label = "Highest note", .kind = Kind::kString,
            .def = std::string("C6"), .help = "Scientific pitch name, e.g. C6"},
      Field{.key = "difficulty", .label = "Difficulty", .kind = Kind::kInt, .def = 5,
            .ir = IntRange{kMinDifficulty, kMaxDifficulty, 1}},
      Field{.key = "measures", .label = "Measures", .kind = Kind::kInt, .def = 4,
            .ir = IntRange{kMinMeasures, kMaxMeasures, 1}},
      Field{.key = "tempo", .label = "Tempo (BPM)", .kind = Kind::kInt, .def = 120,
            .ir = IntRange{kMinTempo, kMaxTempo, 1}},
      Field{.key = "technicalType", .label = "Technical type", .kind = Kind::kEnum,
            .def = std::string("scale"), .choices = technical_types, .optional = true},
      Field{.key = "scaleType", .label = "Scale type", .kind = Kind::kEnum,
            .def = std::string("major"), .choices = scale_types, .optional = true,
            .help = "Defaults to the key's mode"},
      Field{.key = "arpeggioType", .label = "Arpeggio type", .kind = Kind::kEnum,
            .def = std::string("major"), .choices = chord_types, .optional = true,
            .help = "Defaults to the key's tonic triad"},
      Field{.key = "hanonPattern", .label = "Hanon pattern", .kind = Kind::kIntList,
            .def = std::vector<int>{1, 3, 5, 6, 5, 3}, .optional = true},
      Field{.key = "includeDescending", .label = "Include descending", .kind = Kind::kBool,
            .def = true, .optional = true},
      Field{.key = "octaves", .label = "Octaves", .kind = Kind::kInt, .def = 1,
            .ir = IntRange{1, kMaxOctaves, 1}, .optional = true},
      Field{.key = "includeFingerings", .label = "Include fingerings", .kind = Kind::kBool,
            .def = false},
      Field{.key = "seed", .label = "Random seed", .kind = Kind::kInt, .def = 1},
  };
  return schema;
}

} // namespace etude
