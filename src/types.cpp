#include "etude/types.hpp"

#include "etude/errors.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <utility>

namespace etude {
namespace {

template <typename Enum, std::size_t N>
Enum lookup_token(const std::array<std::pair<const char*, Enum>, N>& table,
                  const std::string& token, const char* what) {
  for (const auto& [name, value] : table) {
    if (token == name) {
      return value;
    }
  }
  throw FormatError(std::string("Unknown ") + what + ": '" + token + "'");
}

template <typename Enum, std::size_t N>
std::string token_for(const std::array<std::pair<const char*, Enum>, N>& table, Enum value) {
  for (const auto& [name, entry] : table) {
    if (entry == value) {
      return name;
    }
  }
  return "";
}

constexpr std::array<std::pair<const char*, NoteDuration>, 6> kDurations{{
    {"w", NoteDuration::Whole},
    {"h", NoteDuration::Half},
    {"q", NoteDuration::Quarter},
    {"8", NoteDuration::Eighth},
    {"16", NoteDuration::Sixteenth},
    {"32", NoteDuration::ThirtySecond},
}};

constexpr std::array<std::pair<const char*, Clef>, 5> kClefs{{
    {"treble", Clef::Treble},
    {"bass", Clef::Bass},
    {"alto", Clef::Alto},
    {"tenor", Clef::Tenor},
    {"grand_staff", Clef::GrandStaff},
}};

constexpr std::array<std::pair<const char*, StemDirection>, 3> kStems{{
    {"up", StemDirection::Up},
    {"down", StemDirection::Down},
    {"auto", StemDirection::Auto},
}};

constexpr std::array<std::pair<const char*, TieType>, 3> kTies{{
    {"start", TieType::Start},
    {"stop", TieType::Stop},
    {"continue", TieType::Continue},
}};

constexpr std::array<std::pair<const char*, Articulation>, 6> kArticulations{{
    {"staccato", Articulation::Staccato},
    {"accent", Articulation::Accent},
    {"tenuto", Articulation::Tenuto},
    {"marcato", Articulation::Marcato},
    {"legato", Articulation::Legato},
    {"fermata", Articulation::Fermata},
}};

constexpr std::array<std::pair<const char*, DynamicMarking>, 8> kDynamics{{
    {"ppp", DynamicMarking::PPP},
    {"pp", DynamicMarking::PP},
    {"p", DynamicMarking::P},
    {"mp", DynamicMarking::MP},
    {"mf", DynamicMarking::MF},
    {"f", DynamicMarking::F},
    {"ff", DynamicMarking::FF},
    {"fff", DynamicMarking::FFF},
}};

constexpr std::array<std::pair<const char*, BarLineType>, 6> kBarLines{{
    {"single", BarLineType::Single},
    {"double", BarLineType::Double},
    {"end", BarLineType::End},
    {"repeat-start", BarLineType::RepeatStart},
    {"repeat-end", BarLineType::RepeatEnd},
    {"repeat-both", BarLineType::RepeatBoth},
}};

constexpr std::array<std::pair<const char*, Instrument>, 2> kInstruments{{
    {"PIANO", Instrument::Piano},
    {"GUITAR", Instrument::Guitar},
}};

constexpr std::array<std::pair<const char*, ExerciseType>, 4> kExerciseTypes{{
    {"SIGHT_READING", ExerciseType::SightReading},
    {"TECHNICAL", ExerciseType::Technical},
    {"RHYTHM", ExerciseType::Rhythm},
    {"HARMONY", ExerciseType::Harmony},
}};

struct KeyToken {
  const char* token;
  const char* readable;
  KeySignature key;
};

constexpr std::array<KeyToken, 30> kKeys{{
    {"C_MAJOR", "C major", KeySignature::CMajor},
    {"G_MAJOR", "G major", KeySignature::GMajor},
    {"D_MAJOR", "D major", KeySignature::DMajor},
    {"A_MAJOR", "A major", KeySignature::AMajor},
    {"E_MAJOR", "E major", KeySignature::EMajor},
    {"B_MAJOR", "B major", KeySignature::BMajor},
    {"F_SHARP_MAJOR", "F# major", KeySignature::FSharpMajor},
    {"C_SHARP_MAJOR", "C# major", KeySignature::CSharpMajor},
    {"F_MAJOR", "F major", KeySignature::FMajor},
    {"B_FLAT_MAJOR", "Bb major", KeySignature::BFlatMajor},
    {"E_FLAT_MAJOR", "Eb major", KeySignature::EFlatMajor},
    {"A_FLAT_MAJOR", "Ab major", KeySignature::AFlatMajor},
    {"D_FLAT_MAJOR", "Db major", KeySignature::DFlatMajor},
    {"G_FLAT_MAJOR", "Gb major", KeySignature::GFlatMajor},
    {"C_FLAT_MAJOR", "Cb major", KeySignature::CFlatMajor},
    {"A_MINOR", "A minor", KeySignature::AMinor},
    {"E_MINOR", "E minor", KeySignature::EMinor},
    {"B_MINOR", "B minor", KeySignature::BMinor},
    {"F_SHARP_MINOR", "F# minor", KeySignature::FSharpMinor},
    {"C_SHARP_MINOR", "C# minor", KeySignature::CSharpMinor},
    {"G_SHARP_MINOR", "G# minor", KeySignature::GSharpMinor},
    {"D_SHARP_MINOR", "D# minor", KeySignature::DSharpMinor},
    {"A_SHARP_MINOR", "A# minor", KeySignature::ASharpMinor},
    {"D_MINOR", "D minor", KeySignature::DMinor},
    {"G_MINOR", "G minor", KeySignature::GMinor},
    {"C_MINOR", "C minor", KeySignature::CMinor},
    {"F_MINOR", "F minor", KeySignature::FMinor},
    {"B_FLAT_MINOR", "Bb minor", KeySignature::BFlatMinor},
    {"E_FLAT_MINOR", "Eb minor", KeySignature::EFlatMinor},
    {"A_FLAT_MINOR", "Ab minor", KeySignature::AFlatMinor},
}};

const std::array<TimeSignature, 9> kStandardMeters{{
    {2, 4}, {3, 4}, {4, 4}, {3, 8}, {6, 8}, {9, 8}, {12, 8}, {5, 4}, {7, 8},
}};

} // namespace

std::string to_string(NoteDuration duration) { return token_for(kDurations, duration); }
NoteDuration note_duration_from_string(const std::string& code) {
  return lookup_token(kDurations, code, "note duration");
}

std::string to_string(Clef clef) { return token_for(kClefs, clef); }
Clef clef_from_string(const std::string& token) { return lookup_token(kClefs, token, "clef"); }

std::string to_string(StemDirection stem) { return token_for(kStems, stem); }
StemDirection stem_direction_from_string(const std::string& token) {
  return lookup_token(kStems, token, "stem direction");
}

std::string to_string(TieType tie) { return token_for(kTies, tie); }
TieType tie_type_from_string(const std::string& token) {
  return lookup_token(kTies, token, "tie type");
}

std::string to_string(Articulation articulation) {
  return token_for(kArticulations, articulation);
}
Articulation articulation_from_string(const std::string& token) {
  return lookup_token(kArticulations, token, "articulation");
}

std::string to_string(DynamicMarking dynamic) { return token_for(kDynamics, dynamic); }
DynamicMarking dynamic_marking_from_string(const std::string& token) {
  return lookup_token(kDynamics, token, "dynamic marking");
}

std::string to_string(BarLineType bar_line) { return token_for(kBarLines, bar_line); }
BarLineType bar_line_type_from_string(const std::string& token) {
  return lookup_token(kBarLines, token, "bar line");
}

std::string to_string(Instrument instrument) { return token_for(kInstruments, instrument); }
Instrument instrument_from_string(const std::string& token) {
  return lookup_token(kInstruments, token, "instrument");
}

std::string to_string(ExerciseType type) { return token_for(kExerciseTypes, type); }
ExerciseType exercise_type_from_string(const std::string& token) {
  return lookup_token(kExerciseTypes, token, "exercise type");
}

std::string to_string(KeySignature key) {
  for (const auto& entry : kKeys) {
    if (entry.key == key) {
      return entry.token;
    }
  }
  return "";
}

KeySignature key_signature_from_string(const std::string& token) {
  for (const auto& entry : kKeys) {
    if (token == entry.token || token == entry.readable) {
      return entry.key;
    }
  }
  throw FormatError("Unknown key signature: '" + token + "'");
}

std::string to_string(const TimeSignature& time_signature) {
  return std::to_string(time_signature.beats) + "/" + std::to_string(time_signature.beat_unit);
}

TimeSignature time_signature_from_string(const std::string& token) {
  const auto slash = token.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= token.size()) {
    throw FormatError("Invalid time signature: '" + token + "'");
  }
  auto parse_part = [&](const std::string& part) {
    if (part.size() > 2) {
      throw FormatError("Invalid time signature: '" + token + "'");
    }
    int value = 0;
    for (char c : part) {
      if (c < '0' || c > '9') {
        throw FormatError("Invalid time signature: '" + token + "'");
      }
      value = value * 10 + (c - '0');
    }
    return value;
  };
  TimeSignature out;
  out.beats = parse_part(token.substr(0, slash));
  out.beat_unit = parse_part(token.substr(slash + 1));
  if (out.beats <= 0 || out.beat_unit <= 0) {
    throw FormatError("Invalid time signature: '" + token + "'");
  }
  return out;
}

bool is_known(Clef clef) {
  return static_cast<int>(clef) >= 0 && static_cast<int>(clef) <= static_cast<int>(Clef::GrandStaff);
}

bool is_known(BarLineType bar_line) {
  return static_cast<int>(bar_line) >= 0 &&
         static_cast<int>(bar_line) <= static_cast<int>(BarLineType::RepeatBoth);
}

bool is_known(StemDirection stem) {
  return static_cast<int>(stem) >= 0 && static_cast<int>(stem) <= static_cast<int>(StemDirection::Auto);
}

bool is_known(TieType tie) {
  return static_cast<int>(tie) >= 0 && static_cast<int>(tie) <= static_cast<int>(TieType::Continue);
}

double duration_value(NoteDuration duration) {
  switch (duration) {
    case NoteDuration::Whole: return 4.0;
    case NoteDuration::Half: return 2.0;
    case NoteDuration::Quarter: return 1.0;
    case NoteDuration::Eighth: return 0.5;
    case NoteDuration::Sixteenth: return 0.25;
    case NoteDuration::ThirtySecond: return 0.125;
  }
  return 1.0;
}

double dotted_value(NoteDuration duration, int dots) {
  double base = duration_value(duration);
  double total = base;
  double addition = base;
  for (int i = 0; i < dots; ++i) {
    addition /= 2.0;
    total += addition;
  }
  return total;
}

double expected_measure_duration(const TimeSignature& time_signature) {
  if (time_signature.beat_unit <= 0) {
    return 0.0;
  }
  return static_cast<double>(time_signature.beats) * 4.0 /
         static_cast<double>(time_signature.beat_unit);
}

bool is_standard(const TimeSignature& time_signature) {
  for (const auto& meter : kStandardMeters) {
    if (meter == time_signature) {
      return true;
    }
  }
  return false;
}

const std::vector<TimeSignature>& standard_time_signatures() {
  static const std::vector<TimeSignature> meters(kStandardMeters.begin(), kStandardMeters.end());
  return meters;
}

std::int64_t to_epoch_ms(Timestamp time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Timestamp from_epoch_ms(std::int64_t millis) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

} // namespace etude
