#include "etude/theory.hpp"

#include "etude/errors.hpp"
#include "etude/pitch.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace etude {
namespace {

struct KeyInfo {
  KeySignature key;
  const char* root;
  KeyMode mode;
  int fifths;
};

constexpr std::array<KeyInfo, 30> kKeyTable{{
    {KeySignature::CMajor, "C", KeyMode::Major, 0},
    {KeySignature::GMajor, "G", KeyMode::Major, 1},
    {KeySignature::DMajor, "D", KeyMode::Major, 2},
    {KeySignature::AMajor, "A", KeyMode::Major, 3},
    {KeySignature::EMajor, "E", KeyMode::Major, 4},
    {KeySignature::BMajor, "B", KeyMode::Major, 5},
    {KeySignature::FSharpMajor, "F#", KeyMode::Major, 6},
    {KeySignature::CSharpMajor, "C#", KeyMode::Major, 7},
    {KeySignature::FMajor, "F", KeyMode::Major, -1},
    {KeySignature::BFlatMajor, "Bb", KeyMode::Major, -2},
    {KeySignature::EFlatMajor, "Eb", KeyMode::Major, -3},
    {KeySignature::AFlatMajor, "Ab", KeyMode::Major, -4},
    {KeySignature::DFlatMajor, "Db", KeyMode::Major, -5},
    {KeySignature::GFlatMajor, "Gb", KeyMode::Major, -6},
    {KeySignature::CFlatMajor, "Cb", KeyMode::Major, -7},
    {KeySignature::AMinor, "A", KeyMode::Minor, 0},
    {KeySignature::EMinor, "E", KeyMode::Minor, 1},
    {KeySignature::BMinor, "B", KeyMode::Minor, 2},
    {KeySignature::FSharpMinor, "F#", KeyMode::Minor, 3},
    {KeySignature::CSharpMinor, "C#", KeyMode::Minor, 4},
    {KeySignature::GSharpMinor, "G#", KeyMode::Minor, 5},
    {KeySignature::DSharpMinor, "D#", KeyMode::Minor, 6},
    {KeySignature::ASharpMinor, "A#", KeyMode::Minor, 7},
    {KeySignature::DMinor, "D", KeyMode::Minor, -1},
    {KeySignature::GMinor, "G", KeyMode::Minor, -2},
    {KeySignature::CMinor, "C", KeyMode::Minor, -3},
    {KeySignature::FMinor, "F", KeyMode::Minor, -4},
    {KeySignature::BFlatMinor, "Bb", KeyMode::Minor, -5},
    {KeySignature::EFlatMinor, "Eb", KeyMode::Minor, -6},
    {KeySignature::AFlatMinor, "Ab", KeyMode::Minor, -7},
}};

constexpr std::array<char, 7> kSharpOrder{'F', 'C', 'G', 'D', 'A', 'E', 'B'};
constexpr std::array<char, 7> kFlatOrder{'B', 'E', 'A', 'D', 'G', 'C', 'F'};

const KeyInfo& key_info(KeySignature key) {
  for (const auto& info : kKeyTable) {
    if (info.key == key) {
      return info;
    }
  }
  throw FormatError("Unknown key signature value: " + std::to_string(static_cast<int>(key)));
}

struct Root {
  Pitch pitch;
  bool has_octave = true;
};

Root parse_root(const std::string& root) {
  if (!root.empty() && std::isdigit(static_cast<unsigned char>(root.back()))) {
    return Root{parse_note_name(root), true};
  }
  return Root{parse_note_name(root + "4"), false};
}

std::string render(const Pitch& pitch, bool with_octave) {
  if (with_octave) {
    return format_note_name(pitch);
  }
  std::string name = format_note_name(pitch);
  name.pop_back();
  return name;
}

// Spells midi on the given letter when it is at most one semitone away,
// otherwise falls back to the enharmonic spelling.
Pitch spell_on_letter(int midi, char letter, bool prefer_flats) {
  const int natural_class = natural_semitone(letter);
  int alter = (midi % 12) - natural_class;
  if (alter > 6) {
    alter -= 12;
  } else if (alter < -6) {
    alter += 12;
  }
  if (std::abs(alter) > 1) {
    return pitch_from_midi(midi, prefer_flats);
  }
  Pitch pitch;
  pitch.letter = letter;
  pitch.alter = alter;
  pitch.octave = (midi - natural_class - alter) / 12 - 1;
  return pitch;
}

std::vector<std::string> spell(const std::string& root, const std::vector<int>& intervals,
                               int letter_step, bool letter_spelling, bool prefer_flats) {
  const Root parsed = parse_root(root);
  const int root_midi = to_midi(parsed.pitch);
  const int root_letter = letter_index(parsed.pitch.letter);
  std::vector<std::string> out;
  out.reserve(intervals.size());
  for (std::size_t i = 0; i < intervals.size(); ++i) {
    const int midi = root_midi + intervals[i];
    Pitch pitch;
    if (letter_spelling) {
      pitch = spell_on_letter(midi, letter_at(root_letter + static_cast<int>(i) * letter_step),
                              prefer_flats);
    } else {
      pitch = pitch_from_midi(midi, prefer_flats);
    }
    out.push_back(render(pitch, parsed.has_octave));
  }
  return out;
}

} // namespace

std::string to_string(ScaleType type) {
  switch (type) {
    case ScaleType::Major: return "major";
    case ScaleType::NaturalMinor: return "natural_minor";
    case ScaleType::HarmonicMinor: return "harmonic_minor";
    case ScaleType::MelodicMinor: return "melodic_minor";
    case ScaleType::Dorian: return "dorian";
    case ScaleType::Phrygian: return "phrygian";
    case ScaleType::Lydian: return "lydian";
    case ScaleType::Mixolydian: return "mixolydian";
    case ScaleType::Locrian: return "locrian";
    case ScaleType::PentatonicMajor: return "pentatonic_major";
    case ScaleType::PentatonicMinor: return "pentatonic_minor";
    case ScaleType::Blues: return "blues";
    case ScaleType::Chromatic: return "chromatic";
  }
  return "major";
}

ScaleType scale_type_from_string(const std::string& token) {
  static const std::array<ScaleType, 13> all{
      ScaleType::Major,      ScaleType::NaturalMinor,    ScaleType::HarmonicMinor,
      ScaleType::MelodicMinor, ScaleType::Dorian,        ScaleType::Phrygian,
      ScaleType::Lydian,     ScaleType::Mixolydian,      ScaleType::Locrian,
      ScaleType::PentatonicMajor, ScaleType::PentatonicMinor, ScaleType::Blues,
      ScaleType::Chromatic};
  for (ScaleType type : all) {
    if (to_string(type) == token) {
      return type;
    }
  }
  throw FormatError("Unknown scale type: '" + token + "'");
}

std::string to_string(ChordType type) {
  switch (type) {
    case ChordType::Major: return "major";
    case ChordType::Minor: return "minor";
    case ChordType::Diminished: return "diminished";
    case ChordType::Augmented: return "augmented";
    case ChordType::Dominant7: return "dominant7";
    case ChordType::Major7: return "major7";
    case ChordType::Minor7: return "minor7";
  }
  return "major";
}

ChordType chord_type_from_string(const std::string& token) {
  static const std::array<ChordType, 7> all{ChordType::Major,     ChordType::Minor,
                                            ChordType::Diminished, ChordType::Augmented,
                                            ChordType::Dominant7, ChordType::Major7,
                                            ChordType::Minor7};
  for (ChordType type : all) {
    if (to_string(type) == token) {
      return type;
    }
  }
  throw FormatError("Unknown chord type: '" + token + "'");
}

const std::vector<int>& scale_intervals(ScaleType type) {
  static const std::vector<int> major{0, 2, 4, 5, 7, 9, 11};
  static const std::vector<int> natural_minor{0, 2, 3, 5, 7, 8, 10};
  static const std::vector<int> harmonic_minor{0, 2, 3, 5, 7, 8, 11};
  static const std::vector<int> melodic_minor{0, 2, 3, 5, 7, 9, 11};
  static const std::vector<int> dorian{0, 2, 3, 5, 7, 9, 10};
  static const std::vector<int> phrygian{0, 1, 3, 5, 7, 8, 10};
  static const std::vector<int> lydian{0, 2, 4, 6, 7, 9, 11};
  static const std::vector<int> mixolydian{0, 2, 4, 5, 7, 9, 10};
  static const std::vector<int> locrian{0, 1, 3, 5, 6, 8, 10};
  static const std::vector<int> pentatonic_major{0, 2, 4, 7, 9};
  static const std::vector<int> pentatonic_minor{0, 3, 5, 7, 10};
  static const std::vector<int> blues{0, 3, 5, 6, 7, 10};
  static const std::vector<int> chromatic{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
  switch (type) {
    case ScaleType::Major: return major;
    case ScaleType::NaturalMinor: return natural_minor;
    case ScaleType::HarmonicMinor: return harmonic_minor;
    case ScaleType::MelodicMinor: return melodic_minor;
    case ScaleType::Dorian: return dorian;
    case ScaleType::Phrygian: return phrygian;
    case ScaleType::Lydian: return lydian;
    case ScaleType::Mixolydian: return mixolydian;
    case ScaleType::Locrian: return locrian;
    case ScaleType::PentatonicMajor: return pentatonic_major;
    case ScaleType::PentatonicMinor: return pentatonic_minor;
    case ScaleType::Blues: return blues;
    case ScaleType::Chromatic: return chromatic;
  }
  return major;
}

const std::vector<int>& chord_intervals(ChordType type) {
  static const std::vector<int> major{0, 4, 7};
  static const std::vector<int> minor{0, 3, 7};
  static const std::vector<int> diminished{0, 3, 6};
  static const std::vector<int> augmented{0, 4, 8};
  static const std::vector<int> dominant7{0, 4, 7, 10};
  static const std::vector<int> major7{0, 4, 7, 11};
  static const std::vector<int> minor7{0, 3, 7, 10};
  switch (type) {
    case ChordType::Major: return major;
    case ChordType::Minor: return minor;
    case ChordType::Diminished: return diminished;
    case ChordType::Augmented: return augmented;
    case ChordType::Dominant7: return dominant7;
    case ChordType::Major7: return major7;
    case ChordType::Minor7: return minor7;
  }
  return major;
}

std::vector<std::string> get_scale_notes(const std::string& root, ScaleType type) {
  const auto& intervals = scale_intervals(type);
  const Root parsed = parse_root(root);
  const bool prefer_flats = parsed.pitch.alter < 0 ||
                            (parsed.pitch.alter == 0 && parsed.pitch.letter == 'F') ||
                            type == ScaleType::Blues;
  return spell(root, intervals, 1, intervals.size() == 7, prefer_flats);
}

std::vector<std::string> get_chord_notes(const std::string& root, ChordType type) {
  const Root parsed = parse_root(root);
  return spell(root, chord_intervals(type), 2, true, parsed.pitch.alter < 0);
}

bool KeyAlterations::sharpens(char letter) const {
  const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  return std::find(sharps.begin(), sharps.end(), upper) != sharps.end();
}

bool KeyAlterations::flattens(char letter) const {
  const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  return std::find(flats.begin(), flats.end(), upper) != flats.end();
}

KeyAlterations get_key_signature_alterations(KeySignature key) {
  const int fifths = key_info(key).fifths;
  KeyAlterations out;
  for (int i = 0; i < fifths; ++i) {
    out.sharps.push_back(kSharpOrder[static_cast<std::size_t>(i)]);
  }
  for (int i = 0; i < -fifths; ++i) {
    out.flats.push_back(kFlatOrder[static_cast<std::size_t>(i)]);
  }
  return out;
}

KeyMode key_mode(KeySignature key) { return key_info(key).mode; }

std::string key_root(KeySignature key) { return key_info(key).root; }

std::string key_display_name(KeySignature key) {
  const auto& info = key_info(key);
  return std::string(info.root) + (info.mode == KeyMode::Major ? " major" : " minor");
}

int key_fifths(KeySignature key) { return key_info(key).fifths; }

ScaleType default_scale_type(KeySignature key) {
  return key_mode(key) == KeyMode::Major ? ScaleType::Major : ScaleType::NaturalMinor;
}

ChordType default_chord_type(KeySignature key) {
  return key_mode(key) == KeyMode::Major ? ChordType::Major : ChordType::Minor;
}

} // namespace etude
