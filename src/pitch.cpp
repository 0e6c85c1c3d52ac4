#include "etude/pitch.hpp"

#include "etude/errors.hpp"

#include <array>
#include <cctype>

namespace etude {
namespace {

constexpr std::array<char, 7> kLetters{'C', 'D', 'E', 'F', 'G', 'A', 'B'};
constexpr std::array<int, 7> kNaturalSemitones{0, 2, 4, 5, 7, 9, 11};

constexpr std::array<const char*, 12> kSharpNames{"C", "C#", "D", "D#", "E", "F",
                                                  "F#", "G", "G#", "A", "A#", "B"};
constexpr std::array<const char*, 12> kFlatNames{"C", "Db", "D", "Eb", "E", "F",
                                                 "Gb", "G", "Ab", "A", "Bb", "B"};

int alter_from_symbol(char symbol) {
  if (symbol == '#') {
    return 1;
  }
  if (symbol == 'b') {
    return -1;
  }
  return 0;
}

const char* alter_symbol(int alter) {
  if (alter > 0) {
    return "#";
  }
  if (alter < 0) {
    return "b";
  }
  return "";
}

} // namespace

int letter_index(char letter) {
  const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  for (std::size_t i = 0; i < kLetters.size(); ++i) {
    if (kLetters[i] == upper) {
      return static_cast<int>(i);
    }
  }
  throw FormatError(std::string("Invalid note letter: '") + letter + "'");
}

char letter_at(int index) {
  const int wrapped = ((index % 7) + 7) % 7;
  return kLetters[static_cast<std::size_t>(wrapped)];
}

int natural_semitone(char letter) {
  return kNaturalSemitones[static_cast<std::size_t>(letter_index(letter))];
}

Pitch parse_note_name(const std::string& name) {
  // [A-G][#b]?[0-9]
  if (name.size() < 2 || name.size() > 3) {
    throw FormatError("Invalid note format: '" + name + "'");
  }
  const char letter = name[0];
  if (letter < 'A' || letter > 'G') {
    throw FormatError("Invalid note format: '" + name + "'");
  }
  Pitch pitch;
  pitch.letter = letter;
  std::size_t pos = 1;
  if (name.size() == 3) {
    if (name[1] != '#' && name[1] != 'b') {
      throw FormatError("Invalid note format: '" + name + "'");
    }
    pitch.alter = alter_from_symbol(name[1]);
    pos = 2;
  }
  const char digit = name[pos];
  if (digit < '0' || digit > '9') {
    throw FormatError("Invalid note format: '" + name + "'");
  }
  pitch.octave = digit - '0';
  return pitch;
}

std::string format_note_name(const Pitch& pitch) {
  return std::string(1, pitch.letter) + alter_symbol(pitch.alter) + std::to_string(pitch.octave);
}

Pitch parse_pitch_key(const std::string& key) {
  // ^[a-g][#b]?/[0-9]$
  if (key.size() < 3 || key.size() > 4) {
    throw FormatError("Invalid pitch key: '" + key + "'");
  }
  const char letter = key[0];
  if (letter < 'a' || letter > 'g') {
    throw FormatError("Invalid pitch key: '" + key + "'");
  }
  Pitch pitch;
  pitch.letter = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  std::size_t pos = 1;
  if (key.size() == 4) {
    if (key[1] != '#' && key[1] != 'b') {
      throw FormatError("Invalid pitch key: '" + key + "'");
    }
    pitch.alter = alter_from_symbol(key[1]);
    pos = 2;
  }
  if (key[pos] != '/') {
    throw FormatError("Invalid pitch key: '" + key + "'");
  }
  const char digit = key[pos + 1];
  if (digit < '0' || digit > '9') {
    throw FormatError("Invalid pitch key: '" + key + "'");
  }
  pitch.octave = digit - '0';
  return pitch;
}

std::string format_pitch_key(const Pitch& pitch) {
  std::string out(1, static_cast<char>(std::tolower(static_cast<unsigned char>(pitch.letter))));
  out += alter_symbol(pitch.alter);
  out += '/';
  out += std::to_string(pitch.octave);
  return out;
}

bool is_valid_pitch_key(const std::string& key) {
  try {
    parse_pitch_key(key);
    return true;
  } catch (const FormatError&) {
    return false;
  }
}

bool is_valid_note_name(const std::string& name) {
  try {
    return to_midi(parse_note_name(name)) >= 0;
  } catch (const FormatError&) {
    return false;
  }
}

int to_midi(const Pitch& pitch) {
  const int midi = (pitch.octave + 1) * 12 + natural_semitone(pitch.letter) + pitch.alter;
  if (midi < 0 || midi > 127) {
    throw FormatError("Pitch outside MIDI range: " + format_note_name(pitch));
  }
  return midi;
}

Pitch pitch_from_midi(int midi, bool prefer_flats) {
  if (midi < kLowestNamedMidi || midi > kHighestNamedMidi) {
    throw FormatError("MIDI number outside named range: " + std::to_string(midi));
  }
  const int pitch_class = midi % 12;
  const char* name = prefer_flats ? kFlatNames[static_cast<std::size_t>(pitch_class)]
                                  : kSharpNames[static_cast<std::size_t>(pitch_class)];
  Pitch pitch;
  pitch.letter = name[0];
  pitch.alter = name[1] == '\0' ? 0 : alter_from_symbol(name[1]);
  pitch.octave = midi / 12 - 1;
  return pitch;
}

int note_to_midi(const std::string& name) { return to_midi(parse_note_name(name)); }

std::string midi_to_note(int midi, bool prefer_flats) {
  return format_note_name(pitch_from_midi(midi, prefer_flats));
}

int pitch_key_to_midi(const std::string& key) { return to_midi(parse_pitch_key(key)); }

std::string midi_to_pitch_key(int midi, bool prefer_flats) {
  return format_pitch_key(pitch_from_midi(midi, prefer_flats));
}

std::string note_name_to_pitch_key(const std::string& name) {
  return format_pitch_key(parse_note_name(name));
}

std::string pitch_key_to_note_name(const std::string& key) {
  return format_note_name(parse_pitch_key(key));
}

std::string transpose_pitch_key(const std::string& key, int semitones) {
  const Pitch pitch = parse_pitch_key(key);
  return midi_to_pitch_key(to_midi(pitch) + semitones, pitch.alter < 0);
}

} // namespace etude
