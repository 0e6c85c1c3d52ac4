#pragma once

#include <string>

namespace etude {

// A spelled pitch. letter is upper case 'A'..'G', alter is -1 (flat),
// 0 or +1 (sharp), octave is the scientific octave digit (C4 = MIDI 60).
struct Pitch {
  char letter = 'C';
  int alter = 0;
  int octave = 4;

  bool operator==(const Pitch& other) const = default;
};

constexpr int kLowestNamedMidi = 12;   // C0
constexpr int kHighestNamedMidi = 127; // G9

// Scientific names: "C4", "F#3", "Bb5". Raises FormatError.
Pitch parse_note_name(const std::string& name);
std::string format_note_name(const Pitch& pitch);

// Wire keys matching ^[a-g][#b]?/[0-9]$: "c/4", "f#/5", "bb/3". Raises FormatError.
Pitch parse_pitch_key(const std::string& key);
std::string format_pitch_key(const Pitch& pitch);

bool is_valid_pitch_key(const std::string& key);
bool is_valid_note_name(const std::string& name);

int to_midi(const Pitch& pitch);

// Sharp spelling unless prefer_flats. Defined for MIDI 12..127.
Pitch pitch_from_midi(int midi, bool prefer_flats = false);

int note_to_midi(const std::string& name);
std::string midi_to_note(int midi, bool prefer_flats = false);

int pitch_key_to_midi(const std::string& key);
std::string midi_to_pitch_key(int midi, bool prefer_flats = false);

std::string note_name_to_pitch_key(const std::string& name);
std::string pitch_key_to_note_name(const std::string& key);

// Keeps flat spelling for keys spelled with a flat.
std::string transpose_pitch_key(const std::string& key, int semitones);

// C = 0 .. B = 6
int letter_index(char letter);
char letter_at(int index);
// Semitone offset of the natural letter above C.
int natural_semitone(char letter);

} // namespace etude
