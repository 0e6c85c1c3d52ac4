#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace etude {

enum class ScaleType {
  Major,
  NaturalMinor,
  HarmonicMinor,
  MelodicMinor,
  Dorian,
  Phrygian,
  Lydian,
  Mixolydian,
  Locrian,
  PentatonicMajor,
  PentatonicMinor,
  Blues,
  Chromatic,
};

enum class ChordType { Major, Minor, Diminished, Augmented, Dominant7, Major7, Minor7 };

std::string to_string(ScaleType type);
ScaleType scale_type_from_string(const std::string& token);

std::string to_string(ChordType type);
ChordType chord_type_from_string(const std::string& token);

// Semitone offsets above the root.
const std::vector<int>& scale_intervals(ScaleType type);
const std::vector<int>& chord_intervals(ChordType type);

// Root is a scientific name ("A4") or a bare letter name ("Bb"). With an
// octave the result carries ascending octaves ("A4", "B4", "C5", ...);
// without one the result is letter names only. Seven-note scales use one
// letter per degree, chords stack thirds.
std::vector<std::string> get_scale_notes(const std::string& root, ScaleType type);
std::vector<std::string> get_chord_notes(const std::string& root, ChordType type);

struct KeyAlterations {
  std::vector<char> sharps; // upper-case letters in signature order
  std::vector<char> flats;

  bool sharpens(char letter) const;
  bool flattens(char letter) const;
};

KeyAlterations get_key_signature_alterations(KeySignature key);

KeyMode key_mode(KeySignature key);
// Tonic letter name without octave, e.g. "F#", "Bb".
std::string key_root(KeySignature key);
// "F# major", "Bb minor".
std::string key_display_name(KeySignature key);
// Positive for sharps, negative for flats.
int key_fifths(KeySignature key);

ScaleType default_scale_type(KeySignature key);
ChordType default_chord_type(KeySignature key);

} // namespace etude
