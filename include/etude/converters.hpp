#pragma once

#include <string>
#include <vector>

#include "score.hpp"
#include "sheet_music.hpp"

namespace etude {

// Conversion output plus the notes that were skipped or adjusted on the way.
template <typename T>
struct Converted {
  T value;
  std::vector<std::string> warnings;
};

// Copies a flat note into `voice_id` on `staff_id`.
VoiceNote to_voice_note(const Note& note, const std::string& voice_id, const std::string& staff_id);

// Grand-staff documents (any measure declaring a grand-staff clef) split
// into treble/rightHand (octave >= 4, rests) and bass/leftHand; everything
// else becomes a single "main" staff and voice.
Converted<Score> flat_to_multi_voice_with_report(const SheetMusic& sheet, Timestamp now = {});
Score flat_to_multi_voice(const SheetMusic& sheet, Timestamp now = {});

// Lossy: voices are flattened, simultaneous notes merge into chords, time is
// re-based per measure, signatures carry forward, empty measures get a whole
// rest and an empty score gets one placeholder measure.
Converted<SheetMusic> multi_voice_to_flat_with_report(const Score& score);
SheetMusic multi_voice_to_flat(const Score& score);

} // namespace etude
