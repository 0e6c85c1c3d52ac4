#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace etude {

using Timestamp = std::chrono::system_clock::time_point;

enum class NoteDuration { Whole, Half, Quarter, Eighth, Sixteenth, ThirtySecond };

enum class Clef { Treble, Bass, Alto, Tenor, GrandStaff };

enum class StemDirection { Up, Down, Auto };

enum class TieType { Start, Stop, Continue };

enum class Articulation { Staccato, Accent, Tenuto, Marcato, Legato, Fermata };

enum class DynamicMarking { PPP, PP, P, MP, MF, F, FF, FFF };

enum class BarLineType { Single, Double, End, RepeatStart, RepeatEnd, RepeatBoth };

enum class Instrument { Piano, Guitar };

enum class ExerciseType { SightReading, Technical, Rhythm, Harmony };

enum class KeyMode { Major, Minor };

// The 15 major and 15 minor key signatures. Order is significant: the index
// within each mode is the position on the circle of fifths used by the
// alteration tables (see theory.cpp).
enum class KeySignature {
  CMajor, GMajor, DMajor, AMajor, EMajor, BMajor, FSharpMajor, CSharpMajor,
  FMajor, BFlatMajor, EFlatMajor, AFlatMajor, DFlatMajor, GFlatMajor, CFlatMajor,
  AMinor, EMinor, BMinor, FSharpMinor, CSharpMinor, GSharpMinor, DSharpMinor, ASharpMinor,
  DMinor, GMinor, CMinor, FMinor, BFlatMinor, EFlatMinor, AFlatMinor,
};

struct TimeSignature {
  int beats = 4;
  int beat_unit = 4;

  bool operator==(const TimeSignature& other) const = default;
};

//====================================================================
// WIRE TOKENS
//====================================================================
// Every enum has a to_string / *_from_string pair using the legacy wire
// tokens. Parsers raise FormatError on unknown tokens.

std::string to_string(NoteDuration duration);
NoteDuration note_duration_from_string(const std::string& code);

std::string to_string(Clef clef);
Clef clef_from_string(const std::string& token);

std::string to_string(StemDirection stem);
StemDirection stem_direction_from_string(const std::string& token);

std::string to_string(TieType tie);
TieType tie_type_from_string(const std::string& token);

std::string to_string(Articulation articulation);
Articulation articulation_from_string(const std::string& token);

std::string to_string(DynamicMarking dynamic);
DynamicMarking dynamic_marking_from_string(const std::string& token);

std::string to_string(BarLineType bar_line);
BarLineType bar_line_type_from_string(const std::string& token);

std::string to_string(Instrument instrument);
Instrument instrument_from_string(const std::string& token);

std::string to_string(ExerciseType type);
ExerciseType exercise_type_from_string(const std::string& token);

std::string to_string(KeySignature key);
// Accepts the canonical token ("B_FLAT_MAJOR") and the readable form
// ("Bb major", "F# minor").
KeySignature key_signature_from_string(const std::string& token);

std::string to_string(const TimeSignature& time_signature);
TimeSignature time_signature_from_string(const std::string& token);

// Enumerator range checks for values that did not come through a parser.
bool is_known(Clef clef);
bool is_known(BarLineType bar_line);
bool is_known(StemDirection stem);
bool is_known(TieType tie);

//====================================================================
// RHYTHM ARITHMETIC (quarter-note units)
//====================================================================

double duration_value(NoteDuration duration);

// Each dot adds half of the previous addition: 1 dot = x1.5, 2 dots = x1.75.
double dotted_value(NoteDuration duration, int dots);

double expected_measure_duration(const TimeSignature& time_signature);

// The nine meters the legacy format enumerates.
bool is_standard(const TimeSignature& time_signature);

const std::vector<TimeSignature>& standard_time_signatures();

constexpr double kDurationTolerance = 0.001;

// Milliseconds since the Unix epoch, the persisted timestamp form.
std::int64_t to_epoch_ms(Timestamp time);
Timestamp from_epoch_ms(std::int64_t millis);

} // namespace etude
