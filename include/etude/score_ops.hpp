#pragma once

#include <optional>
#include <string>
#include <vector>

#include "score.hpp"

namespace etude {

// All operations return a fresh Score; inputs are never modified.

// Keeps only voices with the given id, drops staves left empty and parts
// that no longer own a surviving staff.
Score extract_voice(const Score& score, const std::string& voice_id, Timestamp now = {});

Score extract_staff(const Score& score, const std::string& staff_id, Timestamp now = {});

// Measure-by-measure union of staves, padded to the longest score. Parts are
// renumbered "part0", "part1", ...; staff ids that collide with an earlier
// score are suffixed with "-<score index>". Throws std::invalid_argument on
// an empty input.
Score merge_scores(const std::vector<Score>& scores,
                   const std::optional<std::string>& title = std::nullopt, Timestamp now = {});

// Replaces the listed voices, staff by staff, with one voice whose id is the
// ids joined by '-' and whose notes are ordered by time.
Score merge_voices(const Score& score, const std::vector<std::string>& voice_ids,
                   Timestamp now = {});

// Playback flags only; notes are untouched.
Score mute_voice(const Score& score, const std::string& voice_id);
Score solo_voice(const Score& score, const std::string& voice_id);

// Rests are left alone. Raises FormatError if a pitch leaves the named range.
Score transpose_voice(const Score& score, const std::string& voice_id, int semitones,
                      Timestamp now = {});

} // namespace etude
