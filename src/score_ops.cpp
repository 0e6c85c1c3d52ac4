#include "etude/score_ops.hpp"

#include <algorithm>
#include <initializer_list>
#include <map>
#include <set>
#include <stdexcept>

#include "etude/pitch.hpp"

namespace etude {
namespace {

bool contains(const std::vector<std::string>& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void touch(Score& score, Timestamp now, std::initializer_list<std::string> tags) {
  score.metadata.modified_at = now;
  score.metadata.tags.insert(score.metadata.tags.end(), tags.begin(), tags.end());
}

// Parts keep only staff ids that still appear in some measure; parts left
// with none are dropped.
void prune_parts(Score& score) {
  std::set<std::string> surviving;
  for (const auto& measure : score.measures) {
    for (const auto& staff : measure.staves) {
      surviving.insert(staff.id);
    }
  }
  std::vector<Part> parts;
  for (auto part : score.parts) {
    std::vector<std::string> staves;
    for (const auto& id : part.staves) {
      if (surviving.count(id)) {
        staves.push_back(id);
      }
    }
    if (staves.empty()) {
      continue;
    }
    part.staves = std::move(staves);
    parts.push_back(std::move(part));
  }
  score.parts = std::move(parts);
}

template <typename T>
void first_non_empty(std::optional<T>& target, const std::optional<T>& candidate) {
  if (!target && candidate) {
    target = candidate;
  }
}

} // namespace

Score extract_voice(const Score& score, const std::string& voice_id, Timestamp now) {
  Score out = score;
  for (auto& measure : out.measures) {
    std::vector<Staff> staves;
    for (auto& staff : measure.staves) {
      std::erase_if(staff.voices, [&](const Voice& voice) { return voice.id != voice_id; });
      if (!staff.voices.empty()) {
        staves.push_back(std::move(staff));
      }
    }
    measure.staves = std::move(staves);
  }
  prune_parts(out);
  out.title = score.title + " - " + voice_id;
  touch(out, now, {"extracted-voice", voice_id});
  return out;
}

Score extract_staff(const Score& score, const std::string& staff_id, Timestamp now) {
  Score out = score;
  for (auto& measure : out.measures) {
    std::erase_if(measure.staves, [&](const Staff& staff) { return staff.id != staff_id; });
  }
  std::erase_if(out.parts, [&](const Part& part) { return !contains(part.staves, staff_id); });
  for (auto& part : out.parts) {
    part.staves = {staff_id};
  }
  out.title = score.title + " - Staff " + staff_id;
  touch(out, now, {"extracted-staff", staff_id});
  return out;
}

Score merge_scores(const std::vector<Score>& scores, const std::optional<std::string>& title,
                   Timestamp now) {
  if (scores.empty()) {
    throw std::invalid_argument("Cannot merge empty array of scores");
  }
  if (scores.size() == 1) {
    return scores.front();
  }

  // Staff renames per score, applied to both parts and measures.
  std::vector<std::map<std::string, std::string>> renames(scores.size());
  std::set<std::string> taken;
  for (std::size_t i = 0; i < scores.size(); ++i) {
    std::set<std::string> own;
    for (const auto& part : scores[i].parts) {
      own.insert(part.staves.begin(), part.staves.end());
    }
    for (const auto& measure : scores[i].measures) {
      for (const auto& staff : measure.staves) {
        own.insert(staff.id);
      }
    }
    for (const auto& id : own) {
      std::string unique = id;
      for (std::size_t suffix = i; taken.count(unique); ++suffix) {
        unique = id + "-" + std::to_string(suffix);
      }
      renames[i][id] = unique;
      taken.insert(unique);
    }
  }
  auto renamed = [&](std::size_t score_index, const std::string& id) {
    const auto& table = renames[score_index];
    const auto it = table.find(id);
    return it == table.end() ? id : it->second;
  };

  Score out;
  std::size_t part_index = 0;
  std::size_t measure_count = 0;
  std::vector<std::string> titles;
  for (std::size_t i = 0; i < scores.size(); ++i) {
    titles.push_back(scores[i].title);
    measure_count = std::max(measure_count, scores[i].measures.size());
    for (auto part : scores[i].parts) {
      part.id = "part" + std::to_string(part_index++);
      for (auto& staff_id : part.staves) {
        staff_id = renamed(i, staff_id);
      }
      out.parts.push_back(std::move(part));
    }
  }

  for (std::size_t m = 0; m < measure_count; ++m) {
    ScoreMeasure measure;
    measure.number = static_cast<int>(m) + 1;
    for (std::size_t i = 0; i < scores.size(); ++i) {
      if (m >= scores[i].measures.size()) {
        continue;
      }
      const ScoreMeasure& source = scores[i].measures[m];
      for (auto staff : source.staves) {
        staff.id = renamed(i, staff.id);
        for (auto& voice : staff.voices) {
          for (auto& note : voice.notes) {
            if (note.staff_id) {
              note.staff_id = staff.id;
            }
          }
        }
        measure.staves.push_back(std::move(staff));
      }
      first_non_empty(measure.time_signature, source.time_signature);
      first_non_empty(measure.key_signature, source.key_signature);
      first_non_empty(measure.tempo, source.tempo);
    }
    out.measures.push_back(std::move(measure));
  }

  std::string joined;
  for (std::size_t i = 0; i < titles.size(); ++i) {
    joined += (i > 0 ? " + " : "") + titles[i];
  }
  out.title = title.value_or(joined);
  out.composer = scores.front().composer;
  out.metadata.created_at = now;
  out.metadata.modified_at = now;
  out.metadata.source = "Merged scores";
  out.metadata.tags = {"merged", "ensemble"};
  return out;
}

Score merge_voices(const Score& score, const std::vector<std::string>& voice_ids, Timestamp now) {
  std::string merged_id;
  std::string merged_names;
  for (std::size_t i = 0; i < voice_ids.size(); ++i) {
    merged_id += (i > 0 ? "-" : "") + voice_ids[i];
    merged_names += (i > 0 ? ", " : "") + voice_ids[i];
  }

  Score out = score;
  for (auto& measure : out.measures) {
    for (auto& staff : measure.staves) {
      Voice merged{merged_id, "Merged (" + merged_names + ")", StemDirection::Auto, {}};
      std::vector<Voice> others;
      bool any = false;
      for (auto& voice : staff.voices) {
        if (!contains(voice_ids, voice.id)) {
          others.push_back(std::move(voice));
          continue;
        }
        any = true;
        for (auto& note : voice.notes) {
          note.voice_id = merged_id;
          merged.notes.push_back(std::move(note));
        }
      }
      if (!any) {
        staff.voices = std::move(others);
        continue;
      }
      std::stable_sort(merged.notes.begin(), merged.notes.end(),
                       [](const VoiceNote& a, const VoiceNote& b) { return a.time < b.time; });
      others.push_back(std::move(merged));
      staff.voices = std::move(others);
    }
  }
  touch(out, now, {"merged-voices"});
  return out;
}

Score mute_voice(const Score& score, const std::string& voice_id) {
  Score out = score;
  if (!contains(out.metadata.muted_voices, voice_id)) {
    out.metadata.muted_voices.push_back(voice_id);
  }
  return out;
}

Score solo_voice(const Score& score, const std::string& voice_id) {
  std::vector<std::string> muted;
  for (const auto& measure : score.measures) {
    for (const auto& staff : measure.staves) {
      for (const auto& voice : staff.voices) {
        if (voice.id != voice_id && !contains(muted, voice.id)) {
          muted.push_back(voice.id);
        }
      }
    }
  }
  Score out = score;
  out.metadata.muted_voices = std::move(muted);
  out.metadata.solo_voice = voice_id;
  return out;
}

Score transpose_voice(const Score& score, const std::string& voice_id, int semitones,
                      Timestamp now) {
  Score out = score;
  for (auto& measure : out.measures) {
    for (auto& staff : measure.staves) {
      for (auto& voice : staff.voices) {
        if (voice.id != voice_id) {
          continue;
        }
        for (auto& note : voice.notes) {
          if (note.rest) {
            continue;
          }
          for (auto& key : note.keys) {
            key = transpose_pitch_key(key, semitones);
          }
        }
      }
    }
  }
  touch(out, now, {"transposed-" + voice_id});
  return out;
}

} // namespace etude
