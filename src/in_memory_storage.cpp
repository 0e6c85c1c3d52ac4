#include "etude/storage.hpp"

namespace etude {

void InMemoryStorage::write(const std::string& key, const nlohmann::json& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = value;
}

std::optional<nlohmann::json> InMemoryStorage::read(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryStorage::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(key) > 0;
}

std::vector<std::string> InMemoryStorage::list_keys(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    keys.push_back(it->first);
  }
  return keys;
}

std::size_t InMemoryStorage::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace etude
