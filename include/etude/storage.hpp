#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace etude {

// Key-value persistence used by the library. Calls may block on I/O;
// failures are reported by throwing.
class Storage {
public:
  virtual ~Storage() = default;

  virtual void write(const std::string& key, const nlohmann::json& value) = 0;

  virtual std::optional<nlohmann::json> read(const std::string& key) = 0;

  // Returns false when the key was absent.
  virtual bool remove(const std::string& key) = 0;

  // Keys starting with prefix, in lexicographic order.
  virtual std::vector<std::string> list_keys(const std::string& prefix) = 0;
};

class InMemoryStorage : public Storage {
public:
  void write(const std::string& key, const nlohmann::json& value) override;
  std::optional<nlohmann::json> read(const std::string& key) override;
  bool remove(const std::string& key) override;
  std::vector<std::string> list_keys(const std::string& prefix) override;

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, nlohmann::json> entries_;
};

} // namespace etude
