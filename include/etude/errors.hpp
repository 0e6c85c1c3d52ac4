#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace etude {

// Malformed pitch string, duration code or enum token.
class FormatError : public std::invalid_argument {
public:
  explicit FormatError(const std::string& message) : std::invalid_argument(message) {}
};

// Carries every violated constraint, not only the first one found.
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(std::vector<std::string> errors)
      : std::invalid_argument(join(errors)), errors_(std::move(errors)) {}

  const std::vector<std::string>& errors() const { return errors_; }

private:
  static std::string join(const std::vector<std::string>& errors) {
    std::string out = "Invalid parameters: ";
    for (std::size_t i = 0; i < errors.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += errors[i];
    }
    return out;
  }

  std::vector<std::string> errors_;
};

class NotImplemented : public std::logic_error {
public:
  explicit NotImplemented(const std::string& what)
      : std::logic_error(what + " not implemented") {}
};

} // namespace etude
