#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fsk {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Invalid parameter combination, raised before any signal processing.
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &what) : Error(what) {}
};

// Malformed bit string, sample buffer or file contents.
class InputFormatError : public Error {
public:
  explicit InputFormatError(const std::string &what) : Error(what) {}
};

class IoError : public Error {
public:
  explicit IoError(const std::string &what) : Error(what) {}
};

struct BitFailure {
  size_t index;       // bit position in the decoded sequence
  std::string reason;
};

class IncompleteDecodeError : public Error {
public:
  explicit IncompleteDecodeError(std::vector<BitFailure> failures)
      : Error(describe(failures)), failures_(std::move(failures)) {}

  const std::vector<BitFailure> &failures() const { return failures_; }

private:
  static std::string describe(const std::vector<BitFailure> &failures) {
    std::string msg = "decode incomplete: " +
                      std::to_string(failures.size()) + " bit(s) failed";
    if (!failures.empty())
      msg += ", first at index " + std::to_string(failures.front().index) +
             " (" + failures.front().reason + ")";
    return msg;
  }

  std::vector<BitFailure> failures_;
};

} // namespace fsk
