#pragma once
#include "dsp/params.hpp"
#include <string>

namespace fsk {

struct Config {
  ModulationParameters modulation;
  AnalysisOptions analysis;
  float amplitude = 1.0f;
  std::string log_level = "info";

  // Reads `key = value` lines; a missing file leaves the defaults.
  static Config load(const std::string &path);

  // Applies one setting. Unknown keys return false; malformed numbers throw
  // ConfigurationError.
  bool set(const std::string &key, const std::string &value);
};

} // namespace fsk
