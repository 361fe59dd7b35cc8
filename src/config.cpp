#include "config.hpp"
#include "errors.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace fsk {
namespace {
std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

double to_double(const std::string &key, const std::string &value) {
  size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(value, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used == 0 || used != value.size() || !std::isfinite(v))
    throw ConfigurationError("invalid number for " + key + ": '" + value + "'");
  return v;
}

size_t to_size(const std::string &key, const std::string &value) {
  double v = to_double(key, value);
  if (v < 0.0 || v != std::floor(v))
    throw ConfigurationError(key + " must be a non-negative integer, got '" +
                             value + "'");
  return static_cast<size_t>(v);
}
} // namespace

bool Config::set(const std::string &key, const std::string &value) {
  if (key == "center_freq" || key == "frequency") {
    modulation.center_freq_hz = to_double(key, value);
  } else if (key == "deviation") {
    modulation.deviation_hz = to_double(key, value);
  } else if (key == "baud_rate") {
    modulation.baud_rate = to_double(key, value);
  } else if (key == "bit_duration") {
    double d = to_double(key, value);
    if (d <= 0.0)
      throw ConfigurationError("bit_duration must be positive, got '" + value +
                               "'");
    modulation.baud_rate = 1.0 / d;
  } else if (key == "sample_rate") {
    modulation.sample_rate = to_double(key, value);
  } else if (key == "window_size") {
    analysis.window_size = to_size(key, value);
  } else if (key == "hop_size") {
    analysis.hop_size = to_size(key, value);
  } else if (key == "search_margin") {
    analysis.search_margin_hz = to_double(key, value);
  } else if (key == "amplitude") {
    amplitude = static_cast<float>(to_double(key, value));
  } else if (key == "log_level") {
    log_level = value;
  } else {
    return false;
  }
  return true;
}

Config Config::load(const std::string &path) {
  Config cfg;
  std::ifstream in(path);
  if (!in.is_open())
    return cfg;
  std::string line;
  while (std::getline(in, line)) {
    auto hash = line.find('#');
    if (hash != std::string::npos)
      line = line.substr(0, hash);
    line = trim(line);
    if (line.empty())
      continue;
    auto eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    cfg.set(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
  }
  return cfg;
}

} // namespace fsk
