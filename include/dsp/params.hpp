#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace fsk {

using BitSequence = std::vector<uint8_t>;
using SampleBuffer = std::vector<float>;

struct ToneAssignment {
  double space_hz; // bit 0
  double mark_hz;  // bit 1

  double midpoint() const { return 0.5 * (space_hz + mark_hz); }
};

struct ModulationParameters {
  double center_freq_hz = 10000.0;
  double deviation_hz = 500.0;
  double baud_rate = 100.0;
  double sample_rate = 44100.0;

  double bit_duration() const { return 1.0 / baud_rate; }
  size_t samples_per_bit() const;
  ToneAssignment tones() const {
    return {center_freq_hz - deviation_hz, center_freq_hz + deviation_hz};
  }

  // Throws ConfigurationError on a non-physical or aliasing combination.
  void validate() const;
};

// STFT geometry. Zero fields are derived from the modulation parameters by
// resolve().
struct AnalysisOptions {
  size_t window_size = 0;
  size_t hop_size = 0;
  double search_margin_hz = 0.0;

  AnalysisOptions resolve(const ModulationParameters &params) const;
};

} // namespace fsk
