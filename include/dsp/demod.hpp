#pragma once
#include "dsp/params.hpp"
#include "dsp/stft.hpp"
#include <cstddef>
#include <vector>

namespace fsk {

struct FrequencyFrame {
  size_t center_sample; // window centre, used for bit assignment
  float freq_hz;        // interpolated dominant frequency
  float magnitude;      // peak bin magnitude
  bool valid;
};

struct BinRange {
  size_t first;
  size_t last; // inclusive
  bool empty() const { return first > last; }
};

// FFT bins covering [space - margin, mark + margin], excluding DC and the
// Nyquist bin.
BinRange search_bins(double sample_rate, size_t window_size,
                     const ToneAssignment &tones, double margin_hz);

class FrequencyExtractor {
public:
  // Peaks at or below this magnitude are treated as silence.
  static constexpr float kSilenceFloor = 1e-6f;

  FrequencyExtractor(double sample_rate, size_t window_size,
                     const ToneAssignment &tones, double margin_hz);

  FrequencyFrame extract(const SpectrumFrame &frame) const;
  std::vector<FrequencyFrame>
  extract_all(const std::vector<SpectrumFrame> &frames) const;

  const BinRange &band() const { return band_; }

private:
  double sample_rate_;
  size_t window_size_;
  BinRange band_;
};

} // namespace fsk
