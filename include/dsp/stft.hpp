#pragma once
#include "dsp/params.hpp"
#include <cstddef>
#include <vector>

namespace fsk {

struct SpectrumFrame {
  size_t start_sample;           // first sample covered by the window
  std::vector<float> magnitudes; // bins 0..window/2
};

// Hann-windowed short-time Fourier transform over full windows only.
class ShortTimeFourier {
public:
  ShortTimeFourier(size_t window_size, size_t hop_size);

  std::vector<SpectrumFrame> transform(const SampleBuffer &signal) const;

  size_t window_size() const { return window_size_; }
  size_t hop_size() const { return hop_size_; }
  size_t frame_count(size_t num_samples) const;

private:
  size_t window_size_;
  size_t hop_size_;
  std::vector<float> window_;
};

} // namespace fsk
