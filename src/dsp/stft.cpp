#include "dsp/stft.hpp"
#include "dsp/fft.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace fsk {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
}

ShortTimeFourier::ShortTimeFourier(size_t window_size, size_t hop_size)
    : window_size_(window_size), hop_size_(hop_size) {
  if (window_size_ == 0 || hop_size_ == 0)
    throw ConfigurationError("STFT window and hop must be positive");
  // Periodic Hann
  window_.resize(window_size_);
  for (size_t i = 0; i < window_size_; ++i) {
    window_[i] = static_cast<float>(
        0.5 - 0.5 * std::cos(kTwoPi * static_cast<double>(i) / window_size_));
  }
}

size_t ShortTimeFourier::frame_count(size_t num_samples) const {
  if (num_samples < window_size_)
    return 0;
  return (num_samples - window_size_) / hop_size_ + 1;
}

std::vector<SpectrumFrame>
ShortTimeFourier::transform(const SampleBuffer &signal) const {
  std::vector<SpectrumFrame> frames;
  const size_t count = frame_count(signal.size());
  if (count == 0)
    return frames;

  RealFft fft(window_size_);
  frames.reserve(count);
  for (size_t f = 0; f < count; ++f) {
    const size_t start = f * hop_size_;
    float *in = fft.input();
    for (size_t i = 0; i < window_size_; ++i)
      in[i] = signal[start + i] * window_[i];
    const auto &bins = fft.execute();

    SpectrumFrame frame;
    frame.start_sample = start;
    frame.magnitudes.resize(bins.size());
    std::transform(bins.begin(), bins.end(), frame.magnitudes.begin(),
                   [](const std::complex<float> &c) { return std::abs(c); });
    frames.push_back(std::move(frame));
  }
  return frames;
}

} // namespace fsk
