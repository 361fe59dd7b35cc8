#include "dsp/demod.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace fsk {

BinRange search_bins(double sample_rate, size_t window_size,
                     const ToneAssignment &tones, double margin_hz) {
  BinRange r{1, 0};
  if (window_size < 4 || sample_rate <= 0.0)
    return r;
  const double bin_hz = sample_rate / static_cast<double>(window_size);
  const double lo_hz = std::max(tones.space_hz - margin_hz, 0.0);
  const double hi_hz = std::min(tones.mark_hz + margin_hz, sample_rate / 2.0);
  if (hi_hz < lo_hz)
    return r;
  // Skip DC and Nyquist so the peak always has two neighbours.
  r.first = std::max<size_t>(static_cast<size_t>(std::ceil(lo_hz / bin_hz)), 1);
  r.last = std::min<size_t>(static_cast<size_t>(std::floor(hi_hz / bin_hz)),
                            window_size / 2 - 1);
  return r;
}

FrequencyExtractor::FrequencyExtractor(double sample_rate, size_t window_size,
                                       const ToneAssignment &tones,
                                       double margin_hz)
    : sample_rate_(sample_rate), window_size_(window_size),
      band_(search_bins(sample_rate, window_size, tones, margin_hz)) {
  if (band_.empty())
    throw ConfigurationError("no FFT bin of a " + std::to_string(window_size) +
                             "-point window falls in the tone search band");
}

FrequencyFrame FrequencyExtractor::extract(const SpectrumFrame &frame) const {
  const auto &mag = frame.magnitudes;
  if (mag.size() < window_size_ / 2 + 1)
    throw InputFormatError("spectrum frame has " + std::to_string(mag.size()) +
                           " bins, expected " +
                           std::to_string(window_size_ / 2 + 1));

  FrequencyFrame out{};
  out.center_sample = frame.start_sample + window_size_ / 2;

  size_t peak = band_.first;
  for (size_t k = band_.first + 1; k <= band_.last; ++k) {
    if (mag[k] > mag[peak])
      peak = k;
  }
  out.magnitude = mag[peak];
  if (!std::isfinite(out.magnitude) || out.magnitude <= kSilenceFloor) {
    out.valid = false;
    return out;
  }

  // Parabolic interpolation across the peak and its neighbours.
  const float a = mag[peak - 1];
  const float b = mag[peak];
  const float c = mag[peak + 1];
  const float denom = a - 2.0f * b + c;
  float shift = 0.0f;
  if (denom < 0.0f) {
    shift = 0.5f * (a - c) / denom;
    shift = std::max(-0.5f, std::min(0.5f, shift));
  }
  out.freq_hz = static_cast<float>((static_cast<double>(peak) + shift) *
                                   sample_rate_ / window_size_);
  out.valid = true;
  return out;
}

std::vector<FrequencyFrame>
FrequencyExtractor::extract_all(const std::vector<SpectrumFrame> &frames) const {
  std::vector<FrequencyFrame> out;
  out.reserve(frames.size());
  for (const auto &f : frames)
    out.push_back(extract(f));
  return out;
}

} // namespace fsk
