#include "dsp/estimate.hpp"
#include "dsp/fft.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace fsk {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;

double refine(const std::vector<float> &mag, size_t k) {
  if (k == 0 || k + 1 >= mag.size())
    return static_cast<double>(k);
  const double a = mag[k - 1], b = mag[k], c = mag[k + 1];
  const double denom = a - 2.0 * b + c;
  if (denom >= 0.0)
    return static_cast<double>(k);
  double shift = 0.5 * (a - c) / denom;
  return static_cast<double>(k) + std::max(-0.5, std::min(0.5, shift));
}
} // namespace

std::vector<SpectralPeak> dominant_frequencies(const SampleBuffer &signal,
                                               double sample_rate,
                                               size_t count,
                                               double min_separation_hz) {
  std::vector<SpectralPeak> peaks;
  const size_t n = signal.size();
  if (n < 4 || count == 0)
    return peaks;
  if (!(sample_rate > 0.0))
    throw ConfigurationError("sample rate must be positive");

  // Remove DC and apply a symmetric Hamming window.
  const double mean =
      std::accumulate(signal.begin(), signal.end(), 0.0) / static_cast<double>(n);
  RealFft fft(n);
  float *in = fft.input();
  for (size_t i = 0; i < n; ++i) {
    double w = 0.54 - 0.46 * std::cos(kTwoPi * static_cast<double>(i) /
                                      static_cast<double>(n - 1));
    in[i] = static_cast<float>((signal[i] - mean) * w);
  }
  const auto &bins = fft.execute();
  std::vector<float> mag(bins.size());
  for (size_t k = 0; k < bins.size(); ++k)
    mag[k] = std::abs(bins[k]);

  const double bin_hz = sample_rate / static_cast<double>(n);
  if (min_separation_hz <= 0.0)
    min_separation_hz = 4.0 * bin_hz;

  // Local maxima, DC excluded.
  std::vector<size_t> maxima;
  for (size_t k = 1; k < mag.size(); ++k) {
    if (mag[k] <= 0.0f || mag[k] <= mag[k - 1])
      continue;
    if (k + 1 < mag.size() && mag[k] < mag[k + 1])
      continue;
    maxima.push_back(k);
  }
  std::sort(maxima.begin(), maxima.end(),
            [&mag](size_t a, size_t b) { return mag[a] > mag[b]; });

  for (size_t k : maxima) {
    double f = refine(mag, k) * bin_hz;
    bool separated = std::all_of(
        peaks.begin(), peaks.end(), [&](const SpectralPeak &p) {
          return std::fabs(p.freq_hz - f) >= min_separation_hz;
        });
    if (!separated)
      continue;
    peaks.push_back({f, mag[k]});
    if (peaks.size() == count)
      break;
  }
  return peaks;
}

EstimatedParameters estimate_parameters(const SampleBuffer &signal,
                                        double sample_rate,
                                        double min_separation_hz) {
  auto peaks = dominant_frequencies(signal, sample_rate, 2, min_separation_hz);
  if (peaks.size() < 2)
    throw InputFormatError("fewer than two separated spectral peaks in a " +
                           std::to_string(signal.size()) + "-sample signal");

  EstimatedParameters est{};
  est.space = peaks[0].freq_hz < peaks[1].freq_hz ? peaks[0] : peaks[1];
  est.mark = peaks[0].freq_hz < peaks[1].freq_hz ? peaks[1] : peaks[0];
  est.center_freq_hz = 0.5 * (est.space.freq_hz + est.mark.freq_hz);
  est.deviation_hz = 0.5 * (est.mark.freq_hz - est.space.freq_hz);
  return est;
}

} // namespace fsk
