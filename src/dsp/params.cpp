#include "dsp/params.hpp"
#include "dsp/demod.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

namespace fsk {

namespace {
bool positive(double v) { return std::isfinite(v) && v > 0.0; }

std::string hz(double v) { return std::to_string(v) + " Hz"; }
} // namespace

size_t ModulationParameters::samples_per_bit() const {
  double n = sample_rate * bit_duration();
  if (!std::isfinite(n) || n < 0.5)
    return 0;
  return static_cast<size_t>(std::lround(n));
}

void ModulationParameters::validate() const {
  if (!positive(center_freq_hz))
    throw ConfigurationError("center frequency must be positive, got " +
                             hz(center_freq_hz));
  if (!positive(deviation_hz))
    throw ConfigurationError("deviation must be positive, got " +
                             hz(deviation_hz));
  if (!positive(baud_rate))
    throw ConfigurationError("baud rate must be positive, got " +
                             std::to_string(baud_rate));
  if (!positive(sample_rate))
    throw ConfigurationError("sample rate must be positive, got " +
                             hz(sample_rate));
  if (deviation_hz >= center_freq_hz)
    throw ConfigurationError("deviation " + hz(deviation_hz) +
                             " must be below the center frequency " +
                             hz(center_freq_hz));
  double highest = center_freq_hz + deviation_hz;
  if (sample_rate <= 2.0 * highest)
    throw ConfigurationError("sample rate " + hz(sample_rate) +
                             " violates Nyquist for mark tone " + hz(highest));
  if (samples_per_bit() < 1)
    throw ConfigurationError("bit duration " + std::to_string(bit_duration()) +
                             " s gives zero samples per bit at " +
                             hz(sample_rate));
}

AnalysisOptions
AnalysisOptions::resolve(const ModulationParameters &params) const {
  params.validate();
  const size_t spb = params.samples_per_bit();

  AnalysisOptions out = *this;
  if (out.window_size == 0) {
    out.window_size = 1;
    while (out.window_size * 2 <= spb)
      out.window_size *= 2;
  }
  if (out.hop_size == 0)
    out.hop_size = out.window_size / 4 > 0 ? out.window_size / 4 : 1;
  if (out.search_margin_hz == 0.0)
    out.search_margin_hz = params.deviation_hz;

  if (out.window_size > spb)
    throw ConfigurationError("window size " + std::to_string(out.window_size) +
                             " exceeds " + std::to_string(spb) +
                             " samples per bit");
  // The last bit window needs a frame centre before the buffer ends.
  if (out.hop_size > spb - out.window_size / 2)
    throw ConfigurationError("hop size " + std::to_string(out.hop_size) +
                             " leaves bit windows without frames (window " +
                             std::to_string(out.window_size) + ", " +
                             std::to_string(spb) + " samples per bit)");
  if (!std::isfinite(out.search_margin_hz) || out.search_margin_hz < 0.0)
    throw ConfigurationError("search margin must be non-negative, got " +
                             hz(out.search_margin_hz));
  const ToneAssignment tones = params.tones();
  const double bin_hz = params.sample_rate / static_cast<double>(out.window_size);
  if (2.0 * params.deviation_hz < bin_hz)
    throw ConfigurationError("window size " + std::to_string(out.window_size) +
                             " gives " + hz(bin_hz) +
                             " bins, wider than the tone spacing " +
                             hz(2.0 * params.deviation_hz));
  const BinRange band = search_bins(params.sample_rate, out.window_size, tones,
                                    out.search_margin_hz);
  if (band.empty())
    throw ConfigurationError("window size " + std::to_string(out.window_size) +
                             " resolves no FFT bin between " +
                             hz(tones.space_hz) + " and " + hz(tones.mark_hz));
  // Both tones need their own bin inside the search band.
  const size_t space_bin =
      static_cast<size_t>(std::lround(tones.space_hz / bin_hz));
  const size_t mark_bin =
      static_cast<size_t>(std::lround(tones.mark_hz / bin_hz));
  if (space_bin == mark_bin || space_bin < band.first || mark_bin > band.last)
    throw ConfigurationError(
        "tones fall on FFT bins " + std::to_string(space_bin) + " and " +
        std::to_string(mark_bin) + ", search band covers bins " +
        std::to_string(band.first) + ".." + std::to_string(band.last));
  return out;
}

} // namespace fsk
