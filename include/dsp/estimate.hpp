#pragma once
#include "dsp/params.hpp"
#include <cstddef>
#include <vector>

namespace fsk {

struct SpectralPeak {
  double freq_hz;
  double magnitude;
};

struct EstimatedParameters {
  double center_freq_hz;
  double deviation_hz;
  SpectralPeak space; // lower of the two tones
  SpectralPeak mark;
};

// Strongest local maxima of the whole-buffer spectrum, at least
// min_separation_hz apart, sorted by descending magnitude. A separation of
// zero or less means four FFT bins.
std::vector<SpectralPeak> dominant_frequencies(const SampleBuffer &signal,
                                               double sample_rate,
                                               size_t count,
                                               double min_separation_hz = 0.0);

// Centre frequency and deviation from the two strongest separated peaks.
EstimatedParameters estimate_parameters(const SampleBuffer &signal,
                                        double sample_rate,
                                        double min_separation_hz = 0.0);

} // namespace fsk
