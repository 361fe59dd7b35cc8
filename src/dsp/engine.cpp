#include "dsp/engine.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace fsk {

Demodulator::Demodulator(const ModulationParameters &params,
                         const AnalysisOptions &options)
    : params_(params), options_(options.resolve(params)),
      stft_(options_.window_size, options_.hop_size),
      extractor_(params_.sample_rate, options_.window_size, params_.tones(),
                 options_.search_margin_hz),
      sync_(params_.samples_per_bit()), classifier_(params_.tones()) {}

DecodeResult Demodulator::demodulate(const SampleBuffer &signal,
                                     TraceSink *sink) const {
  for (size_t i = 0; i < signal.size(); ++i) {
    if (!std::isfinite(signal[i]))
      throw InputFormatError("sample " + std::to_string(i) +
                             " is not a finite number");
  }
  if (signal.empty())
    return DecodeResult{};

  auto spectra = stft_.transform(signal);
  auto frames = extractor_.extract_all(spectra);
  spectra.clear();
  if (sink) {
    for (size_t i = 0; i < frames.size(); ++i)
      sink->on_frame(i, frames[i]);
  }

  auto estimates = sync_.partition(frames, signal.size());
  DecodeResult result = classifier_.decide(estimates);
  if (sink) {
    for (size_t i = 0; i < estimates.size(); ++i)
      sink->on_bit(estimates[i], result.bits[i]);
  }
  return result;
}

BitSequence Demodulator::demodulate_strict(const SampleBuffer &signal) const {
  DecodeResult result = demodulate(signal);
  if (!result.complete())
    throw IncompleteDecodeError(std::move(result.failures));
  return std::move(result.bits);
}

DecodeResult demodulate(const SampleBuffer &signal,
                        const ModulationParameters &params) {
  return Demodulator(params).demodulate(signal);
}

} // namespace fsk
