#pragma once
#include "dsp/decode.hpp"
#include "dsp/demod.hpp"
#include "dsp/stft.hpp"
#include "dsp/sync.hpp"
#include <cstdint>

namespace fsk {

// Observer for intermediate pipeline results. Called synchronously from
// demodulate(); implementations must not throw.
class TraceSink {
public:
  virtual ~TraceSink() = default;
  virtual void on_frame(size_t frame_index, const FrequencyFrame &frame) = 0;
  virtual void on_bit(const BitEstimate &estimate, uint8_t bit) = 0;
};

class Demodulator {
public:
  explicit Demodulator(const ModulationParameters &params,
                       const AnalysisOptions &options = AnalysisOptions{});

  DecodeResult demodulate(const SampleBuffer &signal,
                          TraceSink *sink = nullptr) const;

  // Throws IncompleteDecodeError if any bit window yields no estimate.
  BitSequence demodulate_strict(const SampleBuffer &signal) const;

  const ModulationParameters &params() const { return params_; }
  const AnalysisOptions &options() const { return options_; }

private:
  ModulationParameters params_;
  AnalysisOptions options_;
  ShortTimeFourier stft_;
  FrequencyExtractor extractor_;
  BitSynchronizer sync_;
  BitClassifier classifier_;
};

DecodeResult demodulate(const SampleBuffer &signal,
                        const ModulationParameters &params);

} // namespace fsk
