#pragma once
#include "dsp/params.hpp"

namespace fsk {

// Continuous-phase binary FSK synthesiser.
class Modulator {
public:
  explicit Modulator(const ModulationParameters &params,
                     float amplitude = 1.0f);

  SampleBuffer modulate(const BitSequence &bits) const;

  const ModulationParameters &params() const { return params_; }
  float amplitude() const { return amplitude_; }

private:
  ModulationParameters params_;
  float amplitude_;
  size_t samples_per_bit_;
};

SampleBuffer modulate(const BitSequence &bits,
                      const ModulationParameters &params);

} // namespace fsk
