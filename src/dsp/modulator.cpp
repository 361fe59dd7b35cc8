#include "dsp/modulator.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

namespace fsk {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
}

Modulator::Modulator(const ModulationParameters &params, float amplitude)
    : params_(params), amplitude_(amplitude) {
  params_.validate();
  if (!std::isfinite(amplitude_) || amplitude_ <= 0.0f)
    throw ConfigurationError("amplitude must be positive, got " +
                             std::to_string(amplitude_));
  samples_per_bit_ = params_.samples_per_bit();
}

SampleBuffer Modulator::modulate(const BitSequence &bits) const {
  for (size_t i = 0; i < bits.size(); ++i) {
    if (bits[i] > 1)
      throw InputFormatError("bit " + std::to_string(i) + " has value " +
                             std::to_string(bits[i]) + ", expected 0 or 1");
  }

  const ToneAssignment tones = params_.tones();
  const double space_inc = kTwoPi * tones.space_hz / params_.sample_rate;
  const double mark_inc = kTwoPi * tones.mark_hz / params_.sample_rate;

  SampleBuffer out(bits.size() * samples_per_bit_);
  // Phase carries across bit boundaries so tone changes do not click.
  double phase = 0.0;
  size_t n = 0;
  for (uint8_t bit : bits) {
    const double inc = bit ? mark_inc : space_inc;
    for (size_t k = 0; k < samples_per_bit_; ++k) {
      out[n++] = amplitude_ * static_cast<float>(std::sin(phase));
      phase += inc;
      if (phase >= kTwoPi)
        phase -= kTwoPi;
    }
  }
  return out;
}

SampleBuffer modulate(const BitSequence &bits,
                      const ModulationParameters &params) {
  return Modulator(params).modulate(bits);
}

} // namespace fsk
