#include "dsp/decode.hpp"

#include <cmath>

namespace fsk {

BitClassifier::BitClassifier(const ToneAssignment &tones)
    : threshold_hz_(tones.midpoint()) {}

uint8_t BitClassifier::classify(float freq_hz) const {
  // Ties at the midpoint go to the space tone.
  return static_cast<double>(freq_hz) > threshold_hz_ ? 1 : 0;
}

DecodeResult
BitClassifier::decide(const std::vector<BitEstimate> &estimates) const {
  DecodeResult result;
  result.bits.reserve(estimates.size());
  for (const auto &e : estimates) {
    if (e.frame_count == 0 || !std::isfinite(e.freq_hz)) {
      result.bits.push_back(0);
      result.failures.push_back({e.index, "no usable frequency frames"});
      continue;
    }
    result.bits.push_back(classify(e.freq_hz));
  }
  return result;
}

} // namespace fsk
