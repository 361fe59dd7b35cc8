#pragma once
#include "dsp/sync.hpp"
#include "errors.hpp"
#include <cstdint>
#include <vector>

namespace fsk {

struct DecodeResult {
  BitSequence bits;                 // one entry per bit window
  std::vector<BitFailure> failures; // positions whose entry is not a decision

  bool complete() const { return failures.empty(); }
};

class BitClassifier {
public:
  explicit BitClassifier(const ToneAssignment &tones);

  // 1 above the tone midpoint, 0 at or below it.
  uint8_t classify(float freq_hz) const;
  DecodeResult decide(const std::vector<BitEstimate> &estimates) const;

  double threshold_hz() const { return threshold_hz_; }

private:
  double threshold_hz_;
};

} // namespace fsk
