#pragma once
#include "dsp/demod.hpp"
#include <cstddef>
#include <vector>

namespace fsk {

struct BitEstimate {
  size_t index;       // bit position
  float freq_hz;      // median of the valid frames in the bit window
  size_t frame_count; // valid frames that contributed, 0 = unusable
};

// Splits a frame sequence into consecutive bit windows anchored at sample 0.
class BitSynchronizer {
public:
  explicit BitSynchronizer(size_t samples_per_bit);

  std::vector<BitEstimate> partition(const std::vector<FrequencyFrame> &frames,
                                     size_t total_samples) const;

  size_t bit_count(size_t total_samples) const;

private:
  size_t samples_per_bit_;
};

} // namespace fsk
