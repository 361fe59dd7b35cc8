#include "dsp/sync.hpp"
#include "errors.hpp"

#include <algorithm>

namespace fsk {

namespace {
float median(std::vector<float> &v) {
  const size_t mid = v.size() / 2;
  std::nth_element(v.begin(), v.begin() + mid, v.end());
  float hi = v[mid];
  if (v.size() % 2 != 0)
    return hi;
  float lo = *std::max_element(v.begin(), v.begin() + mid);
  return 0.5f * (lo + hi);
}
} // namespace

BitSynchronizer::BitSynchronizer(size_t samples_per_bit)
    : samples_per_bit_(samples_per_bit) {
  if (samples_per_bit_ == 0)
    throw ConfigurationError("samples per bit must be at least 1");
}

size_t BitSynchronizer::bit_count(size_t total_samples) const {
  return (total_samples + samples_per_bit_ - 1) / samples_per_bit_;
}

std::vector<BitEstimate>
BitSynchronizer::partition(const std::vector<FrequencyFrame> &frames,
                           size_t total_samples) const {
  const size_t count = bit_count(total_samples);
  std::vector<std::vector<float>> buckets(count);
  for (const auto &f : frames) {
    if (!f.valid)
      continue;
    const size_t bit = f.center_sample / samples_per_bit_;
    if (bit < count)
      buckets[bit].push_back(f.freq_hz);
  }

  std::vector<BitEstimate> out(count);
  for (size_t i = 0; i < count; ++i) {
    out[i].index = i;
    out[i].frame_count = buckets[i].size();
    out[i].freq_hz = buckets[i].empty() ? 0.0f : median(buckets[i]);
  }
  return out;
}

} // namespace fsk
