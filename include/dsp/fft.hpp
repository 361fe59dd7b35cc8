#pragma once
#include <complex>
#include <cstddef>
#include <vector>

struct fftwf_plan_s; // forward declaration from fftw3

namespace fsk {

// Owns a single-precision real-to-complex FFTW plan and its buffers.
// Planning is serialised process-wide; execute() may run concurrently on
// distinct instances.
class RealFft {
public:
  explicit RealFft(size_t size);
  ~RealFft();

  RealFft(const RealFft &) = delete;
  RealFft &operator=(const RealFft &) = delete;

  size_t size() const { return in_.size(); }
  float *input() { return in_.data(); }

  // Returns bins 0..size/2 of the transform of input().
  const std::vector<std::complex<float>> &execute();

private:
  std::vector<float> in_;
  std::vector<std::complex<float>> out_;
  fftwf_plan_s *plan_;
};

} // namespace fsk
