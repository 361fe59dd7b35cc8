#include "dsp/fft.hpp"
#include "errors.hpp"

#include <fftw3.h>
#include <mutex>
#include <string>

namespace fsk {

namespace {
// fftw's planner is not thread-safe; only fftwf_execute is.
std::mutex &planner_mutex() {
  static std::mutex m;
  return m;
}
} // namespace

RealFft::RealFft(size_t size)
    : in_(size, 0.0f), out_(size / 2 + 1), plan_(nullptr) {
  if (size == 0)
    throw ConfigurationError("FFT size must be positive");
  std::lock_guard<std::mutex> lock(planner_mutex());
  plan_ = fftwf_plan_dft_r2c_1d(
      static_cast<int>(size), in_.data(),
      reinterpret_cast<fftwf_complex *>(out_.data()), FFTW_ESTIMATE);
  if (!plan_)
    throw ConfigurationError("fftw could not plan a transform of size " +
                             std::to_string(size));
}

RealFft::~RealFft() {
  if (plan_) {
    std::lock_guard<std::mutex> lock(planner_mutex());
    fftwf_destroy_plan(plan_);
  }
}

const std::vector<std::complex<float>> &RealFft::execute() {
  fftwf_execute(plan_);
  return out_;
}

} // namespace fsk
