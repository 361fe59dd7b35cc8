#pragma once
#include "dsp/params.hpp"
#include <cstdint>
#include <string>

namespace fsk {

struct WavData {
  SampleBuffer samples; // first channel; PCM scaled by 2^(bits-1) into [-1, 1)
  uint32_t sample_rate;
  uint16_t channels;
  uint16_t bits_per_sample;
};

// Mono 16-bit PCM; samples are clipped to [-1, 1].
void write_wav(const std::string &path, const SampleBuffer &samples,
               uint32_t sample_rate);
// PCM 8/16/24/32-bit or 32-bit IEEE float.
WavData read_wav(const std::string &path);

// One amplitude per line.
void write_csv(const std::string &path, const SampleBuffer &samples);
// Accepts values separated by newlines and/or commas.
SampleBuffer read_csv(const std::string &path);

} // namespace fsk
