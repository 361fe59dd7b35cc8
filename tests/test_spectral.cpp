#include <catch2/catch.hpp>
#include "dsp/demod.hpp"
#include "dsp/stft.hpp"
#include "errors.hpp"
#include <cmath>

namespace {
const double kPi = 3.14159265358979323846;

fsk::SampleBuffer tone(double freq, double fs, size_t n, double amp = 1.0) {
  fsk::SampleBuffer out(n);
  for (size_t i = 0; i < n; ++i)
    out[i] = static_cast<float>(amp * std::sin(2.0 * kPi * freq * i / fs));
  return out;
}

const fsk::ToneAssignment kTones{9500.0, 10500.0};
} // namespace

TEST_CASE("STFT emits one frame per hop over full windows") {
  fsk::ShortTimeFourier stft(256, 64);
  REQUIRE(stft.frame_count(255) == 0);
  REQUIRE(stft.frame_count(256) == 1);
  REQUIRE(stft.frame_count(1764) == 24);

  auto frames = stft.transform(tone(10500.0, 44100.0, 1764));
  REQUIRE(frames.size() == 24);
  for (size_t i = 0; i < frames.size(); ++i) {
    REQUIRE(frames[i].start_sample == i * 64);
    REQUIRE(frames[i].magnitudes.size() == 129);
  }
  REQUIRE(stft.transform(fsk::SampleBuffer(100, 0.5f)).empty());
}

TEST_CASE("STFT peak sits on the tone bin") {
  fsk::ShortTimeFourier stft(256, 256);
  auto frames = stft.transform(tone(10500.0, 44100.0, 256));
  REQUIRE(frames.size() == 1);
  const auto &mag = frames[0].magnitudes;
  size_t peak = 0;
  for (size_t k = 1; k < mag.size(); ++k) {
    if (mag[k] > mag[peak])
      peak = k;
  }
  REQUIRE(peak == 61); // 10500 / (44100 / 256) = 60.95
  // Hann window coherent gain is 0.5, so a unit sine peaks near N/4.
  REQUIRE(mag[peak] == Approx(64.0).epsilon(0.05));
}

TEST_CASE("Zero window or hop is rejected") {
  REQUIRE_THROWS_AS(fsk::ShortTimeFourier(0, 4), fsk::ConfigurationError);
  REQUIRE_THROWS_AS(fsk::ShortTimeFourier(256, 0), fsk::ConfigurationError);
}

TEST_CASE("Search band covers the tones plus margin") {
  auto band = fsk::search_bins(44100.0, 256, kTones, 500.0);
  REQUIRE(band.first == 53);
  REQUIRE(band.last == 63);
  REQUIRE(fsk::search_bins(44100.0, 4, kTones, 500.0).empty());

  // Clamped below Nyquist
  auto wide = fsk::search_bins(44100.0, 256, kTones, 20000.0);
  REQUIRE(wide.first == 1);
  REQUIRE(wide.last == 127);
}

TEST_CASE("Extractor interpolates the dominant frequency") {
  fsk::ShortTimeFourier stft(256, 64);
  fsk::FrequencyExtractor extractor(44100.0, 256, kTones, 500.0);
  for (double f : {9500.0, 9800.0, 10250.0, 10500.0}) {
    auto frames = extractor.extract_all(stft.transform(tone(f, 44100.0, 1024)));
    REQUIRE_FALSE(frames.empty());
    for (const auto &fr : frames) {
      REQUIRE(fr.valid);
      // a quarter of a 172 Hz bin
      REQUIRE(fr.freq_hz == Approx(f).margin(45.0));
    }
  }
}

TEST_CASE("Extractor ignores energy outside the search band") {
  auto strong = tone(5000.0, 44100.0, 512, 1.0);
  auto weak = tone(9500.0, 44100.0, 512, 0.3);
  fsk::SampleBuffer mix(512);
  for (size_t i = 0; i < mix.size(); ++i)
    mix[i] = strong[i] + weak[i];

  fsk::ShortTimeFourier stft(256, 128);
  fsk::FrequencyExtractor extractor(44100.0, 256, kTones, 500.0);
  for (const auto &fr : extractor.extract_all(stft.transform(mix))) {
    REQUIRE(fr.valid);
    REQUIRE(fr.freq_hz == Approx(9500.0).margin(45.0));
  }
}

TEST_CASE("Silent frames carry no frequency estimate") {
  fsk::ShortTimeFourier stft(256, 64);
  fsk::FrequencyExtractor extractor(44100.0, 256, kTones, 500.0);
  auto frames = extractor.extract_all(stft.transform(fsk::SampleBuffer(512, 0.0f)));
  REQUIRE(frames.size() == 5);
  for (const auto &fr : frames)
    REQUIRE_FALSE(fr.valid);
  REQUIRE(frames[2].center_sample == 2 * 64 + 128);
}

TEST_CASE("Analysis options derive from the bit length") {
  fsk::ModulationParameters p;
  auto opt = fsk::AnalysisOptions{}.resolve(p);
  REQUIRE(opt.window_size == 256);
  REQUIRE(opt.hop_size == 64);
  REQUIRE(opt.search_margin_hz == Approx(500.0));

  fsk::AnalysisOptions too_wide;
  too_wide.window_size = 512;
  REQUIRE_THROWS_AS(too_wide.resolve(p), fsk::ConfigurationError);

  fsk::AnalysisOptions sparse;
  sparse.hop_size = 400;
  REQUIRE_THROWS_AS(sparse.resolve(p), fsk::ConfigurationError);

  fsk::AnalysisOptions tiny;
  tiny.window_size = 4;
  REQUIRE_THROWS_AS(tiny.resolve(p), fsk::ConfigurationError);

  fsk::AnalysisOptions negative;
  negative.search_margin_hz = -10.0;
  REQUIRE_THROWS_AS(negative.resolve(p), fsk::ConfigurationError);
}
