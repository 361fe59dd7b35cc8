#include <catch2/catch.hpp>
#include "bits.hpp"
#include "dsp/engine.hpp"
#include "dsp/modulator.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include "trace_sink.hpp"
#include <cmath>
#include <fstream>
#include <future>
#include <limits>
#include <random>
#include <string>
#include <vector>

using fsk::ModulationParameters;

namespace {
ModulationParameters make_params(double center, double dev, double baud,
                                 double fs) {
  ModulationParameters p;
  p.center_freq_hz = center;
  p.deviation_hz = dev;
  p.baud_rate = baud;
  p.sample_rate = fs;
  return p;
}

double bit_error_rate(const fsk::BitSequence &sent,
                      const fsk::DecodeResult &got) {
  size_t errors = got.failures.size();
  for (size_t i = 0; i < sent.size(); ++i) {
    if (i >= got.bits.size() || got.bits[i] != sent[i])
      ++errors;
  }
  return static_cast<double>(errors) / sent.size();
}

struct CountingSink : fsk::TraceSink {
  size_t frames = 0;
  size_t valid = 0;
  std::vector<uint8_t> bits;
  void on_frame(size_t, const fsk::FrequencyFrame &f) override {
    ++frames;
    if (f.valid)
      ++valid;
  }
  void on_bit(const fsk::BitEstimate &, uint8_t bit) override {
    bits.push_back(bit);
  }
};
} // namespace

TEST_CASE("1011 round-trips at the default parameters") {
  ModulationParameters p;
  auto bits = fsk::parse_bits("1011");
  auto signal = fsk::modulate(bits, p);
  REQUIRE(signal.size() == 1764);

  auto result = fsk::demodulate(signal, p);
  REQUIRE(result.complete());
  REQUIRE(fsk::to_string(result.bits) == "1011");
}

TEST_CASE("Noise-free round trip recovers random sequences") {
  std::vector<ModulationParameters> sets = {
      ModulationParameters{},
      make_params(4000, 1000, 300, 48000),
      make_params(1700, 500, 100, 8000),
      make_params(10000, 200, 50, 44100),
  };
  unsigned seed = 1;
  for (const auto &p : sets) {
    auto bits = fsk::test::random_bits(128, seed++);
    fsk::Demodulator demod(p);
    auto result = demod.demodulate(fsk::Modulator(p).modulate(bits));
    REQUIRE(result.complete());
    REQUIRE(result.bits == bits);
  }
}

TEST_CASE("Constant runs and alternations decode") {
  ModulationParameters p;
  fsk::Demodulator demod(p);
  for (const char *text : {"0", "1", "00000000", "11111111", "0101010101",
                           "1100110011", "1000000001"}) {
    auto bits = fsk::parse_bits(text);
    REQUIRE(demod.demodulate_strict(fsk::modulate(bits, p)) == bits);
  }
}

TEST_CASE("Decoding does not depend on amplitude") {
  ModulationParameters p;
  auto bits = fsk::test::random_bits(32, 7);
  fsk::Demodulator demod(p);
  for (float amp : {0.01f, 0.5f, 4.0f})
    REQUIRE(demod.demodulate_strict(fsk::Modulator(p, amp).modulate(bits)) ==
            bits);
}

TEST_CASE("Empty buffer decodes to an empty sequence") {
  ModulationParameters p;
  auto signal = fsk::modulate({}, p);
  REQUIRE(signal.empty());
  auto result = fsk::demodulate(signal, p);
  REQUIRE(result.complete());
  REQUIRE(result.bits.empty());
  REQUIRE(fsk::to_string(result.bits).empty());
}

TEST_CASE("Truncated recording reports the missing last bit") {
  ModulationParameters p;
  auto signal = fsk::modulate(fsk::parse_bits("1011"), p);
  signal.resize(signal.size() - 300);

  fsk::Demodulator demod(p);
  auto result = demod.demodulate(signal);
  REQUIRE(result.bits.size() == 4);
  REQUIRE_FALSE(result.complete());
  REQUIRE(result.failures.size() == 1);
  REQUIRE(result.failures[0].index == 3);
  REQUIRE(result.bits[0] == 1);
  REQUIRE(result.bits[1] == 0);
  REQUIRE(result.bits[2] == 1);

  try {
    demod.demodulate_strict(signal);
    FAIL("expected IncompleteDecodeError");
  } catch (const fsk::IncompleteDecodeError &e) {
    REQUIRE(e.failures().size() == 1);
    REQUIRE(e.failures()[0].index == 3);
  }
}

TEST_CASE("A silent tail yields failed bit windows") {
  ModulationParameters p;
  auto signal = fsk::modulate(fsk::parse_bits("110"), p);
  signal.resize(signal.size() + 2 * p.samples_per_bit(), 0.0f);
  auto result = fsk::demodulate(signal, p);
  REQUIRE(result.bits.size() == 5);
  REQUIRE_FALSE(result.complete());
  // The first silent window still sees leakage from the last tone.
  REQUIRE(result.failures.back().index == 4);
  REQUIRE(result.bits[0] == 1);
  REQUIRE(result.bits[1] == 1);
  REQUIRE(result.bits[2] == 0);
}

TEST_CASE("Non-finite samples are rejected") {
  ModulationParameters p;
  auto signal = fsk::modulate({1, 0}, p);
  signal[17] = std::numeric_limits<float>::quiet_NaN();
  REQUIRE_THROWS_AS(fsk::demodulate(signal, p), fsk::InputFormatError);
  signal[17] = std::numeric_limits<float>::infinity();
  REQUIRE_THROWS_AS(fsk::demodulate(signal, p), fsk::InputFormatError);
}

TEST_CASE("Demodulator rejects unusable analysis geometry") {
  ModulationParameters p;
  fsk::AnalysisOptions opt;
  opt.window_size = 1024;
  REQUIRE_THROWS_AS(fsk::Demodulator(p, opt), fsk::ConfigurationError);
  REQUIRE_THROWS_AS(fsk::Demodulator(make_params(10000, 500, 100, 20000)),
                    fsk::ConfigurationError);
}

TEST_CASE("Tones that share an FFT bin are rejected up front") {
  // Bins of 1000, 500 and 689 Hz against tone spacings of 995, 240 and
  // 333.6 Hz.
  REQUIRE_THROWS_AS(fsk::Demodulator(make_params(3470.6, 497.5, 552.3, 8000)),
                    fsk::ConfigurationError);
  REQUIRE_THROWS_AS(fsk::Demodulator(make_params(305.7, 120, 407.8, 8000)),
                    fsk::ConfigurationError);
  REQUIRE_THROWS_AS(fsk::Demodulator(make_params(527.8, 166.8, 393.8, 22050)),
                    fsk::ConfigurationError);

  // The mark tone rounds to bin 32 of a 64-point window, past the last
  // searchable bin.
  REQUIRE_THROWS_AS(fsk::Demodulator(make_params(3500, 400, 100, 7900)),
                    fsk::ConfigurationError);

  // A window too short for the default tones.
  ModulationParameters p;
  fsk::AnalysisOptions opt;
  opt.window_size = 32;
  REQUIRE_THROWS_AS(fsk::Demodulator(p, opt), fsk::ConfigurationError);
}

TEST_CASE("Accepted setups decode what they are given") {
  std::vector<ModulationParameters> sets = {
      make_params(1200, 300, 100, 8000),  make_params(2000, 250, 150, 8000),
      make_params(3000, 500, 200, 16000), make_params(6000, 800, 600, 22050),
  };
  unsigned seed = 300;
  for (const auto &p : sets) {
    auto bits = fsk::test::random_bits(48, seed++);
    fsk::Demodulator demod(p);
    auto result = demod.demodulate(fsk::modulate(bits, p));
    REQUIRE(result.complete());
    REQUIRE(result.bits == bits);
  }
}

TEST_CASE("Explicit window and hop still round-trip") {
  ModulationParameters p;
  fsk::AnalysisOptions opt;
  opt.window_size = 441;
  opt.hop_size = 100;
  auto bits = fsk::test::random_bits(40, 11);
  fsk::Demodulator demod(p, opt);
  REQUIRE(demod.options().window_size == 441);
  REQUIRE(demod.demodulate_strict(fsk::modulate(bits, p)) == bits);
}

TEST_CASE("Bit error rate does not fall as noise grows") {
  ModulationParameters p;
  auto bits = fsk::test::random_bits(200, 42);
  auto clean = fsk::modulate(bits, p);
  fsk::Demodulator demod(p);

  std::vector<double> rates;
  for (double sigma : {0.0, 0.25, 1.0, 16.0}) {
    auto noisy = clean;
    if (sigma > 0.0) {
      std::mt19937 rng(1234);
      std::normal_distribution<float> noise(0.0f, static_cast<float>(sigma));
      for (auto &s : noisy)
        s += noise(rng);
    }
    rates.push_back(bit_error_rate(bits, demod.demodulate(noisy)));
  }
  REQUIRE(rates[0] == 0.0);
  REQUIRE(rates[1] == 0.0);
  for (size_t i = 1; i < rates.size(); ++i)
    REQUIRE(rates[i] >= rates[i - 1]);
  REQUIRE(rates.back() > 0.0);
}

TEST_CASE("Trace sink observes every frame and bit") {
  ModulationParameters p;
  auto signal = fsk::modulate(fsk::parse_bits("1011"), p);
  fsk::Demodulator demod(p);
  CountingSink sink;
  auto result = demod.demodulate(signal, &sink);
  REQUIRE(sink.frames == 24); // (1764 - 256) / 64 + 1
  REQUIRE(sink.valid == 24);
  REQUIRE(sink.bits == result.bits);
}

TEST_CASE("Independent decodes run concurrently") {
  ModulationParameters p;
  std::vector<fsk::BitSequence> inputs;
  for (unsigned i = 0; i < 6; ++i)
    inputs.push_back(fsk::test::random_bits(64, 100 + i));

  std::vector<std::future<fsk::BitSequence>> futures;
  for (const auto &bits : inputs) {
    futures.emplace_back(std::async(std::launch::async, [&p, &bits]() {
      return fsk::Demodulator(p).demodulate_strict(fsk::modulate(bits, p));
    }));
  }
  for (size_t i = 0; i < futures.size(); ++i)
    REQUIRE(futures[i].get() == inputs[i]);
}

TEST_CASE("CSV trace records one row per frame and bit") {
  fsk::test::TempFile tmp("trace.csv");
  ModulationParameters p;
  auto signal = fsk::modulate(fsk::parse_bits("10"), p);
  {
    fsk::CsvTraceSink csv(tmp.path());
    fsk::LogTraceSink log(p.sample_rate);
    fsk::TeeTraceSink tee(&csv, &log);
    fsk::Demodulator(p).demodulate(signal, &tee);
    csv.close();
  }
  std::ifstream in(tmp.path());
  std::string line;
  size_t frames = 0, bits = 0;
  REQUIRE(std::getline(in, line));
  REQUIRE(line == "kind,index,sample,freq_hz,magnitude,bit");
  while (std::getline(in, line)) {
    if (line.compare(0, 6, "frame,") == 0)
      ++frames;
    else if (line.compare(0, 4, "bit,") == 0)
      ++bits;
  }
  REQUIRE(frames == 10); // (882 - 256) / 64 + 1
  REQUIRE(bits == 2);
}

TEST_CASE("Re-encoding decoded bits decodes to the same bits") {
  ModulationParameters p;
  auto bits = fsk::test::random_bits(64, 5);
  auto noisy = fsk::modulate(bits, p);
  std::mt19937 rng(77);
  std::normal_distribution<float> noise(0.0f, 2.0f);
  for (auto &s : noisy)
    s += noise(rng);

  fsk::Demodulator demod(p);
  auto first = demod.demodulate(noisy);
  REQUIRE(first.complete());
  auto second = demod.demodulate(fsk::modulate(first.bits, p));
  REQUIRE(second.complete());
  REQUIRE(second.bits == first.bits);
}
