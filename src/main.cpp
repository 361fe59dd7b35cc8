#include "bits.hpp"
#include "config.hpp"
#include "dsp/engine.hpp"
#include "dsp/estimate.hpp"
#include "dsp/modulator.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "signal_io.hpp"
#include "trace_sink.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <future>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

enum OptionId {
  kOptConfig = 256,
  kOptFrequency,
  kOptDeviation,
  kOptBaudRate,
  kOptBitDuration,
  kOptSampleRate,
  kOptWindow,
  kOptHop,
  kOptMargin,
  kOptAmplitude,
  kOptLogLevel,
  kOptCsv,
  kOptBitsFile,
  kOptTrace,
  kOptPeaks,
  kOptMinSeparation,
};

const struct option kLongOptions[] = {
    {"config", required_argument, nullptr, kOptConfig},
    {"frequency", required_argument, nullptr, kOptFrequency},
    {"deviation", required_argument, nullptr, kOptDeviation},
    {"baud-rate", required_argument, nullptr, kOptBaudRate},
    {"bit-duration", required_argument, nullptr, kOptBitDuration},
    {"sample-rate", required_argument, nullptr, kOptSampleRate},
    {"window", required_argument, nullptr, kOptWindow},
    {"hop", required_argument, nullptr, kOptHop},
    {"margin", required_argument, nullptr, kOptMargin},
    {"amplitude", required_argument, nullptr, kOptAmplitude},
    {"log-level", required_argument, nullptr, kOptLogLevel},
    {"debug", required_argument, nullptr, kOptLogLevel},
    {"output", required_argument, nullptr, 'o'},
    {"csv", required_argument, nullptr, kOptCsv},
    {"bits-file", required_argument, nullptr, kOptBitsFile},
    {"trace", required_argument, nullptr, kOptTrace},
    {"peaks", required_argument, nullptr, kOptPeaks},
    {"min-separation", required_argument, nullptr, kOptMinSeparation},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}};

struct Options {
  std::string config_path = "fskmodem.conf";
  std::vector<std::pair<std::string, std::string>> overrides;
  std::string output;
  std::string csv_output;
  std::string bits_file;
  std::string trace_path;
  size_t peaks = 10;
  double min_separation_hz = 0.0; // 0: four FFT bins
  std::vector<std::string> positional;
};

void usage(const char *prog) {
  std::fprintf(
      stderr,
      "Usage:\n"
      "  %s encode <bits> [--bits-file F] [-o out.wav] [--csv out.csv]\n"
      "  %s decode <file.wav|file.csv>... [--trace trace.csv]\n"
      "  %s analyze <file.wav|file.csv> [--peaks N] [--min-separation HZ]\n"
      "\n"
      "Common options:\n"
      "  --config F         settings file (default fskmodem.conf)\n"
      "  --frequency HZ     center frequency (default 10000)\n"
      "  --deviation HZ     frequency deviation (default 500)\n"
      "  --baud-rate B      bits per second (default 100)\n"
      "  --bit-duration S   seconds per bit, alternative to --baud-rate\n"
      "  --sample-rate HZ   sample rate (default 44100; WAV input overrides)\n"
      "  --window N         STFT window in samples (default: derived)\n"
      "  --hop N            STFT hop in samples (default: window/4)\n"
      "  --margin HZ        search band margin around the tones\n"
      "  --amplitude A      encoder peak amplitude (default 1.0)\n"
      "  --log-level L      debug|info|warning|error or 10..50\n"
      "  --peaks N          peaks listed by analyze (default 10)\n"
      "  --min-separation HZ  minimum peak spacing for analyze\n"
      "                     (default: four FFT bins)\n",
      prog, prog, prog);
}

bool has_suffix(const std::string &s, const std::string &suffix) {
  if (s.size() < suffix.size())
    return false;
  for (size_t i = 0; i < suffix.size(); ++i) {
    char c = s[s.size() - suffix.size() + i];
    if (std::tolower(static_cast<unsigned char>(c)) != suffix[i])
      return false;
  }
  return true;
}

size_t parse_count(const char *name, const char *arg) {
  char *end = nullptr;
  unsigned long v = std::strtoul(arg, &end, 10);
  if (end == arg || *end != '\0' || v == 0)
    throw fsk::ConfigurationError(std::string(name) +
                                  " must be a positive integer, got '" + arg +
                                  "'");
  return static_cast<size_t>(v);
}

double parse_hz(const char *name, const char *arg) {
  char *end = nullptr;
  double v = std::strtod(arg, &end);
  if (end == arg || *end != '\0' || !std::isfinite(v))
    throw fsk::ConfigurationError(std::string(name) + " must be a number, got '" +
                                  arg + "'");
  return v;
}

// Returns false when help was requested.
bool parse_args(int argc, char **argv, Options &opts) {
  int sub_argc = argc - 1;
  char **sub_argv = argv + 1;
  optind = 1;
  int opt;
  while ((opt = getopt_long(sub_argc, sub_argv, "o:h", kLongOptions,
                            nullptr)) != -1) {
    switch (opt) {
    case kOptConfig: opts.config_path = optarg; break;
    case kOptFrequency: opts.overrides.emplace_back("center_freq", optarg); break;
    case kOptDeviation: opts.overrides.emplace_back("deviation", optarg); break;
    case kOptBaudRate: opts.overrides.emplace_back("baud_rate", optarg); break;
    case kOptBitDuration: opts.overrides.emplace_back("bit_duration", optarg); break;
    case kOptSampleRate: opts.overrides.emplace_back("sample_rate", optarg); break;
    case kOptWindow: opts.overrides.emplace_back("window_size", optarg); break;
    case kOptHop: opts.overrides.emplace_back("hop_size", optarg); break;
    case kOptMargin: opts.overrides.emplace_back("search_margin", optarg); break;
    case kOptAmplitude: opts.overrides.emplace_back("amplitude", optarg); break;
    case kOptLogLevel: opts.overrides.emplace_back("log_level", optarg); break;
    case 'o': opts.output = optarg; break;
    case kOptCsv: opts.csv_output = optarg; break;
    case kOptBitsFile: opts.bits_file = optarg; break;
    case kOptTrace: opts.trace_path = optarg; break;
    case kOptPeaks: opts.peaks = parse_count("--peaks", optarg); break;
    case kOptMinSeparation:
      opts.min_separation_hz = parse_hz("--min-separation", optarg);
      break;
    case 'h':
      return false;
    default:
      throw fsk::ConfigurationError("unrecognised option, see --help");
    }
  }
  for (int i = optind; i < sub_argc; ++i)
    opts.positional.push_back(sub_argv[i]);
  return true;
}

std::string format_frequency(double hz) {
  char buf[32];
  if (hz >= 1e6)
    std::snprintf(buf, sizeof(buf), "%.2f MHz", hz / 1e6);
  else if (hz >= 1e3)
    std::snprintf(buf, sizeof(buf), "%.2f kHz", hz / 1e3);
  else
    std::snprintf(buf, sizeof(buf), "%.2f Hz", hz);
  return buf;
}

void log_parameters(const fsk::ModulationParameters &p) {
  fsk::log::info("Baud rate used: " + std::to_string(p.baud_rate) + " baud");
  fsk::log::info("Sample rate used: " + std::to_string(p.sample_rate) + " Hz");
  fsk::log::info("Frequency used: " + std::to_string(p.center_freq_hz) + " Hz");
  fsk::log::info("Deviation used: " + std::to_string(p.deviation_hz) + " Hz");
}

uint32_t wav_rate(double sample_rate) {
  if (sample_rate != std::floor(sample_rate) || sample_rate > 4294967295.0)
    throw fsk::ConfigurationError("WAV output needs an integral sample rate, got " +
                                  std::to_string(sample_rate));
  return static_cast<uint32_t>(sample_rate);
}

// Loads a recording; WAV files carry their own sample rate.
fsk::SampleBuffer load_signal(const std::string &path,
                              fsk::ModulationParameters &params) {
  if (has_suffix(path, ".csv"))
    return fsk::read_csv(path);
  fsk::WavData wav = fsk::read_wav(path);
  if (wav.channels > 1)
    fsk::log::warn(path + ": " + std::to_string(wav.channels) +
                   " channels, decoding the first");
  if (static_cast<double>(wav.sample_rate) != params.sample_rate) {
    fsk::log::info(path + ": using WAV sample rate " +
                   std::to_string(wav.sample_rate) + " Hz instead of " +
                   std::to_string(params.sample_rate) + " Hz");
    params.sample_rate = wav.sample_rate;
  }
  return std::move(wav.samples);
}

int run_encode(const Options &opts, const fsk::Config &cfg) {
  fsk::BitSequence bits;
  if (!opts.bits_file.empty()) {
    if (!opts.positional.empty())
      throw fsk::ConfigurationError("give the bits either inline or with "
                                    "--bits-file, not both");
    bits = fsk::load_bits(opts.bits_file);
  } else if (opts.positional.size() == 1) {
    bits = fsk::parse_bits(opts.positional[0]);
  } else {
    throw fsk::ConfigurationError("encode takes exactly one bit string");
  }

  const fsk::ModulationParameters &params = cfg.modulation;
  fsk::Modulator modulator(params, cfg.amplitude);
  fsk::SampleBuffer signal = modulator.modulate(bits);

  fsk::log::info("Generated FSK signal for bits: " + fsk::to_string(bits));
  fsk::log::info("Number of bits: " + std::to_string(bits.size()));
  fsk::log::info("Total duration: " +
                 std::to_string(bits.size() * params.bit_duration()) +
                 " seconds");
  fsk::log::info("Number of samples: " + std::to_string(signal.size()));
  log_parameters(params);

  if (!opts.csv_output.empty()) {
    fsk::write_csv(opts.csv_output, signal);
    fsk::log::info("FSK signal saved to " + opts.csv_output);
  }
  if (opts.csv_output.empty() || !opts.output.empty()) {
    const std::string path = opts.output.empty() ? "output.wav" : opts.output;
    fsk::write_wav(path, signal, wav_rate(params.sample_rate));
    fsk::log::info("FSK signal saved to " + path);
  }
  return 0;
}

struct FileDecode {
  fsk::DecodeResult result;
  size_t samples;
};

FileDecode decode_file(const std::string &path, const fsk::Config &cfg,
                       const std::string &trace_path) {
  fsk::ModulationParameters params = cfg.modulation;
  fsk::SampleBuffer signal = load_signal(path, params);
  fsk::Demodulator demod(params, cfg.analysis);

  fsk::LogTraceSink log_sink(params.sample_rate);
  std::unique_ptr<fsk::CsvTraceSink> csv_sink;
  if (!trace_path.empty())
    csv_sink = std::make_unique<fsk::CsvTraceSink>(trace_path);
  fsk::TeeTraceSink sink(&log_sink, csv_sink.get());

  FileDecode out{demod.demodulate(signal, &sink), signal.size()};
  if (csv_sink)
    csv_sink->close();

  const auto &opt = demod.options();
  fsk::log::info(path + ": decoded " + std::to_string(out.result.bits.size()) +
                 " bits from " + std::to_string(out.samples) + " samples (window " +
                 std::to_string(opt.window_size) + ", hop " +
                 std::to_string(opt.hop_size) + ")");
  for (const auto &f : out.result.failures)
    fsk::log::warn(path + ": bit " + std::to_string(f.index) + ": " + f.reason);
  return out;
}

int run_decode(const Options &opts, const fsk::Config &cfg) {
  if (opts.positional.empty())
    throw fsk::ConfigurationError("decode needs at least one input file");
  if (!opts.trace_path.empty() && opts.positional.size() > 1)
    throw fsk::ConfigurationError("--trace takes a single input file");

  log_parameters(cfg.modulation);
  std::vector<std::future<FileDecode>> futures;
  futures.reserve(opts.positional.size());
  for (const auto &path : opts.positional) {
    futures.emplace_back(std::async(std::launch::async, [&cfg, &opts, path]() {
      return decode_file(path, cfg, opts.trace_path);
    }));
  }

  int rc = 0;
  for (size_t i = 0; i < futures.size(); ++i) {
    const std::string &path = opts.positional[i];
    try {
      FileDecode d = futures[i].get();
      std::string text = fsk::to_string(d.result.bits);
      for (const auto &f : d.result.failures)
        text[f.index] = '?';
      if (opts.positional.size() > 1)
        std::cout << path << ": ";
      std::cout << text << std::endl;
      if (!d.result.complete()) {
        fsk::log::error(path + ": decoding incomplete, " +
                        std::to_string(d.result.failures.size()) +
                        " bit(s) undetermined");
        if (rc == 0)
          rc = 2;
      }
    } catch (const fsk::Error &e) {
      fsk::log::error(path + ": " + e.what());
      rc = 1;
    }
  }
  return rc;
}

int run_analyze(const Options &opts, const fsk::Config &cfg) {
  if (opts.positional.size() != 1)
    throw fsk::ConfigurationError("analyze takes exactly one input file");
  const std::string &path = opts.positional[0];
  fsk::ModulationParameters params = cfg.modulation;
  fsk::SampleBuffer signal = load_signal(path, params);
  fsk::log::info("Detected sample rate: " + format_frequency(params.sample_rate));

  auto peaks = fsk::dominant_frequencies(signal, params.sample_rate, opts.peaks,
                                         opts.min_separation_hz);
  for (size_t i = 0; i < peaks.size(); ++i) {
    std::printf("%zu %s %.4g\n", i + 1,
                format_frequency(peaks[i].freq_hz).c_str(), peaks[i].magnitude);
  }
  if (peaks.size() < 2) {
    fsk::log::error("FSK parameter estimation failed: fewer than two peaks");
    return 1;
  }
  auto est = fsk::estimate_parameters(signal, params.sample_rate,
                                      opts.min_separation_hz);
  std::printf("center %.2f Hz\ndeviation %.2f Hz\nrange %.2f Hz - %.2f Hz\n",
              est.center_freq_hz, est.deviation_hz, est.space.freq_hz,
              est.mark.freq_hz);
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 1;
  }
  const std::string command = argv[1];
  if (command == "-h" || command == "--help") {
    usage(argv[0]);
    return 0;
  }

  try {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
      usage(argv[0]);
      return 0;
    }

    auto cfg = fsk::Config::load(opts.config_path);
    for (const auto &kv : opts.overrides)
      cfg.set(kv.first, kv.second);
    fsk::log::init(fsk::log::level_from_string(cfg.log_level));

    if (command == "encode")
      return run_encode(opts, cfg);
    if (command == "decode")
      return run_decode(opts, cfg);
    if (command == "analyze")
      return run_analyze(opts, cfg);
    fsk::log::error("unknown command '" + command + "'");
    usage(argv[0]);
    return 1;
  } catch (const fsk::Error &e) {
    fsk::log::error(e.what());
    return 1;
  } catch (const std::exception &e) {
    fsk::log::error(std::string("unexpected failure: ") + e.what());
    return 1;
  }
}
