#include "signal_io.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

namespace fsk {

namespace {
constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t> &out, uint32_t v) {
  for (int i = 0; i < 4; ++i)
    out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void put_tag(std::vector<uint8_t> &out, const char *tag) {
  out.insert(out.end(), tag, tag + 4);
}

uint16_t get_u16(const uint8_t *p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32(const uint8_t *p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

std::vector<uint8_t> read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throw IoError("cannot open " + path);
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
  if (in.bad())
    throw IoError("error reading " + path);
  return data;
}

float decode_sample(const uint8_t *p, uint16_t format, uint16_t bits) {
  if (format == kFormatFloat) {
    float f;
    uint32_t raw = get_u32(p);
    std::memcpy(&f, &raw, sizeof(f));
    return f;
  }
  switch (bits) {
  case 8:
    return (static_cast<int>(p[0]) - 128) / 128.0f;
  case 16:
    return static_cast<int16_t>(get_u16(p)) / 32768.0f;
  case 24: {
    int32_t v = static_cast<int32_t>(p[0] | (p[1] << 8) | (p[2] << 16));
    if (v & 0x800000)
      v -= 0x1000000;
    return static_cast<float>(v / 8388608.0);
  }
  default:
    return static_cast<float>(static_cast<int32_t>(get_u32(p)) / 2147483648.0);
  }
}
} // namespace

void write_wav(const std::string &path, const SampleBuffer &samples,
               uint32_t sample_rate) {
  const uint16_t channels = 1;
  const uint16_t bits = 16;
  const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);

  std::vector<uint8_t> out;
  out.reserve(44 + data_size);
  put_tag(out, "RIFF");
  put_u32(out, 36 + data_size);
  put_tag(out, "WAVE");
  put_tag(out, "fmt ");
  put_u32(out, 16);
  put_u16(out, kFormatPcm);
  put_u16(out, channels);
  put_u32(out, sample_rate);
  put_u32(out, sample_rate * channels * bits / 8);
  put_u16(out, channels * bits / 8);
  put_u16(out, bits);
  put_tag(out, "data");
  put_u32(out, data_size);
  for (float s : samples) {
    float v = std::max(-1.0f, std::min(1.0f, s));
    put_u16(out, static_cast<uint16_t>(
                     static_cast<int16_t>(std::lround(v * 32767.0f))));
  }

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.is_open())
    throw IoError("cannot create " + path);
  f.write(reinterpret_cast<const char *>(out.data()),
          static_cast<std::streamsize>(out.size()));
  if (!f)
    throw IoError("error writing " + path);
}

WavData read_wav(const std::string &path) {
  const std::vector<uint8_t> bytes = read_file(path);
  if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
      std::memcmp(bytes.data() + 8, "WAVE", 4) != 0)
    throw InputFormatError(path + " is not a RIFF/WAVE file");

  WavData wav{};
  uint16_t format = 0;
  uint16_t block_align = 0;
  bool have_fmt = false;
  const uint8_t *data = nullptr;
  size_t data_size = 0;

  size_t pos = 12;
  while (pos + 8 <= bytes.size()) {
    const uint8_t *chunk = bytes.data() + pos;
    size_t size = get_u32(chunk + 4);
    size_t avail = bytes.size() - pos - 8;
    if (std::memcmp(chunk, "fmt ", 4) == 0) {
      if (size < 16 || size > avail)
        throw InputFormatError(path + ": truncated fmt chunk");
      format = get_u16(chunk + 8);
      wav.channels = get_u16(chunk + 10);
      wav.sample_rate = get_u32(chunk + 12);
      block_align = get_u16(chunk + 20);
      wav.bits_per_sample = get_u16(chunk + 22);
      if (format == kFormatExtensible && size >= 40)
        format = get_u16(chunk + 32);
      have_fmt = true;
    } else if (std::memcmp(chunk, "data", 4) == 0) {
      data = chunk + 8;
      // Streamed recordings may carry a placeholder length.
      data_size = std::min(size, avail);
      break;
    }
    pos += 8 + size + (size & 1);
  }

  if (!have_fmt)
    throw InputFormatError(path + ": missing fmt chunk");
  if (!data)
    throw InputFormatError(path + ": missing data chunk");
  if (format != kFormatPcm && format != kFormatFloat)
    throw InputFormatError(path + ": unsupported WAV format tag " +
                           std::to_string(format));
  const uint16_t bits = wav.bits_per_sample;
  if ((format == kFormatPcm && bits != 8 && bits != 16 && bits != 24 &&
       bits != 32) ||
      (format == kFormatFloat && bits != 32))
    throw InputFormatError(path + ": unsupported sample width " +
                           std::to_string(bits));
  if (wav.channels == 0 || wav.sample_rate == 0 ||
      block_align < wav.channels * (bits / 8))
    throw InputFormatError(path + ": inconsistent fmt chunk");

  const size_t frames = data_size / block_align;
  wav.samples.resize(frames);
  for (size_t i = 0; i < frames; ++i) {
    float v = decode_sample(data + i * block_align, format, bits);
    if (!std::isfinite(v))
      throw InputFormatError(path + ": sample " + std::to_string(i) +
                             " is not finite");
    wav.samples[i] = v;
  }
  return wav;
}

void write_csv(const std::string &path, const SampleBuffer &samples) {
  std::FILE *f = std::fopen(path.c_str(), "w");
  if (!f)
    throw IoError("cannot create " + path);
  bool ok = true;
  for (float s : samples) {
    if (std::fprintf(f, "%.9g\n", static_cast<double>(s)) < 0) {
      ok = false;
      break;
    }
  }
  if (std::fclose(f) != 0)
    ok = false;
  if (!ok)
    throw IoError("error writing " + path);
}

SampleBuffer read_csv(const std::string &path) {
  const std::vector<uint8_t> bytes = read_file(path);
  std::string text(bytes.begin(), bytes.end());

  SampleBuffer out;
  size_t line = 1;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find_first_of(",\n", pos);
    if (end == std::string::npos)
      end = text.size();
    std::string tok = text.substr(pos, end - pos);
    auto b = tok.find_first_not_of(" \t\r");
    if (b != std::string::npos) {
      tok = tok.substr(b, tok.find_last_not_of(" \t\r") - b + 1);
      char *stop = nullptr;
      double v = std::strtod(tok.c_str(), &stop);
      if (stop == tok.c_str() || *stop != '\0' || !std::isfinite(v))
        throw InputFormatError(path + ":" + std::to_string(line) +
                               ": invalid sample '" + tok + "'");
      out.push_back(static_cast<float>(v));
    }
    if (end < text.size() && text[end] == '\n')
      ++line;
    pos = end + 1;
  }
  return out;
}

} // namespace fsk
