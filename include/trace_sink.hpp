#pragma once
#include "dsp/engine.hpp"
#include <cstdio>
#include <string>

namespace fsk {

// Forwards pipeline observations to the debug log.
class LogTraceSink : public TraceSink {
public:
  explicit LogTraceSink(double sample_rate) : sample_rate_(sample_rate) {}
  void on_frame(size_t frame_index, const FrequencyFrame &frame) override;
  void on_bit(const BitEstimate &estimate, uint8_t bit) override;

private:
  double sample_rate_;
};

// Writes frames and bit decisions as CSV rows for external plotting:
// kind,index,sample,freq_hz,magnitude,bit
class CsvTraceSink : public TraceSink {
public:
  explicit CsvTraceSink(const std::string &path);
  ~CsvTraceSink() override;

  CsvTraceSink(const CsvTraceSink &) = delete;
  CsvTraceSink &operator=(const CsvTraceSink &) = delete;

  void on_frame(size_t frame_index, const FrequencyFrame &frame) override;
  void on_bit(const BitEstimate &estimate, uint8_t bit) override;

  // Flushes and closes; throws IoError if any row failed to write.
  void close();

private:
  std::string path_;
  std::FILE *file_;
  bool failed_;
};

// Fans one pipeline run out to two sinks; either may be null.
class TeeTraceSink : public TraceSink {
public:
  TeeTraceSink(TraceSink *a, TraceSink *b) : a_(a), b_(b) {}
  void on_frame(size_t frame_index, const FrequencyFrame &frame) override {
    if (a_)
      a_->on_frame(frame_index, frame);
    if (b_)
      b_->on_frame(frame_index, frame);
  }
  void on_bit(const BitEstimate &estimate, uint8_t bit) override {
    if (a_)
      a_->on_bit(estimate, bit);
    if (b_)
      b_->on_bit(estimate, bit);
  }

private:
  TraceSink *a_;
  TraceSink *b_;
};

} // namespace fsk
