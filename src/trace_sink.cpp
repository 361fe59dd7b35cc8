#include "trace_sink.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <sstream>

namespace fsk {

void LogTraceSink::on_frame(size_t frame_index, const FrequencyFrame &frame) {
  if (!log::enabled(log::Level::Debug))
    return;
  std::ostringstream os;
  os << "frame " << frame_index << " t=" << frame.center_sample / sample_rate_
     << "s ";
  if (frame.valid)
    os << "freq=" << frame.freq_hz << " Hz mag=" << frame.magnitude;
  else
    os << "no peak";
  log::debug(os.str());
}

void LogTraceSink::on_bit(const BitEstimate &estimate, uint8_t bit) {
  if (!log::enabled(log::Level::Debug))
    return;
  std::ostringstream os;
  os << "bit " << estimate.index << ": ";
  if (estimate.frame_count == 0)
    os << "no usable frames";
  else
    os << estimate.freq_hz << " Hz from " << estimate.frame_count
       << " frames -> " << static_cast<int>(bit);
  log::debug(os.str());
}

CsvTraceSink::CsvTraceSink(const std::string &path)
    : path_(path), file_(std::fopen(path.c_str(), "w")), failed_(false) {
  if (!file_)
    throw IoError("cannot create trace file " + path);
  if (std::fprintf(file_, "kind,index,sample,freq_hz,magnitude,bit\n") < 0)
    failed_ = true;
}

CsvTraceSink::~CsvTraceSink() {
  if (file_)
    std::fclose(file_);
}

void CsvTraceSink::on_frame(size_t frame_index, const FrequencyFrame &frame) {
  if (!file_)
    return;
  if (std::fprintf(file_, "frame,%zu,%zu,%.3f,%.6g,\n", frame_index,
                   frame.center_sample,
                   frame.valid ? static_cast<double>(frame.freq_hz) : 0.0,
                   static_cast<double>(frame.magnitude)) < 0)
    failed_ = true;
}

void CsvTraceSink::on_bit(const BitEstimate &estimate, uint8_t bit) {
  if (!file_)
    return;
  int rc = estimate.frame_count == 0
               ? std::fprintf(file_, "bit,%zu,,,,\n", estimate.index)
               : std::fprintf(file_, "bit,%zu,,%.3f,,%d\n", estimate.index,
                              static_cast<double>(estimate.freq_hz),
                              static_cast<int>(bit));
  if (rc < 0)
    failed_ = true;
}

void CsvTraceSink::close() {
  if (!file_)
    return;
  if (std::fclose(file_) != 0)
    failed_ = true;
  file_ = nullptr;
  if (failed_)
    throw IoError("error writing trace file " + path_);
}

} // namespace fsk
