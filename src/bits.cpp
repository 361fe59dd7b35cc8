#include "bits.hpp"
#include "errors.hpp"
#include <cctype>
#include <fstream>
#include <sstream>

namespace fsk {

BitSequence parse_bits(const std::string &text) {
  BitSequence bits;
  bits.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '0' || c == '1') {
      bits.push_back(static_cast<uint8_t>(c - '0'));
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      std::string shown = std::isprint(static_cast<unsigned char>(c))
                              ? std::string(1, c)
                              : "\\x" + std::to_string(
                                            static_cast<unsigned char>(c));
      throw InputFormatError("invalid bit character '" + shown +
                             "' at position " + std::to_string(i));
    }
  }
  return bits;
}

BitSequence load_bits(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw IoError("cannot open bits file " + path);
  std::ostringstream os;
  os << in.rdbuf();
  if (in.bad())
    throw IoError("error reading bits file " + path);
  return parse_bits(os.str());
}

std::string to_string(const BitSequence &bits) {
  std::string s;
  s.reserve(bits.size());
  for (uint8_t b : bits)
    s.push_back(b ? '1' : '0');
  return s;
}

} // namespace fsk
