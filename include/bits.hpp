#pragma once
#include "dsp/params.hpp"
#include <string>

namespace fsk {

// Whitespace is skipped; any other character than '0'/'1' throws
// InputFormatError.
BitSequence parse_bits(const std::string &text);
BitSequence load_bits(const std::string &path);

std::string to_string(const BitSequence &bits);

} // namespace fsk
