#pragma once

#include <string>
#include "io/image_types.hpp"

namespace vqhuff {

// PGM (P5), 8-bit when bits_stored <= 8, otherwise 16-bit big-endian.
// Signed images are shifted into the unsigned range first.
void save_pgm(const std::string& path, const Image& im);

} // namespace vqhuff
