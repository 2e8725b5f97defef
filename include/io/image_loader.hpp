#pragma once

#include <string>
#include "io/image_types.hpp"

namespace vqhuff {

// Loader:
// - PGM (P5) 8/16-bit, selected by ".pgm" extension
// - DICOM (DCMTK) uncompressed, single-frame MONOCHROME2
// - a directory is read as a DICOM series; the first readable slice by
//   InstanceNumber is returned
Image load_image(const std::string& path);

} // namespace vqhuff
