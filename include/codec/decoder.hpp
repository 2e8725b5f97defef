#pragma once

#include <vector>
#include <cstdint>
#include "format/container.hpp"
#include "io/image_types.hpp"
#include "model/index_model.hpp"

namespace vqhuff {

// Unpack and reshape the indices of an artifact.
IndexGrid decompress_indices(const CompressedArtifact& a);

// Decode .vqhf bytes to image through `model`; the result is cropped to the
// recorded image size when the container carries a model section.
Image decompress_image(const std::vector<uint8_t>& bytes, const IndexModel& model);

// Same, with a BlockVqModel rebuilt from the container's model section.
Image decompress_image(const std::vector<uint8_t>& bytes);

} // namespace vqhuff
