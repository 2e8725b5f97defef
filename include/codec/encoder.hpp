#pragma once

#include <vector>
#include <cstdint>
#include "format/container.hpp"
#include "io/image_types.hpp"
#include "model/index_model.hpp"

namespace vqhuff {

// Huffman-code an index grid: flatten -> count -> build -> pack.
// No model section is attached.
CompressedArtifact compress_indices(const IndexGrid& grid);

// Encode image to .vqhf bytes through `model`. A model section is written
// only when model.info_for() reports one.
std::vector<uint8_t> compress_image(const Image& im, const IndexModel& model);

} // namespace vqhuff
