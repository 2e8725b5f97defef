#pragma once

#include <vector>
#include "io/image_types.hpp"

namespace vqhuff {

// Block tiling metadata
struct BlockGrid {
    int block_size = 8;
    int blocks_x = 0;
    int blocks_y = 0;
    int padded_w = 0;
    int padded_h = 0;
};

bool is_supported_block_size(int block_size);

// Create grid info from image dimensions and block size (2, 4, 8 or 16).
BlockGrid make_grid(int width, int height, int block_size);

// Pad image to padded_w x padded_h (raster order) by replicating the last
// row/column.
std::vector<int32_t> tile_to_blocks(const Image& img, const BlockGrid& g);

// Crop padded raster back to img.width x img.height.
void untile_from_blocks(Image& img, const BlockGrid& g, const std::vector<int32_t>& padded);

// Copy block (bx, by) out of / into a padded raster; block is
// block_size*block_size values, row-major.
void read_block(const std::vector<int32_t>& padded, const BlockGrid& g,
                int bx, int by, std::vector<int32_t>& block);
void write_block(std::vector<int32_t>& padded, const BlockGrid& g,
                 int bx, int by, const std::vector<int32_t>& block);

} // namespace vqhuff
