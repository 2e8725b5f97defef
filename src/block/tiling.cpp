#include "block/tiling.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace vqhuff {

bool is_supported_block_size(int block_size) {
    return block_size == 2 || block_size == 4 || block_size == 8 || block_size == 16;
}

BlockGrid make_grid(int width, int height, int block_size) {
    if (!is_supported_block_size(block_size)) {
        throw std::runtime_error("make_grid: block_size must be 2, 4, 8 or 16, got " + std::to_string(block_size));
    }
    if (width <= 0 || height <= 0) {
        throw std::runtime_error("make_grid: invalid image size");
    }
    BlockGrid g;
    g.block_size = block_size;
    g.blocks_x = (width + block_size - 1) / block_size;
    g.blocks_y = (height + block_size - 1) / block_size;
    g.padded_w = g.blocks_x * block_size;
    g.padded_h = g.blocks_y * block_size;
    return g;
}

std::vector<int32_t> tile_to_blocks(const Image& img, const BlockGrid& g) {
    if (img.channels != 1) throw std::runtime_error("tile_to_blocks: only grayscale supported");
    if (img.width <= 0 || img.height <= 0) throw std::runtime_error("tile_to_blocks: invalid image size");
    if (img.pixels.size() != static_cast<size_t>(img.width) * img.height) {
        throw std::runtime_error("tile_to_blocks: pixel buffer mismatch");
    }
    if (g.padded_w < img.width || g.padded_h < img.height) {
        throw std::runtime_error("tile_to_blocks: invalid grid");
    }

    std::vector<int32_t> padded(static_cast<size_t>(g.padded_w) * g.padded_h, 0);

    for (int y = 0; y < g.padded_h; ++y) {
        const int sy = std::min(y, img.height - 1);
        for (int x = 0; x < g.padded_w; ++x) {
            const int sx = std::min(x, img.width - 1);
            const size_t src_idx = static_cast<size_t>(sy) * img.width + sx;
            const size_t dst_idx = static_cast<size_t>(y) * g.padded_w + x;
            padded[dst_idx] = img.pixels[src_idx];
        }
    }
    return padded;
}

void untile_from_blocks(Image& img, const BlockGrid& g, const std::vector<int32_t>& padded) {
    if (img.channels != 1) throw std::runtime_error("untile_from_blocks: only grayscale supported");
    if (img.width <= 0 || img.height <= 0) throw std::runtime_error("untile_from_blocks: invalid image size");
    if (img.width > g.padded_w || img.height > g.padded_h) {
        throw std::runtime_error("untile_from_blocks: image larger than grid");
    }
    if (padded.size() != static_cast<size_t>(g.padded_w) * g.padded_h) {
        throw std::runtime_error("untile_from_blocks: padded buffer mismatch");
    }

    img.pixels.resize(static_cast<size_t>(img.width) * img.height);
    for (int y = 0; y < img.height; ++y) {
        for (int x = 0; x < img.width; ++x) {
            const size_t src_idx = static_cast<size_t>(y) * g.padded_w + x;
            const size_t dst_idx = static_cast<size_t>(y) * img.width + x;
            img.pixels[dst_idx] = padded[src_idx];
        }
    }
}

void read_block(const std::vector<int32_t>& padded, const BlockGrid& g,
                int bx, int by, std::vector<int32_t>& block) {
    const int N = g.block_size;
    block.resize(static_cast<size_t>(N) * N);
    for (int v = 0; v < N; ++v) {
        const size_t row = static_cast<size_t>(by * N + v) * g.padded_w + static_cast<size_t>(bx) * N;
        std::copy(padded.begin() + row, padded.begin() + row + N, block.begin() + static_cast<size_t>(v) * N);
    }
}

void write_block(std::vector<int32_t>& padded, const BlockGrid& g,
                 int bx, int by, const std::vector<int32_t>& block) {
    const int N = g.block_size;
    if (block.size() != static_cast<size_t>(N) * N) {
        throw std::runtime_error("write_block: block size mismatch");
    }
    for (int v = 0; v < N; ++v) {
        const size_t row = static_cast<size_t>(by * N + v) * g.padded_w + static_cast<size_t>(bx) * N;
        std::copy(block.begin() + static_cast<size_t>(v) * N, block.begin() + static_cast<size_t>(v + 1) * N,
                  padded.begin() + row);
    }
}

#ifndef NDEBUG
namespace {
// Simple self-test to validate tiling/untile round-trip on a tiny image.
struct TilingSelfTest {
    TilingSelfTest() {
        Image img;
        img.width = 5;
        img.height = 3;
        img.channels = 1;
        img.bits_stored = 8;
        img.bits_allocated = 8;
        img.pixels = {
            1, 2, 3, 4, 5,
            6, 7, 8, 9, 10,
            11, 12, 13, 14, 15
        };

        BlockGrid g = make_grid(img.width, img.height, 4);
        auto padded = tile_to_blocks(img, g);
        if (padded.size() != static_cast<size_t>(g.padded_w) * g.padded_h) {
            throw std::runtime_error("tiling self-test: padded size mismatch");
        }
        // edge replication: bottom-right corner repeats the last pixel
        if (padded.back() != 15) {
            throw std::runtime_error("tiling self-test: edge replication mismatch");
        }

        Image out = img;
        out.pixels.clear();
        untile_from_blocks(out, g, padded);
        if (out.pixels != img.pixels) {
            throw std::runtime_error("tiling self-test: round-trip mismatch");
        }
    }
};
static TilingSelfTest _tiling_self_test{};
} // namespace
#endif

} // namespace vqhuff
