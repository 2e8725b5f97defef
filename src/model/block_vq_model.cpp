#include "model/index_model.hpp"

#include "block/tiling.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vqhuff {

namespace {

void check_levels(uint32_t levels) {
    if (levels < 2 || levels > 65536) {
        throw std::runtime_error("model: codebook size must be in 2..65536, got " + std::to_string(levels));
    }
}

// Index of the codeword nearest to `mean`; lowest index on ties.
uint32_t nearest_codeword(const std::vector<int32_t>& codebook, double mean) {
    auto it = std::lower_bound(codebook.begin(), codebook.end(), mean,
                               [](int32_t c, double m) { return static_cast<double>(c) < m; });
    if (it == codebook.end()) {
        it = std::lower_bound(codebook.begin(), codebook.end(), codebook.back());
        return static_cast<uint32_t>(it - codebook.begin());
    }
    if (it != codebook.begin()) {
        const int32_t below = *(it - 1);
        if (mean - static_cast<double>(below) <= static_cast<double>(*it) - mean) {
            it = std::lower_bound(codebook.begin(), codebook.end(), below);
        }
    }
    return static_cast<uint32_t>(it - codebook.begin());
}

} // namespace

BlockVqModel::BlockVqModel(int block_size, uint32_t levels)
    : block_size_(block_size), levels_(levels) {
    if (!is_supported_block_size(block_size)) {
        throw std::runtime_error("model: block_size must be 2, 4, 8 or 16, got " + std::to_string(block_size));
    }
    check_levels(levels);
}

BlockVqModel::BlockVqModel(const ModelInfo& info)
    : BlockVqModel(static_cast<int>(info.block_size), info.levels) {
    if (info.bits_stored == 0 || info.bits_stored > 16) {
        throw std::runtime_error("model: bits_stored must be in 1..16");
    }
    bits_stored_ = info.bits_stored;
    is_signed_ = info.is_signed;
}

std::vector<int32_t> BlockVqModel::make_codebook(int32_t lo, int32_t hi) const {
    if (hi < lo) throw std::runtime_error("model: empty intensity range");
    std::vector<int32_t> cb(levels_);
    const double span = static_cast<double>(hi) - static_cast<double>(lo);
    for (uint32_t k = 0; k < levels_; ++k) {
        const double v = static_cast<double>(lo) + std::round(span * k / static_cast<double>(levels_ - 1));
        cb[k] = static_cast<int32_t>(v);
    }
    return cb;
}

std::optional<ModelInfo> BlockVqModel::info_for(const Image& im) const {
    if (im.width <= 0 || im.height <= 0) throw std::runtime_error("model: invalid image size");
    ModelInfo m;
    m.block_size = static_cast<uint16_t>(block_size_);
    m.levels = levels_;
    m.bits_stored = static_cast<uint16_t>(im.bits_stored);
    m.is_signed = im.is_signed;
    m.width = static_cast<uint32_t>(im.width);
    m.height = static_cast<uint32_t>(im.height);
    return m;
}

IndexGrid BlockVqModel::encode_image(const Image& im) const {
    if (im.channels != 1) throw std::runtime_error("model: only grayscale is supported");
    if (im.bits_stored <= 0 || im.bits_stored > 16) throw std::runtime_error("model: bits_stored out of range");

    const BlockGrid g = make_grid(im.width, im.height, block_size_);
    const std::vector<int32_t> padded = tile_to_blocks(im, g);
    const std::vector<int32_t> codebook = make_codebook(im.min_value(), im.max_value());

    IndexGrid grid;
    grid.shape = {static_cast<uint32_t>(g.blocks_y), static_cast<uint32_t>(g.blocks_x)};
    grid.values.reserve(static_cast<size_t>(g.blocks_x) * g.blocks_y);

    std::vector<int32_t> block;
    const double n = static_cast<double>(block_size_) * block_size_;
    for (int by = 0; by < g.blocks_y; ++by) {
        for (int bx = 0; bx < g.blocks_x; ++bx) {
            read_block(padded, g, bx, by, block);
            int64_t sum = 0;
            for (int32_t v : block) sum += v;
            grid.values.push_back(nearest_codeword(codebook, static_cast<double>(sum) / n));
        }
    }
    return grid;
}

Image BlockVqModel::decode_indices(const IndexGrid& grid) const {
    if (grid.shape.size() != 2 || grid.shape[0] == 0 || grid.shape[1] == 0) {
        throw std::runtime_error("model: expected a non-empty 2-D index grid");
    }
    const size_t blocks_y = grid.shape[0];
    const size_t blocks_x = grid.shape[1];
    const size_t max_blocks = static_cast<size_t>(std::numeric_limits<int>::max() / block_size_);
    if (blocks_x > max_blocks || blocks_y > max_blocks) {
        throw std::runtime_error("model: index grid " + std::to_string(blocks_y) + "x" + std::to_string(blocks_x) +
                                 " is too large for block_size " + std::to_string(block_size_));
    }
    if (grid.values.size() != blocks_x * blocks_y) {
        throw std::runtime_error("model: index grid has " + std::to_string(grid.values.size()) +
                                 " values for shape " + std::to_string(blocks_y) + "x" + std::to_string(blocks_x));
    }

    Image im;
    im.width = static_cast<int>(blocks_x) * block_size_;
    im.height = static_cast<int>(blocks_y) * block_size_;
    im.channels = 1;
    im.bits_stored = bits_stored_;
    im.bits_allocated = bits_stored_ <= 8 ? 8 : 16;
    im.is_signed = is_signed_;
    im.type = is_signed_ ? PixelType::S16 : (im.bits_allocated <= 8 ? PixelType::U8 : PixelType::U16);

    const BlockGrid g = make_grid(im.width, im.height, block_size_);
    const std::vector<int32_t> codebook = make_codebook(im.min_value(), im.max_value());
    std::vector<int32_t> padded(static_cast<size_t>(g.padded_w) * g.padded_h, 0);
    std::vector<int32_t> block(static_cast<size_t>(block_size_) * block_size_);

    size_t i = 0;
    for (int by = 0; by < g.blocks_y; ++by) {
        for (int bx = 0; bx < g.blocks_x; ++bx, ++i) {
            const Symbol k = grid.values[i];
            if (k >= levels_) {
                throw std::runtime_error("model: index " + std::to_string(k) + " outside codebook of " +
                                         std::to_string(levels_) + " entries");
            }
            std::fill(block.begin(), block.end(), codebook[k]);
            write_block(padded, g, bx, by, block);
        }
    }
    im.pixels = std::move(padded);
    return im;
}

} // namespace vqhuff
