#include "codec/decoder.hpp"

#include "block/tiling.hpp"
#include "codec/grid_layout.hpp"
#include "common/errors.hpp"

#include "entropy/bitpack.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vqhuff {

IndexGrid decompress_indices(const CompressedArtifact& a) {
    std::vector<Symbol> symbols = unpack_symbols(a.payload, a.bit_length, a.code_table, a.symbol_count);
    return reshape_indices(std::move(symbols), a.shape);
}

namespace {

Image decode_artifact(const CompressedArtifact& a, const IndexModel& model) {
    const IndexGrid grid = decompress_indices(a);

    Image im = model.decode_indices(grid);
    if (!a.model) {
        return im;
    }

    // Crop back to the source size
    const int width = static_cast<int>(a.model->width);
    const int height = static_cast<int>(a.model->height);
    if (width > im.width || height > im.height) {
        throw std::runtime_error("decode: model output " + std::to_string(im.width) + "x" +
                                 std::to_string(im.height) + " is smaller than recorded image " +
                                 std::to_string(width) + "x" + std::to_string(height));
    }
    BlockGrid g;
    g.block_size = a.model->block_size;
    g.padded_w = im.width;
    g.padded_h = im.height;
    g.blocks_x = im.width / g.block_size;
    g.blocks_y = im.height / g.block_size;

    std::vector<int32_t> padded = std::move(im.pixels);
    im.width = width;
    im.height = height;
    untile_from_blocks(im, g, padded);

    if (im.pixels.size() != static_cast<size_t>(im.width) * im.height * im.channels) {
        throw std::runtime_error("decode: decoded pixel count mismatch");
    }
    return im;
}

} // namespace

Image decompress_image(const std::vector<uint8_t>& bytes, const IndexModel& model) {
    return decode_artifact(parse_artifact(bytes), model);
}

Image decompress_image(const std::vector<uint8_t>& bytes) {
    const CompressedArtifact a = parse_artifact(bytes);
    if (!a.model) {
        throw MalformedContainerError("model", "section absent; a model must be supplied to decode");
    }
    const BlockVqModel model(*a.model);
    return decode_artifact(a, model);
}

} // namespace vqhuff
