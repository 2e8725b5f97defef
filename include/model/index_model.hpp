#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "entropy/huffman.hpp"
#include "format/vqhf_format.hpp"
#include "io/image_types.hpp"

namespace vqhuff {

// Codebook indices of one image, row-major (last dimension fastest).
struct IndexGrid {
    Shape shape;
    std::vector<Symbol> values;
};

// Boundary to the vector-quantization model. Implementations report their
// own failures by throwing; the pipeline passes them through untouched.
class IndexModel {
public:
    virtual ~IndexModel() = default;

    virtual IndexGrid encode_image(const Image& im) const = 0;
    // Returns the image at grid resolution (may be larger than the source).
    virtual Image decode_indices(const IndexGrid& grid) const = 0;
    // Parameters a decoder needs to rebuild this model for `im`, written to
    // the container's model section. Only BlockVqModel can be rebuilt from
    // them; any other model returns nullopt and must be passed to the
    // decoder explicitly.
    virtual std::optional<ModelInfo> info_for(const Image& im) const = 0;
};

// Block vector quantizer with a fixed codebook of flat blocks.
//
// The image is cut into block_size x block_size tiles (edge-replicated at the
// borders). Codeword k is a flat block at intensity
//   lo + round(k * (hi - lo) / (levels - 1))
// over the image's stored range [lo, hi]. Each tile maps to the codeword with
// the least squared error, i.e. the one closest to the tile mean; ties go to
// the lower index. Grid shape is [blocks_y, blocks_x].
class BlockVqModel : public IndexModel {
public:
    // Encoder side: the intensity range is taken from each image.
    BlockVqModel(int block_size, uint32_t levels);
    // Decoder side: range and sizes as recorded in a container.
    explicit BlockVqModel(const ModelInfo& info);

    IndexGrid encode_image(const Image& im) const override;
    Image decode_indices(const IndexGrid& grid) const override;
    std::optional<ModelInfo> info_for(const Image& im) const override;

    int block_size() const { return block_size_; }
    uint32_t levels() const { return levels_; }

    // Codeword intensities for the range [lo, hi], non-decreasing.
    std::vector<int32_t> make_codebook(int32_t lo, int32_t hi) const;

private:
    int block_size_;
    uint32_t levels_;
    int bits_stored_{8};
    bool is_signed_{false};
};

} // namespace vqhuff
