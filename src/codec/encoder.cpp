#include "codec/encoder.hpp"

#include "codec/grid_layout.hpp"
#include "common/errors.hpp"

#include "entropy/bitpack.hpp"
#include "entropy/huffman.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

namespace vqhuff {

CompressedArtifact compress_indices(const IndexGrid& grid) {
    if (grid.values.empty()) {
        throw EmptyInputError("encode: empty index grid");
    }
    //===Flatten (row-major)===//
    std::vector<Symbol> symbols = flatten_grid(grid);

#ifndef NDEBUG
    std::fprintf(stderr, "First 16 indices:\n");
    for (size_t i = 0; i < 16 && i < symbols.size(); ++i) {
        std::fprintf(stderr, "%u ", symbols[i]);
    }
    std::fprintf(stderr, "\n");
#endif

    //===Entropy Coding===//
    const FrequencyTable freqs = build_symbol_frequencies(symbols);
    CodeTable table = build_code_table(freqs);
    PackedBits packed = pack_symbols(symbols, table);

    // Debug: print Huffman table head and first payload bytes
#ifndef NDEBUG
    std::fprintf(stderr, "Huffman table (%zu symbols, first 10):\n", table.size());
    int count = 0;
    for (const auto& [sym, code] : table) {
        if (count++ >= 10) break;
        std::fprintf(stderr, "sym=%u len=%u code=%s\n", sym, static_cast<unsigned>(code.len),
                     code_to_string(code).c_str());
    }
    std::fprintf(stderr, "entropy=%.4f avg_len=%.4f bits/symbol\n",
                 shannon_entropy(freqs), average_code_length(freqs, table));
    std::fprintf(stderr, "First 2 payload bytes (binary):\n");
    for (size_t i = 0; i < 2 && i < packed.bytes.size(); ++i) {
        std::fprintf(stderr, "0b");
        for (int bit = 7; bit >= 0; --bit) {
            std::fprintf(stderr, "%d", (packed.bytes[i] >> bit) & 1);
        }
        std::fprintf(stderr, " ");
    }
    std::fprintf(stderr, "\n");
#endif

    CompressedArtifact a;
    a.shape = grid.shape;
    a.symbol_count = static_cast<uint32_t>(symbols.size());
    a.code_table = std::move(table);
    a.bit_length = packed.bit_length;
    a.payload = std::move(packed.bytes);
    return a;
}

std::vector<uint8_t> compress_image(const Image& im, const IndexModel& model) {
    if (im.width <= 0 || im.height <= 0) throw std::runtime_error("encode: invalid image size");
    if (im.pixels.size() != static_cast<size_t>(im.width) * im.height * im.channels) {
        throw std::runtime_error("encode: buffer size mismatch");
    }
#ifndef NDEBUG
    std::fprintf(stderr, "Image %dx%d bits_stored=%d signed=%d\n",
                 im.width, im.height, im.bits_stored, im.is_signed ? 1 : 0);
#endif

    //===Vector quantization===//
    const IndexGrid grid = model.encode_image(im);

    //===Bitstream Writer===//
    CompressedArtifact a = compress_indices(grid);
    a.model = model.info_for(im);
    return serialize_artifact(a);
}

} // namespace vqhuff
