#include "model/index_model.hpp"

#include "block/tiling.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace vqhuff {
namespace {

Image make_image(int w, int h, int bits, bool is_signed, std::vector<int32_t> pixels) {
    Image im;
    im.width = w;
    im.height = h;
    im.bits_stored = bits;
    im.bits_allocated = bits <= 8 ? 8 : 16;
    im.is_signed = is_signed;
    im.type = is_signed ? PixelType::S16 : (bits <= 8 ? PixelType::U8 : PixelType::U16);
    im.pixels = std::move(pixels);
    return im;
}

TEST(Tiling, GridCoversImage) {
    const BlockGrid g = make_grid(5, 3, 4);
    EXPECT_EQ(g.blocks_x, 2);
    EXPECT_EQ(g.blocks_y, 1);
    EXPECT_EQ(g.padded_w, 8);
    EXPECT_EQ(g.padded_h, 4);
    EXPECT_THROW(make_grid(5, 3, 3), std::runtime_error);
    EXPECT_THROW(make_grid(5, 3, 32), std::runtime_error);
    EXPECT_THROW(make_grid(0, 3, 4), std::runtime_error);
}

TEST(Tiling, EdgeReplicationAndCrop) {
    const Image im = make_image(3, 2, 8, false, {1, 2, 3, 4, 5, 6});
    const BlockGrid g = make_grid(im.width, im.height, 2);
    const std::vector<int32_t> padded = tile_to_blocks(im, g);
    const std::vector<int32_t> expected = {1, 2, 3, 3,
                                           4, 5, 6, 6};
    EXPECT_EQ(padded, expected);

    Image out = make_image(3, 2, 8, false, {});
    untile_from_blocks(out, g, padded);
    EXPECT_EQ(out.pixels, im.pixels);
}

TEST(Tiling, BlocksReadBack) {
    const BlockGrid g = make_grid(4, 4, 2);
    std::vector<int32_t> padded(16, 0);
    write_block(padded, g, 1, 1, {7, 8, 9, 10});
    EXPECT_EQ(padded[10], 7);
    EXPECT_EQ(padded[15], 10);
    std::vector<int32_t> block;
    read_block(padded, g, 1, 1, block);
    EXPECT_EQ(block, std::vector<int32_t>({7, 8, 9, 10}));
    EXPECT_THROW(write_block(padded, g, 0, 0, {1, 2, 3}), std::runtime_error);
}

TEST(BlockVqModel, CodebookSpansRange) {
    const BlockVqModel m(2, 5);
    EXPECT_EQ(m.make_codebook(0, 255), std::vector<int32_t>({0, 64, 128, 191, 255}));
    EXPECT_EQ(BlockVqModel(2, 2).make_codebook(-2048, 2047), std::vector<int32_t>({-2048, 2047}));
}

TEST(BlockVqModel, FlatBlocksMapToNearestCodeword) {
    const BlockVqModel m(2, 5);
    const IndexGrid g = m.encode_image(make_image(4, 2, 8, false, {128, 128, 250, 255,
                                                                   128, 128, 255, 255}));
    EXPECT_EQ(g.shape, Shape({1, 2}));
    EXPECT_EQ(g.values, std::vector<Symbol>({2, 4}));
}

TEST(BlockVqModel, TiesGoToLowerIndex) {
    const BlockVqModel m(2, 5);
    // mean 32 is halfway between codewords 0 and 64
    const IndexGrid g = m.encode_image(make_image(2, 2, 8, false, {0, 64, 0, 64}));
    EXPECT_EQ(g.values, std::vector<Symbol>({0}));
}

TEST(BlockVqModel, GridShapeIsRowsThenColumns) {
    const BlockVqModel m(4, 16);
    const IndexGrid g = m.encode_image(make_image(9, 5, 8, false, std::vector<int32_t>(45, 0)));
    EXPECT_EQ(g.shape, Shape({2, 3}));
    EXPECT_EQ(g.values.size(), 6u);
}

TEST(BlockVqModel, SignedImagesUseStoredRange) {
    const BlockVqModel m(2, 2);
    const Image im = make_image(4, 2, 12, true, {-2048, -2000, 2047, 2000,
                                                 -2048, -1900, 2047, 1900});
    const IndexGrid g = m.encode_image(im);
    EXPECT_EQ(g.values, std::vector<Symbol>({0, 1}));

    const ModelInfo info = m.info_for(im).value();
    EXPECT_EQ(info.bits_stored, 12u);
    EXPECT_TRUE(info.is_signed);

    const Image rec = BlockVqModel(info).decode_indices(g);
    EXPECT_TRUE(rec.is_signed);
    EXPECT_EQ(rec.pixels, std::vector<int32_t>({-2048, -2048, 2047, 2047,
                                                -2048, -2048, 2047, 2047}));
}

TEST(BlockVqModel, InfoRecordsSourceGeometry) {
    const BlockVqModel m(8, 64);
    const ModelInfo info = m.info_for(make_image(30, 17, 10, false, std::vector<int32_t>(30 * 17, 0))).value();
    EXPECT_EQ(info.block_size, 8u);
    EXPECT_EQ(info.levels, 64u);
    EXPECT_EQ(info.width, 30u);
    EXPECT_EQ(info.height, 17u);
    EXPECT_EQ(info.bits_stored, 10u);
    EXPECT_FALSE(info.is_signed);
}

TEST(BlockVqModel, DecodeRejectsBadGrids) {
    const BlockVqModel m(2, 4);
    IndexGrid g;
    g.shape = {4};
    g.values = {0, 1, 2, 3};
    EXPECT_THROW(m.decode_indices(g), std::runtime_error);

    g.shape = {2, 2};
    g.values = {0, 1, 2, 4};
    EXPECT_THROW(m.decode_indices(g), std::runtime_error);

    g.values = {0, 1, 2};
    EXPECT_THROW(m.decode_indices(g), std::runtime_error);

    g.values = {0, 1, 2, 3};
    const Image im = m.decode_indices(g);
    EXPECT_EQ(im.width, 4);
    EXPECT_EQ(im.height, 4);
}

TEST(BlockVqModel, DecodeRejectsGridsTooWideForInt) {
    const BlockVqModel m(16, 2);
    IndexGrid g;
    g.shape = {1, 200000000};
    EXPECT_THROW(m.decode_indices(g), std::runtime_error);
}

TEST(BlockVqModel, RejectsBadParameters) {
    EXPECT_THROW(BlockVqModel(3, 16), std::runtime_error);
    EXPECT_THROW(BlockVqModel(8, 1), std::runtime_error);
    EXPECT_THROW(BlockVqModel(8, 65537), std::runtime_error);
    EXPECT_NO_THROW(BlockVqModel(16, 65536));

    ModelInfo info;
    info.bits_stored = 0;
    EXPECT_THROW(BlockVqModel{info}, std::runtime_error);
}

} // namespace
} // namespace vqhuff
