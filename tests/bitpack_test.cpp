#include "entropy/bitpack.hpp"

#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <random>
#include <vector>

namespace vqhuff {
namespace {

std::vector<Symbol> random_symbols(std::mt19937& rng, size_t n, uint32_t alphabet) {
    // geometric-ish skew so code lengths differ
    std::geometric_distribution<uint32_t> dist(0.3);
    std::vector<Symbol> s(n);
    for (auto& v : s) v = dist(rng) % alphabet;
    return s;
}

TEST(BitWriter, PacksMsbFirstAndPads) {
    BitWriter bw;
    bw.write_bits(0b101, 3);
    bw.write_bits(0b11110000, 8);
    EXPECT_EQ(bw.bit_count(), 11u);
    const std::vector<uint8_t> bytes = bw.release();
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0b10111110);
    EXPECT_EQ(bytes[1], 0b00000000);
}

TEST(BitWriter, AcceptsSixtyFourBitCodes) {
    BitWriter bw;
    bw.write_bits(0x8000000000000001ull, 64);
    const std::vector<uint8_t> bytes = bw.release();
    ASSERT_EQ(bytes.size(), 8u);
    EXPECT_EQ(bytes.front(), 0x80);
    EXPECT_EQ(bytes.back(), 0x01);
    EXPECT_THROW(bw.write_bits(0, 0), std::runtime_error);
}

TEST(BitPack, WorkedExample) {
    const std::vector<Symbol> s = {2, 2, 2, 3, 3, 1};
    const CodeTable t = build_code_table(build_symbol_frequencies(s));
    const PackedBits p = pack_symbols(s, t);
    EXPECT_EQ(p.bit_length, 9u);
    ASSERT_EQ(p.bytes.size(), 2u);
    // 000 11 11 10 + 7 padding bits
    EXPECT_EQ(p.bytes[0], 0x1F);
    EXPECT_EQ(p.bytes[1], 0x00);
    EXPECT_EQ(unpack_symbols(p.bytes, p.bit_length, t, s.size()), s);
}

TEST(BitPack, SingleSymbolUsesOneBitPerSymbol) {
    const std::vector<Symbol> s(13, 5);
    const CodeTable t = build_code_table(build_symbol_frequencies(s));
    const PackedBits p = pack_symbols(s, t);
    EXPECT_EQ(p.bit_length, 13u);
    EXPECT_EQ(p.bytes, std::vector<uint8_t>({0x00, 0x00}));
    EXPECT_EQ(unpack_symbols(p.bytes, p.bit_length, t, s.size()), s);
}

TEST(BitPack, RoundTripsRandomSequences) {
    std::mt19937 rng(2024);
    for (uint32_t alphabet : {1u, 2u, 17u, 300u}) {
        for (size_t n : {1u, 2u, 7u, 64u, 1000u, 4099u}) {
            const std::vector<Symbol> s = random_symbols(rng, n, alphabet);
            const CodeTable t = build_code_table(build_symbol_frequencies(s));
            const PackedBits p = pack_symbols(s, t);
            EXPECT_EQ(p.bytes.size(), packed_byte_count(p.bit_length));
            EXPECT_EQ(unpack_symbols(p.bytes, p.bit_length, t, s.size()), s)
                << "alphabet=" << alphabet << " n=" << n;
        }
    }
}

TEST(BitPack, UnknownSymbolThrows) {
    const CodeTable t = build_code_table(build_symbol_frequencies({1, 2, 2}));
    EXPECT_THROW(pack_symbols({1, 2, 3}, t), UnknownSymbolError);
}

TEST(BitPack, InvalidTableIsRejectedBeforePacking) {
    CodeTable zero_len;
    zero_len[1] = HuffCode{0, 0};
    EXPECT_THROW(pack_symbols({1}, zero_len), DegenerateTableError);

    CodeTable overlapping;
    overlapping[1] = code_from_string("1");
    overlapping[2] = code_from_string("10");
    EXPECT_THROW(pack_symbols({1, 2}, overlapping), DegenerateTableError);

    EXPECT_THROW(pack_symbols({1}, CodeTable{}), DegenerateTableError);
}

TEST(BitUnpack, TruncatedPayloadIsCorrupt) {
    std::mt19937 rng(5);
    const std::vector<Symbol> s = random_symbols(rng, 500, 20);
    const CodeTable t = build_code_table(build_symbol_frequencies(s));
    PackedBits p = pack_symbols(s, t);
    ASSERT_GT(p.bytes.size(), 1u);
    p.bytes.pop_back();
    EXPECT_THROW(unpack_symbols(p.bytes, p.bit_length, t, s.size()), CorruptStreamError);
}

TEST(BitUnpack, SymbolCountMismatchIsCorrupt) {
    const std::vector<Symbol> s = {2, 2, 2, 3, 3, 1};
    const CodeTable t = build_code_table(build_symbol_frequencies(s));
    const PackedBits p = pack_symbols(s, t);
    // asks for more symbols than the bits hold
    EXPECT_THROW(unpack_symbols(p.bytes, p.bit_length, t, 7), CorruptStreamError);
    // leaves bits unconsumed
    EXPECT_THROW(unpack_symbols(p.bytes, p.bit_length, t, 5), CorruptStreamError);
}

TEST(BitUnpack, BitLengthMismatchIsCorrupt) {
    const std::vector<Symbol> s = {2, 2, 2, 3, 3, 1};
    const CodeTable t = build_code_table(build_symbol_frequencies(s));
    const PackedBits p = pack_symbols(s, t);
    // 8 bits fit in one byte, but two were supplied
    EXPECT_THROW(unpack_symbols(p.bytes, 8, t, s.size()), CorruptStreamError);
    // same byte count, one extra bit: the padding bit is left over
    EXPECT_THROW(unpack_symbols(p.bytes, 10, t, s.size()), CorruptStreamError);
}

TEST(BitUnpack, BitWithoutCodeIsCorrupt) {
    CodeTable t;
    t[5] = code_from_string("0");
    EXPECT_THROW(unpack_symbols({0x80}, 1, t, 1), CorruptStreamError);
}

TEST(BitUnpack, NonPrefixFreeTableIsRejected) {
    CodeTable t;
    t[1] = code_from_string("1");
    t[2] = code_from_string("10");
    EXPECT_THROW(unpack_symbols({0x80}, 1, t, 1), DegenerateTableError);
}

} // namespace
} // namespace vqhuff
