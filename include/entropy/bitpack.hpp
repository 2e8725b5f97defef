#pragma once

#include <cstdint>
#include <vector>

#include "entropy/huffman.hpp"

namespace vqhuff {

// MSB-first bit sink. The last byte is zero-padded by flush().
class BitWriter {
public:
    void write_bits(uint64_t code, uint8_t bit_len);
    void flush();

    uint64_t bit_count() const { return bit_count_; }
    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> release();

private:
    std::vector<uint8_t> data_;
    uint64_t bit_count_{0};
    uint8_t cur_{0};
    uint8_t bit_pos_{0}; // bits filled in cur_ (0..8)
};

// MSB-first bit source limited to `bit_length` valid bits; padding past that
// is never handed out.
class BitReader {
public:
    BitReader(const std::vector<uint8_t>& buf, uint64_t bit_length)
        : data_(buf), bit_length_(bit_length) {}

    bool has_bits() const { return consumed_ < bit_length_; }
    bool read_bit();
    uint64_t consumed() const { return consumed_; }

private:
    const std::vector<uint8_t>& data_;
    uint64_t bit_length_;
    uint64_t consumed_{0};
};

struct PackedBits {
    std::vector<uint8_t> bytes;
    uint64_t bit_length{0};
};

// Bytes needed to hold `bit_length` bits.
inline uint64_t packed_byte_count(uint64_t bit_length) { return (bit_length + 7) / 8; }

// Concatenate each symbol's code in sequence order.
// Throws DegenerateTableError for an invalid table and UnknownSymbolError
// when a symbol has no code.
PackedBits pack_symbols(const std::vector<Symbol>& symbols, const CodeTable& table);

// Inverse of pack_symbols. Must consume exactly `bit_length` bits and produce
// exactly `symbol_count` symbols, otherwise CorruptStreamError.
std::vector<Symbol> unpack_symbols(const std::vector<uint8_t>& bytes,
                                   uint64_t bit_length,
                                   const CodeTable& table,
                                   size_t symbol_count);

} // namespace vqhuff
