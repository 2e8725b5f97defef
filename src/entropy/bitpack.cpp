#include "entropy/bitpack.hpp"

#include "common/errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace vqhuff {

// ---------------- BitWriter ---------------- //
void BitWriter::write_bits(uint64_t code, uint8_t bit_len) {
    if (bit_len == 0 || bit_len > kMaxCodeLength) {
        throw std::runtime_error("BitWriter: invalid bit length");
    }
    // write MSB-first
    for (int i = bit_len - 1; i >= 0; --i) {
        uint8_t bit = static_cast<uint8_t>((code >> i) & 1u);
        cur_ = static_cast<uint8_t>((cur_ << 1) | bit);
        ++bit_pos_;
        ++bit_count_;
        if (bit_pos_ == 8) {
            data_.push_back(cur_);
            cur_ = 0;
            bit_pos_ = 0;
        }
    }
}

void BitWriter::flush() {
    if (bit_pos_ > 0) {
        cur_ = static_cast<uint8_t>(cur_ << (8 - bit_pos_));
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

std::vector<uint8_t> BitWriter::release() {
    flush();
    return std::move(data_);
}

// ---------------- BitReader ---------------- //
bool BitReader::read_bit() {
    if (consumed_ >= bit_length_) {
        throw CorruptStreamError("BitReader: read past bit_length " + std::to_string(bit_length_));
    }
    const size_t byte_idx = static_cast<size_t>(consumed_ >> 3);
    if (byte_idx >= data_.size()) {
        throw CorruptStreamError("BitReader: out of data at byte " + std::to_string(byte_idx));
    }
    const uint8_t bit_pos = static_cast<uint8_t>(consumed_ & 7u);
    ++consumed_;
    return ((data_[byte_idx] >> (7 - bit_pos)) & 1u) != 0;
}

PackedBits pack_symbols(const std::vector<Symbol>& symbols, const CodeTable& table) {
    // rejects zero-length, over-long and non-prefix-free codes
    build_decode_tree(table);

    BitWriter bw;
    for (size_t i = 0; i < symbols.size(); ++i) {
        auto it = table.find(symbols[i]);
        if (it == table.end()) {
            throw UnknownSymbolError("pack: symbol " + std::to_string(symbols[i]) +
                                     " at position " + std::to_string(i) + " is not in the code table");
        }
        bw.write_bits(it->second.bits, it->second.len);
    }
    PackedBits out;
    out.bit_length = bw.bit_count();
    out.bytes = bw.release();
    return out;
}

std::vector<Symbol> unpack_symbols(const std::vector<uint8_t>& bytes,
                                   uint64_t bit_length,
                                   const CodeTable& table,
                                   size_t symbol_count) {
    const uint64_t expected_bytes = packed_byte_count(bit_length);
    if (bytes.size() != expected_bytes) {
        throw CorruptStreamError("unpack: payload holds " + std::to_string(bytes.size()) +
                                 " bytes, bit_length " + std::to_string(bit_length) +
                                 " requires " + std::to_string(expected_bytes));
    }
    const DecodeTree t = build_decode_tree(table);

    BitReader br(bytes, bit_length);
    std::vector<Symbol> out;
    out.reserve(symbol_count);
    for (size_t n = 0; n < symbol_count; ++n) {
        int node = 0;
        while (t.nodes[node].symbol == -1) {
            if (!br.has_bits()) {
                throw CorruptStreamError("unpack: bitstream exhausted after " + std::to_string(n) +
                                         " of " + std::to_string(symbol_count) + " symbols");
            }
            const bool bit = br.read_bit();
            const DecodeTree::Node& nd = t.nodes[node];
            node = bit ? nd.right : nd.left;
            if (node == -1) {
                throw CorruptStreamError("unpack: bit " + std::to_string(br.consumed() - 1) +
                                         " matches no code");
            }
        }
        out.push_back(static_cast<Symbol>(t.nodes[node].symbol));
    }
    if (br.consumed() != bit_length) {
        throw CorruptStreamError("unpack: decoded " + std::to_string(symbol_count) +
                                 " symbols using " + std::to_string(br.consumed()) +
                                 " bits, expected " + std::to_string(bit_length));
    }
    return out;
}

} // namespace vqhuff
