#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace vqhuff {

using Symbol = uint32_t;

// Sparse (symbol, count) list, ascending symbol, every count > 0.
using FrequencyTable = std::vector<std::pair<Symbol, uint32_t>>;

// Code bits are MSB-first: the first bit emitted is bit (len - 1) of `bits`.
struct HuffCode {
    uint64_t bits{0};
    uint8_t len{0};

    bool operator==(const HuffCode& o) const { return bits == o.bits && len == o.len; }
    bool operator!=(const HuffCode& o) const { return !(*this == o); }
};

inline constexpr uint8_t kMaxCodeLength = 64;

// Ordered by symbol so iteration (and therefore serialization) is canonical.
using CodeTable = std::map<Symbol, HuffCode>;

// Huffman tree stored in an arena. Leaves occupy indices [0, N) in ascending
// symbol order; internal nodes follow in creation order. The arena index
// doubles as the tie-break key while building.
struct HuffTree {
    struct Node {
        uint64_t weight{0};
        Symbol symbol{0};
        int left{-1};   // -1 for leaves
        int right{-1};

        bool is_leaf() const { return left == -1 && right == -1; }
    };
    std::vector<Node> nodes;
    int root{-1};
};

// Decode-side trie built from a code table.
struct DecodeTree {
    struct Node {
        int left{-1};
        int right{-1};
        int64_t symbol{-1}; // -1 for inner nodes
    };
    std::vector<Node> nodes; // nodes[0] is the root
};

// Build sparse (symbol,freq) list from a symbol stream.
FrequencyTable build_symbol_frequencies(const std::vector<Symbol>& symbols);

// Min-heap Huffman construction keyed by (weight, arena index).
HuffTree build_huffman_tree(const FrequencyTable& freqs);

// Walk root -> leaf; left child = bit 0, right child = bit 1.
// A single-leaf tree yields the one-bit code "0".
CodeTable build_code_table(const HuffTree& tree);
CodeTable build_code_table(const FrequencyTable& freqs);

// Throws DegenerateTableError when the table is empty, has an invalid code
// length, or is not prefix-free.
DecodeTree build_decode_tree(const CodeTable& table);

// "0110" form of a code.
std::string code_to_string(const HuffCode& code);
// Inverse of code_to_string; throws std::invalid_argument on bad input.
HuffCode code_from_string(const std::string& bits);

// Shannon entropy of the distribution in bits/symbol.
double shannon_entropy(const FrequencyTable& freqs);
// Frequency-weighted mean code length in bits/symbol.
double average_code_length(const FrequencyTable& freqs, const CodeTable& table);

} // namespace vqhuff
