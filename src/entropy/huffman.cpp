#include "entropy/huffman.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vqhuff {

// Build sparse (symbol,freq) list from symbols
FrequencyTable build_symbol_frequencies(const std::vector<Symbol>& symbols) {
    if (symbols.empty()) {
        throw EmptyInputError("huffman: empty symbol sequence");
    }
    std::unordered_map<Symbol, uint32_t> freq_map;
    for (Symbol s : symbols) {
        auto it = freq_map.find(s);
        if (it == freq_map.end()) {
            freq_map.emplace(s, 1u);
        } else {
            if (it->second == std::numeric_limits<uint32_t>::max()) {
                throw DegenerateTableError("huffman: frequency overflow for symbol " + std::to_string(s));
            }
            ++it->second;
        }
    }
    FrequencyTable sym_freq;
    sym_freq.reserve(freq_map.size());
    for (const auto& kv : freq_map) {
        sym_freq.push_back(kv);
    }
    std::sort(sym_freq.begin(), sym_freq.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return sym_freq;
}

namespace {

// (weight, arena index); the smaller index wins ties.
using HeapEntry = std::pair<uint64_t, int>;

struct HeapComp {
    bool operator()(const HeapEntry& a, const HeapEntry& b) const {
        if (a.first != b.first) return a.first > b.first; // min-heap
        return a.second > b.second;
    }
};

} // namespace

HuffTree build_huffman_tree(const FrequencyTable& freqs) {
    if (freqs.empty()) {
        throw EmptyInputError("huffman: empty frequency table");
    }
    FrequencyTable sorted = freqs;
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (sorted[i].second == 0) {
            throw DegenerateTableError("huffman: zero count for symbol " + std::to_string(sorted[i].first));
        }
        if (i > 0 && sorted[i].first == sorted[i - 1].first) {
            throw DegenerateTableError("huffman: duplicate entry for symbol " + std::to_string(sorted[i].first));
        }
    }

    HuffTree tree;
    tree.nodes.reserve(sorted.size() * 2 - 1);
    std::priority_queue<HeapEntry, std::vector<HeapEntry>, HeapComp> pq;
    for (const auto& sf : sorted) {
        HuffTree::Node leaf;
        leaf.weight = sf.second;
        leaf.symbol = sf.first;
        const int idx = static_cast<int>(tree.nodes.size());
        tree.nodes.push_back(leaf);
        pq.push({leaf.weight, idx});
    }

    while (pq.size() > 1) {
        HeapEntry a = pq.top(); pq.pop();
        HeapEntry b = pq.top(); pq.pop();
        HuffTree::Node parent;
        parent.weight = a.first + b.first;
        parent.left = a.second;  // first extracted -> bit 0
        parent.right = b.second;
        const int idx = static_cast<int>(tree.nodes.size());
        tree.nodes.push_back(parent);
        pq.push({parent.weight, idx});
    }
    tree.root = pq.top().second;
    return tree;
}

CodeTable build_code_table(const HuffTree& tree) {
    if (tree.root < 0 || static_cast<size_t>(tree.root) >= tree.nodes.size()) {
        throw EmptyInputError("huffman: tree has no root");
    }
    CodeTable table;

    // Edge case: only one symbol. A zero-length code would make the stream
    // carry no bits at all, so it gets "0".
    const HuffTree::Node& root = tree.nodes[static_cast<size_t>(tree.root)];
    if (root.is_leaf()) {
        table[root.symbol] = {0u, 1u};
        return table;
    }

    struct Frame { int idx; uint64_t bits; uint8_t depth; };
    std::vector<Frame> stack;
    stack.push_back({tree.root, 0u, 0u});
    while (!stack.empty()) {
        Frame f = stack.back();
        stack.pop_back();
        const HuffTree::Node& cur = tree.nodes[static_cast<size_t>(f.idx)];
        if (cur.is_leaf()) {
            table[cur.symbol] = {f.bits, f.depth};
            continue;
        }
        if (cur.left == -1 || cur.right == -1) {
            throw DegenerateTableError("huffman: invalid tree structure");
        }
        if (f.depth >= kMaxCodeLength) {
            throw DegenerateTableError("huffman: code length exceeds 64");
        }
        const uint8_t d = static_cast<uint8_t>(f.depth + 1);
        // push right then left so left is processed first
        stack.push_back({cur.right, (f.bits << 1) | 1u, d});
        stack.push_back({cur.left, f.bits << 1, d});
    }
    return table;
}

CodeTable build_code_table(const FrequencyTable& freqs) {
    return build_code_table(build_huffman_tree(freqs));
}

DecodeTree build_decode_tree(const CodeTable& table) {
    if (table.empty()) {
        throw DegenerateTableError("huffman: empty code table");
    }
    DecodeTree t;
    t.nodes.push_back({}); // root

    for (const auto& [sym, code] : table) {
        if (code.len == 0 || code.len > kMaxCodeLength) {
            throw DegenerateTableError("huffman: invalid code length " + std::to_string(code.len) +
                                       " for symbol " + std::to_string(sym));
        }
        if (code.len < 64 && (code.bits >> code.len) != 0) {
            throw DegenerateTableError("huffman: code for symbol " + std::to_string(sym) +
                                       " has bits beyond its length");
        }
        int node_idx = 0;
        for (int i = code.len - 1; i >= 0; --i) {
            if (t.nodes[node_idx].symbol != -1) {
                throw DegenerateTableError("huffman: code table is not prefix-free (symbol " +
                                           std::to_string(t.nodes[node_idx].symbol) +
                                           " is a prefix of symbol " + std::to_string(sym) + ")");
            }
            const uint64_t bit = (code.bits >> i) & 1u;
            int next = (bit == 0) ? t.nodes[node_idx].left : t.nodes[node_idx].right;
            if (next == -1) {
                next = static_cast<int>(t.nodes.size());
                t.nodes.push_back({});
                if (bit == 0) t.nodes[node_idx].left = next;
                else t.nodes[node_idx].right = next;
            }
            node_idx = next;
        }
        const DecodeTree::Node& end = t.nodes[node_idx];
        if (end.symbol != -1 || end.left != -1 || end.right != -1) {
            throw DegenerateTableError("huffman: code table is not prefix-free (code of symbol " +
                                       std::to_string(sym) + " collides)");
        }
        t.nodes[node_idx].symbol = static_cast<int64_t>(sym);
    }
    return t;
}

std::string code_to_string(const HuffCode& code) {
    std::string s;
    s.reserve(code.len);
    for (int i = code.len - 1; i >= 0; --i) {
        s.push_back(((code.bits >> i) & 1u) ? '1' : '0');
    }
    return s;
}

HuffCode code_from_string(const std::string& bits) {
    if (bits.empty() || bits.size() > kMaxCodeLength) {
        throw std::invalid_argument("huffman: code string length out of range");
    }
    HuffCode c;
    for (char ch : bits) {
        if (ch != '0' && ch != '1') {
            throw std::invalid_argument("huffman: code string must contain only '0'/'1'");
        }
        c.bits = (c.bits << 1) | static_cast<uint64_t>(ch == '1');
    }
    c.len = static_cast<uint8_t>(bits.size());
    return c;
}

double shannon_entropy(const FrequencyTable& freqs) {
    uint64_t total = 0;
    for (const auto& sf : freqs) total += sf.second;
    if (total == 0) return 0.0;
    double h = 0.0;
    for (const auto& sf : freqs) {
        if (sf.second == 0) continue;
        const double p = static_cast<double>(sf.second) / static_cast<double>(total);
        h -= p * std::log2(p);
    }
    return h;
}

double average_code_length(const FrequencyTable& freqs, const CodeTable& table) {
    uint64_t total = 0;
    uint64_t bits = 0;
    for (const auto& sf : freqs) {
        auto it = table.find(sf.first);
        if (it == table.end()) {
            throw UnknownSymbolError("huffman: symbol " + std::to_string(sf.first) + " has no code");
        }
        total += sf.second;
        bits += static_cast<uint64_t>(sf.second) * it->second.len;
    }
    if (total == 0) return 0.0;
    return static_cast<double>(bits) / static_cast<double>(total);
}

#ifndef NDEBUG
namespace {
// Minimal self-test: the six-symbol example must give {1:"10", 2:"0", 3:"11"}.
struct HuffmanSelfTest {
    HuffmanSelfTest() {
        const std::vector<Symbol> symbols = {2, 2, 2, 3, 3, 1};
        CodeTable t = build_code_table(build_symbol_frequencies(symbols));
        if (t.size() != 3 ||
            code_to_string(t[1]) != "10" ||
            code_to_string(t[2]) != "0" ||
            code_to_string(t[3]) != "11") {
            throw std::runtime_error("huffman self-test: unexpected code table");
        }
        build_decode_tree(t);
    }
};
static HuffmanSelfTest _huff_self_test{};
} // namespace
#endif

} // namespace vqhuff
