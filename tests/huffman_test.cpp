#include "entropy/huffman.hpp"

#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <vector>

namespace vqhuff {
namespace {

bool is_prefix_free(const CodeTable& t) {
    std::vector<std::string> codes;
    for (const auto& kv : t) codes.push_back(code_to_string(kv.second));
    for (size_t i = 0; i < codes.size(); ++i) {
        for (size_t j = 0; j < codes.size(); ++j) {
            if (i == j) continue;
            if (codes[j].compare(0, codes[i].size(), codes[i]) == 0) return false;
        }
    }
    return true;
}

TEST(FrequencyCounter, CountsSortedBySymbol) {
    const FrequencyTable f = build_symbol_frequencies({2, 2, 2, 3, 3, 1});
    const FrequencyTable expected = {{1, 1}, {2, 3}, {3, 2}};
    EXPECT_EQ(f, expected);
}

TEST(FrequencyCounter, CountsSumToLength) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<uint32_t> dist(0, 40);
    std::vector<Symbol> s(1000);
    for (auto& v : s) v = dist(rng);
    uint64_t total = 0;
    for (const auto& sf : build_symbol_frequencies(s)) {
        EXPECT_GT(sf.second, 0u);
        total += sf.second;
    }
    EXPECT_EQ(total, s.size());
}

TEST(FrequencyCounter, EmptyInputThrows) {
    EXPECT_THROW(build_symbol_frequencies({}), EmptyInputError);
}

TEST(HuffmanTree, WorkedExample) {
    const CodeTable t = build_code_table(build_symbol_frequencies({2, 2, 2, 3, 3, 1}));
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(code_to_string(t.at(2)), "0");
    EXPECT_EQ(code_to_string(t.at(1)), "10");
    EXPECT_EQ(code_to_string(t.at(3)), "11");
}

TEST(HuffmanTree, SingleSymbolGetsOneBitCode) {
    const CodeTable t = build_code_table(build_symbol_frequencies(std::vector<Symbol>(9, 42)));
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t.at(42).len, 1u);
    EXPECT_EQ(code_to_string(t.at(42)), "0");
}

TEST(HuffmanTree, EqualWeightsFollowInsertionOrder) {
    const CodeTable t = build_code_table(FrequencyTable{{10, 1}, {11, 1}, {12, 1}, {13, 1}});
    EXPECT_EQ(code_to_string(t.at(10)), "00");
    EXPECT_EQ(code_to_string(t.at(11)), "01");
    EXPECT_EQ(code_to_string(t.at(12)), "10");
    EXPECT_EQ(code_to_string(t.at(13)), "11");
}

TEST(HuffmanTree, FibonacciWeightsGiveSkewedLengths) {
    const CodeTable t = build_code_table(FrequencyTable{{0, 1}, {1, 1}, {2, 2}, {3, 3}, {4, 5}, {5, 8}});
    EXPECT_EQ(code_to_string(t.at(5)), "0");
    EXPECT_EQ(code_to_string(t.at(4)), "10");
    EXPECT_EQ(code_to_string(t.at(3)), "110");
    EXPECT_EQ(code_to_string(t.at(2)), "1110");
    EXPECT_EQ(code_to_string(t.at(0)), "11110");
    EXPECT_EQ(code_to_string(t.at(1)), "11111");
}

TEST(HuffmanTree, InputOrderDoesNotMatter) {
    const FrequencyTable sorted = {{1, 4}, {5, 4}, {9, 2}, {12, 7}, {30, 1}};
    FrequencyTable shuffled = {{30, 1}, {9, 2}, {12, 7}, {1, 4}, {5, 4}};
    EXPECT_EQ(build_code_table(sorted), build_code_table(shuffled));
}

TEST(HuffmanTree, DeterministicAcrossBuilds) {
    std::mt19937 rng(123);
    std::uniform_int_distribution<uint32_t> count(1, 5);
    FrequencyTable f;
    for (Symbol s = 0; s < 300; ++s) f.push_back({s, count(rng)});
    const CodeTable a = build_code_table(f);
    const CodeTable b = build_code_table(f);
    ASSERT_EQ(a.size(), b.size());
    for (const auto& kv : a) {
        EXPECT_EQ(code_to_string(kv.second), code_to_string(b.at(kv.first)));
    }
}

TEST(HuffmanTree, TablesArePrefixFreeAndComplete) {
    std::mt19937 rng(99);
    for (int round = 0; round < 20; ++round) {
        std::uniform_int_distribution<int> n_dist(2, 200);
        std::uniform_int_distribution<uint32_t> w_dist(1, 1000);
        const int n = n_dist(rng);
        FrequencyTable f;
        for (int s = 0; s < n; ++s) f.push_back({static_cast<Symbol>(s * 3), w_dist(rng)});
        const CodeTable t = build_code_table(f);
        ASSERT_EQ(t.size(), f.size());
        EXPECT_TRUE(is_prefix_free(t));
        // Kraft sum of a full binary tree is exactly 1
        double kraft = 0.0;
        for (const auto& kv : t) kraft += std::ldexp(1.0, -static_cast<int>(kv.second.len));
        EXPECT_DOUBLE_EQ(kraft, 1.0);
        EXPECT_NO_THROW(build_decode_tree(t));
    }
}

TEST(HuffmanTree, AverageLengthWithinOneBitOfEntropy) {
    const FrequencyTable f = {{0, 50}, {1, 20}, {2, 15}, {3, 10}, {4, 4}, {5, 1}};
    const CodeTable t = build_code_table(f);
    const double h = shannon_entropy(f);
    const double l = average_code_length(f, t);
    EXPECT_GE(l + 1e-12, h);
    EXPECT_LT(l, h + 1.0);
}

TEST(HuffmanTree, RejectsDegenerateTables) {
    EXPECT_THROW(build_huffman_tree({}), EmptyInputError);
    EXPECT_THROW(build_huffman_tree({{1, 3}, {2, 0}}), DegenerateTableError);
    EXPECT_THROW(build_huffman_tree({{1, 3}, {1, 2}}), DegenerateTableError);
}

TEST(HuffmanTree, TreeIsArenaOwned) {
    const HuffTree tree = build_huffman_tree({{4, 1}, {5, 2}, {6, 3}});
    ASSERT_EQ(tree.nodes.size(), 5u);
    EXPECT_EQ(tree.root, 4);
    EXPECT_EQ(tree.nodes[static_cast<size_t>(tree.root)].weight, 6u);
    for (int i = 0; i < 3; ++i) EXPECT_TRUE(tree.nodes[static_cast<size_t>(i)].is_leaf());
}

TEST(DecodeTree, RejectsPrefixViolations) {
    CodeTable t;
    t[1] = code_from_string("0");
    t[2] = code_from_string("01");
    EXPECT_THROW(build_decode_tree(t), DegenerateTableError);

    CodeTable dup;
    dup[1] = code_from_string("10");
    dup[2] = code_from_string("10");
    EXPECT_THROW(build_decode_tree(dup), DegenerateTableError);

    CodeTable zero_len;
    zero_len[1] = HuffCode{0, 0};
    EXPECT_THROW(build_decode_tree(zero_len), DegenerateTableError);

    EXPECT_THROW(build_decode_tree(CodeTable{}), DegenerateTableError);
}

TEST(CodeStrings, RoundTrip) {
    const HuffCode c = code_from_string("1011");
    EXPECT_EQ(c.bits, 0b1011u);
    EXPECT_EQ(c.len, 4u);
    EXPECT_EQ(code_to_string(c), "1011");
    EXPECT_EQ(code_to_string(code_from_string("0001")), "0001");
    EXPECT_THROW(code_from_string(""), std::invalid_argument);
    EXPECT_THROW(code_from_string("012"), std::invalid_argument);
}

} // namespace
} // namespace vqhuff
