#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "entropy/huffman.hpp"
#include "format/vqhf_format.hpp"

namespace vqhuff {

struct CompressedArtifact {
    Shape shape;
    uint32_t symbol_count{0};
    CodeTable code_table;
    uint64_t bit_length{0};
    std::vector<uint8_t> payload;
    std::optional<ModelInfo> model;
};

// Validates, then writes header + sections. Throws MalformedContainerError
// on an invalid artifact.
std::vector<uint8_t> serialize_artifact(const CompressedArtifact& a);

// Strict parse. Any missing/invalid field throws MalformedContainerError
// naming the field. The shape product is not checked against symbol_count
// here; with a model section the shape must match the recorded image size.
CompressedArtifact parse_artifact(const std::vector<uint8_t>& bytes);

// Human-readable dump used by the inspect tool.
std::string describe_artifact(const CompressedArtifact& a);

} // namespace vqhuff
