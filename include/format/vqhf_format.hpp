#pragma once

#include <cstdint>
#include <vector>

namespace vqhuff {

// IMPORTANT:
// Do NOT write/read these structs by dumping raw memory or using sizeof().
// Struct padding/alignment is compiler-dependent. Always serialize field-by-field.
inline constexpr uint16_t kVqhfVersion = 1;
inline constexpr uint16_t kVqhfHeaderBytes = 32;    // fixed on-disk header size for v1
inline constexpr uint16_t kVqhfModelSectionBytes = 16;
inline constexpr uint32_t kMaxImageDimension = 1u << 20; // model width/height

// header flags
inline constexpr uint16_t kFlagModelSection = 0x0001;
inline constexpr uint16_t kKnownFlags = kFlagModelSection;

// .vqhf file layout:
// [Header][shape: ndim x u32][model section?][code table][payload...]
//
// Code table record: u32 symbol, u8 len, ceil(len/8) code bytes (MSB-first).
// All fields are little-endian.
struct VqhfHeader {
    char     magic[4];        // "VQHF"
    uint16_t version;
    uint16_t header_bytes;    // fixed header size

    uint16_t flags;           // bit0 = model section present
    uint16_t ndim;            // index grid dimensions

    uint32_t symbol_count;    // flattened index count
    uint32_t table_entries;   // code table records

    uint64_t bit_length;      // valid bits in payload
    uint32_t payload_bytes;   // ceil(bit_length / 8)
};

// Index grid dimensions, all > 0.
using Shape = std::vector<uint32_t>;

// Parameters of the model that produced the indices, plus the size of the
// source image so the reconstruction can be cropped. When present, the shape
// must be [ceil(height / block_size), ceil(width / block_size)].
struct ModelInfo {
    uint16_t block_size{8};
    uint16_t bits_stored{8};
    bool     is_signed{false};
    uint32_t levels{64};      // codebook size
    uint32_t width{0};
    uint32_t height{0};

    bool operator==(const ModelInfo& o) const {
        return block_size == o.block_size && bits_stored == o.bits_stored &&
               is_signed == o.is_signed && levels == o.levels &&
               width == o.width && height == o.height;
    }
    bool operator!=(const ModelInfo& o) const { return !(*this == o); }
};

} // namespace vqhuff
