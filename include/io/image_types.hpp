#pragma once

#include <cstdint>
#include <vector>
#include <string>

namespace vqhuff {

enum class PixelType : uint8_t {
    U8  = 1,
    U16 = 2,
    S16 = 3,
};

struct Image {
    int width = 0;
    int height = 0;
    int channels = 1;         // grayscale only
    int bits_stored = 0;      // 1..16
    int bits_allocated = 0;   // 8/16
    bool is_signed = false;
    PixelType type = PixelType::U16;
    std::vector<int32_t> pixels; // row-major, unified buffer

    size_t size() const { return pixels.size(); }
    bool empty() const { return pixels.empty(); }

    // Representable range given bits_stored and signedness.
    int32_t min_value() const { return is_signed ? -(1 << (bits_stored - 1)) : 0; }
    int32_t max_value() const {
        return is_signed ? (1 << (bits_stored - 1)) - 1 : (1 << bits_stored) - 1;
    }
};

} // namespace vqhuff
