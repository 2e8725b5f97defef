#include "io/image_saver.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace vqhuff {

void save_pgm(const std::string& path, const Image& im) {
    if (im.channels != 1) throw std::runtime_error("Only grayscale is supported for PGM output");
    if (im.width <= 0 || im.height <= 0) throw std::runtime_error("Invalid image size");
    if (im.pixels.size() != static_cast<size_t>(im.width) * im.height) {
        throw std::runtime_error("pixel buffer size mismatch");
    }
    if (im.bits_stored <= 0 || im.bits_stored > 16) throw std::runtime_error("Invalid bits_stored for PGM output");

    // signed samples are shifted by 2^(B-1) into [0, 2^B - 1]
    const int32_t offset = im.is_signed ? (1 << (im.bits_stored - 1)) : 0;
    const int32_t maxv = (im.bits_stored <= 8) ? 255 : ((1 << im.bits_stored) - 1);

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);

    ofs << "P5\n" << im.width << " " << im.height << "\n" << maxv << "\n";

    for (int32_t px : im.pixels) {
        const int32_t v = std::min(std::max(px + offset, 0), maxv);
        if (maxv == 255) {
            ofs.put(static_cast<char>(static_cast<uint8_t>(v)));
        } else {
            // PGM 16-bit expects big-endian; maxv may be < 65535 (e.g., 12-bit => 4095)
            const uint16_t u = static_cast<uint16_t>(v);
            ofs.put(static_cast<char>((u >> 8) & 0xFF));
            ofs.put(static_cast<char>(u & 0xFF));
        }
    }
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

} // namespace vqhuff
