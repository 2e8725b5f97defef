#include "format/container.hpp"

#include "common/errors.hpp"
#include "entropy/bitpack.hpp"
#include "entropy/bitstream.hpp"

#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace vqhuff {

namespace {

[[noreturn]] void malformed(const std::string& field, const std::string& detail) {
    throw MalformedContainerError(field, detail);
}

size_t code_byte_count(uint8_t len) { return (static_cast<size_t>(len) + 7) / 8; }

void check_block_size(uint16_t bs) {
    if (bs != 2 && bs != 4 && bs != 8 && bs != 16) {
        malformed("model.block_size", "must be 2, 4, 8 or 16, got " + std::to_string(bs));
    }
}

void validate_model(const ModelInfo& m) {
    check_block_size(m.block_size);
    if (m.bits_stored == 0 || m.bits_stored > 16) {
        malformed("model.bits_stored", "must be in 1..16, got " + std::to_string(m.bits_stored));
    }
    if (m.levels < 2 || m.levels > 65536) {
        malformed("model.levels", "must be in 2..65536, got " + std::to_string(m.levels));
    }
    if (m.width == 0 || m.width > kMaxImageDimension) {
        malformed("model.width", "must be in 1.." + std::to_string(kMaxImageDimension) + ", got " +
                                     std::to_string(m.width));
    }
    if (m.height == 0 || m.height > kMaxImageDimension) {
        malformed("model.height", "must be in 1.." + std::to_string(kMaxImageDimension) + ", got " +
                                      std::to_string(m.height));
    }
}

// Index grid of a block model covers the image: [blocks_y, blocks_x].
void check_model_shape(const Shape& shape, const ModelInfo& m) {
    const uint32_t blocks_y = (m.height + m.block_size - 1) / m.block_size;
    const uint32_t blocks_x = (m.width + m.block_size - 1) / m.block_size;
    if (shape.size() != 2 || shape[0] != blocks_y || shape[1] != blocks_x) {
        std::string got = "[";
        for (size_t i = 0; i < shape.size(); ++i) {
            if (i) got += ", ";
            got += std::to_string(shape[i]);
        }
        malformed("shape", got + "] does not match a " + std::to_string(m.width) + "x" +
                               std::to_string(m.height) + " image in blocks of " +
                               std::to_string(m.block_size) + ", expected [" + std::to_string(blocks_y) +
                               ", " + std::to_string(blocks_x) + "]");
    }
}

void validate_table(const CodeTable& table, const std::optional<ModelInfo>& model) {
    if (table.empty()) malformed("code_table", "no entries");
    if (table.size() > std::numeric_limits<uint32_t>::max()) malformed("code_table", "too many entries");
    if (model) {
        for (const auto& kv : table) {
            if (kv.first >= model->levels) {
                malformed("code_table", "symbol " + std::to_string(kv.first) + " outside codebook of " +
                                            std::to_string(model->levels) + " entries");
            }
        }
    }
    try {
        build_decode_tree(table);
    } catch (const DegenerateTableError& e) {
        malformed("code_table", e.what());
    }
}

void validate_counts(uint32_t symbol_count, uint64_t bit_length, uint64_t payload_bytes) {
    if (symbol_count == 0) malformed("symbol_count", "must be > 0");
    if (bit_length < symbol_count) {
        malformed("bit_length", std::to_string(bit_length) + " bits cannot hold " +
                                    std::to_string(symbol_count) + " symbols");
    }
    if (bit_length > static_cast<uint64_t>(symbol_count) * kMaxCodeLength) {
        malformed("bit_length", std::to_string(bit_length) + " bits exceeds " +
                                    std::to_string(symbol_count) + " symbols of at most 64 bits");
    }
    const uint64_t expected = packed_byte_count(bit_length);
    if (payload_bytes != expected) {
        malformed("payload", "expected " + std::to_string(expected) + " bytes for bit_length " +
                                 std::to_string(bit_length) + ", got " + std::to_string(payload_bytes));
    }
    if (payload_bytes > std::numeric_limits<uint32_t>::max()) {
        malformed("payload", "larger than 4 GiB");
    }
}

void validate_artifact(const CompressedArtifact& a) {
    if (a.shape.empty()) malformed("shape", "no dimensions");
    if (a.shape.size() > std::numeric_limits<uint16_t>::max()) malformed("shape", "too many dimensions");
    for (size_t i = 0; i < a.shape.size(); ++i) {
        if (a.shape[i] == 0) malformed("shape", "dimension " + std::to_string(i) + " is zero");
    }
    if (a.model) {
        validate_model(*a.model);
        check_model_shape(a.shape, *a.model);
    }
    validate_counts(a.symbol_count, a.bit_length, a.payload.size());
    validate_table(a.code_table, a.model);
}

void need(const ByteReader& r, size_t n, const std::string& field) {
    if (r.remaining() < n) {
        malformed(field, "truncated: need " + std::to_string(n) + " bytes, " +
                             std::to_string(r.remaining()) + " left");
    }
}

} // namespace

std::vector<uint8_t> serialize_artifact(const CompressedArtifact& a) {
    validate_artifact(a);

    ByteWriter w;
    VqhfHeader hdr{};
    // "VQHF"
    hdr.magic[0] = 'V';
    hdr.magic[1] = 'Q';
    hdr.magic[2] = 'H';
    hdr.magic[3] = 'F';
    hdr.version = kVqhfVersion;
    hdr.header_bytes = kVqhfHeaderBytes;
    hdr.flags = a.model ? kFlagModelSection : 0;
    hdr.ndim = static_cast<uint16_t>(a.shape.size());
    hdr.symbol_count = a.symbol_count;
    hdr.table_entries = static_cast<uint32_t>(a.code_table.size());
    hdr.bit_length = a.bit_length;
    hdr.payload_bytes = static_cast<uint32_t>(a.payload.size());

    w.write_bytes(hdr.magic, 4);
    w.write_u16_le(hdr.version);
    w.write_u16_le(hdr.header_bytes);
    w.write_u16_le(hdr.flags);
    w.write_u16_le(hdr.ndim);
    w.write_u32_le(hdr.symbol_count);
    w.write_u32_le(hdr.table_entries);
    w.write_u64_le(hdr.bit_length);
    w.write_u32_le(hdr.payload_bytes);
    if (w.size() != kVqhfHeaderBytes) {
        throw std::runtime_error("container: header size mismatch while writing");
    }

    for (uint32_t d : a.shape) w.write_u32_le(d);

    if (a.model) {
        const ModelInfo& m = *a.model;
        w.write_u16_le(m.block_size);
        w.write_u16_le(m.bits_stored);
        w.write_u8(m.is_signed ? 1 : 0);
        w.write_u8(0); // reserved
        w.write_u32_le(m.levels);
        w.write_u32_le(m.width);
        w.write_u32_le(m.height);
    }

    // std::map iterates in ascending symbol order
    for (const auto& [sym, code] : a.code_table) {
        w.write_u32_le(sym);
        w.write_u8(code.len);
        const size_t nbytes = code_byte_count(code.len);
        const uint64_t aligned = code.bits << (nbytes * 8 - code.len);
        for (size_t k = 0; k < nbytes; ++k) {
            w.write_u8(static_cast<uint8_t>((aligned >> ((nbytes - 1 - k) * 8)) & 0xFF));
        }
    }

    w.write_bytes(a.payload.data(), a.payload.size());
    return w.release();
}

CompressedArtifact parse_artifact(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kVqhfHeaderBytes) {
        malformed("header", "need " + std::to_string(kVqhfHeaderBytes) + " bytes, got " +
                                std::to_string(bytes.size()));
    }
    ByteReader r(bytes);

    VqhfHeader hdr{};
    r.read_bytes(hdr.magic, 4);
    hdr.version = r.read_u16_le();
    hdr.header_bytes = r.read_u16_le();
    hdr.flags = r.read_u16_le();
    hdr.ndim = r.read_u16_le();
    hdr.symbol_count = r.read_u32_le();
    hdr.table_entries = r.read_u32_le();
    hdr.bit_length = r.read_u64_le();
    hdr.payload_bytes = r.read_u32_le();

    if (!(hdr.magic[0] == 'V' && hdr.magic[1] == 'Q' && hdr.magic[2] == 'H' && hdr.magic[3] == 'F')) {
        malformed("magic", "not a .vqhf container");
    }
    if (hdr.version != kVqhfVersion) malformed("version", "unsupported version " + std::to_string(hdr.version));
    if (hdr.header_bytes != kVqhfHeaderBytes) {
        malformed("header_bytes", "expected " + std::to_string(kVqhfHeaderBytes) + ", got " +
                                      std::to_string(hdr.header_bytes));
    }
    if ((hdr.flags & ~kKnownFlags) != 0) malformed("flags", "unknown flag bits set");
    if (hdr.ndim == 0) malformed("shape", "no dimensions");
    if (hdr.table_entries == 0) malformed("code_table", "no entries");
    validate_counts(hdr.symbol_count, hdr.bit_length, hdr.payload_bytes);

    CompressedArtifact a;
    a.symbol_count = hdr.symbol_count;
    a.bit_length = hdr.bit_length;

    // shape section
    need(r, static_cast<size_t>(hdr.ndim) * 4u, "shape");
    a.shape.reserve(hdr.ndim);
    for (uint16_t i = 0; i < hdr.ndim; ++i) {
        const uint32_t d = r.read_u32_le();
        if (d == 0) malformed("shape", "dimension " + std::to_string(i) + " is zero");
        a.shape.push_back(d);
    }

    // model section
    if (hdr.flags & kFlagModelSection) {
        need(r, kVqhfModelSectionBytes, "model");
        ModelInfo m;
        m.block_size = r.read_u16_le();
        m.bits_stored = r.read_u16_le();
        const uint8_t is_signed = r.read_u8();
        const uint8_t reserved = r.read_u8();
        m.levels = r.read_u32_le();
        m.width = r.read_u32_le();
        m.height = r.read_u32_le();
        if (is_signed > 1) malformed("model.is_signed", "must be 0 or 1");
        if (reserved != 0) malformed("model", "reserved byte must be zero");
        m.is_signed = (is_signed == 1);
        validate_model(m);
        check_model_shape(a.shape, m);
        a.model = m;
    }

    // code table section
    bool have_prev = false;
    Symbol prev = 0;
    for (uint32_t i = 0; i < hdr.table_entries; ++i) {
        need(r, 5u, "code_table");
        const Symbol sym = r.read_u32_le();
        const uint8_t len = r.read_u8();
        if (have_prev && sym <= prev) {
            malformed("code_table", "symbols not strictly ascending at entry " + std::to_string(i));
        }
        if (len == 0 || len > kMaxCodeLength) {
            malformed("code_table", "invalid code length " + std::to_string(len) +
                                        " for symbol " + std::to_string(sym));
        }
        const size_t nbytes = code_byte_count(len);
        need(r, nbytes, "code_table");
        uint64_t aligned = 0;
        for (size_t k = 0; k < nbytes; ++k) {
            aligned = (aligned << 8) | r.read_u8();
        }
        const size_t pad = nbytes * 8 - len;
        if (pad > 0 && (aligned & ((uint64_t{1} << pad) - 1)) != 0) {
            malformed("code_table", "non-zero padding in code of symbol " + std::to_string(sym));
        }
        a.code_table[sym] = HuffCode{aligned >> pad, len};
        prev = sym;
        have_prev = true;
    }
    validate_table(a.code_table, a.model);

    // payload
    if (r.remaining() < hdr.payload_bytes) {
        malformed("payload", "truncated: expected " + std::to_string(hdr.payload_bytes) +
                                 " bytes, got " + std::to_string(r.remaining()));
    }
    if (r.remaining() > hdr.payload_bytes) {
        malformed("payload", std::to_string(r.remaining() - hdr.payload_bytes) + " trailing bytes");
    }
    a.payload.resize(hdr.payload_bytes);
    r.read_bytes(a.payload.data(), a.payload.size());
    return a;
}

std::string describe_artifact(const CompressedArtifact& a) {
    std::ostringstream os;
    os << "shape:         [";
    for (size_t i = 0; i < a.shape.size(); ++i) {
        if (i) os << ", ";
        os << a.shape[i];
    }
    os << "]\n";
    os << "symbol_count:  " << a.symbol_count << "\n";
    os << "bit_length:    " << a.bit_length << "\n";
    os << "payload_bytes: " << a.payload.size() << "\n";
    if (a.symbol_count > 0) {
        os << "bits/symbol:   " << std::fixed << std::setprecision(4)
           << static_cast<double>(a.bit_length) / static_cast<double>(a.symbol_count) << "\n";
        os.unsetf(std::ios::fixed);
    }
    if (a.model) {
        const ModelInfo& m = *a.model;
        os << "model:         block_size=" << m.block_size
           << " levels=" << m.levels
           << " bits_stored=" << m.bits_stored
           << " signed=" << (m.is_signed ? 1 : 0)
           << " image=" << m.width << "x" << m.height << "\n";
    } else {
        os << "model:         (none)\n";
    }
    os << "code_table:    " << a.code_table.size() << " entries\n";
    for (const auto& [sym, code] : a.code_table) {
        os << "  " << std::setw(6) << sym << "  " << code_to_string(code) << "\n";
    }
    return os.str();
}

} // namespace vqhuff
