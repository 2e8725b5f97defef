#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace vqhuff {

// Little-endian field writer. Containers are always serialized field by
// field through this class.
class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_u64_le(uint64_t v) {
        write_u32_le(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        write_u32_le(static_cast<uint32_t>((v >> 32) & 0xFFFFFFFFu));
    }
    void write_bytes(const void* p, size_t n) {
        if (n == 0) return;
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    size_t size() const { return buf_.size(); }
    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> release() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : buf_(data) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint16_t read_u16_le() {
        uint16_t lo = read_u8();
        uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t read_u32_le() {
        uint32_t a = read_u16_le();
        uint32_t b = read_u16_le();
        return a | (b << 16);
    }
    uint64_t read_u64_le() {
        uint64_t a = read_u32_le();
        uint64_t b = read_u32_le();
        return a | (b << 32);
    }
    void read_bytes(void* out, size_t n) {
        need(n);
        if (n == 0) return;
        std::memcpy(out, buf_.data() + pos_, n);
        pos_ += n;
    }
    bool eof() const { return pos_ >= buf_.size(); }
    size_t position() const { return pos_; }
    size_t remaining() const { return buf_.size() - pos_; }
private:
    void need(size_t n) {
        if (n > remaining()) throw std::runtime_error("bitstream: premature EOF");
    }
    const std::vector<uint8_t>& buf_;
    size_t pos_ = 0;
};

} // namespace vqhuff
