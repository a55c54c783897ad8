#include <vectorcluster/common/codec.hpp>
#include <cstring>
#include <stdexcept>

namespace VectorCluster {

// ============================================================================
// BYTE WRITER
// ============================================================================

void ByteWriter::putU16(uint16_t v) {
    buffer_.push_back(static_cast<uint8_t>(v));
    buffer_.push_back(static_cast<uint8_t>(v >> 8));
}

void ByteWriter::putU32(uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buffer_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void ByteWriter::putU64(uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void ByteWriter::putFloat(float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    putU32(bits);
}

void ByteWriter::putString(const std::string& s) {
    putU32(static_cast<uint32_t>(s.size()));
    buffer_.insert(buffer_.end(), s.begin(), s.end());
}

void ByteWriter::putBytes(const std::vector<uint8_t>& bytes) {
    putU32(static_cast<uint32_t>(bytes.size()));
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::putRaw(const uint8_t* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
}

// ============================================================================
// BYTE READER
// ============================================================================

void ByteReader::require(size_t n) const {
    if (len_ - offset_ < n) {
        throw std::runtime_error("Truncated buffer: need " + std::to_string(n) +
                                 " bytes, have " + std::to_string(len_ - offset_));
    }
}

uint8_t ByteReader::getU8() {
    require(1);
    return data_[offset_++];
}

uint16_t ByteReader::getU16() {
    require(2);
    uint16_t v = static_cast<uint16_t>(data_[offset_]) |
                 static_cast<uint16_t>(data_[offset_ + 1]) << 8;
    offset_ += 2;
    return v;
}

uint32_t ByteReader::getU32() {
    require(4);
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(data_[offset_ + i]) << (8 * i);
    }
    offset_ += 4;
    return v;
}

uint64_t ByteReader::getU64() {
    require(8);
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data_[offset_ + i]) << (8 * i);
    }
    offset_ += 8;
    return v;
}

float ByteReader::getFloat() {
    uint32_t bits = getU32();
    float v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

std::string ByteReader::getString() {
    uint32_t len = getU32();
    require(len);
    std::string s(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return s;
}

std::vector<uint8_t> ByteReader::getBytes() {
    uint32_t len = getU32();
    require(len);
    std::vector<uint8_t> bytes(data_ + offset_, data_ + offset_ + len);
    offset_ += len;
    return bytes;
}

// ============================================================================
// FRAME HELPERS
// ============================================================================

void writeUint32BE(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

uint32_t readUint32BE(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           (static_cast<uint32_t>(data[3]));
}

}  // namespace VectorCluster
