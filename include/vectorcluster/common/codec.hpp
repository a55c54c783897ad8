#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace VectorCluster {

/**
 * @class ByteWriter
 * @brief Little-endian binary encoder used for logs, snapshots and frames.
 */
class ByteWriter {
public:
    ByteWriter() = default;

    void putU8(uint8_t v) { buffer_.push_back(v); }
    void putU16(uint16_t v);
    void putU32(uint32_t v);
    void putU64(uint64_t v);
    void putBool(bool v) { putU8(v ? 1 : 0); }
    void putFloat(float v);
    void putString(const std::string& s);
    void putBytes(const std::vector<uint8_t>& bytes);
    void putRaw(const uint8_t* data, size_t len);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @class ByteReader
 * @brief Decoder matching ByteWriter.
 * @throws std::runtime_error on any read past the end of the buffer
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit ByteReader(const std::vector<uint8_t>& buffer)
        : data_(buffer.data()), len_(buffer.size()) {}

    uint8_t getU8();
    uint16_t getU16();
    uint32_t getU32();
    uint64_t getU64();
    bool getBool() { return getU8() != 0; }
    float getFloat();
    std::string getString();
    std::vector<uint8_t> getBytes();

    size_t remaining() const { return len_ - offset_; }
    bool atEnd() const { return offset_ == len_; }

private:
    void require(size_t n) const;

    const uint8_t* data_;
    size_t len_;
    size_t offset_ = 0;
};

// Big-endian helpers for the 4-byte frame length prefix
void writeUint32BE(uint8_t* out, uint32_t v);
uint32_t readUint32BE(const uint8_t* data);

}  // namespace VectorCluster
