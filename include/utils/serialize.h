#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>

namespace sigelnet {
namespace utils {

// Big-endian writer/reader. Every read throws std::runtime_error when the
// buffer does not hold enough bytes.
class ByteBuffer {
public:
    ByteBuffer();
    explicit ByteBuffer(const std::vector<uint8_t>& data);
    explicit ByteBuffer(std::vector<uint8_t>&& data);
    ByteBuffer(const uint8_t* data, size_t len);

    void writeUint8(uint8_t value);
    void writeUint16(uint16_t value);
    void writeUint32(uint32_t value);
    void writeUint64(uint64_t value);
    void writeDouble(double value);
    void writeBool(bool value);
    void writeVarInt(uint64_t value);
    void writeString(const std::string& value);
    void writeBytes(const std::vector<uint8_t>& value);
    void writeFixedBytes(const uint8_t* data, size_t length);

    uint8_t readUint8();
    uint16_t readUint16();
    uint32_t readUint32();
    uint64_t readUint64();
    double readDouble();
    bool readBool();
    uint64_t readVarInt();
    std::string readString();
    std::vector<uint8_t> readBytes();
    void readFixedBytes(uint8_t* dest, size_t length);

    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> release() { readPos_ = 0; return std::move(data_); }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - readPos_; }
    size_t position() const { return readPos_; }
    bool atEnd() const { return readPos_ >= data_.size(); }
    void reset() { readPos_ = 0; }
    void clear() { data_.clear(); readPos_ = 0; }

private:
    std::vector<uint8_t> data_;
    size_t readPos_;

    void checkRead(uint64_t bytes) const;
};

}
}
