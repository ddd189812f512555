#include "utils/serialize.h"
#include <cstring>
#include <stdexcept>
#include <utility>

namespace sigelnet {
namespace utils {

ByteBuffer::ByteBuffer() : readPos_(0) {}

ByteBuffer::ByteBuffer(const std::vector<uint8_t>& data) : data_(data), readPos_(0) {}

ByteBuffer::ByteBuffer(std::vector<uint8_t>&& data) : data_(std::move(data)), readPos_(0) {}

ByteBuffer::ByteBuffer(const uint8_t* data, size_t len) : data_(data, data + len), readPos_(0) {}

void ByteBuffer::writeUint8(uint8_t value) {
    data_.push_back(value);
}

void ByteBuffer::writeUint16(uint16_t value) {
    data_.push_back(static_cast<uint8_t>(value >> 8));
    data_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteBuffer::writeUint32(uint32_t value) {
    data_.push_back(static_cast<uint8_t>(value >> 24));
    data_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    data_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    data_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteBuffer::writeUint64(uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void ByteBuffer::writeDouble(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    writeUint64(bits);
}

void ByteBuffer::writeBool(bool value) {
    writeUint8(value ? 1 : 0);
}

void ByteBuffer::writeVarInt(uint64_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value));
}

void ByteBuffer::writeString(const std::string& value) {
    writeVarInt(value.length());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeBytes(const std::vector<uint8_t>& value) {
    writeVarInt(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeFixedBytes(const uint8_t* data, size_t length) {
    data_.insert(data_.end(), data, data + length);
}

uint8_t ByteBuffer::readUint8() {
    checkRead(1);
    return data_[readPos_++];
}

uint16_t ByteBuffer::readUint16() {
    checkRead(2);
    uint16_t value = static_cast<uint16_t>((static_cast<uint16_t>(data_[readPos_]) << 8) |
                                           static_cast<uint16_t>(data_[readPos_ + 1]));
    readPos_ += 2;
    return value;
}

uint32_t ByteBuffer::readUint32() {
    checkRead(4);
    uint32_t value = (static_cast<uint32_t>(data_[readPos_]) << 24) |
                     (static_cast<uint32_t>(data_[readPos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[readPos_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[readPos_ + 3]);
    readPos_ += 4;
    return value;
}

uint64_t ByteBuffer::readUint64() {
    checkRead(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | static_cast<uint64_t>(data_[readPos_ + i]);
    }
    readPos_ += 8;
    return value;
}

double ByteBuffer::readDouble() {
    uint64_t bits = readUint64();
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

bool ByteBuffer::readBool() {
    return readUint8() != 0;
}

uint64_t ByteBuffer::readVarInt() {
    uint64_t value = 0;
    int shift = 0;

    while (true) {
        checkRead(1);
        uint8_t byte = data_[readPos_++];
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;

        if ((byte & 0x80) == 0) break;
        shift += 7;

        if (shift >= 64) {
            throw std::runtime_error("VarInt overflow");
        }
    }

    return value;
}

std::string ByteBuffer::readString() {
    uint64_t length = readVarInt();
    checkRead(length);

    std::string value(data_.begin() + readPos_, data_.begin() + readPos_ + length);
    readPos_ += length;
    return value;
}

std::vector<uint8_t> ByteBuffer::readBytes() {
    uint64_t length = readVarInt();
    checkRead(length);

    std::vector<uint8_t> value(data_.begin() + readPos_, data_.begin() + readPos_ + length);
    readPos_ += length;
    return value;
}

void ByteBuffer::readFixedBytes(uint8_t* dest, size_t length) {
    checkRead(length);
    std::memcpy(dest, data_.data() + readPos_, length);
    readPos_ += length;
}

void ByteBuffer::checkRead(uint64_t bytes) const {
    if (bytes > data_.size() - readPos_) {
        throw std::runtime_error("Buffer underflow");
    }
}

}
}
