/**
 * @file LittleEndian.hpp
 * @brief 小端字节流读写工具
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>
#include <fmt/format.h>
#include "fastxls/core/Exception.hpp"

namespace fastxls {
namespace utils {

/**
 * @brief 只读小端游标，越界读取抛出 FormatException
 *
 * 不持有数据，调用方保证底层缓冲区在读取期间有效
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data.data()), size_(data.size()) {}

    size_t position() const noexcept { return pos_; }
    size_t size() const noexcept { return size_; }
    size_t remaining() const noexcept { return size_ - pos_; }
    bool atEnd() const noexcept { return pos_ >= size_; }

    void seek(size_t pos) {
        require(pos, 0);
        pos_ = pos;
    }

    void skip(size_t count) {
        require(pos_, count);
        pos_ += count;
    }

    uint8_t readU8() {
        require(pos_, 1);
        return data_[pos_++];
    }

    uint16_t readU16() {
        require(pos_, 2);
        uint16_t v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    int16_t readI16() { return static_cast<int16_t>(readU16()); }

    uint32_t readU32() {
        require(pos_, 4);
        uint32_t v = static_cast<uint32_t>(data_[pos_])
                   | (static_cast<uint32_t>(data_[pos_ + 1]) << 8)
                   | (static_cast<uint32_t>(data_[pos_ + 2]) << 16)
                   | (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    int32_t readI32() { return static_cast<int32_t>(readU32()); }

    uint64_t readU64() {
        uint64_t lo = readU32();
        uint64_t hi = readU32();
        return lo | (hi << 32);
    }

    double readDouble() {
        uint64_t bits = readU64();
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::vector<uint8_t> readBytes(size_t count) {
        require(pos_, count);
        std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + count);
        pos_ += count;
        return out;
    }

    std::vector<uint8_t> readRemaining() { return readBytes(remaining()); }

    const uint8_t* current() const noexcept { return data_ + pos_; }

private:
    void require(size_t at, size_t count) const {
        if (at > size_ || count > size_ - at) {
            FASTXLS_THROW(core::FormatException,
                          fmt::format("Unexpected end of data: need {} bytes at offset {}, buffer holds {}",
                                      count, at, size_));
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

/**
 * @brief 追加式小端写入器
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { buffer_.reserve(reserve); }

    void writeU8(uint8_t v) { buffer_.push_back(v); }

    void writeU16(uint16_t v) {
        buffer_.push_back(static_cast<uint8_t>(v & 0xFF));
        buffer_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }

    void writeI16(int16_t v) { writeU16(static_cast<uint16_t>(v)); }

    void writeU32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            buffer_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    void writeI32(int32_t v) { writeU32(static_cast<uint32_t>(v)); }

    void writeU64(uint64_t v) {
        writeU32(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        writeU32(static_cast<uint32_t>(v >> 32));
    }

    void writeDouble(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        writeU64(bits);
    }

    void writeBytes(const uint8_t* data, size_t size) { buffer_.insert(buffer_.end(), data, data + size); }
    void writeBytes(const std::vector<uint8_t>& data) { buffer_.insert(buffer_.end(), data.begin(), data.end()); }
    void writeZeros(size_t count) { buffer_.insert(buffer_.end(), count, 0); }

    /**
     * @brief 覆写已写入位置的 16 位值（回填长度字段）
     */
    void patchU16(size_t offset, uint16_t v) {
        buffer_.at(offset) = static_cast<uint8_t>(v & 0xFF);
        buffer_.at(offset + 1) = static_cast<uint8_t>((v >> 8) & 0xFF);
    }

    void patchU32(size_t offset, uint32_t v) {
        for (size_t i = 0; i < 4; ++i) {
            buffer_.at(offset + i) = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        }
    }

    void reserve(size_t n) { buffer_.reserve(n); }

    /**
     * @brief 丢弃 size 之后的内容（出错回滚）
     */
    void truncate(size_t size) {
        if (size < buffer_.size()) {
            buffer_.resize(size);
        }
    }

    void clear() noexcept { buffer_.clear(); }
    size_t size() const noexcept { return buffer_.size(); }
    const std::vector<uint8_t>& data() const noexcept { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief 直接读取缓冲区中的小端值（调用方保证不越界）
 */
inline uint16_t readU16LE(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline void writeU16LE(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>(v >> 8);
}

inline void writeU32LE(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

} // namespace utils
} // namespace fastxls
