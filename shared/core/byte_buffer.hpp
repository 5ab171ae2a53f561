#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace shared::core {

// ============================================================================
// ByteWriter - Serialize little-endian data to bytes
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    // --- Primitives ---

    void write_u8(std::uint8_t v) {
        data_.push_back(v);
    }

    void write_u16(std::uint16_t v) {
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    }

    void write_u32(std::uint32_t v) {
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    }

    // --- Strings ---

    // Writes the characters followed by a single NUL.
    void write_cstring(std::string_view s) {
        data_.insert(data_.end(), s.begin(), s.end());
        data_.push_back(0);
    }

    // --- Raw bytes ---

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // --- Access ---

    std::span<const std::uint8_t> data() const { return data_; }
    std::size_t size() const { return data_.size(); }
    std::vector<std::uint8_t> take() { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
};

// ============================================================================
// ByteReader - Deserialize little-endian data from bytes
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data)
        : data_(data), pos_(0) {}

    // --- Primitives ---

    std::uint16_t read_u16() {
        check_remaining(2);
        std::uint16_t v = static_cast<std::uint16_t>(data_[pos_])
                       | static_cast<std::uint16_t>(static_cast<std::uint16_t>(data_[pos_ + 1]) << 8);
        pos_ += 2;
        return v;
    }

    std::uint32_t read_u32() {
        check_remaining(4);
        std::uint32_t v = static_cast<std::uint32_t>(data_[pos_])
                       | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8)
                       | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16)
                       | (static_cast<std::uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    // --- Strings ---

    // Reads up to the next NUL and consumes it. Throws if no NUL remains.
    std::string read_cstring() {
        std::size_t end = pos_;
        while (end < data_.size() && data_[end] != 0) {
            ++end;
        }
        if (end >= data_.size()) {
            throw std::out_of_range("ByteReader: unterminated string");
        }
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), end - pos_);
        pos_ = end + 1;
        return s;
    }

    // --- Raw bytes ---

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        check_remaining(count);
        auto span = data_.subspan(pos_, count);
        pos_ += count;
        return span;
    }

    // --- State ---

    void seek(std::size_t pos) {
        if (pos > data_.size()) {
            throw std::out_of_range("ByteReader: seek past end");
        }
        pos_ = pos;
    }

    std::size_t position() const { return pos_; }
    std::size_t size() const { return data_.size(); }
    std::size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    void check_remaining(std::size_t need) {
        if (need > data_.size() - pos_) {
            throw std::out_of_range("ByteReader: not enough data");
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_;
};

} // namespace shared::core
