#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace geometrytools::binutil {

// Assumes little-endian (x86/x64). Fail at compile time otherwise.
static_assert(std::endian::native == std::endian::little,
              "geometrytools requires a little-endian platform");

// Thrown when a read runs past the end of the buffer.
class EndOfData : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- Reader: bounded cursor over a byte buffer (throws EndOfData) ---

class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit Reader(const std::vector<uint8_t>& buf) : Reader(buf.data(), buf.size()) {}

    [[nodiscard]] size_t tell() const { return pos_; }
    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t remaining() const { return size_ - pos_; }
    [[nodiscard]] const uint8_t* data() const { return data_; }

    void seek(size_t pos) {
        if (pos > size_)
            throw EndOfData(std::format("binutil: seek to {} past end ({})", pos, size_));
        pos_ = pos;
    }

    void skip(size_t n) {
        require(n, "skip");
        pos_ += n;
    }

    uint8_t read_u8() {
        require(1, "u8");
        return data_[pos_++];
    }

    uint32_t read_u32() {
        uint32_t v;
        copy_out(&v, 4, "u32");
        return v;
    }

    float read_f32() {
        float v;
        copy_out(&v, 4, "f32");
        return v;
    }

    std::string read_fixed_string(size_t n) {
        require(n, "fixed string");
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    // Reads n bytes and reports whether all of them are zero.
    bool read_zeros(size_t n) {
        require(n, "zeros");
        bool all_zero = true;
        for (size_t i = 0; i < n; i++)
            all_zero = all_zero && data_[pos_ + i] == 0;
        pos_ += n;
        return all_zero;
    }

private:
    void require(size_t n, const char* what) const {
        if (n > size_ - pos_)
            throw EndOfData(std::format("binutil: failed to read {} at offset {} ({} bytes left)",
                                        what, pos_, size_ - pos_));
    }

    void copy_out(void* dst, size_t n, const char* what) {
        require(n, what);
        std::memcpy(dst, data_ + pos_, n);
        pos_ += n;
    }

    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
};

// --- Writer: growable byte buffer ---

class Writer {
public:
    Writer() = default;
    explicit Writer(size_t reserve) { buf_.reserve(reserve); }

    [[nodiscard]] size_t tell() const { return buf_.size(); }
    [[nodiscard]] const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }

    void write_u8(uint8_t v) { buf_.push_back(v); }

    void write_u32(uint32_t v) { append_raw(&v, 4); }

    void write_f32(float v) { append_raw(&v, 4); }

    void write_bytes(const void* src, size_t n) { append_raw(src, n); }

    void fill(uint8_t value, size_t n) { buf_.insert(buf_.end(), n, value); }

    // Fills with value until the write position reaches pos.
    void pad_to(size_t pos, uint8_t value) {
        if (pos < buf_.size())
            throw std::runtime_error(
                std::format("binutil: cannot pad to {}, already at {}", pos, buf_.size()));
        fill(value, pos - buf_.size());
    }

    void append(const std::vector<uint8_t>& other) {
        buf_.insert(buf_.end(), other.begin(), other.end());
    }

private:
    void append_raw(const void* src, size_t n) {
        auto p = static_cast<const uint8_t*>(src);
        buf_.insert(buf_.end(), p, p + n);
    }

    std::vector<uint8_t> buf_;
};

} // namespace geometrytools::binutil
