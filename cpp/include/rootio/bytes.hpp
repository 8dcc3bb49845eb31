// rootio – big-endian byte cursors with sticky error state
#pragma once

#include "rootio/error.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rootio {

constexpr uint32_t kByteCountMask = 0x40000000;
constexpr uint32_t kNewClassTag   = 0xFFFFFFFF;
constexpr uint32_t kNullTag       = 0;

/// Streamed-object preamble: (byte_count | kByteCountMask) then version.
/// `byte_count` counts every byte after the 4-byte count word.
struct ObjectHeader {
    int64_t  start      = 0;   // position of the count word
    uint32_t byte_count = 0;   // 0 for the legacy bare-version form
    int16_t  version    = 0;
};

// ── ReadBuffer ─────────────────────────────────────────────────────────────

/// Non-owning reader. Positions include `offset`, so a buffer holding a key
/// payload can be addressed with keylen-inclusive positions.
///
/// Once a read fails the buffer is poisoned: later reads return zero values
/// and `check()` throws the first error.
class ReadBuffer {
public:
    ReadBuffer() = default;
    ReadBuffer(const uint8_t* data, size_t size, int64_t offset = 0)
        : data_(data), size_(size), offset_(offset) {}
    explicit ReadBuffer(const std::vector<uint8_t>& data, int64_t offset = 0)
        : ReadBuffer(data.data(), data.size(), offset) {}

    int64_t pos() const { return offset_ + static_cast<int64_t>(pos_); }
    int64_t end() const { return offset_ + static_cast<int64_t>(size_); }
    size_t  remaining() const { return size_ - pos_; }
    void    set_pos(int64_t pos);
    void    skip(size_t n);

    bool               ok() const { return err_.empty(); }
    const std::string& error() const { return err_; }
    ErrorCode          error_code() const { return err_code_; }
    void               check() const;
    void               set_error(ErrorCode code, const std::string& msg);

    uint8_t  read_u8()  { return read_be<uint8_t>(); }
    int8_t   read_i8()  { return static_cast<int8_t>(read_be<uint8_t>()); }
    uint16_t read_u16() { return read_be<uint16_t>(); }
    int16_t  read_i16() { return static_cast<int16_t>(read_be<uint16_t>()); }
    uint32_t read_u32() { return read_be<uint32_t>(); }
    int32_t  read_i32() { return static_cast<int32_t>(read_be<uint32_t>()); }
    uint64_t read_u64() { return read_be<uint64_t>(); }
    int64_t  read_i64() { return static_cast<int64_t>(read_be<uint64_t>()); }
    bool     read_bool() { return read_u8() != 0; }
    float    read_f32();
    double   read_f64();

    std::string read_string();
    std::string read_cstring();
    void        read_bytes(void* dst, size_t n);

    template <class T>
    T read() {
        static_assert(std::is_arithmetic<T>::value, "arithmetic type expected");
        if constexpr (std::is_same<T, bool>::value) return read_bool();
        else if constexpr (std::is_same<T, float>::value) return read_f32();
        else if constexpr (std::is_same<T, double>::value) return read_f64();
        else return static_cast<T>(read_be<typename std::make_unsigned<T>::type>());
    }

    template <class T>
    void read_array(T* dst, size_t n) {
        for (size_t i = 0; i < n; ++i) dst[i] = read<T>();
    }

    ObjectHeader read_header();
    /// Land exactly at the end of the object announced by `hdr`.
    void         check_header(const ObjectHeader& hdr, const std::string& cls);

private:
    bool need(size_t n);

    template <class T>
    T read_be() {
        if (!need(sizeof(T))) return T(0);
        T v = 0;
        for (size_t i = 0; i < sizeof(T); ++i)
            v = static_cast<T>((static_cast<uint64_t>(v) << 8) | data_[pos_ + i]);
        pos_ += sizeof(T);
        return v;
    }

    const uint8_t* data_   = nullptr;
    size_t         size_   = 0;
    size_t         pos_    = 0;
    int64_t        offset_ = 0;
    std::string    err_;
    ErrorCode      err_code_ = ErrorCode::kIOError;
};

// ── WriteBuffer ────────────────────────────────────────────────────────────

class WriteBuffer {
public:
    explicit WriteBuffer(int64_t offset = 0) : offset_(offset) {}

    int64_t pos() const { return offset_ + static_cast<int64_t>(buf_.size()); }
    size_t  size() const { return buf_.size(); }

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

    bool               ok() const { return err_.empty(); }
    const std::string& error() const { return err_; }
    void               check() const;

    void write_u8(uint8_t v)   { write_be(v); }
    void write_i8(int8_t v)    { write_be(static_cast<uint8_t>(v)); }
    void write_u16(uint16_t v) { write_be(v); }
    void write_i16(int16_t v)  { write_be(static_cast<uint16_t>(v)); }
    void write_u32(uint32_t v) { write_be(v); }
    void write_i32(int32_t v)  { write_be(static_cast<uint32_t>(v)); }
    void write_u64(uint64_t v) { write_be(v); }
    void write_i64(int64_t v)  { write_be(static_cast<uint64_t>(v)); }
    void write_bool(bool v)    { write_u8(v ? 1 : 0); }
    void write_f32(float v);
    void write_f64(double v);

    void write_string(const std::string& s);
    void write_cstring(const std::string& s);
    void write_bytes(const void* src, size_t n);

    template <class T>
    void write(T v) {
        static_assert(std::is_arithmetic<T>::value, "arithmetic type expected");
        if constexpr (std::is_same<T, bool>::value) write_bool(v);
        else if constexpr (std::is_same<T, float>::value) write_f32(v);
        else if constexpr (std::is_same<T, double>::value) write_f64(v);
        else write_be(static_cast<typename std::make_unsigned<T>::type>(v));
    }

    template <class T>
    void write_array(const T* src, size_t n) {
        for (size_t i = 0; i < n; ++i) write<T>(src[i]);
    }

    /// Reserve the count word and write `version`; returns the mark to close.
    int64_t write_header(int16_t version);
    void    close_header(int64_t mark);
    void    patch_u32(int64_t at, uint32_t v);

private:
    template <class T>
    void write_be(T v) {
        for (size_t i = 0; i < sizeof(T); ++i)
            buf_.push_back(static_cast<uint8_t>(
                static_cast<uint64_t>(v) >> (8 * (sizeof(T) - 1 - i))));
    }

    std::vector<uint8_t> buf_;
    int64_t              offset_ = 0;
    std::string          err_;
};

} // namespace rootio
