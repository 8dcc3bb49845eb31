// rootio – byte cursor implementation

#include "rootio/bytes.hpp"

namespace rootio {

// ── ReadBuffer ─────────────────────────────────────────────────────────────

void ReadBuffer::set_error(ErrorCode code, const std::string& msg) {
    if (!err_.empty()) return;   // keep the first failure
    err_      = msg;
    err_code_ = code;
}

void ReadBuffer::check() const {
    if (!err_.empty()) fail(err_code_, err_);
}

bool ReadBuffer::need(size_t n) {
    if (!err_.empty()) return false;
    if (n > size_ - pos_) {
        set_error(ErrorCode::kIOError,
                  "read of " + std::to_string(n) + " bytes at position "
                  + std::to_string(pos()) + " past end of buffer ("
                  + std::to_string(end()) + ")");
        return false;
    }
    return true;
}

void ReadBuffer::set_pos(int64_t pos) {
    if (!err_.empty()) return;
    if (pos < offset_ || pos > end()) {
        set_error(ErrorCode::kIOError,
                  "seek to " + std::to_string(pos) + " outside buffer ["
                  + std::to_string(offset_) + ", " + std::to_string(end()) + "]");
        return;
    }
    pos_ = static_cast<size_t>(pos - offset_);
}

void ReadBuffer::skip(size_t n) {
    if (need(n)) pos_ += n;
}

float ReadBuffer::read_f32() {
    uint32_t u = read_u32();
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

double ReadBuffer::read_f64() {
    uint64_t u = read_u64();
    double d;
    std::memcpy(&d, &u, sizeof(d));
    return d;
}

std::string ReadBuffer::read_string() {
    uint32_t n = read_u8();
    if (n == 255) n = read_u32();
    if (!need(n)) return std::string();
    std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return s;
}

std::string ReadBuffer::read_cstring() {
    if (!err_.empty()) return std::string();
    const void* nul = pos_ < size_ ? std::memchr(data_ + pos_, 0, size_ - pos_)
                                   : nullptr;
    if (!nul) {
        set_error(ErrorCode::kIOError, "unterminated C string");
        return std::string();
    }
    size_t n = static_cast<size_t>(static_cast<const uint8_t*>(nul) - (data_ + pos_));
    std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n + 1;
    return s;
}

void ReadBuffer::read_bytes(void* dst, size_t n) {
    if (!need(n)) {
        if (n) std::memset(dst, 0, n);
        return;
    }
    if (n) std::memcpy(dst, data_ + pos_, n);
    pos_ += n;
}

ObjectHeader ReadBuffer::read_header() {
    ObjectHeader hdr;
    hdr.start = pos();
    uint32_t bc = read_u32();
    if (bc & kByteCountMask) {
        hdr.byte_count = bc & ~kByteCountMask;
        hdr.version    = read_i16();
    } else {
        // Legacy form: no byte count, the first two bytes are the version.
        set_pos(hdr.start);
        hdr.version = read_i16();
    }
    return hdr;
}

void ReadBuffer::check_header(const ObjectHeader& hdr, const std::string& cls) {
    if (!err_.empty() || hdr.byte_count == 0) return;
    int64_t want = hdr.start + 4 + static_cast<int64_t>(hdr.byte_count);
    if (pos() > want) {
        set_error(ErrorCode::kCorruptBlock,
                  cls + ": object overran its byte count by "
                  + std::to_string(pos() - want) + " bytes");
        return;
    }
    set_pos(want);
}

// ── WriteBuffer ────────────────────────────────────────────────────────────

void WriteBuffer::check() const {
    if (!err_.empty()) fail(ErrorCode::kIOError, err_);
}

void WriteBuffer::write_f32(float v) {
    uint32_t u;
    std::memcpy(&u, &v, sizeof(u));
    write_u32(u);
}

void WriteBuffer::write_f64(double v) {
    uint64_t u;
    std::memcpy(&u, &v, sizeof(u));
    write_u64(u);
}

void WriteBuffer::write_string(const std::string& s) {
    if (s.size() < 255) {
        write_u8(static_cast<uint8_t>(s.size()));
    } else {
        write_u8(255);
        write_u32(static_cast<uint32_t>(s.size()));
    }
    write_bytes(s.data(), s.size());
}

void WriteBuffer::write_cstring(const std::string& s) {
    write_bytes(s.data(), s.size());
    write_u8(0);
}

void WriteBuffer::write_bytes(const void* src, size_t n) {
    const auto* p = static_cast<const uint8_t*>(src);
    buf_.insert(buf_.end(), p, p + n);
}

int64_t WriteBuffer::write_header(int16_t version) {
    int64_t mark = pos();
    write_u32(0);
    write_i16(version);
    return mark;
}

void WriteBuffer::close_header(int64_t mark) {
    int64_t n = pos() - mark - 4;
    if (n < 0 || static_cast<uint64_t>(n) >= kByteCountMask) {
        if (err_.empty()) err_ = "object too large for a byte count";
        return;
    }
    patch_u32(mark, static_cast<uint32_t>(n) | kByteCountMask);
}

void WriteBuffer::patch_u32(int64_t at, uint32_t v) {
    int64_t i = at - offset_;
    if (i < 0 || static_cast<size_t>(i) + 4 > buf_.size()) {
        if (err_.empty()) err_ = "patch outside buffer at " + std::to_string(at);
        return;
    }
    for (size_t k = 0; k < 4; ++k)
        buf_[static_cast<size_t>(i) + k] = static_cast<uint8_t>(v >> (8 * (3 - k)));
}

} // namespace rootio
