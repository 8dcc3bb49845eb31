// rootio – key record

#include "rootio/key.hpp"
#include "rootio/compress.hpp"
#include "rootio/io.hpp"

namespace rootio {

namespace {

int32_t string_size(const std::string& s) {
    return static_cast<int32_t>(s.size() < 255 ? 1 + s.size() : 5 + s.size());
}

// nbytes, version, objlen, datime, keylen, cycle
constexpr int32_t kKeyFixedSize = 4 + 2 + 4 + 4 + 2 + 2;
// offset of the keylen field inside the header
constexpr int32_t kKeyLenOffset = 4 + 2 + 4 + 4;

} // namespace

uint32_t pack_datime(std::time_t t) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    int year = tm.tm_year + 1900;
    if (year < 1995) year = 1995;
    return static_cast<uint32_t>(year - 1995) << 26
         | static_cast<uint32_t>(tm.tm_mon + 1) << 22
         | static_cast<uint32_t>(tm.tm_mday) << 17
         | static_cast<uint32_t>(tm.tm_hour) << 12
         | static_cast<uint32_t>(tm.tm_min) << 6
         | static_cast<uint32_t>(tm.tm_sec);
}

std::time_t unpack_datime(uint32_t d) {
    std::tm tm{};
    tm.tm_year  = static_cast<int>(d >> 26) + 1995 - 1900;
    tm.tm_mon   = static_cast<int>((d >> 22) & 0xF) - 1;
    tm.tm_mday  = static_cast<int>((d >> 17) & 0x1F);
    tm.tm_hour  = static_cast<int>((d >> 12) & 0x1F);
    tm.tm_min   = static_cast<int>((d >> 6) & 0x3F);
    tm.tm_sec   = static_cast<int>(d & 0x3F);
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

int32_t Key::header_size() const {
    int32_t seeks = is_big() ? 16 : 8;
    return kKeyFixedSize + seeks
         + string_size(class_name) + string_size(name) + string_size(title);
}

void Key::read(ReadBuffer& r) {
    nbytes  = r.read_i32();
    version = r.read_i16();
    objlen  = r.read_i32();
    datime  = r.read_u32();
    keylen  = r.read_i16();
    cycle   = r.read_i16();
    if (is_big()) {
        seek_key  = r.read_i64();
        seek_pdir = r.read_i64();
    } else {
        seek_key  = r.read_i32();
        seek_pdir = r.read_i32();
    }
    class_name = r.read_string();
    name       = r.read_string();
    title      = r.read_string();

    if (r.ok() && (nbytes < keylen || keylen < 0 || objlen < 0))
        r.set_error(ErrorCode::kCorruptBlock,
                    "inconsistent key header for '" + name + "' (nbytes="
                    + std::to_string(nbytes) + " keylen=" + std::to_string(keylen)
                    + " objlen=" + std::to_string(objlen) + ")");
}

void Key::write(WriteBuffer& w) const {
    w.write_i32(nbytes);
    w.write_i16(version);
    w.write_i32(objlen);
    w.write_u32(datime);
    w.write_i16(keylen);
    w.write_i16(cycle);
    if (is_big()) {
        w.write_i64(seek_key);
        w.write_i64(seek_pdir);
    } else {
        w.write_i32(static_cast<int32_t>(seek_key));
        w.write_i32(static_cast<int32_t>(seek_pdir));
    }
    w.write_string(class_name);
    w.write_string(name);
    w.write_string(title);
}

Key Key::read_at(const FileHandle& f, int64_t pos) {
    if (pos < 0 || static_cast<uint64_t>(pos) + kKeyFixedSize > f.size())
        fail(ErrorCode::kIOError, "key header at " + std::to_string(pos)
                                  + " lies past end of file");

    uint8_t fixed[kKeyFixedSize];
    f.pread(fixed, sizeof(fixed), static_cast<uint64_t>(pos));
    ReadBuffer head(fixed, sizeof(fixed));
    head.skip(kKeyLenOffset);
    int16_t keylen = head.read_i16();
    if (keylen < kKeyFixedSize)
        fail(ErrorCode::kCorruptBlock,
             "invalid key length " + std::to_string(keylen) + " at " + std::to_string(pos));

    std::vector<uint8_t> hdr(static_cast<size_t>(keylen));
    f.pread(hdr.data(), hdr.size(), static_cast<uint64_t>(pos));
    ReadBuffer r(hdr, pos);
    Key k;
    k.read(r);
    r.check();
    return k;
}

std::vector<uint8_t> Key::load(const FileHandle& f) const {
    if (stored_size() < 0 || objlen < 0)
        fail(ErrorCode::kCorruptBlock, "key '" + name + "' has negative sizes");
    uint64_t payload_end = static_cast<uint64_t>(seek_key) + static_cast<uint64_t>(keylen)
                         + static_cast<uint64_t>(stored_size());
    if (seek_key < 0 || payload_end > f.size())
        fail(ErrorCode::kCorruptBlock, "payload of key '" + name + "' runs past end of file");
    std::vector<uint8_t> stored(static_cast<size_t>(stored_size()));
    if (!stored.empty())
        f.pread(stored.data(), stored.size(), static_cast<uint64_t>(seek_key + keylen));
    return decompress(stored, static_cast<size_t>(objlen));
}

} // namespace rootio
