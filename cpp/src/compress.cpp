// rootio – compression envelopes: zlib, lzma, lz4 (+xxh64), zstd

#include "rootio/compress.hpp"
#include "rootio/error.hpp"
#include "rootio/log.hpp"

#include <algorithm>
#include <cstring>

#include <lz4.h>
#include <lz4hc.h>
#include <lzma.h>
#include <xxhash.h>
#include <zlib.h>
#include <zstd.h>
#include <zstd_errors.h>

namespace rootio {

namespace {

[[noreturn]] void corrupt(const std::string& msg) {
    fail(ErrorCode::kCorruptBlock, msg);
}

void put_u24le(uint8_t* p, size_t v) {
    p[0] = static_cast<uint8_t>(v & 0xff);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xff);
    p[2] = static_cast<uint8_t>((v >> 16) & 0xff);
}

size_t get_u24le(const uint8_t* p) {
    return static_cast<size_t>(p[0])
         | static_cast<size_t>(p[1]) << 8
         | static_cast<size_t>(p[2]) << 16;
}

// Sum of the inflated sizes the envelope headers declare.
size_t declared_size(const uint8_t* src, size_t n) {
    size_t in    = 0;
    size_t total = 0;
    while (in < n) {
        if (n - in < kEnvelopeHeaderSize)
            corrupt("truncated compression envelope at byte " + std::to_string(in));
        size_t csize = get_u24le(src + in + 3);
        total += get_u24le(src + in + 6);
        in += kEnvelopeHeaderSize;
        if (csize > n - in)
            corrupt("envelope claims " + std::to_string(csize) + " bytes, "
                    + std::to_string(n - in) + " left");
        in += csize;
    }
    return total;
}

void put_u64be(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i)
        p[i] = static_cast<uint8_t>(v >> (8 * (7 - i)));
}

uint64_t get_u64be(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

struct Codec {
    char    tag[2];
    uint8_t method;
};

Codec codec_for(Algorithm alg) {
    switch (alg) {
        case Algorithm::kZLIB: return {{'Z', 'L'}, Z_DEFLATED};
        case Algorithm::kLZMA: return {{'X', 'Z'}, 0};
        case Algorithm::kLZ4:
            return {{'L', '4'}, static_cast<uint8_t>(LZ4_versionNumber() / (100 * 100))};
        case Algorithm::kZSTD: return {{'Z', 'S'}, 1};
        default:
            fail(ErrorCode::kInvalidArgument,
                 std::string("cannot compress with algorithm ") + algorithm_name(alg));
    }
}

// Each encoder writes into [dst, dst+cap) and returns the byte count, or 0
// when the chunk does not fit (the caller then stores the payload raw).

size_t encode_zlib(int level, const uint8_t* src, size_t n, uint8_t* dst, size_t cap) {
    uLongf out_len = static_cast<uLongf>(cap);
    int rc = ::compress2(dst, &out_len, src, static_cast<uLong>(n),
                         std::min(std::max(level, 1), 9));
    if (rc == Z_BUF_ERROR) return 0;
    if (rc != Z_OK) fail(ErrorCode::kInvalidArgument, "zlib compress2 failed");
    return static_cast<size_t>(out_len);
}

size_t encode_lzma(int level, const uint8_t* src, size_t n, uint8_t* dst, size_t cap) {
    size_t out_pos = 0;
    lzma_ret rc = lzma_easy_buffer_encode(
        static_cast<uint32_t>(std::min(std::max(level, 0), 9)), LZMA_CHECK_CRC32,
        nullptr, src, n, dst, &out_pos, cap);
    if (rc == LZMA_BUF_ERROR) return 0;
    if (rc != LZMA_OK) fail(ErrorCode::kInvalidArgument, "lzma encode failed");
    return out_pos;
}

size_t encode_lz4(int level, const uint8_t* src, size_t n, uint8_t* dst, size_t cap) {
    if (cap <= kLZ4ChecksumSize) return 0;
    char* block = reinterpret_cast<char*>(dst + kLZ4ChecksumSize);
    int   bcap  = static_cast<int>(cap - kLZ4ChecksumSize);
    int   m;
    if (level >= 4)
        m = LZ4_compress_HC(reinterpret_cast<const char*>(src), block,
                            static_cast<int>(n), bcap, std::min(level, LZ4HC_CLEVEL_MAX));
    else
        m = LZ4_compress_default(reinterpret_cast<const char*>(src), block,
                                 static_cast<int>(n), bcap);
    if (m <= 0) return 0;
    put_u64be(dst, XXH64(block, static_cast<size_t>(m), 0));
    return kLZ4ChecksumSize + static_cast<size_t>(m);
}

size_t encode_zstd(int level, const uint8_t* src, size_t n, uint8_t* dst, size_t cap) {
    size_t rc = ZSTD_compress(dst, cap, src, n, std::min(level, ZSTD_maxCLevel()));
    if (ZSTD_isError(rc)) {
        if (ZSTD_getErrorCode(rc) == ZSTD_error_dstSize_tooSmall) return 0;
        fail(ErrorCode::kInvalidArgument,
             std::string("zstd: ") + ZSTD_getErrorName(rc));
    }
    return rc;
}

size_t encode_chunk(const CompressionSettings& cs, const uint8_t* src, size_t n,
                    uint8_t* dst, size_t cap) {
    switch (cs.algorithm) {
        case Algorithm::kZLIB: return encode_zlib(cs.level, src, n, dst, cap);
        case Algorithm::kLZMA: return encode_lzma(cs.level, src, n, dst, cap);
        case Algorithm::kLZ4:  return encode_lz4(cs.level, src, n, dst, cap);
        case Algorithm::kZSTD: return encode_zstd(cs.level, src, n, dst, cap);
        default:
            fail(ErrorCode::kInvalidArgument,
                 std::string("unsupported compression algorithm ")
                 + algorithm_name(cs.algorithm));
    }
}

void decode_chunk(const char* tag, const uint8_t* src, size_t n,
                  uint8_t* dst, size_t ulen) {
    if (std::memcmp(tag, "ZL", 2) == 0) {
        uLongf out_len = static_cast<uLongf>(ulen);
        int rc = ::uncompress(dst, &out_len, src, static_cast<uLong>(n));
        if (rc != Z_OK) corrupt("zlib uncompress failed (rc=" + std::to_string(rc) + ")");
        if (out_len != ulen) corrupt("zlib decompressed size mismatch");
        return;
    }
    if (std::memcmp(tag, "XZ", 2) == 0) {
        uint64_t memlimit = UINT64_MAX;
        size_t   in_pos   = 0;
        size_t   out_pos  = 0;
        lzma_ret rc = lzma_stream_buffer_decode(&memlimit, 0, nullptr, src, &in_pos, n,
                                                dst, &out_pos, ulen);
        if (rc != LZMA_OK) corrupt("lzma decode failed (rc=" + std::to_string(rc) + ")");
        if (out_pos != ulen) corrupt("lzma decompressed size mismatch");
        return;
    }
    if (std::memcmp(tag, "L4", 2) == 0) {
        if (n < kLZ4ChecksumSize) corrupt("lz4 chunk shorter than its checksum");
        const uint8_t* block = src + kLZ4ChecksumSize;
        size_t         blen  = n - kLZ4ChecksumSize;
        if (XXH64(block, blen, 0) != get_u64be(src))
            corrupt("lz4 checksum mismatch");
        int m = LZ4_decompress_safe(reinterpret_cast<const char*>(block),
                                    reinterpret_cast<char*>(dst),
                                    static_cast<int>(blen), static_cast<int>(ulen));
        if (m < 0 || static_cast<size_t>(m) != ulen)
            corrupt("lz4 decompressed size mismatch");
        return;
    }
    if (std::memcmp(tag, "ZS", 2) == 0) {
        size_t rc = ZSTD_decompress(dst, ulen, src, n);
        if (ZSTD_isError(rc)) corrupt(std::string("zstd: ") + ZSTD_getErrorName(rc));
        if (rc != ulen) corrupt("zstd decompressed size mismatch");
        return;
    }
    if (std::memcmp(tag, "CS", 2) == 0)
        corrupt("legacy CS compression is not supported");
    corrupt("unknown compression tag '" + std::string(tag, 2) + "'");
}

} // namespace

// ── Settings ───────────────────────────────────────────────────────────────

const char* algorithm_name(Algorithm alg) {
    switch (alg) {
        case Algorithm::kInherit:        return "inherit";
        case Algorithm::kZLIB:           return "zlib";
        case Algorithm::kLZMA:           return "lzma";
        case Algorithm::kOldCompression: return "old";
        case Algorithm::kLZ4:            return "lz4";
        case Algorithm::kZSTD:           return "zstd";
    }
    return "?";
}

bool parse_algorithm(const std::string& name, Algorithm& out) {
    if (name == "zlib" || name == "deflate" || name == "flate") { out = Algorithm::kZLIB; return true; }
    if (name == "lzma" || name == "xz")   { out = Algorithm::kLZMA; return true; }
    if (name == "lz4")                    { out = Algorithm::kLZ4;  return true; }
    if (name == "zstd")                   { out = Algorithm::kZSTD; return true; }
    if (name == "inherit" || name == "none") { out = Algorithm::kInherit; return true; }
    return false;
}

CompressionSettings CompressionSettings::from_packed(int32_t packed) {
    CompressionSettings cs;
    if (packed < 0) packed = 0;
    int alg = packed / 100;
    cs.level = packed % 100;
    if (alg == 0 && cs.level > 0) alg = 1;   // bare level means zlib
    if (alg < 0 || alg > 5) alg = 0;
    cs.algorithm = static_cast<Algorithm>(alg);
    return cs;
}

// ── Compress / decompress ──────────────────────────────────────────────────

std::vector<uint8_t> compress(const CompressionSettings& settings,
                              const uint8_t* src, size_t n) {
    std::vector<uint8_t> raw(src, src + n);
    if (!settings.enabled() || n == 0
        || settings.algorithm == Algorithm::kInherit
        || settings.algorithm == Algorithm::kOldCompression)
        return raw;

    const Codec codec = codec_for(settings.algorithm);

    std::vector<uint8_t> out;
    out.reserve(n);
    std::vector<uint8_t> chunk;
    for (size_t off = 0; off < n; off += kMaxChunk) {
        size_t len = std::min(kMaxChunk, n - off);
        // Output is capped at the chunk size.
        chunk.resize(len);
        size_t m = encode_chunk(settings, src + off, len, chunk.data(), chunk.size());
        if (m == 0 || m >= len || kEnvelopeHeaderSize + out.size() + m >= n) {
            trace() << "compress: " << algorithm_name(settings.algorithm)
                    << " did not shrink " << n << " bytes, storing";
            return raw;
        }
        uint8_t hdr[kEnvelopeHeaderSize];
        hdr[0] = static_cast<uint8_t>(codec.tag[0]);
        hdr[1] = static_cast<uint8_t>(codec.tag[1]);
        hdr[2] = codec.method;
        put_u24le(hdr + 3, m);
        put_u24le(hdr + 6, len);
        out.insert(out.end(), hdr, hdr + kEnvelopeHeaderSize);
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(m));
    }
    return out;
}

void decompress(const uint8_t* src, size_t n, uint8_t* dst, size_t ulen) {
    if (n == ulen) {   // stored
        if (n) std::memcpy(dst, src, n);
        return;
    }

    size_t in = 0;
    size_t out = 0;
    while (out < ulen) {
        if (n - in < kEnvelopeHeaderSize)
            corrupt("truncated compression envelope at byte " + std::to_string(in));
        const uint8_t* hdr   = src + in;
        size_t         csize = get_u24le(hdr + 3);
        size_t         usize = get_u24le(hdr + 6);
        in += kEnvelopeHeaderSize;
        if (csize > n - in)
            corrupt("envelope claims " + std::to_string(csize) + " bytes, "
                    + std::to_string(n - in) + " left");
        if (usize > ulen - out)
            corrupt("envelope inflates past declared length "
                    + std::to_string(ulen));
        if (usize == 0) corrupt("empty compression envelope");
        decode_chunk(reinterpret_cast<const char*>(hdr), src + in, csize,
                     dst + out, usize);
        in  += csize;
        out += usize;
    }
    if (in != n)
        corrupt("trailing " + std::to_string(n - in) + " bytes after envelopes");
}

std::vector<uint8_t> decompress(const std::vector<uint8_t>& src, size_t ulen) {
    if (src.size() != ulen) {
        size_t declared = declared_size(src.data(), src.size());
        if (declared != ulen)
            corrupt("envelopes inflate to " + std::to_string(declared) + " bytes, expected "
                    + std::to_string(ulen));
    }
    std::vector<uint8_t> out(ulen);
    decompress(src.data(), src.size(), out.data(), ulen);
    return out;
}

} // namespace rootio
