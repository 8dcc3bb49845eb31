// rootio – block compression envelopes (ZL, XZ, L4, ZS)
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rootio {

enum class Algorithm : int {
    kInherit        = 0,
    kZLIB           = 1,
    kLZMA           = 2,
    kOldCompression = 3,
    kLZ4            = 4,
    kZSTD           = 5,
};

const char* algorithm_name(Algorithm alg);
bool        parse_algorithm(const std::string& name, Algorithm& out);

/// Packed on disk as algorithm * 100 + level. Level 0 stores payloads as-is.
struct CompressionSettings {
    Algorithm algorithm = Algorithm::kZLIB;
    int       level     = 1;

    static CompressionSettings from_packed(int32_t packed);
    int32_t packed() const { return static_cast<int>(algorithm) * 100 + level; }
    bool    enabled() const { return level > 0; }
};

constexpr size_t kEnvelopeHeaderSize = 9;
constexpr size_t kMaxChunk           = 0xFFFFFF;   // 24-bit size fields
constexpr size_t kLZ4ChecksumSize    = 8;

/// Compress `src` into a chain of envelopes, one per kMaxChunk of input.
/// Returns `src` unchanged when compression is off or does not shrink it.
std::vector<uint8_t> compress(const CompressionSettings& settings,
                              const uint8_t* src, size_t n);

inline std::vector<uint8_t> compress(const CompressionSettings& settings,
                                     const std::vector<uint8_t>& src) {
    return compress(settings, src.data(), src.size());
}

/// Inflate `n` stored bytes into exactly `ulen` bytes at `dst`.
/// Throws Error(kCorruptBlock) on any tag, codec, checksum or size mismatch.
void decompress(const uint8_t* src, size_t n, uint8_t* dst, size_t ulen);

/// As above into a new buffer. The envelope headers must add up to `ulen`
/// before anything is allocated.
std::vector<uint8_t> decompress(const std::vector<uint8_t>& src, size_t ulen);

} // namespace rootio
