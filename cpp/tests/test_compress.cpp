#include "test_util.hpp"
#include "rootio/compress.hpp"

#include <random>
#include <tuple>
#include <vector>

using namespace rootio;

namespace {

std::vector<uint8_t> pattern(size_t n) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 7) % 13);
    return v;
}

std::vector<uint8_t> noise(size_t n) {
    std::mt19937 gen(1234);
    std::vector<uint8_t> v(n);
    for (auto& b : v) b = static_cast<uint8_t>(gen());
    return v;
}

} // anon

class CodecTest : public ::testing::TestWithParam<Algorithm> {};

TEST_P(CodecTest, InflatesToOriginal) {
    CompressionSettings cs{GetParam(), 4};
    auto src    = pattern(100000);
    auto stored = compress(cs, src);
    ASSERT_LT(stored.size(), src.size());
    EXPECT_EQ(decompress(stored, src.size()), src);
}

TEST_P(CodecTest, UnknownTagIsCorrupt) {
    CompressionSettings cs{GetParam(), 4};
    auto src    = pattern(10000);
    auto stored = compress(cs, src);
    ASSERT_LT(stored.size(), src.size());
    stored[0] = 'Q';
    EXPECT_ROOTIO_ERROR(decompress(stored, src.size()), ErrorCode::kCorruptBlock);
}

TEST_P(CodecTest, TruncatedPayloadIsCorrupt) {
    CompressionSettings cs{GetParam(), 4};
    auto src    = pattern(10000);
    auto stored = compress(cs, src);
    ASSERT_LT(stored.size(), src.size());
    stored.resize(stored.size() - 3);
    EXPECT_ROOTIO_ERROR(decompress(stored, src.size()), ErrorCode::kCorruptBlock);
}

INSTANTIATE_TEST_SUITE_P(Algorithms, CodecTest,
                         ::testing::Values(Algorithm::kZLIB, Algorithm::kLZMA,
                                           Algorithm::kLZ4, Algorithm::kZSTD));

class CodecSizeTest : public ::testing::TestWithParam<std::tuple<Algorithm, size_t>> {};

TEST_P(CodecSizeTest, InflatesToOriginal) {
    CompressionSettings cs{std::get<0>(GetParam()), 1};
    size_t n      = std::get<1>(GetParam());
    auto   src    = pattern(n);
    auto   stored = compress(cs, src);
    if (n > kMaxChunk) ASSERT_LT(stored.size(), src.size());
    EXPECT_EQ(decompress(stored, src.size()), src);
}

INSTANTIATE_TEST_SUITE_P(AlgorithmsAndSizes, CodecSizeTest,
                         ::testing::Combine(::testing::Values(Algorithm::kZLIB, Algorithm::kLZMA,
                                                              Algorithm::kLZ4, Algorithm::kZSTD),
                                            ::testing::Values(size_t(0), size_t(1),
                                                              kMaxChunk + 1000)));

TEST(CompressTest, EnvelopesMustAddUpToDeclaredLength) {
    auto src    = pattern(10000);
    auto stored = compress({Algorithm::kZLIB, 5}, src);
    ASSERT_LT(stored.size(), src.size());
    EXPECT_ROOTIO_ERROR(decompress(stored, 0x7fffff00), ErrorCode::kCorruptBlock);
    EXPECT_ROOTIO_ERROR(decompress(stored, src.size() + 1), ErrorCode::kCorruptBlock);
}

TEST(CompressTest, EnvelopeTagsAndLittleEndianSizes) {
    auto src    = std::vector<uint8_t>(1000, 0);
    auto stored = compress({Algorithm::kZLIB, 1}, src);
    ASSERT_GT(stored.size(), kEnvelopeHeaderSize);
    EXPECT_EQ(stored[0], 'Z');
    EXPECT_EQ(stored[1], 'L');

    size_t csize = stored[3] | stored[4] << 8 | stored[5] << 16;
    EXPECT_EQ(csize, stored.size() - kEnvelopeHeaderSize);
    EXPECT_EQ(stored[6], 0xE8);
    EXPECT_EQ(stored[7], 0x03);
    EXPECT_EQ(stored[8], 0x00);
}

TEST(CompressTest, TagsPerAlgorithm) {
    auto src = pattern(5000);
    EXPECT_EQ(compress({Algorithm::kLZMA, 1}, src)[0], 'X');
    EXPECT_EQ(compress({Algorithm::kLZ4, 1}, src)[0], 'L');
    EXPECT_EQ(compress({Algorithm::kZSTD, 1}, src)[1], 'S');
}

TEST(CompressTest, LevelZeroStores) {
    auto src = pattern(5000);
    EXPECT_EQ(compress({Algorithm::kZLIB, 0}, src), src);
}

TEST(CompressTest, IncompressibleInputIsStored) {
    auto src = noise(64);
    EXPECT_EQ(compress({Algorithm::kZLIB, 9}, src), src);
    EXPECT_EQ(decompress(src, src.size()), src);
}

TEST(CompressTest, LargeInputSplitsIntoChunks) {
    std::vector<uint8_t> src(kMaxChunk + 1000, 1);
    auto stored = compress({Algorithm::kZLIB, 1}, src);

    size_t csize = stored[3] | stored[4] << 8 | stored[5] << 16;
    size_t usize = stored[6] | stored[7] << 8 | stored[8] << 16;
    EXPECT_EQ(usize, kMaxChunk);
    size_t second = kEnvelopeHeaderSize + csize;
    ASSERT_LT(second + kEnvelopeHeaderSize, stored.size());
    EXPECT_EQ(stored[second], 'Z');
    EXPECT_EQ(stored[second + 1], 'L');

    EXPECT_EQ(decompress(stored, src.size()), src);
}

TEST(CompressTest, LZ4ChecksumMismatchIsCorrupt) {
    auto src    = pattern(10000);
    auto stored = compress({Algorithm::kLZ4, 1}, src);
    ASSERT_LT(stored.size(), src.size());
    stored[kEnvelopeHeaderSize] ^= 0xFF;
    EXPECT_ROOTIO_ERROR(decompress(stored, src.size()), ErrorCode::kCorruptBlock);
}

TEST(CompressTest, TrailingBytesAreCorrupt) {
    auto src    = pattern(10000);
    auto stored = compress({Algorithm::kZLIB, 1}, src);
    stored.push_back(0);
    EXPECT_ROOTIO_ERROR(decompress(stored, src.size()), ErrorCode::kCorruptBlock);
}

TEST(CompressTest, WrongDeclaredLengthIsCorrupt) {
    auto src    = pattern(10000);
    auto stored = compress({Algorithm::kZSTD, 3}, src);
    EXPECT_ROOTIO_ERROR(decompress(stored, src.size() - 1), ErrorCode::kCorruptBlock);
}

TEST(CompressTest, PackedSettings) {
    auto cs = CompressionSettings::from_packed(505);
    EXPECT_EQ(cs.algorithm, Algorithm::kZSTD);
    EXPECT_EQ(cs.level, 5);
    EXPECT_EQ(cs.packed(), 505);

    auto bare = CompressionSettings::from_packed(1);
    EXPECT_EQ(bare.algorithm, Algorithm::kZLIB);
    EXPECT_EQ(bare.level, 1);

    EXPECT_FALSE(CompressionSettings::from_packed(0).enabled());
}

TEST(CompressTest, AlgorithmNames) {
    Algorithm a;
    ASSERT_TRUE(parse_algorithm("xz", a));
    EXPECT_EQ(a, Algorithm::kLZMA);
    ASSERT_TRUE(parse_algorithm("deflate", a));
    EXPECT_EQ(a, Algorithm::kZLIB);
    EXPECT_FALSE(parse_algorithm("brotli", a));
    EXPECT_STREQ(algorithm_name(Algorithm::kLZ4), "lz4");
}
