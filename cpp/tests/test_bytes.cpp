#include "test_util.hpp"
#include "rootio/bytes.hpp"

#include <vector>

using namespace rootio;

TEST(BytesTest, WritesBigEndian) {
    WriteBuffer w;
    w.write_i16(0x0102);
    w.write_i32(0x03040506);
    w.write_u64(0x0708090A0B0C0D0EULL);

    std::vector<uint8_t> want = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14};
    EXPECT_EQ(w.bytes(), want);
}

TEST(BytesTest, ReadsWhatWasWritten) {
    WriteBuffer w;
    w.write_i8(-3);
    w.write_u16(65000);
    w.write_i32(-123456);
    w.write_i64(-9000000000LL);
    w.write_f32(1.5f);
    w.write_f64(-2.25);
    w.write_bool(true);

    ReadBuffer r(w.bytes());
    EXPECT_EQ(r.read_i8(), -3);
    EXPECT_EQ(r.read_u16(), 65000);
    EXPECT_EQ(r.read_i32(), -123456);
    EXPECT_EQ(r.read_i64(), -9000000000LL);
    EXPECT_EQ(r.read_f32(), 1.5f);
    EXPECT_EQ(r.read_f64(), -2.25);
    EXPECT_TRUE(r.read_bool());
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(BytesTest, ShortStringHasOneBytePrefix) {
    WriteBuffer w;
    w.write_string("abc");
    ASSERT_EQ(w.size(), 4u);
    EXPECT_EQ(w.bytes()[0], 3);
}

TEST(BytesTest, LongStringUsesEscapedPrefix) {
    std::string s(300, 'x');
    WriteBuffer w;
    w.write_string(s);
    ASSERT_EQ(w.size(), 5u + 300u);
    EXPECT_EQ(w.bytes()[0], 255);

    ReadBuffer r(w.bytes());
    EXPECT_EQ(r.read_string(), s);
    EXPECT_TRUE(r.ok());
}

TEST(BytesTest, CStringNeedsTerminator) {
    std::vector<uint8_t> data = {'a', 'b'};
    ReadBuffer r(data);
    EXPECT_EQ(r.read_cstring(), "");
    EXPECT_FALSE(r.ok());
}

TEST(BytesTest, ShortReadPoisonsBuffer) {
    std::vector<uint8_t> data = {0, 0, 0};
    ReadBuffer r(data);
    EXPECT_EQ(r.read_i32(), 0);
    EXPECT_FALSE(r.ok());

    // The first error sticks; later reads yield zero.
    std::string first = r.error();
    EXPECT_EQ(r.read_u8(), 0);
    EXPECT_EQ(r.error(), first);
    EXPECT_ROOTIO_ERROR(r.check(), ErrorCode::kIOError);
}

TEST(BytesTest, PositionsIncludeOffset) {
    std::vector<uint8_t> data(10, 0);
    data[4] = 42;
    ReadBuffer r(data, 100);
    EXPECT_EQ(r.pos(), 100);
    EXPECT_EQ(r.end(), 110);

    r.set_pos(104);
    EXPECT_EQ(r.read_u8(), 42);

    r.set_pos(99);
    EXPECT_FALSE(r.ok());
}

TEST(BytesTest, HeaderCountsBytesAfterCountWord) {
    WriteBuffer w;
    int64_t mark = w.write_header(3);
    w.write_i32(7);
    w.close_header(mark);
    ASSERT_TRUE(w.ok());

    ReadBuffer back(w.bytes());
    EXPECT_EQ(back.read_u32(), kByteCountMask | 6u);

    ReadBuffer r(w.bytes());
    ObjectHeader hdr = r.read_header();
    EXPECT_EQ(hdr.version, 3);
    EXPECT_EQ(hdr.byte_count, 6u);
    EXPECT_EQ(r.read_i32(), 7);
    r.check_header(hdr, "Test");
    EXPECT_TRUE(r.ok());
}

TEST(BytesTest, CheckHeaderSkipsUnreadFields) {
    WriteBuffer w;
    int64_t mark = w.write_header(2);
    w.write_i32(1);
    w.write_i32(2);
    w.write_i32(3);
    w.close_header(mark);
    w.write_u8(0xAB);

    ReadBuffer r(w.bytes());
    ObjectHeader hdr = r.read_header();
    EXPECT_EQ(r.read_i32(), 1);
    r.check_header(hdr, "Test");
    EXPECT_EQ(r.read_u8(), 0xAB);
    EXPECT_TRUE(r.ok());
}

TEST(BytesTest, OverrunningByteCountIsCorrupt) {
    WriteBuffer w;
    int64_t mark = w.write_header(1);
    w.write_i16(5);
    w.close_header(mark);
    w.write_i32(0);

    ReadBuffer r(w.bytes());
    ObjectHeader hdr = r.read_header();
    r.read_i32();
    r.check_header(hdr, "Test");
    EXPECT_ROOTIO_ERROR(r.check(), ErrorCode::kCorruptBlock);
}

TEST(BytesTest, LegacyHeaderHasNoByteCount) {
    std::vector<uint8_t> data = {0x00, 0x05, 0x00, 0x00, 0x00, 0x09};
    ReadBuffer r(data);
    ObjectHeader hdr = r.read_header();
    EXPECT_EQ(hdr.byte_count, 0u);
    EXPECT_EQ(hdr.version, 5);
    EXPECT_EQ(r.read_i32(), 9);
}

TEST(BytesTest, WriteBufferPositionsIncludeOffset) {
    WriteBuffer w(1000);
    EXPECT_EQ(w.pos(), 1000);
    w.write_i32(0);
    w.patch_u32(1000, 0xDEADBEEF);
    EXPECT_TRUE(w.ok());
    ReadBuffer r(w.bytes());
    EXPECT_EQ(r.read_u32(), 0xDEADBEEFu);

    w.patch_u32(0, 1);
    EXPECT_FALSE(w.ok());
    EXPECT_ROOTIO_ERROR(w.check(), ErrorCode::kIOError);
}
