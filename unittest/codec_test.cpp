// ============================================================================
// BINARY CODEC UNIT TESTS
// ============================================================================
// Little-endian ByteWriter / ByteReader and the big-endian frame prefix
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/common/codec.hpp>
#include <stdexcept>

using namespace VectorCluster;

TEST(CodecTest, IntegersAreLittleEndian) {
    ByteWriter w;
    w.putU16(0x0102);
    w.putU32(0x03040506);
    ASSERT_EQ(w.size(), 6u);
    const auto& data = w.data();
    EXPECT_EQ(data[0], 0x02);
    EXPECT_EQ(data[1], 0x01);
    EXPECT_EQ(data[2], 0x06);
    EXPECT_EQ(data[5], 0x03);
}

TEST(CodecTest, ReadsBackMixedFields) {
    ByteWriter w;
    w.putU8(7);
    w.putBool(true);
    w.putU64(0xFFFFFFFFFFFFFFFFull);
    w.putFloat(-1.5f);
    w.putString("collection");
    w.putBytes({1, 2, 3});

    auto buffer = w.take();
    ByteReader r(buffer);
    EXPECT_EQ(r.getU8(), 7);
    EXPECT_TRUE(r.getBool());
    EXPECT_EQ(r.getU64(), 0xFFFFFFFFFFFFFFFFull);
    EXPECT_FLOAT_EQ(r.getFloat(), -1.5f);
    EXPECT_EQ(r.getString(), "collection");
    EXPECT_EQ(r.getBytes(), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_TRUE(r.atEnd());
}

TEST(CodecTest, EmptyStringTakesOnlyLength) {
    ByteWriter w;
    w.putString("");
    EXPECT_EQ(w.size(), 4u);
}

TEST(CodecTest, ThrowsPastEnd) {
    std::vector<uint8_t> buffer = {1, 2, 3};
    ByteReader r(buffer);
    EXPECT_THROW(r.getU32(), std::runtime_error);
}

TEST(CodecTest, ThrowsOnTruncatedString) {
    ByteWriter w;
    w.putU32(100);      // Claims 100 bytes
    w.putU8('x');
    auto buffer = w.take();
    ByteReader r(buffer);
    EXPECT_THROW(r.getString(), std::runtime_error);
}

TEST(CodecTest, RemainingTracksOffset) {
    ByteWriter w;
    w.putU32(1);
    w.putU16(2);
    auto buffer = w.take();
    ByteReader r(buffer);
    EXPECT_EQ(r.remaining(), 6u);
    r.getU32();
    EXPECT_EQ(r.remaining(), 2u);
    EXPECT_FALSE(r.atEnd());
}

TEST(CodecTest, FrameLengthIsBigEndian) {
    uint8_t header[4];
    writeUint32BE(header, 0x0A0B0C0D);
    EXPECT_EQ(header[0], 0x0A);
    EXPECT_EQ(header[3], 0x0D);
    EXPECT_EQ(readUint32BE(header), 0x0A0B0C0Du);
}
