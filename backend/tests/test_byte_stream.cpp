#include <gtest/gtest.h>
#include "storage/ByteStream.hpp"
#include "utils/Errors.hpp"

TEST(ByteStreamTest, IntegersAreBigEndian) {
    ByteWriter w;
    w.writeU16BE(0x1234);
    w.writeU32BE(0xA1B2C3D4);

    std::vector<std::uint8_t> expected = { 0x12, 0x34, 0xA1, 0xB2, 0xC3, 0xD4 };
    EXPECT_EQ(w.data(), expected);

    ByteReader r(w.data());
    EXPECT_EQ(r.readU16BE(), 0x1234);
    EXPECT_EQ(r.readU32BE(), 0xA1B2C3D4u);
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(ByteStreamTest, CStringIsNullTerminated) {
    ByteWriter w;
    w.writeCString("enUS");
    w.writeCString("");

    ASSERT_EQ(w.size(), 6u);
    EXPECT_EQ(w.data()[4], 0);

    ByteReader r(w.data());
    EXPECT_EQ(r.readCString(), "enUS");
    EXPECT_EQ(r.readCString(), "");
    EXPECT_EQ(r.position(), 6u);
}

TEST(ByteStreamTest, UnterminatedStringThrows) {
    std::vector<std::uint8_t> bytes = { 'a', 'b' };
    ByteReader r(bytes);
    EXPECT_THROW(r.readCString(), FormatError);
}

TEST(ByteStreamTest, ShortReadsThrow) {
    std::vector<std::uint8_t> bytes = { 0x01, 0x02, 0x03 };
    ByteReader r(bytes);
    EXPECT_THROW(r.readU32BE(), FormatError);
    EXPECT_EQ(r.readU16BE(), 0x0102);
    EXPECT_THROW(r.readBytes(2), FormatError);
    EXPECT_EQ(r.readU8(), 0x03);
    EXPECT_THROW(r.readU8(), FormatError);
}

TEST(ByteStreamTest, ReaderStartsAtOffset) {
    std::vector<std::uint8_t> bytes = { 0xFF, 0x00, 0x2A };
    ByteReader r(bytes, 1);
    EXPECT_EQ(r.readU16BE(), 0x002A);
}
