#include "ChunkType.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <array>
#include <sstream>

namespace {

ChunkType rust()
{
    std::array<uint8_t, 4> bytes = {{82, 117, 83, 116}};
    return ChunkType(bytes);
}


TEST(ChunkTypeTest, FromBytesKeepsBytes)
{
    std::array<uint8_t, 4> expected = {{82, 117, 83, 116}};
    EXPECT_EQ(rust().bytes(), expected);
}


TEST(ChunkTypeTest, FromBytesDoesNotValidate)
{
    std::array<uint8_t, 4> bytes = {{'R', 'u', '1', 0}};
    ChunkType type(bytes);
    EXPECT_EQ(type.bytes(), bytes);
    EXPECT_FALSE(type.isValid());
}


TEST(ChunkTypeTest, FromStringMatchesFromBytes)
{
    EXPECT_EQ(ChunkType::fromString("RuSt"), rust());
    EXPECT_NE(ChunkType::fromString("RUSt"), rust());
}


TEST(ChunkTypeTest, Critical)
{
    EXPECT_TRUE(ChunkType::fromString("RuSt").isCritical());
    EXPECT_FALSE(ChunkType::fromString("ruSt").isCritical());
}


TEST(ChunkTypeTest, Public)
{
    EXPECT_TRUE(ChunkType::fromString("RUSt").isPublic());
    EXPECT_FALSE(ChunkType::fromString("RuSt").isPublic());
}


TEST(ChunkTypeTest, ReservedBit)
{
    EXPECT_TRUE(ChunkType::fromString("RuSt").isReservedBitValid());
    EXPECT_FALSE(ChunkType::fromString("Rust").isReservedBitValid());
}


TEST(ChunkTypeTest, SafeToCopy)
{
    EXPECT_TRUE(ChunkType::fromString("RuSt").isSafeToCopy());
    EXPECT_FALSE(ChunkType::fromString("RuST").isSafeToCopy());
}


TEST(ChunkTypeTest, Validity)
{
    EXPECT_TRUE(ChunkType::fromString("RuSt").isValid());
    EXPECT_TRUE(ChunkType::fromString("IEND").isValid());
    EXPECT_FALSE(ChunkType::fromString("Rust").isValid());
}


TEST(ChunkTypeTest, FromStringRejectsNonLetters)
{
    EXPECT_THROW(ChunkType::fromString("Ru1t"), InvalidFormatError);
    EXPECT_THROW(ChunkType::fromString("Ru t"), InvalidFormatError);
    EXPECT_THROW(ChunkType::fromString("Ru\xc3t"), InvalidFormatError);
}


TEST(ChunkTypeTest, FromStringRejectsWrongLength)
{
    EXPECT_THROW(ChunkType::fromString(""), InvalidFormatError);
    EXPECT_THROW(ChunkType::fromString("Ru"), InvalidFormatError);
    EXPECT_THROW(ChunkType::fromString("RuS"), InvalidFormatError);
    EXPECT_THROW(ChunkType::fromString("RuStX"), InvalidFormatError);
}


TEST(ChunkTypeTest, StringForm)
{
    ChunkType type = ChunkType::fromString("RuSt");
    EXPECT_EQ(type.toString(), "RuSt");

    std::ostringstream os;
    os << type;
    EXPECT_EQ(os.str(), "RuSt");
}

}  // namespace
