#include "commands.hpp"
#include "Image.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace {

static Chunk make_chunk(const std::string& type, const std::string& data)
{
    return Chunk(ChunkType::fromString(type), std::vector<uint8_t>(data.begin(), data.end()));
}


static std::vector<uint8_t> small_png()
{
    // 2x3, 8-bit RGB, no IDAT since pixels are never decoded
    std::vector<uint8_t> ihdr = {0, 0, 0, 2, 0, 0, 0, 3, 8, 2, 0, 0, 0};
    std::vector<Chunk> chunks;
    chunks.push_back(Chunk(ChunkType::fromString("IHDR"), ihdr));
    chunks.push_back(make_chunk("tEXt", "Comment"));
    chunks.push_back(make_chunk("IEND", ""));
    return Image(chunks).encode();
}


class CommandsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
            path = ::testing::TempDir() + "pngstego_" + info->name() + ".png";
            outputPath = ::testing::TempDir() + "pngstego_" + info->name() + "_out.png";
            writeFile(path, small_png());
        }

        void TearDown() override {
            std::remove(path.c_str());
            std::remove(outputPath.c_str());
        }

        std::string path;
        std::string outputPath;
};


TEST_F(CommandsTest, ReadWriteFile)
{
    EXPECT_EQ(readFile(path), small_png());
}


TEST_F(CommandsTest, ReadMissingFile)
{
    EXPECT_THROW(readFile(path + ".missing"), FileError);
}


TEST_F(CommandsTest, EncodeInPlaceThenDecode)
{
    std::ostringstream out;
    EncodeArgs encodeArgs;
    encodeArgs.filePath = path;
    encodeArgs.chunkType = "RuSt";
    encodeArgs.message = "hidden message";
    encodeCommand(encodeArgs, out);

    Image image = Image::decode(readFile(path));
    ASSERT_EQ(image.getChunks().size(), 4u);
    EXPECT_EQ(image.getChunks()[2].getType().toString(), "RuSt");
    EXPECT_EQ(image.getChunks().back().getType().toString(), "IEND");

    std::ostringstream decoded;
    DecodeArgs decodeArgs;
    decodeArgs.filePath = path;
    decodeArgs.chunkType = "RuSt";
    decodeCommand(decodeArgs, decoded);
    EXPECT_EQ(decoded.str(), "hidden message\n");
}


TEST_F(CommandsTest, EncodeToOutputKeepsInput)
{
    std::ostringstream out;
    EncodeArgs args;
    args.filePath = path;
    args.chunkType = "RuSt";
    args.message = "to another file";
    args.outputPath = outputPath;
    encodeCommand(args, out);

    EXPECT_EQ(readFile(path), small_png());
    Image image = Image::decode(readFile(outputPath));
    ASSERT_NE(image.chunkByType("RuSt"), nullptr);
    EXPECT_EQ(image.chunkByType("RuSt")->dataAsString(), "to another file");
}


TEST_F(CommandsTest, EncodeRejectsBadType)
{
    std::ostringstream out;
    EncodeArgs args;
    args.filePath = path;
    args.chunkType = "Ru1t";
    args.message = "never written";
    EXPECT_THROW(encodeCommand(args, out), InvalidFormatError);
    EXPECT_EQ(readFile(path), small_png());
}


TEST_F(CommandsTest, DecodeMissingChunk)
{
    std::ostringstream out;
    DecodeArgs args;
    args.filePath = path;
    args.chunkType = "RuSt";
    EXPECT_THROW(decodeCommand(args, out), ChunkNotFoundError);
    EXPECT_TRUE(out.str().empty());
}


TEST_F(CommandsTest, Remove)
{
    std::ostringstream out;
    RemoveArgs args;
    args.filePath = path;
    args.chunkType = "tEXt";
    removeCommand(args, out);

    Image image = Image::decode(readFile(path));
    EXPECT_EQ(image.getChunks().size(), 2u);
    EXPECT_EQ(image.chunkByType("tEXt"), nullptr);
    EXPECT_NE(out.str().find("tEXt"), std::string::npos);
}


TEST_F(CommandsTest, RemoveMissingLeavesFile)
{
    std::ostringstream out;
    RemoveArgs args;
    args.filePath = path;
    args.chunkType = "RuSt";
    EXPECT_THROW(removeCommand(args, out), ChunkNotFoundError);
    EXPECT_EQ(readFile(path), small_png());
}


TEST_F(CommandsTest, Print)
{
    std::ostringstream out;
    PrintArgs args;
    args.filePath = path;
    printCommand(args, out);

    std::string text = out.str();
    EXPECT_NE(text.find("width: 2\n"), std::string::npos);
    EXPECT_NE(text.find("height: 3\n"), std::string::npos);
    EXPECT_NE(text.find("channels: 3\n"), std::string::npos);
    EXPECT_NE(text.find("compression: 0\n"), std::string::npos);
    EXPECT_NE(text.find("filter: 0\n"), std::string::npos);
    EXPECT_NE(text.find("interlace: 0\n"), std::string::npos);
    EXPECT_NE(text.find("3 chunks:"), std::string::npos);
    EXPECT_NE(text.find("type: IHDR"), std::string::npos);
    EXPECT_NE(text.find("type: tEXt"), std::string::npos);
    EXPECT_NE(text.find("ancillary public safe-to-copy"), std::string::npos);
}


TEST_F(CommandsTest, PrintShortHeaderStillListsChunks)
{
    std::vector<Chunk> chunks;
    chunks.push_back(Chunk(ChunkType::fromString("IHDR"), std::vector<uint8_t>{1, 2, 3}));
    chunks.push_back(make_chunk("IEND", ""));
    writeFile(path, Image(chunks).encode());

    std::ostringstream out;
    PrintArgs args;
    args.filePath = path;
    ASSERT_NO_THROW(printCommand(args, out));

    std::string text = out.str();
    EXPECT_NE(text.find("IHDR malformed: 3 bytes, expected 13"), std::string::npos);
    EXPECT_EQ(text.find("width:"), std::string::npos);
    EXPECT_NE(text.find("2 chunks:"), std::string::npos);
    EXPECT_NE(text.find("type: IHDR"), std::string::npos);
    EXPECT_NE(text.find("type: IEND"), std::string::npos);
}


TEST_F(CommandsTest, PrintRejectsNonPng)
{
    std::vector<uint8_t> notPng = {'G', 'I', 'F', '8', '9', 'a', 0, 0, 0, 0};
    writeFile(path, notPng);

    std::ostringstream out;
    PrintArgs args;
    args.filePath = path;
    EXPECT_THROW(printCommand(args, out), InvalidSignatureError);
}

}  // namespace
