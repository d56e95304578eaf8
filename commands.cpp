#include "commands.hpp"
#include "Image.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fstream>
#include <iomanip>
#include <iterator>

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream fs(path, std::ios::in | std::ios::binary);
    if (!fs)
        throw FileError("could not open file " + path);

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(fs)), std::istreambuf_iterator<char>());
    if (fs.bad())
        throw FileError("could not read file " + path);
    return bytes;
}

void writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream fs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!fs)
        throw FileError("could not open output file " + path);

    fs.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    fs.flush();
    if (!fs)
        throw FileError("could not write file " + path);
}


void encodeCommand(const EncodeArgs& args, std::ostream& out) {
    ChunkType type = ChunkType::fromString(args.chunkType);
    Image image = Image::decode(readFile(args.filePath));

    Chunk chunk(type, std::vector<uint8_t>(args.message.begin(), args.message.end()));
    image.appendChunk(chunk);

    const std::string& outputPath = args.outputPath.empty() ? args.filePath : args.outputPath;
    writeFile(outputPath, image.encode());
    out << "Encoded " << chunk.getLength() << " bytes into " << type << " chunk of " << outputPath << std::endl;
}


void decodeCommand(const DecodeArgs& args, std::ostream& out) {
    ChunkType type = ChunkType::fromString(args.chunkType);
    Image image = Image::decode(readFile(args.filePath));

    const Chunk* chunk = image.chunkByType(type.toString());
    if (chunk == nullptr)
        throw ChunkNotFoundError(type.toString());
    out << chunk->dataAsString() << std::endl;
}


void removeCommand(const RemoveArgs& args, std::ostream& out) {
    ChunkType type = ChunkType::fromString(args.chunkType);
    Image image = Image::decode(readFile(args.filePath));

    Chunk removed = image.removeChunk(type.toString());
    writeFile(args.filePath, image.encode());
    out << "Removed " << removed << std::endl;
}


void printCommand(const PrintArgs& args, std::ostream& out) {
    Image image = Image::decode(readFile(args.filePath));

    out << "Signature: ";
    for (size_t i = 0; i < Image::SIGNATURE.size(); ++i)
        out << static_cast<int>(Image::SIGNATURE[i]) << ' ';
    out << "(correct)" << std::endl;

    const Chunk* ihdr = image.header();
    // Metadata is informative only, a short IHDR must not stop the listing
    if (ihdr != nullptr && ihdr->getData().size() < IHDR_SIZE) {
        out << "IHDR malformed: " << ihdr->getData().size() << " bytes, expected "
            << IHDR_SIZE << std::endl;
    } else if (ihdr != nullptr) {
        m_data metadata = getMetadata(ihdr->getData().data(), ihdr->getData().size());
        out << "width: " << metadata.width << std::endl;
        out << "height: " << metadata.height << std::endl;
        out << "bitDepth: " << static_cast<int>(metadata.bitDepth) << std::endl;
        out << "color: " << static_cast<int>(metadata.color) << std::endl;
        out << "channels: " << static_cast<int>(metadata.channels) << std::endl;
        out << "compression: " << static_cast<int>(metadata.compression) << std::endl;
        out << "filter: " << static_cast<int>(metadata.filter) << std::endl;
        out << "interlace: " << static_cast<int>(metadata.interlace) << std::endl;
    }

    out << image.getChunks().size() << " chunks:" << std::endl;
    size_t index = 0;
    for (auto& chunk : image.getChunks()) {
        const ChunkType& type = chunk.getType();
        out << std::setw(4) << index++ << "  " << chunk
            << (type.isCritical() ? "  critical" : "  ancillary")
            << (type.isPublic() ? " public" : " private")
            << (type.isSafeToCopy() ? " safe-to-copy" : " unsafe-to-copy") << std::endl;
    }
}
