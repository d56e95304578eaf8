#include "Chunk.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

const size_t LENGTH_SIZE = 4;
const size_t TYPE_SIZE = 4;
const size_t CRC_SIZE = 4;
const size_t FRAME_SIZE = LENGTH_SIZE + TYPE_SIZE + CRC_SIZE;

// Well-formed UTF-8 per RFC 3629: no overlongs, no surrogates, max U+10FFFF
bool isValidUtf8(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        uint8_t b = bytes[i];
        size_t extra = 0;
        uint32_t codePoint = 0;
        uint32_t minimum = 0;

        if (b < 0x80) {
            ++i;
            continue;
        } else if ((b & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = b & 0x1F;
            minimum = 0x80;
        } else if ((b & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = b & 0x0F;
            minimum = 0x800;
        } else if ((b & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = b & 0x07;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (bytes.size() - i <= extra)
            return false;
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t next = bytes[i + k];
            if ((next & 0xC0) != 0x80)
                return false;
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if (codePoint < minimum || codePoint > 0x10FFFF)
            return false;
        if (codePoint >= 0xD800 && codePoint <= 0xDFFF)
            return false;
        i += extra + 1;
    }
    return true;
}

}

Chunk::Chunk(const ChunkType& chunkType, const std::vector<uint8_t>& chunkData)
    : length(0), type(chunkType), data(chunkData), crc(0) {
    if (chunkData.size() > std::numeric_limits<uint32_t>::max())
        throw std::length_error("chunk data does not fit in 32-bit length");

    this->length = static_cast<uint32_t>(chunkData.size());
    this->crc = calculate_crc(chunkType.bytes().data(), this->data.data(), this->data.size());
}

Chunk::Chunk(uint32_t length, const ChunkType& chunkType, std::vector<uint8_t> chunkData, uint32_t crc)
    : length(length), type(chunkType), data(std::move(chunkData)), crc(crc) {}

Chunk Chunk::decode(const uint8_t* bytes, size_t size) {
    if (size < FRAME_SIZE)
        throw TruncatedError("chunk needs at least 12 bytes, got " + std::to_string(size));

    uint32_t dataLength = readBigEndian(bytes);
    // Compared against what is left so a huge length cannot overflow
    if (dataLength > size - FRAME_SIZE)
        throw TruncatedError("chunk declares " + std::to_string(dataLength) + " data bytes but only "
                             + std::to_string(size - FRAME_SIZE) + " are available");

    std::array<uint8_t, 4> typeBytes;
    std::copy(bytes + LENGTH_SIZE, bytes + LENGTH_SIZE + TYPE_SIZE, typeBytes.begin());
    ChunkType chunkType(typeBytes);

    const uint8_t* dataStart = bytes + LENGTH_SIZE + TYPE_SIZE;
    std::vector<uint8_t> chunkData(dataStart, dataStart + dataLength);
    uint32_t storedCrc = readBigEndian(dataStart + dataLength);

    uint32_t computedCrc = calculate_crc(typeBytes.data(), chunkData.data(), chunkData.size());
    if (computedCrc != storedCrc) {
        std::ostringstream msg;
        msg << "checksum mismatch in " << chunkType << " chunk: stored 0x" << std::hex
            << storedCrc << ", computed 0x" << computedCrc;
        throw ChecksumMismatchError(msg.str());
    }

    return Chunk(dataLength, chunkType, std::move(chunkData), storedCrc);
}

Chunk Chunk::decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

uint32_t Chunk::getLength() const {
    return this->length;
}

const ChunkType& Chunk::getType() const {
    return this->type;
}

const std::vector<uint8_t>& Chunk::getData() const {
    return this->data;
}

uint32_t Chunk::getCrc() const {
    return this->crc;
}

size_t Chunk::encodedSize() const {
    return FRAME_SIZE + this->data.size();
}

std::string Chunk::dataAsString() const {
    if (!isValidUtf8(this->data))
        throw InvalidUtf8Error(this->type.toString() + " chunk data is not valid UTF-8");
    return std::string(this->data.begin(), this->data.end());
}

std::vector<uint8_t> Chunk::encode() const {
    std::vector<uint8_t> out(encodedSize());
    uint8_t* p = out.data();

    writeBigEndian(this->length, p);
    p += LENGTH_SIZE;
    p = std::copy(this->type.bytes().begin(), this->type.bytes().end(), p);
    p = std::copy(this->data.begin(), this->data.end(), p);
    writeBigEndian(this->crc, p);

    return out;
}

std::string Chunk::toString() const {
    std::ostringstream os;
    os << "length: " << this->length << ", type: " << this->type
       << ", crc: 0x" << std::hex << std::setfill('0') << std::setw(8) << this->crc;
    return os.str();
}

bool Chunk::operator==(const Chunk& other) const {
    return this->length == other.length && this->type == other.type
        && this->data == other.data && this->crc == other.crc;
}

bool Chunk::operator!=(const Chunk& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    return os << chunk.toString();
}
