#include "ChunkType.hpp"
#include "errors.hpp"

namespace {

inline bool isUpper(uint8_t b) {
    return b >= 'A' && b <= 'Z';
}

inline bool isLetter(uint8_t b) {
    return isUpper(b) || (b >= 'a' && b <= 'z');
}

}

ChunkType::ChunkType(const std::array<uint8_t, 4>& bytes) : type(bytes) {}

ChunkType ChunkType::fromString(const std::string& str) {
    if (str.length() != 4)
        throw InvalidFormatError("chunk type must be 4 characters: \"" + str + "\"");

    std::array<uint8_t, 4> bytes;
    for (size_t i = 0; i < 4; ++i) {
        uint8_t b = static_cast<uint8_t>(str[i]);
        if (!isLetter(b))
            throw InvalidFormatError("chunk type must contain only ASCII letters: \"" + str + "\"");
        bytes[i] = b;
    }
    return ChunkType(bytes);
}

const std::array<uint8_t, 4>& ChunkType::bytes() const {
    return this->type;
}

std::string ChunkType::toString() const {
    return std::string(this->type.begin(), this->type.end());
}

bool ChunkType::isValid() const {
    return isLetter(this->type[0]) && isLetter(this->type[1])
        && isReservedBitValid() && isLetter(this->type[3]);
}

bool ChunkType::isCritical() const {
    return isUpper(this->type[0]);
}

bool ChunkType::isPublic() const {
    return isUpper(this->type[1]);
}

bool ChunkType::isReservedBitValid() const {
    return isUpper(this->type[2]);
}

bool ChunkType::isSafeToCopy() const {
    return !isUpper(this->type[3]);
}

bool ChunkType::operator==(const ChunkType& other) const {
    return this->type == other.type;
}

bool ChunkType::operator!=(const ChunkType& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType) {
    return os << chunkType.toString();
}
