#pragma once
#ifndef CHUNK_TYPE_HPP
#define CHUNK_TYPE_HPP

#include <array>
#include <ostream>
#include <stdint.h>
#include <string>

/* Four byte chunk identifier.
Case of each letter carries one property bit:
    byte 1: uppercase => critical
    byte 2: uppercase => public
    byte 3: uppercase => reserved bit valid
    byte 4: lowercase => safe to copy
*/
class ChunkType {
    std::array<uint8_t, 4> type;
    public:
        /*Structural construction, bytes are not checked*/
        explicit ChunkType(const std::array<uint8_t, 4>& bytes);

        /*Parses 4 ASCII letters; throws InvalidFormatError otherwise*/
        static ChunkType fromString(const std::string& str);

        const std::array<uint8_t, 4>& bytes() const;
        std::string toString() const;

        bool isValid() const;
        bool isCritical() const;
        bool isPublic() const;
        bool isReservedBitValid() const;
        bool isSafeToCopy() const;

        bool operator==(const ChunkType& other) const;
        bool operator!=(const ChunkType& other) const;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType);

#endif
