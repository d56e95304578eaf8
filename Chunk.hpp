#pragma once
#ifndef CHUNK_HPP
#define CHUNK_HPP

#include "ChunkType.hpp"
#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

/* Single PNG chunk
    Length: 4 bytes, big endian, size of data only
    Type:   4 bytes
    Data:   Length bytes
    CRC:    4 bytes, big endian, computed over type and data
*/
class Chunk {
    uint32_t length;
    ChunkType type;
    std::vector<uint8_t> data;
    uint32_t crc;
    public:
        /*Creates chunk from type and data; length and crc are computed*/
        Chunk(const ChunkType& chunkType, const std::vector<uint8_t>& chunkData);

        /*Decodes chunk from the start of bytes; trailing bytes are ignored.
        Throws TruncatedError or ChecksumMismatchError*/
        static Chunk decode(const uint8_t* bytes, size_t size);
        static Chunk decode(const std::vector<uint8_t>& bytes);

        uint32_t getLength() const;
        const ChunkType& getType() const;
        const std::vector<uint8_t>& getData() const;
        uint32_t getCrc() const;

        /*Number of bytes encode() produces*/
        size_t encodedSize() const;

        /*Returns data as text; throws InvalidUtf8Error*/
        std::string dataAsString() const;

        std::vector<uint8_t> encode() const;
        std::string toString() const;

        bool operator==(const Chunk& other) const;
        bool operator!=(const Chunk& other) const;

    private:
        Chunk(uint32_t length, const ChunkType& chunkType, std::vector<uint8_t> chunkData, uint32_t crc);
};

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

#endif
