#pragma once
#ifndef IMAGE_HPP
#define IMAGE_HPP

#include "Chunk.hpp"
#include <array>
#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

/* PNG file as its signature followed by an ordered list of chunks.
First chunk is IHDR and last is IEND by convention; new chunks
are inserted before the last one so IEND stays last.
*/
class Image {
    std::vector<Chunk> chunks;
    public:
        static const std::array<uint8_t, 8> SIGNATURE;

        Image();
        explicit Image(const std::vector<Chunk>& chunks);

        /*Throws InvalidSignatureError, TruncatedError or ChecksumMismatchError*/
        static Image decode(const std::vector<uint8_t>& bytes);

        /*Inserts chunk before the last chunk, or at the end of an empty image*/
        void appendChunk(const Chunk& chunk);

        /*Removes first chunk of given type; throws ChunkNotFoundError*/
        Chunk removeChunk(const std::string& type);

        /*Returns first chunk of given type or nullptr*/
        const Chunk* chunkByType(const std::string& type) const;

        /*Returns first chunk if it is IHDR, nullptr otherwise*/
        const Chunk* header() const;

        const std::vector<Chunk>& getChunks() const;

        std::vector<uint8_t> encode() const;
};

std::ostream& operator<<(std::ostream& os, const Image& image);

#endif
