#include "Image.hpp"
#include "errors.hpp"
#include <algorithm>
#include <utility>

const std::array<uint8_t, 8> Image::SIGNATURE = {{137, 80, 78, 71, 13, 10, 26, 10}};

Image::Image() {
    this->chunks.reserve(5);
}

Image::Image(const std::vector<Chunk>& chunks) : chunks(chunks) {}

Image Image::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < SIGNATURE.size() ||
        !std::equal(SIGNATURE.begin(), SIGNATURE.end(), bytes.begin()))
        throw InvalidSignatureError();

    Image image;
    size_t offset = SIGNATURE.size();
    // Every chunk carries its own length, read them back to back
    while (offset < bytes.size()) {
        Chunk chunk = Chunk::decode(bytes.data() + offset, bytes.size() - offset);
        offset += chunk.encodedSize();
        image.chunks.push_back(std::move(chunk));
    }
    return image;
}

void Image::appendChunk(const Chunk& chunk) {
    if (this->chunks.empty()) {
        this->chunks.push_back(chunk);
        return;
    }
    this->chunks.insert(this->chunks.end() - 1, chunk);
}

Chunk Image::removeChunk(const std::string& type) {
    for (auto it = this->chunks.begin(); it != this->chunks.end(); ++it) {
        if (it->getType().toString() == type) {
            Chunk removed = *it;
            this->chunks.erase(it);
            return removed;
        }
    }
    throw ChunkNotFoundError(type);
}

const Chunk* Image::chunkByType(const std::string& type) const {
    for (auto& chunk : this->chunks) {
        if (chunk.getType().toString() == type)
            return &chunk;
    }
    return nullptr;
}

const Chunk* Image::header() const {
    if (this->chunks.empty() || this->chunks.front().getType().toString() != "IHDR")
        return nullptr;
    return &this->chunks.front();
}

const std::vector<Chunk>& Image::getChunks() const {
    return this->chunks;
}

std::vector<uint8_t> Image::encode() const {
    size_t total = SIGNATURE.size();
    for (auto& chunk : this->chunks)
        total += chunk.encodedSize();

    std::vector<uint8_t> out;
    out.reserve(total);
    out.insert(out.end(), SIGNATURE.begin(), SIGNATURE.end());
    for (auto& chunk : this->chunks) {
        std::vector<uint8_t> bytes = chunk.encode();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Image& image) {
    for (auto& chunk : image.getChunks())
        os << chunk << '\n';
    return os;
}
