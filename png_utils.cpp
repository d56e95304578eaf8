#include "utils.hpp"
#include "errors.hpp"
#include <zlib.h>

uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length) {
    uLong crc = crc32(0L, Z_NULL, 0);                    // Start CRC
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type), 4); // Chunk type
    // zlib takes uInt lengths, so feed large payloads in pieces
    while (length > 0) {
        uInt piece = length > 0x40000000 ? 0x40000000 : static_cast<uInt>(length);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), piece); // Chunk data
        data += piece;
        length -= piece;
    }
    return static_cast<uint32_t>(crc);
}


uint32_t readBigEndian(const uint8_t* bytes) {
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
            static_cast<uint32_t>(bytes[3]);
}


void writeBigEndian(uint32_t value, uint8_t* out) {
    out[0] = (value & 0xFF000000) >> 24;
    out[1] = (value & 0x00FF0000) >> 16;
    out[2] = (value & 0x0000FF00) >> 8;
    out[3] = (value & 0x000000FF);
}


uint8_t getChannels(uint8_t color) {
    switch (color) {
        case 0: // Grayscale
            return 1;
        case 2: // Truecolor (RGB)
            return 3;
        case 3: // Indexed-color
            return 1;
        case 4: // Grayscale + Alpha
            return 2;
        case 6: // Truecolor + Alpha (RGBA)
            return 4;
        default:
            return 0;
    }
}


m_data getMetadata(const uint8_t* data, size_t size) {
    if (size < IHDR_SIZE)
        throw InvalidFormatError("IHDR chunk too short");

    m_data metadata = {};
    metadata.width = readBigEndian(data);
    metadata.height = readBigEndian(data + 4);
    metadata.bitDepth = data[8];
    metadata.color = data[9];
    metadata.compression = data[10];
    metadata.filter = data[11];
    metadata.interlace = data[12];
    metadata.channels = getChannels(metadata.color);
    return metadata;
}
