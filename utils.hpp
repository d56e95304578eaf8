#pragma once
#ifndef UTILS_HPP
#define UTILS_HPP

#include <stdint.h> // uint8_t, uint32_t
#include <cstddef> // size_t

/*Size of IHDR chunk data*/
const size_t IHDR_SIZE = 13;

// Meta data of image
struct m_data {
    uint32_t width;
    uint32_t height;
    uint8_t bitDepth;
    uint8_t color;
    uint8_t channels;
    uint8_t compression;
    uint8_t filter;
    uint8_t interlace;
};

/*Calculates crc of chunk over its 4 type bytes followed by its data*/
uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length);

/*Reads 4 bytes stored with MSB first*/
uint32_t readBigEndian(const uint8_t* bytes);

/*Writes value into 4 bytes, MSB first*/
void writeBigEndian(uint32_t value, uint8_t* out);

/* Returns number of channels based on PNG specifications:
Color in IHDR chunk specification
Color    Allowed    Interpretation
   Type  :  Bit Depths

   0 :      1,2,4,8,16 => Each pixel is a grayscale sample.

   2 :      8,16       => Each pixel is an R,G,B triple.

   3 :      1,2,4,8    => Each pixel is a palette index;
                       a PLTE chunk must appear.

   4 :      8,16       => Each pixel is a grayscale sample,
                       followed by an alpha sample.

   6 :      8,16       => Each pixel is an R,G,B triple,
                       followed by an alpha sample.

Returns 0 for unknown color type
*/
uint8_t getChannels(uint8_t color);

/* Returns metadata of image
IHDR chunk structure
    Width:              4 bytes
    Height:             4 bytes
    Bit depth:          1 byte
    Color type:         1 byte
    Compression method: 1 byte
    Filter method:      1 byte
    Interlace method:   1 byte
Throws InvalidFormatError if size is less than 13
*/
m_data getMetadata(const uint8_t* data, size_t size);

#endif
