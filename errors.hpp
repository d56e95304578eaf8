#pragma once
#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base of every failure raised while handling a PNG file
class PngError : public std::runtime_error {
    public:
        explicit PngError(const std::string& message) : std::runtime_error(message) {}
};

/*Chunk type string is not 4 ASCII letters, or IHDR payload is malformed*/
class InvalidFormatError : public PngError {
    public:
        explicit InvalidFormatError(const std::string& message) : PngError(message) {}
};

/*Chunk could not be decoded from raw bytes*/
class ChunkDecodeError : public PngError {
    public:
        explicit ChunkDecodeError(const std::string& message) : PngError(message) {}
};

class ChecksumMismatchError : public ChunkDecodeError {
    public:
        explicit ChecksumMismatchError(const std::string& message) : ChunkDecodeError(message) {}
};

class TruncatedError : public ChunkDecodeError {
    public:
        explicit TruncatedError(const std::string& message) : ChunkDecodeError(message) {}
};

/*File does not start with the PNG signature*/
class InvalidSignatureError : public PngError {
    public:
        InvalidSignatureError() : PngError("file does not have PNG signature") {}
};

class InvalidUtf8Error : public PngError {
    public:
        explicit InvalidUtf8Error(const std::string& message) : PngError(message) {}
};

class ChunkNotFoundError : public PngError {
    public:
        explicit ChunkNotFoundError(const std::string& type)
            : PngError("chunk does not exist: " + type) {}
};

/*File could not be opened, read or written*/
class FileError : public PngError {
    public:
        explicit FileError(const std::string& message) : PngError(message) {}
};

#endif
