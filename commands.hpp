#pragma once
#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

struct EncodeArgs {
    std::string filePath;
    std::string chunkType;
    std::string message;
    std::string outputPath; // empty => overwrite filePath
};

struct DecodeArgs {
    std::string filePath;
    std::string chunkType;
};

struct RemoveArgs {
    std::string filePath;
    std::string chunkType;
};

struct PrintArgs {
    std::string filePath;
};

/*Reads whole file; throws FileError*/
std::vector<uint8_t> readFile(const std::string& path);

/*Writes whole file, replacing its content; throws FileError*/
void writeFile(const std::string& path, const std::vector<uint8_t>& bytes);

/*Hides message in a new chunk inserted before IEND*/
void encodeCommand(const EncodeArgs& args, std::ostream& out);

/*Prints message stored in first chunk of given type*/
void decodeCommand(const DecodeArgs& args, std::ostream& out);

/*Removes first chunk of given type and rewrites the file*/
void removeCommand(const RemoveArgs& args, std::ostream& out);

/*Prints IHDR metadata and every chunk of the file*/
void printCommand(const PrintArgs& args, std::ostream& out);

#endif
