#pragma once
#include <string>
#include "png.hpp"
std::string describeFlags(const ChunkType& type);
void printChunks(const Png& png, const std::string& inputFile, bool verbose = false);
bool dumpJson(const Png& png, const std::string& filename);
