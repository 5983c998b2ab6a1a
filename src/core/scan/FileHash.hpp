#pragma once
#include <cstddef>
#include <string>

// Lower-case hex MD5 of a file's content, read in chunks of chunkSize bytes.
// Throws std::runtime_error if the file cannot be read.
std::string md5_file_hex(const std::string& path, std::size_t chunkSize = 1 << 20);
