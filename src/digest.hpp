#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

constexpr std::size_t kHashChunkSize = 1 << 20;

std::string sha1_hex(const std::string& data);

// Reads the file in chunk_size pieces; the file is never held in memory whole.
std::string sha1_file(const std::filesystem::path& path, std::size_t chunk_size = kHashChunkSize);
