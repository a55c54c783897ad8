#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

/**
 * @brief Replace path with data: written to path + ".tmp" then renamed.
 * @throws StorageError on any I/O failure
 */
void writeFileAtomic(const std::string& path, const std::vector<uint8_t>& data);

/**
 * @return file content, std::nullopt if the file does not exist
 * @throws StorageError if the file exists but cannot be read
 */
std::optional<std::vector<uint8_t>> readFile(const std::string& path);

// Creates the directory and its parents
void ensureDirectory(const std::string& path);

void removePath(const std::string& path);

}  // namespace VectorCluster
