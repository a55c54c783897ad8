#include <vectorcluster/common/file_io.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace VectorCluster {

namespace fs = std::filesystem;

void writeFileAtomic(const std::string& path, const std::vector<uint8_t>& data) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("Failed to open {} for writing", tmp);
            throw StorageError("Failed to open " + tmp);
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            throw StorageError("Failed to write " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw StorageError("Failed to rename " + tmp + ": " + ec.message());
    }
}

std::optional<std::vector<uint8_t>> readFile(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Failed to open " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StorageError("Failed to read " + path);
    }
    return data;
}

void ensureDirectory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw StorageError("Failed to create directory " + path + ": " + ec.message());
    }
}

void removePath(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path, ec.message());
    }
}

}  // namespace VectorCluster
