/**
 * LevelPak - File Utilities Implementation
 */

#include "levelpak/files.hpp"
#include <fstream>
#include <cstdio>

namespace levelpak {

Result<std::vector<uint8_t>> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error::file_not_found(path.string());
    }
    
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open file", path.string());
    }
    
    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if (size < 0) {
        return Error::io_error("Cannot determine file size", path.string());
    }
    file.seekg(0, std::ios::beg);
    
    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);
    if (file.gcount() != size) {
        return Error::io_error("Short read: got " + std::to_string(file.gcount()) +
                               " of " + std::to_string(size) + " bytes", path.string());
    }
    return data;
}

Result<void> write_text_file(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error::io_error("Cannot create directory: " + ec.message(), path.parent_path().string());
        }
    }
    
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::io_error("Cannot open file for writing", path.string());
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file) {
        return Error::io_error("Write failed", path.string());
    }
    return Result<void>::success();
}

std::string format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }
    
    char buf[64];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%zu B", bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    }
    return buf;
}

} // namespace levelpak
