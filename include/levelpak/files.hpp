/**
 * LevelPak - File utilities
 */

#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace levelpak {

namespace fs = std::filesystem;

/**
 * Read entire file into memory.
 */
Result<std::vector<uint8_t>> read_file(const fs::path& path);

/**
 * Write text to a file, creating parent directories.
 */
Result<void> write_text_file(const fs::path& path, const std::string& text);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

} // namespace levelpak
