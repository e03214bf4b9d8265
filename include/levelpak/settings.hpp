/**
 * LevelPak - Settings
 * 
 * Optional JSON settings file, e.g.:
 *   {
 *     "log_level": "debug",
 *     "log_file": "levelpak.log",
 *     "console_log": true,
 *     "strict_chunk_size": false,
 *     "json_indent": 2
 *   }
 * Missing keys keep their defaults.
 */

#pragma once

#include "logging.hpp"
#include "result.hpp"
#include <filesystem>
#include <string>

namespace levelpak {

namespace fs = std::filesystem;

constexpr const char* DEFAULT_SETTINGS_FILE = "levelpak.json";

struct Settings {
    LogLevel log_level = LogLevel::Info;
    fs::path log_file;                  // Empty = no log file
    bool console_log = false;
    bool strict_chunk_size = false;     // Under-consumed chunk is an error instead of a warning
    int json_indent = 2;                // -1 = compact output
};

/**
 * Parse settings from JSON text. Malformed JSON or a value of the wrong
 * type is a ParseError.
 */
Result<Settings> parse_settings(const std::string& text);

/**
 * Load settings from a file. Returns FileNotFound if it does not exist.
 */
Result<Settings> load_settings(const fs::path& path);

/**
 * Configure the global Logger from settings.
 */
Result<void> apply_logging_settings(const Settings& settings);

} // namespace levelpak
