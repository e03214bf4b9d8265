/**
 * LevelPak - Settings Implementation
 */

#include "levelpak/settings.hpp"
#include "levelpak/files.hpp"
#include <nlohmann/json.hpp>

namespace levelpak {

Result<Settings> parse_settings(const std::string& text) {
    Settings settings;
    
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Error::parse_error("Settings must be a JSON object");
        }
        
        if (j.contains("log_level")) {
            auto name = j["log_level"].get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                return Error::parse_error("Unknown log level '" + name + "'");
            }
            settings.log_level = *level;
        }
        if (j.contains("log_file")) settings.log_file = j["log_file"].get<std::string>();
        if (j.contains("console_log")) settings.console_log = j["console_log"].get<bool>();
        if (j.contains("strict_chunk_size")) settings.strict_chunk_size = j["strict_chunk_size"].get<bool>();
        if (j.contains("json_indent")) settings.json_indent = j["json_indent"].get<int>();
    } catch (const nlohmann::json::exception& e) {
        return Error::parse_error(std::string("Invalid settings: ") + e.what());
    }
    
    return settings;
}

Result<Settings> load_settings(const fs::path& path) {
    TRY_ASSIGN(data, read_file(path));
    auto settings = parse_settings(std::string(data.begin(), data.end()));
    if (!settings) {
        return settings.error().with_context(path.string());
    }
    return settings;
}

Result<void> apply_logging_settings(const Settings& settings) {
    auto& logger = Logger::instance();
    logger.set_level(settings.log_level);
    logger.set_console_output(settings.console_log);
    
    if (!settings.log_file.empty()) {
        if (!logger.set_file(settings.log_file)) {
            return Error::io_error("Cannot open log file", settings.log_file.string());
        }
    }
    return Result<void>::success();
}

} // namespace levelpak
