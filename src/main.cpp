/**
 * LevelPak - Entry Point
 * 
 * Command-line inspector for level chunk files:
 *   levelpak --list <file> [--filter <type>]
 *   levelpak --dump <file> [--output <json>] [--filter <type>]
 *   levelpak --help
 */

#include "levelpak/chunk_file.hpp"
#include "levelpak/chunk_header.hpp"
#include "levelpak/files.hpp"
#include "levelpak/json_export.hpp"
#include "levelpak/logging.hpp"
#include "levelpak/settings.hpp"

#include <iostream>
#include <iomanip>
#include <optional>
#include <string>
#include <filesystem>

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    bool list_mode = false;
    bool dump_mode = false;
    bool strict = false;
    std::string input_path;
    std::string output_path;
    std::string filter;
    std::string config_path;
    bool verbose = false;
    bool debug_logging = false;
    std::string error;
};

void print_help() {
    std::cout << R"(
LevelPak - Level Chunk File Inspector

Usage:
  levelpak --help                           Show this help
  levelpak --list <file> [options]          List chunks in a level file
  levelpak --dump <file> [options]          Decode chunks and print them as JSON

Options:
  --help, -h           Show this help message
  --list, -l <file>    List chunk headers (offset, type, size, version)
  --dump, -D <file>    Decode every chunk and export JSON
  --output, -o <file>  Write JSON to a file instead of stdout (with --dump)
  --filter, -f <type>  Only list/decode chunks of this type (e.g. Materials, World)
  --config, -c <file>  Settings file (default: levelpak.json if present)
  --strict             Fail when a decoder leaves chunk payload bytes unread
  --verbose, -v        Log to the console
  --debug, -d          Enable debug logging

Examples:
  levelpak --list level.dat
  levelpak --dump level.dat --filter Materials --output materials.json
  levelpak --debug --dump level.dat > level.json

)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    
    // Options that take a value report a usage error when it is missing
    auto take_value = [&](int& i, const std::string& flag, std::string& out) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else if (args.error.empty()) {
            args.error = "Missing value for " + flag;
        }
    };
    
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        
        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--list" || arg == "-l") {
            args.list_mode = true;
            take_value(i, arg, args.input_path);
        }
        else if (arg == "--dump" || arg == "-D") {
            args.dump_mode = true;
            take_value(i, arg, args.input_path);
        }
        else if (arg == "--output" || arg == "-o") {
            take_value(i, arg, args.output_path);
        }
        else if (arg == "--filter" || arg == "-f") {
            take_value(i, arg, args.filter);
        }
        else if (arg == "--config" || arg == "-c") {
            take_value(i, arg, args.config_path);
        }
        else if (arg == "--strict") {
            args.strict = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--debug" || arg == "-d") {
            args.debug_logging = true;
        }
        else if (args.error.empty()) {
            args.error = "Unknown argument: " + arg;
        }
    }
    
    return args;
}

// Settings file first, then command-line overrides
levelpak::Result<levelpak::Settings> resolve_settings(const CliArgs& args) {
    levelpak::Settings settings;
    
    if (!args.config_path.empty()) {
        TRY_ASSIGN(loaded, levelpak::load_settings(args.config_path));
        settings = loaded;
    } else if (std::filesystem::exists(levelpak::DEFAULT_SETTINGS_FILE)) {
        TRY_ASSIGN(loaded, levelpak::load_settings(levelpak::DEFAULT_SETTINGS_FILE));
        settings = loaded;
    }
    
    if (args.verbose) settings.console_log = true;
    if (args.debug_logging) {
        settings.log_level = levelpak::LogLevel::Debug;
        settings.console_log = true;
    }
    if (args.strict) settings.strict_chunk_size = true;
    
    return settings;
}

int run_list(const levelpak::ChunkFile& file, std::optional<levelpak::ChunkType> filter) {
    auto entries = file.list();
    if (!entries) {
        std::cerr << "Error: " << entries.error().full_message() << "\n";
        return 1;
    }
    
    size_t matched = 0;
    for (const auto& entry : *entries) {
        if (filter && entry.header.type != *filter) {
            continue;
        }
        std::cout << std::setw(10) << entry.offset << "  "
                  << std::left << std::setw(16) << levelpak::chunk_type_name(entry.header.type) << std::right
                  << " code=" << std::setw(5) << static_cast<int32_t>(entry.header.type)
                  << " size=" << std::setw(9) << entry.header.size
                  << " version=" << entry.header.version << "\n";
        matched++;
    }
    std::cout << "\nChunks: " << matched << " / " << entries->size() << "\n";
    return 0;
}

int run_dump(const levelpak::ChunkFile& file, const CliArgs& args,
             const levelpak::Settings& settings, std::optional<levelpak::ChunkType> filter) {
    levelpak::ChunkDecoder decoder;
    levelpak::ChunkFileOptions options;
    options.strict_chunk_size = settings.strict_chunk_size;
    options.filter = filter;
    
    auto chunks = file.decode_all(decoder, options);
    if (!chunks) {
        std::cerr << "Error: " << levelpak::error_code_string(chunks.error().code) << ": "
                  << chunks.error().full_message() << "\n";
        return 1;
    }
    
    size_t warnings = levelpak::Logger::instance().count(levelpak::LogLevel::Warning);
    if (warnings > 0) {
        std::cerr << "Decoded " << chunks->size() << " chunks with " << warnings << " warning(s)\n";
    }
    
    std::string json = levelpak::export_chunks_json(*chunks, settings.json_indent);
    
    if (args.output_path.empty()) {
        std::cout << json << "\n";
        return 0;
    }
    
    auto written = levelpak::write_text_file(args.output_path, json + "\n");
    if (!written) {
        std::cerr << "Error: " << written.error().full_message() << "\n";
        return 1;
    }
    LOG_INFO("App", "Wrote " << chunks->size() << " chunks to " << args.output_path);
    return 0;
}

int run_cli(const CliArgs& args, const levelpak::Settings& settings) {
    if (args.input_path.empty()) {
        std::cerr << "Error: No input file specified\n";
        print_help();
        return 1;
    }
    
    std::optional<levelpak::ChunkType> filter;
    if (!args.filter.empty()) {
        filter = levelpak::chunk_type_from_name(args.filter);
        if (!filter) {
            std::cerr << "Error: Unknown chunk type: " << args.filter << "\n";
            return 1;
        }
    }
    
    levelpak::ChunkFile file;
    auto loaded = file.load(args.input_path);
    if (!loaded) {
        std::cerr << "Error: " << loaded.error().full_message() << "\n";
        return 1;
    }
    
    if (args.list_mode) {
        return run_list(file, filter);
    }
    return run_dump(file, args, settings, filter);
}

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);
    
    if (args.show_help) {
        print_help();
        return 0;
    }
    
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        print_help();
        return 1;
    }
    
    if (args.list_mode == args.dump_mode) {
        std::cerr << "Error: Specify exactly one of --list or --dump\n";
        print_help();
        return 1;
    }
    
    auto settings = resolve_settings(args);
    if (!settings) {
        std::cerr << "Error: " << settings.error().full_message() << "\n";
        return 1;
    }
    
    auto logging = levelpak::apply_logging_settings(*settings);
    if (!logging) {
        std::cerr << "Warning: " << logging.error().full_message() << "\n";
    }
    
    if (args.debug_logging) {
        LOG_INFO("App", "Debug logging enabled");
    }
    
    int result = run_cli(args, *settings);
    levelpak::Logger::instance().close_file();
    return result;
}
