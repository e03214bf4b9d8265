/**
 * LevelPak - Result Type
 * 
 * Provides a Result<T> type for consistent error handling across the
 * chunk decoders. Decoders never throw for malformed stream content;
 * every failure travels back to the caller as an Error value.
 */

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <utility>
#include <cstddef>
#include <cstdint>

namespace levelpak {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        ShortRead,              // Fewer bytes remain than a field requires
        UnrecognizedChunkType,  // Chunk type code outside the known set
        InvalidLength,          // Negative length where non-negative is required
        SizeMismatch,           // Decoder consumed fewer bytes than the chunk declared
        FileNotFound,
        IoError,
        CompressionError,
        InvalidArgument,
        ParseError
    };
    
    Code code = Code::None;
    std::string message;
    std::string context;  // Additional context (offset, file path, etc.)
    
    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx) 
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}
    
    bool ok() const { return code == Code::None; }
    
    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }
    
    // Returns a copy with extra context prepended (outermost first)
    Error with_context(const std::string& ctx) const {
        Error e = *this;
        e.context = context.empty() ? ctx : ctx + ": " + context;
        return e;
    }
    
    // Common error constructors
    static Error short_read(size_t wanted, size_t remaining, size_t offset) {
        return Error(Code::ShortRead,
                     "Short read: wanted " + std::to_string(wanted) + " bytes, " +
                     std::to_string(remaining) + " remaining",
                     "offset " + std::to_string(offset));
    }
    
    static Error unrecognized_chunk_type(int32_t type_code) {
        return Error(Code::UnrecognizedChunkType,
                     "Unrecognized chunk type " + std::to_string(type_code));
    }
    
    static Error invalid_length(const std::string& what, int64_t length) {
        return Error(Code::InvalidLength,
                     "Invalid " + what + " length " + std::to_string(length));
    }
    
    static Error size_mismatch(const std::string& msg) {
        return Error(Code::SizeMismatch, msg);
    }
    
    static Error file_not_found(const std::string& path) {
        return Error(Code::FileNotFound, "File not found", path);
    }
    
    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }
    
    static Error compression_error(const std::string& msg) {
        return Error(Code::CompressionError, msg);
    }
    
    static Error invalid_argument(const std::string& msg) {
        return Error(Code::InvalidArgument, msg);
    }
    
    static Error parse_error(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::ParseError, msg, ctx);
    }
};

/**
 * Short name of an error code, used in log lines and CLI output.
 */
constexpr const char* error_code_string(Error::Code code) {
    switch (code) {
        case Error::Code::None:                  return "None";
        case Error::Code::ShortRead:             return "ShortRead";
        case Error::Code::UnrecognizedChunkType: return "UnrecognizedChunkType";
        case Error::Code::InvalidLength:         return "InvalidLength";
        case Error::Code::SizeMismatch:          return "SizeMismatch";
        case Error::Code::FileNotFound:          return "FileNotFound";
        case Error::Code::IoError:               return "IoError";
        case Error::Code::CompressionError:      return "CompressionError";
        case Error::Code::InvalidArgument:       return "InvalidArgument";
        case Error::Code::ParseError:            return "ParseError";
        default:                                 return "Unknown";
    }
}

/**
 * Result type that holds either a value T or an Error
 * 
 * Usage:
 *   Result<ChunkHeader> decode_chunk_header(ByteReader& reader);
 *   
 *   auto header = decode_chunk_header(reader);
 *   if (header) {
 *       dispatch(*header);
 *   } else {
 *       LOG_ERROR("Chunks", header.error().full_message());
 *   }
 */
template<typename T>
class Result {
public:
    // Success construction
    Result(T value) : data_(std::move(value)) {}
    
    // Error construction
    Result(Error error) : data_(std::move(error)) {}
    
    // Check if result is successful
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }
    
    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }
    
    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }
    
    // Access error
    const Error& error() const {
        if (ok()) {
            static Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }
    
    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    
    // Transform the value if present
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (ok()) {
            return Result<U>(func(std::move(value())));
        }
        return Result<U>(error());
    }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}
    
    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    
    const Error& error() const {
        static Error no_error;
        return error_ ? *error_ : no_error;
    }
    
    static Result success() { return Result(); }
    static Result failure(Error err) { return Result(std::move(err)); }

private:
    std::optional<Error> error_;
};

// Helper macros for early return on error
#define TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace levelpak
