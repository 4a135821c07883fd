#pragma once

#include <cstdint>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace umbra::core {

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using Vector = std::vector<T>;

using String = std::string;
using StringView = std::string_view;

// ============================================================================
// Result and Optional Types
// ============================================================================

template<typename T, typename E>
using Result = std::expected<T, E>;

template<typename T>
using Option = std::optional<T>;

// ============================================================================
// Error Types
// ============================================================================

/**
 * Error codes used across the engine. Ranges group the failure taxonomy:
 * geometry and oracle failures are recovered inside the engine, override
 * conflicts are reported as data, persistence failures degrade the store.
 */
enum class ErrorCode : u32 {
    Success = 0,

    // Generic errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,

    // Geometry and oracle errors (100-199)
    GeometryInvalid = 100,
    OracleFailure = 101,

    // Override errors (200-299)
    OverrideConflict = 200,
    PersistenceUnavailable = 201,

    // File and configuration errors (300-399)
    FileNotFound = 300,
    FileReadError = 301,
    FileWriteError = 302,
    ParseError = 303,
    ConfigInvalid = 304,
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::GeometryInvalid: return "GeometryInvalid";
        case ErrorCode::OracleFailure: return "OracleFailure";
        case ErrorCode::OverrideConflict: return "OverrideConflict";
        case ErrorCode::PersistenceUnavailable: return "PersistenceUnavailable";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
    }
    return "Unknown";
}

// Failure taxonomy used by the recovery ledger
enum class ErrorCategory : u8 {
    Geometry,
    Oracle,
    OverrideConflict,
    Persistence,
    Other
};

inline ErrorCategory categorize(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::GeometryInvalid: return ErrorCategory::Geometry;
        case ErrorCode::OracleFailure: return ErrorCategory::Oracle;
        case ErrorCode::OverrideConflict: return ErrorCategory::OverrideConflict;
        case ErrorCode::PersistenceUnavailable:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError: return ErrorCategory::Persistence;
        default: return ErrorCategory::Other;
    }
}

inline const char* to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Geometry: return "geometry";
        case ErrorCategory::Oracle: return "oracle";
        case ErrorCategory::OverrideConflict: return "override-conflict";
        case ErrorCategory::Persistence: return "persistence";
        case ErrorCategory::Other: return "other";
    }
    return "other";
}

/**
 * Error information structure
 */
struct Error {
    ErrorCode code = ErrorCode::Success;
    String message;
    String source_location; // file:line where the error was raised

    Error() = default;

    explicit Error(ErrorCode code_, String message_ = "", String location_ = "")
        : code(code_), message(std::move(message_)), source_location(std::move(location_)) {}

    bool is_success() const { return code == ErrorCode::Success; }
    bool is_error() const { return code != ErrorCode::Success; }

    String to_string() const {
        if (is_success()) return "Success";
        String result = String(error_code_name(code));
        if (!message.empty()) result += ": " + message;
        if (!source_location.empty()) result += " at " + source_location;
        return result;
    }
};

// Builds an Error stamped with the caller's file and line
inline Error make_error(ErrorCode code, String message,
                        const std::source_location& location = std::source_location::current()) {
    return Error(code, std::move(message),
                 std::filesystem::path(location.file_name()).filename().string() + ":" +
                     std::to_string(location.line()));
}

// Thrown by geometry code for malformed occluder data
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& what) : std::runtime_error(what) {}
};

// Thrown by scene providers when a spatial or lighting query cannot be answered
class OracleError : public std::runtime_error {
public:
    explicit OracleError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace umbra::core

namespace umbra {
    using umbra::core::u8;
    using umbra::core::u16;
    using umbra::core::u32;
    using umbra::core::u64;
    using umbra::core::i32;
    using umbra::core::i64;
    using umbra::core::f64;
    using umbra::core::usize;
    using umbra::core::Result;
    using umbra::core::Option;
    using umbra::core::Error;
    using umbra::core::ErrorCode;
} // namespace umbra
