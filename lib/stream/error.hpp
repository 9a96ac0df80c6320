// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace kvmerge {

/// Error codes for stream, configuration and reporting operations.
enum class ErrorCode {
    // Usage
    PushbackPending,       ///< Pushback called twice without an intervening pull
    NothingToPushBack,     ///< Pushback called before any record was pulled
    SourceReleased,        ///< Line source was released; it cannot be read or rewound
    InvalidArgument,       ///< Stream composed from invalid inputs (e.g. no streams)

    // Input
    SourceNotFound,        ///< Input file does not exist
    ReadFailed,            ///< Underlying stream reported an I/O failure

    // Configuration
    ConfigNotFound,        ///< Configuration file does not exist
    ConfigUnreadable,      ///< Configuration file cannot be opened
    ConfigParseError,      ///< Configuration file is not valid YAML
    ConfigNotMapping,      ///< Configuration root is not a mapping
    NoSections,            ///< No configuration sections were requested
    SectionNotFound,       ///< Requested section is absent from the file
    SectionNotMapping,     ///< Requested section is not a mapping
    KeyNotFound,           ///< Configuration key is absent
    TypeMismatch,          ///< Configuration value cannot convert to the requested type

    // Output
    LogSetupFailed,        ///< Log sink could not be created
    ReportWriteFailed,     ///< Report could not be written to its destination
};

/// Error payload returned through std::expected.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "usage", "config").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::PushbackPending:
        case ErrorCode::NothingToPushBack:
        case ErrorCode::SourceReleased:
        case ErrorCode::InvalidArgument:
            return "usage";
        case ErrorCode::SourceNotFound:
        case ErrorCode::ReadFailed:
            return "input";
        case ErrorCode::ConfigNotFound:
        case ErrorCode::ConfigUnreadable:
        case ErrorCode::ConfigParseError:
        case ErrorCode::ConfigNotMapping:
        case ErrorCode::NoSections:
        case ErrorCode::SectionNotFound:
        case ErrorCode::SectionNotMapping:
        case ErrorCode::KeyNotFound:
        case ErrorCode::TypeMismatch:
            return "config";
        case ErrorCode::LogSetupFailed:
        case ErrorCode::ReportWriteFailed:
            return "output";
    }
    return "unknown";
}

}  // namespace kvmerge
