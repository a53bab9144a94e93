// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace speakstream
{

/// @brief Error codes for categorizing failures across the streaming pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProcessError,
    FetchError,
    SegmentationError,
    SynthesisError,
    TimeoutError,
    PlaybackError,
    Cancelled,
};

/// @brief Returns a short, stable reason string for an error code.
///
/// Used as the reason of ChunkFailed notifications (e.g. "timeout").
[[nodiscard]] constexpr auto describe(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::ProcessError: return "process";
        case ErrorCode::FetchError: return "fetch";
        case ErrorCode::SegmentationError: return "segmentation";
        case ErrorCode::SynthesisError: return "synthesis";
        case ErrorCode::TimeoutError: return "timeout";
        case ErrorCode::PlaybackError: return "playback";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace speakstream

template <>
struct std::formatter<speakstream::Error>: std::formatter<std::string>
{
    auto format(const speakstream::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", speakstream::describe(error.code), error.message), ctx);
    }
};
