// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>

namespace speakstream
{

/// @brief Abstract incremental text producer (file, stdin, extractor process, ...).
///
/// The content feeder calls read() repeatedly until it returns std::nullopt.
class TextSource
{
  public:
    virtual ~TextSource() = default;

    /// @brief Reads the next piece of text (blocking).
    ///
    /// Implementations must return promptly once stop is requested on token.
    /// @param token Cancellation token.
    /// @return The next piece (may be empty), std::nullopt when exhausted, or a FetchError.
    [[nodiscard]] virtual auto read(std::stop_token token) -> Result<std::optional<std::string>> = 0;

    /// @brief Returns a human-readable identifier (path, URL, "stdin").
    [[nodiscard]] virtual auto sourceId() const -> std::string = 0;

    /// @brief Returns the total size in bytes if known in advance.
    [[nodiscard]] virtual auto sizeHint() const -> std::optional<std::size_t> { return std::nullopt; }
};

} // namespace speakstream
