// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <source/TextSource.hpp>

#include <string>

namespace speakstream
{

/// @brief Serves an in-memory text in fixed-size blocks.
class StringTextSource: public TextSource
{
  public:
    /// @param text The complete text.
    /// @param blockSize Bytes returned per read() call.
    /// @param id Identifier reported by sourceId().
    explicit StringTextSource(std::string text, std::size_t blockSize = 4096, std::string id = "text");

    [[nodiscard]] auto read(std::stop_token token) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto sourceId() const -> std::string override;
    [[nodiscard]] auto sizeHint() const -> std::optional<std::size_t> override;

  private:
    std::string _text;
    std::size_t _blockSize;
    std::size_t _offset = 0;
    std::string _id;
};

} // namespace speakstream
