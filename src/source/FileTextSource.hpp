// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <source/TextSource.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace speakstream
{

/// @brief Reads text from a file, or from stdin when the path is "-".
///
/// Reads are polled in short slices so a blocked stdin read observes cancellation.
class FileTextSource: public TextSource
{
  public:
    FileTextSource();
    ~FileTextSource() override;

    FileTextSource(const FileTextSource&) = delete;
    FileTextSource& operator=(const FileTextSource&) = delete;

    /// @brief Opens the file.
    /// @param path File path, or "-" for stdin.
    /// @param blockSize Maximum bytes returned per read() call.
    /// @return Success or a FetchError.
    [[nodiscard]] auto open(std::string_view path, std::size_t blockSize = 4096) -> VoidResult;

    [[nodiscard]] auto read(std::stop_token token) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto sourceId() const -> std::string override;
    [[nodiscard]] auto sizeHint() const -> std::optional<std::size_t> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace speakstream
