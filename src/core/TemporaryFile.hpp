// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string_view>

namespace speakstream
{

/// @brief A uniquely named file in the system temp directory, removed on destruction.
class TemporaryFile
{
  public:
    /// @brief Reserves a new unique file name with the given prefix and suffix.
    /// @return The temporary file or an IoError.
    [[nodiscard]] static auto create(std::string_view prefix, std::string_view suffix) -> Result<TemporaryFile>;

    TemporaryFile(TemporaryFile&& other) noexcept;
    TemporaryFile& operator=(TemporaryFile&& other) noexcept;
    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;
    ~TemporaryFile();

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return _path; }

  private:
    explicit TemporaryFile(std::filesystem::path path);

    void remove() noexcept;

    std::filesystem::path _path;
};

} // namespace speakstream
