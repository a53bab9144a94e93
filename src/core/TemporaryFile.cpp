// SPDX-License-Identifier: Apache-2.0
#include "TemporaryFile.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace speakstream
{

auto TemporaryFile::create(std::string_view prefix, std::string_view suffix) -> Result<TemporaryFile>
{
    auto ec = std::error_code {};
    auto const dir = std::filesystem::temp_directory_path(ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("No temp directory: {}", ec.message()));

    auto const pattern = (dir / std::format("{}XXXXXX{}", prefix, suffix)).string();
    auto buffer = std::vector<char>(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    auto const fd = ::mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create temporary file '{}': {}", pattern, strerror(errno)));
    ::close(fd);

    return TemporaryFile(std::filesystem::path(buffer.data()));
}

TemporaryFile::TemporaryFile(std::filesystem::path path): _path(std::move(path))
{
}

TemporaryFile::TemporaryFile(TemporaryFile&& other) noexcept: _path(std::move(other._path))
{
    other._path.clear();
}

TemporaryFile& TemporaryFile::operator=(TemporaryFile&& other) noexcept
{
    if (this != &other)
    {
        remove();
        _path = std::move(other._path);
        other._path.clear();
    }
    return *this;
}

TemporaryFile::~TemporaryFile()
{
    remove();
}

void TemporaryFile::remove() noexcept
{
    if (_path.empty())
        return;

    auto ec = std::error_code {};
    std::filesystem::remove(_path, ec);
    if (ec)
        log::warning("Failed to remove temporary file {}: {}", _path.string(), ec.message());
    _path.clear();
}

} // namespace speakstream
