// SPDX-License-Identifier: Apache-2.0
#include "FileTextSource.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <vector>

#include <sys/stat.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace speakstream
{

namespace
{
    constexpr auto PollSliceMs = 100;
} // namespace

struct FileTextSource::Impl
{
    int fd = -1;
    bool ownsFd = false;
    bool exhausted = false;
    std::string path;
    std::size_t blockSize = 4096;
    std::optional<std::size_t> size;
};

FileTextSource::FileTextSource(): _impl(std::make_unique<Impl>())
{
}

FileTextSource::~FileTextSource()
{
    if (_impl->ownsFd && _impl->fd >= 0)
        ::close(_impl->fd);
}

auto FileTextSource::open(std::string_view path, std::size_t blockSize) -> VoidResult
{
    _impl->path = std::string(path);
    _impl->blockSize = std::max<std::size_t>(blockSize, 1);

    if (path == "-")
    {
        _impl->fd = STDIN_FILENO;
        _impl->ownsFd = false;
    }
    else
    {
        _impl->fd = ::open(_impl->path.c_str(), O_RDONLY | O_CLOEXEC);
        if (_impl->fd < 0)
            return makeError(ErrorCode::FetchError,
                             std::format("Cannot open '{}': {}", _impl->path, strerror(errno)));
        _impl->ownsFd = true;
    }

    struct stat info {};
    if (::fstat(_impl->fd, &info) == 0 && S_ISREG(info.st_mode))
        _impl->size = static_cast<std::size_t>(info.st_size);

    log::debug("Opened text source '{}' ({} bytes)", sourceId(), _impl->size.value_or(0));
    return {};
}

auto FileTextSource::read(std::stop_token token) -> Result<std::optional<std::string>>
{
    if (_impl->fd < 0)
        return makeError(ErrorCode::FetchError, "Text source is not open");
    if (_impl->exhausted)
        return std::optional<std::string> {};

    while (!token.stop_requested())
    {
        auto pfd = pollfd { .fd = _impl->fd, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, PollSliceMs);
        if (ready == 0)
            continue;
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::FetchError, std::format("poll() on '{}' failed: {}", sourceId(), strerror(errno)));
        }

        auto buffer = std::vector<char>(_impl->blockSize);
        auto const bytesRead = ::read(_impl->fd, buffer.data(), buffer.size());
        if (bytesRead < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return makeError(ErrorCode::FetchError,
                             std::format("Failed to read '{}': {}", sourceId(), strerror(errno)));
        }
        if (bytesRead == 0)
        {
            _impl->exhausted = true;
            return std::optional<std::string> {};
        }
        return std::optional<std::string> { std::string(buffer.data(), static_cast<std::size_t>(bytesRead)) };
    }

    return makeError(ErrorCode::Cancelled, "Read cancelled");
}

auto FileTextSource::sourceId() const -> std::string
{
    return _impl->path == "-" ? std::string("stdin") : _impl->path;
}

auto FileTextSource::sizeHint() const -> std::optional<std::size_t>
{
    return _impl->size;
}

} // namespace speakstream
