// SPDX-License-Identifier: Apache-2.0
#include "PlaybackBuffer.hpp"

#include <format>

namespace speakstream
{

auto validate(const PlaybackBufferConfig& config) -> VoidResult
{
    if (config.lowWatermark < 1)
        return makeError(ErrorCode::ConfigError, "playback.lowWatermark must be at least 1");
    if (config.lowWatermark > config.highWatermark)
        return makeError(ErrorCode::ConfigError,
                         std::format("playback.lowWatermark ({}) exceeds playback.highWatermark ({})",
                                     config.lowWatermark,
                                     config.highWatermark));
    if (config.highWatermark > config.capacity)
        return makeError(ErrorCode::ConfigError,
                         std::format("playback.highWatermark ({}) exceeds playback.capacity ({})",
                                     config.highWatermark,
                                     config.capacity));
    return {};
}

PlaybackBuffer::PlaybackBuffer(PlaybackBufferConfig config): _config(config)
{
}

auto PlaybackBuffer::reserve(std::stop_token token) -> bool
{
    auto lock = std::unique_lock(_mutex);
    if (!_cv.wait(lock, token, [this] { return _closed || _reserved < _config.highWatermark; }))
        return false;
    if (_closed)
        return false;
    ++_reserved;
    return true;
}

void PlaybackBuffer::releaseReservation()
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_reserved > 0)
            --_reserved;
    }
    _cv.notify_all();
}

auto PlaybackBuffer::enqueue(AudioArtifact artifact, std::stop_token token) -> bool
{
    {
        auto lock = std::unique_lock(_mutex);
        if (!_cv.wait(lock, token, [this] { return _closed || _artifacts.size() < _config.capacity; }))
            return false;
        if (_closed)
            return false;
        _artifacts.push_back(std::move(artifact));
    }
    _cv.notify_all();
    return true;
}

auto PlaybackBuffer::dequeue(std::stop_token token) -> std::optional<AudioArtifact>
{
    auto artifact = std::optional<AudioArtifact> {};
    {
        auto lock = std::unique_lock(_mutex);
        if (!_cv.wait(lock, token, [this] { return _closed || !_artifacts.empty(); }))
            return std::nullopt;
        if (_artifacts.empty())
            return std::nullopt;
        artifact.emplace(takeFront());
    }
    _cv.notify_all();
    return artifact;
}

auto PlaybackBuffer::tryDequeue() -> std::optional<AudioArtifact>
{
    auto artifact = std::optional<AudioArtifact> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (_artifacts.empty())
            return std::nullopt;
        artifact.emplace(takeFront());
    }
    _cv.notify_all();
    return artifact;
}

auto PlaybackBuffer::waitForLevel(std::size_t level, std::stop_token token) -> bool
{
    auto lock = std::unique_lock(_mutex);
    return _cv.wait(lock, token, [this, level] { return _closed || _artifacts.size() >= level; });
}

void PlaybackBuffer::close()
{
    {
        auto lock = std::lock_guard(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

auto PlaybackBuffer::clear() -> std::size_t
{
    auto count = std::size_t { 0 };
    {
        auto lock = std::lock_guard(_mutex);
        count = _artifacts.size();
        _artifacts.clear();
        _reserved = _reserved > count ? _reserved - count : 0;
    }
    _cv.notify_all();
    return count;
}

auto PlaybackBuffer::size() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _artifacts.size();
}

auto PlaybackBuffer::reserved() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _reserved;
}

auto PlaybackBuffer::isClosed() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closed;
}

auto PlaybackBuffer::isDrained() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closed && _artifacts.empty();
}

auto PlaybackBuffer::takeFront() -> AudioArtifact
{
    auto artifact = std::move(_artifacts.front());
    _artifacts.pop_front();
    if (_reserved > 0)
        --_reserved;
    return artifact;
}

} // namespace speakstream
