// SPDX-License-Identifier: Apache-2.0
#include "ReorderBuffer.hpp"

#include <core/Log.hpp>

namespace speakstream
{

ReorderBuffer::ReorderBuffer(std::uint64_t firstIndex): _nextExpected(firstIndex)
{
}

auto ReorderBuffer::insert(AudioArtifact artifact) -> bool
{
    auto lock = std::lock_guard(_mutex);
    if (artifact.index < _nextExpected)
    {
        log::warning("Dropping artifact {}: already released (next expected {})", artifact.index, _nextExpected);
        return false;
    }

    auto const index = artifact.index;
    auto const [it, inserted] = _pending.try_emplace(index, std::move(artifact));
    if (!inserted)
        log::warning("Dropping duplicate artifact {}", index);
    return inserted;
}

auto ReorderBuffer::releaseReadyPrefix() -> std::vector<AudioArtifact>
{
    auto lock = std::lock_guard(_mutex);
    auto released = std::vector<AudioArtifact> {};
    for (auto it = _pending.begin(); it != _pending.end() && it->first == _nextExpected; it = _pending.erase(it))
    {
        released.push_back(std::move(it->second));
        ++_nextExpected;
    }
    return released;
}

auto ReorderBuffer::pendingCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _pending.size();
}

auto ReorderBuffer::nextExpected() const -> std::uint64_t
{
    auto lock = std::lock_guard(_mutex);
    return _nextExpected;
}

void ReorderBuffer::clear()
{
    auto lock = std::lock_guard(_mutex);
    _pending.clear();
}

} // namespace speakstream
