// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace speakstream
{

/// @brief Restores chunk order for artifacts that complete out of order.
///
/// Holds artifacts keyed by index and releases them strictly in ascending order with
/// no gaps. Failed artifacts are released like ready ones so a failing chunk never
/// blocks its successors. Thread-safe.
class ReorderBuffer
{
  public:
    explicit ReorderBuffer(std::uint64_t firstIndex = 0);

    /// @brief Stores an artifact.
    /// @return false if the index was already released or is already pending; the artifact is dropped.
    auto insert(AudioArtifact artifact) -> bool;

    /// @brief Removes and returns the maximal run of consecutive artifacts starting at nextExpected().
    [[nodiscard]] auto releaseReadyPrefix() -> std::vector<AudioArtifact>;

    [[nodiscard]] auto pendingCount() const -> std::size_t;
    [[nodiscard]] auto nextExpected() const -> std::uint64_t;

    /// @brief Drops all pending artifacts.
    void clear();

  private:
    mutable std::mutex _mutex;
    std::map<std::uint64_t, AudioArtifact> _pending;
    std::uint64_t _nextExpected;
};

} // namespace speakstream
