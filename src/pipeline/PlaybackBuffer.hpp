// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace speakstream
{

/// @brief Capacity and watermarks of the playback buffer.
struct PlaybackBufferConfig
{
    std::size_t capacity = 5;      ///< Maximum number of buffered artifacts.
    std::size_t lowWatermark = 2;  ///< Playback (re)starts once this many artifacts are buffered.
    std::size_t highWatermark = 5; ///< Synthesis is throttled while this many artifacts are in flight.
};

/// @brief Validates 1 <= lowWatermark <= highWatermark <= capacity.
[[nodiscard]] auto validate(const PlaybackBufferConfig& config) -> VoidResult;

/// @brief Ordered FIFO of audio artifacts awaiting playback.
///
/// Besides the bounded queue itself, the buffer hands out reservations to synthesis
/// workers: a worker reserves a slot before taking a chunk, and the reservation is
/// returned when the resulting artifact is dequeued. Reservations are limited by the
/// high watermark, which bounds the audio held in memory and throttles upstream stages
/// while playback is paused or slow.
class PlaybackBuffer
{
  public:
    explicit PlaybackBuffer(PlaybackBufferConfig config = {});

    PlaybackBuffer(const PlaybackBuffer&) = delete;
    PlaybackBuffer& operator=(const PlaybackBuffer&) = delete;

    /// @brief Reserves a slot for an artifact that is about to be produced.
    /// @return false if the buffer was closed or the token stopped.
    [[nodiscard]] auto reserve(std::stop_token token) -> bool;

    /// @brief Returns a reservation that will not produce an artifact.
    void releaseReservation();

    /// @brief Appends an artifact, blocking while the buffer is at capacity.
    /// @return false if the buffer was closed or the token stopped; the artifact is dropped.
    auto enqueue(AudioArtifact artifact, std::stop_token token) -> bool;

    /// @brief Removes the oldest artifact, blocking while the buffer is empty and open.
    /// @return The artifact, or nullopt once closed and drained or the token stopped.
    [[nodiscard]] auto dequeue(std::stop_token token) -> std::optional<AudioArtifact>;

    /// @brief Removes the oldest artifact without blocking.
    [[nodiscard]] auto tryDequeue() -> std::optional<AudioArtifact>;

    /// @brief Blocks until at least level artifacts are buffered or the buffer is closed.
    /// @return false if the token stopped first.
    auto waitForLevel(std::size_t level, std::stop_token token) -> bool;

    /// @brief Marks the end of the stream: no more artifacts will be enqueued.
    void close();

    /// @brief Discards all buffered artifacts and their reservations.
    /// @return The number of discarded artifacts.
    auto clear() -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto reserved() const -> std::size_t;
    [[nodiscard]] auto isClosed() const -> bool;

    /// @brief Returns true once the buffer is closed and empty.
    [[nodiscard]] auto isDrained() const -> bool;

    [[nodiscard]] auto config() const noexcept -> const PlaybackBufferConfig& { return _config; }

  private:
    auto takeFront() -> AudioArtifact;

    PlaybackBufferConfig const _config;
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<AudioArtifact> _artifacts;
    std::size_t _reserved = 0;
    bool _closed = false;
};

} // namespace speakstream
