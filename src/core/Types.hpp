// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace speakstream
{

/// @brief A contiguous, bounded-size span of source text destined for one synthesis call.
struct TextChunk
{
    std::uint64_t index = 0;
    std::string text;
    std::size_t charCount = 0; ///< Number of Unicode code points in text.
};

/// @brief Decoded PCM audio produced by a synthesizer.
struct AudioClip
{
    std::vector<float> samples; ///< Interleaved float32 samples.
    unsigned sampleRate = 22050;
    unsigned channels = 1;

    /// @brief Returns the number of frames (samples per channel).
    [[nodiscard]] auto frameCount() const noexcept -> std::size_t
    {
        return channels == 0 ? 0 : samples.size() / channels;
    }

    /// @brief Returns the playback duration of the clip.
    [[nodiscard]] auto duration() const -> std::chrono::milliseconds
    {
        if (sampleRate == 0)
            return std::chrono::milliseconds { 0 };
        return std::chrono::milliseconds { static_cast<std::int64_t>(frameCount() * 1000 / sampleRate) };
    }
};

/// @brief Synthesized audio for one chunk, or the reason it could not be produced.
///
/// Move-only by convention: ownership passes from the worker to the reorder buffer,
/// the playback buffer and finally the playback controller.
struct AudioArtifact
{
    std::uint64_t index = 0;
    AudioClip clip;
    std::chrono::milliseconds durationEstimate { 0 };
    std::optional<Error> failure;

    [[nodiscard]] auto isReady() const noexcept -> bool { return !failure.has_value(); }

    /// @brief Creates a playable artifact.
    [[nodiscard]] static auto ready(std::uint64_t index, AudioClip clip) -> AudioArtifact
    {
        auto const duration = clip.duration();
        return AudioArtifact { .index = index, .clip = std::move(clip), .durationEstimate = duration, .failure = {} };
    }

    /// @brief Creates a placeholder for a chunk whose synthesis failed.
    [[nodiscard]] static auto failed(std::uint64_t index, Error reason) -> AudioArtifact
    {
        return AudioArtifact { .index = index, .clip = {}, .durationEstimate = {}, .failure = std::move(reason) };
    }
};

/// @brief Playback session state machine.
///
/// Idle -> Fetching -> Buffering -> Playing <-> Paused -> Completed | Stopped | Failed
enum class PlaybackState : std::uint8_t
{
    Idle,
    Fetching,
    Buffering,
    Playing,
    Paused,
    Completed,
    Stopped,
    Failed,
};

/// @brief Converts a PlaybackState to its string representation.
[[nodiscard]] constexpr auto toString(PlaybackState state) -> std::string_view
{
    switch (state)
    {
        case PlaybackState::Idle: return "idle";
        case PlaybackState::Fetching: return "fetching";
        case PlaybackState::Buffering: return "buffering";
        case PlaybackState::Playing: return "playing";
        case PlaybackState::Paused: return "paused";
        case PlaybackState::Completed: return "completed";
        case PlaybackState::Stopped: return "stopped";
        case PlaybackState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Returns true for Completed, Stopped and Failed.
[[nodiscard]] constexpr auto isTerminal(PlaybackState state) noexcept -> bool
{
    return state == PlaybackState::Completed || state == PlaybackState::Stopped
           || state == PlaybackState::Failed;
}

/// @brief Point-in-time view of pipeline progress. Read-only once published.
struct ProgressSnapshot
{
    std::uint64_t chunksFetched = 0;
    std::uint64_t chunksSynthesized = 0;
    std::uint64_t chunksFailed = 0;
    std::uint64_t chunksPlayed = 0;
    std::size_t bufferedCount = 0;
    std::optional<std::uint64_t> totalChunksEstimate;
    std::chrono::milliseconds estimatedRemaining { 0 };
    PlaybackState state = PlaybackState::Idle;

    auto operator==(const ProgressSnapshot&) const -> bool = default;
};

/// @brief Receives progress snapshots and discrete pipeline events.
///
/// All methods are invoked from the progress publisher thread, one at a time.
class ProgressSink
{
  public:
    virtual ~ProgressSink() = default;

    /// @brief Called with a fresh snapshot, at most once per publish interval.
    virtual void onProgress(const ProgressSnapshot& snapshot) = 0;

    /// @brief Called once for every chunk that could not be synthesized and was skipped.
    virtual void onChunkFailed(std::uint64_t index, const Error& reason) = 0;

    /// @brief Called on every session state transition.
    virtual void onStateChanged(PlaybackState state) = 0;

    /// @brief Called for notices that are neither failures nor state changes (e.g. truncation).
    virtual void onNotice(std::string_view /*message*/) {}
};

} // namespace speakstream
