// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace speakstream
{

class Session;

/// @brief Aggregates pipeline events into progress snapshots and forwards them to a sink.
///
/// Counters are updated by the stage that observes the event; snapshot() is computed
/// from them on demand. A publisher thread delivers discrete events (chunk failures,
/// state changes, notices) as they happen and snapshots at most once per publish
/// interval, only when something changed. All sink calls come from that one thread.
class ProgressTracker
{
  public:
    using BufferedCountFn = std::function<std::size_t()>;

    /// @param session Source of state and total chunk estimate.
    /// @param bufferedCount Returns the current playback buffer level.
    /// @param sink Receiver of progress, or nullptr.
    /// @param publishInterval Minimum time between two published snapshots.
    ProgressTracker(const Session& session,
                    BufferedCountFn bufferedCount,
                    ProgressSink* sink,
                    std::chrono::milliseconds publishInterval);
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    /// @brief Starts the publisher thread.
    void start();

    /// @brief Stops the publisher thread and flushes pending events plus a final snapshot.
    void stop();

    void chunkFetched();
    void chunkSynthesized(std::chrono::milliseconds duration);
    void chunkFailed(std::uint64_t index, const Error& reason);
    void chunkPlayed(std::uint64_t index, std::chrono::milliseconds duration);
    void stateChanged(PlaybackState state);
    void notice(std::string message);

    /// @brief Computes the current snapshot.
    [[nodiscard]] auto snapshot() const -> ProgressSnapshot;

  private:
    struct ChunkFailedEvent
    {
        std::uint64_t index;
        Error reason;
    };
    struct NoticeEvent
    {
        std::string message;
    };
    using Event = std::variant<ChunkFailedEvent, PlaybackState, NoticeEvent>;

    void post(Event event);
    void run(std::stop_token token);
    void deliver(std::deque<Event> events);
    void publishIfChanged();

    const Session& _session;
    BufferedCountFn _bufferedCount;
    ProgressSink* _sink;
    std::chrono::milliseconds const _publishInterval;

    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::uint64_t _chunksFetched = 0;
    std::uint64_t _chunksSynthesized = 0;
    std::uint64_t _chunksFailed = 0;
    std::uint64_t _chunksPlayed = 0;
    std::chrono::milliseconds _synthesizedAudio { 0 };
    std::chrono::milliseconds _playedAudio { 0 };
    std::deque<Event> _events;

    std::mutex _publishMutex;
    std::optional<ProgressSnapshot> _lastPublished;
    std::jthread _publisher;
};

} // namespace speakstream
