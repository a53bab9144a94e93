// SPDX-License-Identifier: Apache-2.0
#include "ProgressTracker.hpp"

#include <core/Log.hpp>
#include <pipeline/Session.hpp>

namespace speakstream
{

ProgressTracker::ProgressTracker(const Session& session,
                                 BufferedCountFn bufferedCount,
                                 ProgressSink* sink,
                                 std::chrono::milliseconds publishInterval):
    _session(session), _bufferedCount(std::move(bufferedCount)), _sink(sink), _publishInterval(publishInterval)
{
}

ProgressTracker::~ProgressTracker()
{
    stop();
}

void ProgressTracker::start()
{
    if (_publisher.joinable())
        return;
    _publisher = std::jthread([this](std::stop_token token) { run(token); });
}

void ProgressTracker::stop()
{
    if (_publisher.joinable())
    {
        _publisher.request_stop();
        _publisher.join();
    }

    auto events = std::deque<Event> {};
    {
        auto lock = std::lock_guard(_mutex);
        events.swap(_events);
    }
    deliver(std::move(events));
    publishIfChanged();
}

void ProgressTracker::chunkFetched()
{
    auto lock = std::lock_guard(_mutex);
    ++_chunksFetched;
}

void ProgressTracker::chunkSynthesized(std::chrono::milliseconds duration)
{
    auto lock = std::lock_guard(_mutex);
    ++_chunksSynthesized;
    _synthesizedAudio += duration;
}

void ProgressTracker::chunkFailed(std::uint64_t index, const Error& reason)
{
    {
        auto lock = std::lock_guard(_mutex);
        ++_chunksFailed;
    }
    post(ChunkFailedEvent { .index = index, .reason = reason });
}

void ProgressTracker::chunkPlayed(std::uint64_t /*index*/, std::chrono::milliseconds duration)
{
    auto lock = std::lock_guard(_mutex);
    ++_chunksPlayed;
    _playedAudio += duration;
}

void ProgressTracker::stateChanged(PlaybackState state)
{
    post(state);
}

void ProgressTracker::notice(std::string message)
{
    post(NoticeEvent { .message = std::move(message) });
}

auto ProgressTracker::snapshot() const -> ProgressSnapshot
{
    // Session first: the session observer calls into the tracker while holding the session lock.
    auto const state = _session.state();
    auto const total = _session.totalChunksEstimate();
    auto const buffered = _bufferedCount ? _bufferedCount() : std::size_t { 0 };

    auto lock = std::lock_guard(_mutex);
    auto snapshot = ProgressSnapshot {
        .chunksFetched = _chunksFetched,
        .chunksSynthesized = _chunksSynthesized,
        .chunksFailed = _chunksFailed,
        .chunksPlayed = _chunksPlayed,
        .bufferedCount = buffered,
        .totalChunksEstimate = total,
        .estimatedRemaining = std::chrono::milliseconds { 0 },
        .state = state,
    };

    if (isTerminal(state))
        return snapshot;

    auto const pendingAudio = _synthesizedAudio > _playedAudio ? _synthesizedAudio - _playedAudio
                                                                 : std::chrono::milliseconds { 0 };
    auto const averageChunk =
        _chunksSynthesized > 0 ? _synthesizedAudio / static_cast<std::int64_t>(_chunksSynthesized)
                               : std::chrono::milliseconds { 0 };
    auto const expected = total.value_or(_chunksFetched);
    auto const accounted = _chunksSynthesized + _chunksFailed;
    auto const unsynthesized = expected > accounted ? expected - accounted : 0;

    snapshot.estimatedRemaining = pendingAudio + averageChunk * static_cast<std::int64_t>(unsynthesized);
    return snapshot;
}

void ProgressTracker::post(Event event)
{
    {
        auto lock = std::lock_guard(_mutex);
        _events.push_back(std::move(event));
    }
    _cv.notify_one();
}

void ProgressTracker::run(std::stop_token token)
{
    log::setThreadName("progress");
    auto nextPublish = std::chrono::steady_clock::now();
    while (!token.stop_requested())
    {
        auto events = std::deque<Event> {};
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait_until(lock, token, nextPublish, [this] { return !_events.empty(); });
            events.swap(_events);
        }
        deliver(std::move(events));

        auto const now = std::chrono::steady_clock::now();
        if (now >= nextPublish)
        {
            publishIfChanged();
            nextPublish = now + _publishInterval;
        }
    }
}

void ProgressTracker::deliver(std::deque<Event> events)
{
    if (!_sink)
        return;

    auto lock = std::lock_guard(_publishMutex);
    for (auto& event: events)
    {
        if (auto const* failed = std::get_if<ChunkFailedEvent>(&event))
            _sink->onChunkFailed(failed->index, failed->reason);
        else if (auto const* state = std::get_if<PlaybackState>(&event))
            _sink->onStateChanged(*state);
        else if (auto const* notice = std::get_if<NoticeEvent>(&event))
            _sink->onNotice(notice->message);
    }
}

void ProgressTracker::publishIfChanged()
{
    if (!_sink)
        return;

    auto current = snapshot();
    auto lock = std::lock_guard(_publishMutex);
    if (_lastPublished && *_lastPublished == current)
        return;
    _sink->onProgress(current);
    _lastPublished = std::move(current);
}

} // namespace speakstream
