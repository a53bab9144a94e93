// SPDX-License-Identifier: Apache-2.0
#include "Session.hpp"

#include <core/Log.hpp>

namespace speakstream
{

auto isValidTransition(PlaybackState from, PlaybackState to) -> bool
{
    using enum PlaybackState;

    if (from == to || isTerminal(from))
        return false;

    switch (from)
    {
        case Idle: return to == Fetching || to == Stopped || to == Failed;
        case Fetching: return to == Buffering || to == Playing || to == Paused || to == Stopped || to == Failed;
        case Buffering: return to != Idle && to != Fetching;
        case Playing: return to != Idle && to != Fetching;
        case Paused: return to != Idle;
        case Completed:
        case Stopped:
        case Failed: return false;
    }
    return false;
}

Session::Session(std::string sourceId):
    _sourceId(std::move(sourceId)), _startedAt(std::chrono::system_clock::now())
{
}

auto Session::state() const -> PlaybackState
{
    auto lock = std::lock_guard(_mutex);
    return _state;
}

auto Session::transition(PlaybackState next) -> bool
{
    auto lock = std::lock_guard(_mutex);
    return transitionLocked(next);
}

auto Session::transitionFrom(PlaybackState expected, PlaybackState next) -> bool
{
    auto lock = std::lock_guard(_mutex);
    if (_state != expected)
        return false;
    return transitionLocked(next);
}

auto Session::finish(PlaybackState terminal, std::optional<Error> reason) -> bool
{
    auto lock = std::lock_guard(_mutex);
    if (!isTerminal(terminal))
        return false;
    if (terminal == PlaybackState::Failed && reason && !isTerminal(_state))
        _failureReason = std::move(reason);
    return transitionLocked(terminal);
}

auto Session::failureReason() const -> std::optional<Error>
{
    auto lock = std::lock_guard(_mutex);
    return _failureReason;
}

auto Session::totalChunksEstimate() const -> std::optional<std::uint64_t>
{
    auto lock = std::lock_guard(_mutex);
    return _totalChunksEstimate;
}

void Session::setTotalChunksEstimate(std::optional<std::uint64_t> estimate)
{
    auto lock = std::lock_guard(_mutex);
    _totalChunksEstimate = estimate;
}

void Session::setObserver(StateObserver observer)
{
    auto lock = std::lock_guard(_mutex);
    _observer = std::move(observer);
}

auto Session::waitForTerminal() -> PlaybackState
{
    auto lock = std::unique_lock(_mutex);
    _terminalCv.wait(lock, [this] { return isTerminal(_state); });
    return _state;
}

auto Session::waitForTerminal(std::chrono::milliseconds timeout) -> std::optional<PlaybackState>
{
    auto lock = std::unique_lock(_mutex);
    if (!_terminalCv.wait_for(lock, timeout, [this] { return isTerminal(_state); }))
        return std::nullopt;
    return _state;
}

auto Session::transitionLocked(PlaybackState next) -> bool
{
    if (!isValidTransition(_state, next))
    {
        if (_state != next)
            log::debug("Ignoring session transition {} -> {}", toString(_state), toString(next));
        return false;
    }

    log::debug("Session '{}': {} -> {}", _sourceId, toString(_state), toString(next));
    _state = next;

    if (_observer)
        _observer(next);
    if (isTerminal(next))
        _terminalCv.notify_all();
    return true;
}

} // namespace speakstream
