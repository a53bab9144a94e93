// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace speakstream
{

/// @brief Returns true if the session state machine allows moving from one state to another.
[[nodiscard]] auto isValidTransition(PlaybackState from, PlaybackState to) -> bool;

/// @brief One reading of one source, from start to a terminal state.
///
/// Owns the playback state machine. Transitions are validated and serialized; terminal
/// states are absorbing. Thread-safe.
class Session
{
  public:
    using StateObserver = std::function<void(PlaybackState)>;

    explicit Session(std::string sourceId);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] auto sourceId() const -> const std::string& { return _sourceId; }
    [[nodiscard]] auto startedAt() const -> std::chrono::system_clock::time_point { return _startedAt; }

    [[nodiscard]] auto state() const -> PlaybackState;

    /// @brief Moves to next if the transition is valid.
    /// @return true if the state changed.
    auto transition(PlaybackState next) -> bool;

    /// @brief Moves to next only if the current state is expected.
    auto transitionFrom(PlaybackState expected, PlaybackState next) -> bool;

    /// @brief Enters a terminal state, recording the reason for Failed.
    auto finish(PlaybackState terminal, std::optional<Error> reason = std::nullopt) -> bool;

    /// @brief Returns the reason recorded when the session failed.
    [[nodiscard]] auto failureReason() const -> std::optional<Error>;

    [[nodiscard]] auto totalChunksEstimate() const -> std::optional<std::uint64_t>;
    void setTotalChunksEstimate(std::optional<std::uint64_t> estimate);

    /// @brief Installs the observer that is notified of every state change, in order.
    ///
    /// The observer runs while the session lock is held and must not call back into the session.
    void setObserver(StateObserver observer);

    /// @brief Blocks until the session reaches a terminal state.
    auto waitForTerminal() -> PlaybackState;

    /// @brief Blocks until the session reaches a terminal state or the timeout expires.
    auto waitForTerminal(std::chrono::milliseconds timeout) -> std::optional<PlaybackState>;

  private:
    auto transitionLocked(PlaybackState next) -> bool;

    std::string const _sourceId;
    std::chrono::system_clock::time_point const _startedAt;

    mutable std::mutex _mutex;
    std::condition_variable _terminalCv;
    PlaybackState _state = PlaybackState::Idle;
    std::optional<std::uint64_t> _totalChunksEstimate;
    std::optional<Error> _failureReason;
    StateObserver _observer;
};

} // namespace speakstream
