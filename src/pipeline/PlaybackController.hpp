// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace speakstream
{

class PlaybackBuffer;
class PlaybackDevice;
class ProgressTracker;
class Session;

/// @brief Why the playback loop ended.
enum class PlaybackEnd
{
    Drained,      ///< The buffer was closed and every artifact was consumed.
    Stopped,      ///< The pipeline was stopped or cancelled.
    DeviceFailed, ///< The device failed persistently.
};

/// @brief Consumes the playback buffer in order and drives the playback device.
///
/// Waits for the low watermark before starting and after an underrun, skips failed
/// artifacts with a ChunkFailed notification, and applies pause, resume, skip and stop.
/// A device error is retried once for the same clip before it is treated as fatal.
class PlaybackController
{
  public:
    using FinishedCallback = std::function<void(PlaybackEnd end, std::optional<Error> error)>;

    /// @param stopSource Pipeline stop source; stop() requests it.
    PlaybackController(PlaybackBuffer& buffer,
                       PlaybackDevice& device,
                       Session& session,
                       ProgressTracker& progress,
                       std::stop_source stopSource);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /// @brief Installs the callback invoked from the playback thread when the loop ends.
    void onFinished(FinishedCallback callback);

    /// @brief Starts the playback thread.
    void start();

    /// @brief Waits for the playback thread to exit.
    void join();

    /// @brief Holds playback at the current position. No-op unless playing or waiting.
    void pause();

    /// @brief Continues playback after pause(). No-op unless paused.
    void resume();

    /// @brief Abandons the clip currently playing and moves on to the next one.
    void skip();

    /// @brief Stops playback immediately, releases buffered audio and stops the pipeline.
    void stop();

    [[nodiscard]] auto isPaused() const -> bool;

  private:
    void run(std::stop_token token);

    /// @brief Plays one artifact, handling skip, restart-after-pause and device retries.
    auto playArtifact(const AudioArtifact& artifact, std::stop_token token) -> VoidResult;

    /// @brief Blocks while paused. Returns false if the token stopped.
    auto waitWhilePaused(std::stop_token token) -> bool;

    PlaybackBuffer& _buffer;
    PlaybackDevice& _device;
    Session& _session;
    ProgressTracker& _progress;
    std::stop_source _stopSource;
    FinishedCallback _finished;

    mutable std::mutex _mutex;
    std::condition_variable_any _resumed;
    bool _paused = false;
    PlaybackState _stateBeforePause = PlaybackState::Buffering;
    bool _clipActive = false;
    bool _skipRequested = false;
    bool _restartRequested = false;
    std::stop_source _clipStop;

    std::jthread _thread;
};

} // namespace speakstream
