// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <stop_token>

namespace speakstream
{

/// @brief How a call to PlaybackDevice::play() ended.
enum class PlaybackOutcome
{
    Completed,   ///< Every sample of the clip was rendered.
    Interrupted, ///< The interrupt token was stopped before the clip finished.
};

/// @brief Abstract audio output capability.
///
/// play() is only ever called from the playback controller thread; pause() and
/// resume() may be called from any thread.
class PlaybackDevice
{
  public:
    virtual ~PlaybackDevice() = default;

    /// @brief Plays a clip, blocking until it has been rendered or interrupted.
    /// @param clip The audio to render.
    /// @param interruptToken Stopping this token ends the clip early (skip, stop).
    /// @return The outcome, or a PlaybackError if the device failed.
    [[nodiscard]] virtual auto play(const AudioClip& clip, std::stop_token interruptToken)
        -> Result<PlaybackOutcome> = 0;

    /// @brief Holds output at the current position. Persists until resume(), also across clips.
    virtual void pause() = 0;

    /// @brief Continues output from the position where pause() held it.
    virtual void resume() = 0;

    /// @brief Returns true if pause() preserves the playback position.
    ///
    /// Devices without position-preserving pause are interrupted instead and the
    /// current clip restarts from its beginning after resume.
    [[nodiscard]] virtual auto supportsPause() const -> bool = 0;
};

} // namespace speakstream
