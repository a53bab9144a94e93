// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/PlaybackDevice.hpp>

#include <memory>

namespace speakstream
{

/// @brief Plays PCM clips through the default playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. The device is opened lazily
/// for the format of the first clip and kept running between clips of the same format,
/// rendering silence while idle or paused, so consecutive clips play without gaps.
class AudioPlayback: public PlaybackDevice
{
  public:
    AudioPlayback();
    ~AudioPlayback() override;

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    /// @brief Opens the playback device for the given format.
    ///
    /// Calling play() with a clip of another format reopens the device.
    /// @param sampleRate Audio sample rate in Hz (e.g. 22050).
    /// @param channels Number of audio channels (e.g. 1 for mono).
    /// @return Success or a PlaybackError.
    [[nodiscard]] auto initialize(unsigned sampleRate, unsigned channels) -> VoidResult;

    [[nodiscard]] auto play(const AudioClip& clip, std::stop_token interruptToken) -> Result<PlaybackOutcome> override;

    void pause() override;
    void resume() override;

    [[nodiscard]] auto supportsPause() const -> bool override { return true; }

    /// @brief Stops and closes the device.
    void close();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace speakstream
