// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/PlaybackDevice.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace speakstream
{

/// @brief Playback device that appends every clip to a 16-bit PCM WAV file instead of playing it.
///
/// The file is created on the first non-empty clip and takes that clip's sample rate and
/// channel count; a clip of another format is rejected with a PlaybackError. Writing does
/// not wait for real time. pause() holds the next play() call until resume().
class WavFileWriter: public PlaybackDevice
{
  public:
    explicit WavFileWriter(std::filesystem::path path);
    ~WavFileWriter() override;

    WavFileWriter(const WavFileWriter&) = delete;
    WavFileWriter& operator=(const WavFileWriter&) = delete;

    [[nodiscard]] auto play(const AudioClip& clip, std::stop_token interruptToken) -> Result<PlaybackOutcome> override;

    void pause() override;
    void resume() override;

    [[nodiscard]] auto supportsPause() const -> bool override { return true; }

    /// @brief Completes the WAV header and closes the file. Further clips start a new file.
    void finish();

    [[nodiscard]] auto path() const -> const std::filesystem::path&;

    /// @brief Frames written to the file so far.
    [[nodiscard]] auto framesWritten() const -> std::uint64_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace speakstream
