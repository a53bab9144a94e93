// SPDX-License-Identifier: Apache-2.0
#include "WavFileWriter.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <condition_variable>
#include <format>
#include <mutex>
#include <vector>

namespace speakstream
{

struct WavFileWriter::Impl
{
    std::filesystem::path path;
    ma_encoder encoder {};
    bool open = false;
    unsigned sampleRate = 0;
    unsigned channels = 0;
    std::uint64_t framesWritten = 0;

    mutable std::mutex mutex;
    std::condition_variable_any resumed;
    bool paused = false;

    auto openFor(const AudioClip& clip) -> VoidResult
    {
        auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, clip.channels, clip.sampleRate);
        auto const result = ma_encoder_init_file(path.c_str(), &config, &encoder);
        if (result != MA_SUCCESS)
            return makeError(ErrorCode::PlaybackError,
                             std::format("Cannot create '{}': {}", path.string(), static_cast<int>(result)));

        open = true;
        sampleRate = clip.sampleRate;
        channels = clip.channels;
        log::debug("Writing audio to '{}' ({}Hz, {} channel(s))", path.string(), sampleRate, channels);
        return {};
    }
};

WavFileWriter::WavFileWriter(std::filesystem::path path): _impl(std::make_unique<Impl>())
{
    _impl->path = std::move(path);
}

WavFileWriter::~WavFileWriter()
{
    finish();
}

auto WavFileWriter::play(const AudioClip& clip, std::stop_token interruptToken) -> Result<PlaybackOutcome>
{
    auto lock = std::unique_lock(_impl->mutex);
    if (!_impl->resumed.wait(lock, interruptToken, [this] { return !_impl->paused; }))
        return PlaybackOutcome::Interrupted;

    if (clip.frameCount() == 0)
        return PlaybackOutcome::Completed;

    if (!_impl->open)
    {
        if (auto result = _impl->openFor(clip); !result)
            return std::unexpected(result.error());
    }
    else if (clip.sampleRate != _impl->sampleRate || clip.channels != _impl->channels)
    {
        return makeError(ErrorCode::PlaybackError,
                         std::format("Clip format {}Hz/{}ch does not match '{}' ({}Hz/{}ch)",
                                     clip.sampleRate,
                                     clip.channels,
                                     _impl->path.string(),
                                     _impl->sampleRate,
                                     _impl->channels));
    }

    auto const frames = clip.frameCount();
    auto pcm = std::vector<ma_int16>(frames * clip.channels);
    ma_pcm_f32_to_s16(pcm.data(), clip.samples.data(), pcm.size(), ma_dither_mode_none);

    auto written = ma_uint64 { 0 };
    auto const result = ma_encoder_write_pcm_frames(&_impl->encoder, pcm.data(), frames, &written);
    _impl->framesWritten += written;
    if (result != MA_SUCCESS || written != frames)
        return makeError(ErrorCode::PlaybackError,
                         std::format("Writing to '{}' failed after {} of {} frames: {}",
                                     _impl->path.string(),
                                     written,
                                     frames,
                                     static_cast<int>(result)));
    return PlaybackOutcome::Completed;
}

void WavFileWriter::pause()
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->paused = true;
}

void WavFileWriter::resume()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->paused = false;
    }
    _impl->resumed.notify_all();
}

void WavFileWriter::finish()
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->open)
        return;

    ma_encoder_uninit(&_impl->encoder);
    _impl->open = false;
    log::info("Wrote '{}' ({} frames at {}Hz)", _impl->path.string(), _impl->framesWritten, _impl->sampleRate);
}

auto WavFileWriter::path() const -> const std::filesystem::path&
{
    return _impl->path;
}

auto WavFileWriter::framesWritten() const -> std::uint64_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->framesWritten;
}

} // namespace speakstream
