// SPDX-License-Identifier: Apache-2.0
#include "AudioPlayback.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <span>

namespace speakstream
{

struct AudioPlayback::Impl
{
    ma_device device {};
    bool initialized = false;
    unsigned sampleRate = 0;
    unsigned channels = 0;

    // Clip state: guarded by mutex and signalled via condvar
    std::span<const float> buffer;
    std::size_t readPos = 0;
    bool active = false;
    bool interrupted = false;
    std::mutex mutex;
    std::condition_variable done;
    std::atomic<bool> paused { false };

    auto finished() const -> bool { return interrupted || readPos >= buffer.size(); }
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioPlayback::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const channels = device->playback.channels;
        auto const totalSamples = static_cast<std::size_t>(frameCount) * channels;

        auto lock = std::unique_lock(impl->mutex);
        auto toCopy = std::size_t { 0 };
        if (impl->active && !impl->interrupted && !impl->paused.load(std::memory_order_relaxed))
        {
            toCopy = std::min(totalSamples, impl->buffer.size() - impl->readPos);
            std::copy_n(impl->buffer.data() + impl->readPos, toCopy, out);
            impl->readPos += toCopy;
        }

        // Zero-fill any remaining output frames
        if (toCopy < totalSamples)
            std::fill_n(out + toCopy, totalSamples - toCopy, 0.0f);

        if (impl->active && impl->finished())
        {
            lock.unlock();
            impl->done.notify_one();
        }
    }

} // namespace

AudioPlayback::AudioPlayback(): _impl(std::make_unique<Impl>())
{
}

AudioPlayback::~AudioPlayback()
{
    close();
}

auto AudioPlayback::initialize(unsigned sampleRate, unsigned channels) -> VoidResult
{
    if (_impl->initialized && _impl->sampleRate == sampleRate && _impl->channels == channels)
        return {};

    close();

    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = channels;
    config.sampleRate = sampleRate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = _impl.get();

    auto const result = ma_device_init(nullptr, &config, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    _impl->sampleRate = sampleRate;
    _impl->channels = channels;

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
    {
        close();
        return makeError(ErrorCode::PlaybackError,
                         std::format("Failed to start playback: {}", static_cast<int>(startResult)));
    }

    log::info("Audio playback initialized ({}Hz, {} channel(s), f32)", sampleRate, channels);
    return {};
}

auto AudioPlayback::play(const AudioClip& clip, std::stop_token interruptToken) -> Result<PlaybackOutcome>
{
    if (clip.samples.empty())
        return PlaybackOutcome::Completed;

    if (auto result = initialize(clip.sampleRate, clip.channels); !result)
        return std::unexpected(result.error());

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->buffer = clip.samples;
        _impl->readPos = 0;
        _impl->interrupted = false;
        _impl->active = true;
    }

    // Runs inline if the token is already stopped, so the mutex must not be held here.
    auto const onInterrupt = std::stop_callback(interruptToken, [this] {
        {
            auto lock = std::lock_guard(_impl->mutex);
            _impl->interrupted = true;
        }
        _impl->done.notify_one();
    });

    auto lock = std::unique_lock(_impl->mutex);
    _impl->done.wait(lock, [this] { return _impl->finished(); });

    auto const outcome = _impl->interrupted ? PlaybackOutcome::Interrupted : PlaybackOutcome::Completed;
    _impl->active = false;
    _impl->buffer = {};
    _impl->readPos = 0;
    return outcome;
}

void AudioPlayback::pause()
{
    _impl->paused.store(true, std::memory_order_relaxed);
}

void AudioPlayback::resume()
{
    _impl->paused.store(false, std::memory_order_relaxed);
}

void AudioPlayback::close()
{
    if (!_impl->initialized)
        return;

    ma_device_uninit(&_impl->device);
    _impl->initialized = false;
    _impl->sampleRate = 0;
    _impl->channels = 0;
}

} // namespace speakstream
