// SPDX-License-Identifier: Apache-2.0
#include "PlaybackController.hpp"

#include <audio/PlaybackDevice.hpp>
#include <core/Log.hpp>
#include <pipeline/PlaybackBuffer.hpp>
#include <pipeline/ProgressTracker.hpp>
#include <pipeline/Session.hpp>

#include <format>

namespace speakstream
{

namespace
{
    /// @brief Device failures tolerated for one clip before playback is considered broken.
    constexpr auto MaxDeviceAttempts = 2;
} // namespace

PlaybackController::PlaybackController(PlaybackBuffer& buffer,
                                       PlaybackDevice& device,
                                       Session& session,
                                       ProgressTracker& progress,
                                       std::stop_source stopSource):
    _buffer(buffer), _device(device), _session(session), _progress(progress), _stopSource(std::move(stopSource))
{
}

PlaybackController::~PlaybackController()
{
    if (_thread.joinable())
    {
        _stopSource.request_stop();
        _thread.join();
    }
}

void PlaybackController::onFinished(FinishedCallback callback)
{
    _finished = std::move(callback);
}

void PlaybackController::start()
{
    _thread = std::jthread([this, token = _stopSource.get_token()] { run(token); });
}

void PlaybackController::join()
{
    if (_thread.joinable())
        _thread.join();
}

void PlaybackController::pause()
{
    auto lock = std::lock_guard(_mutex);
    auto const state = _session.state();
    if (_paused || isTerminal(state) || state == PlaybackState::Idle)
        return;

    _paused = true;
    _stateBeforePause = state;
    _session.transition(PlaybackState::Paused);

    if (_device.supportsPause())
        _device.pause();
    else if (_clipActive)
    {
        _restartRequested = true;
        _clipStop.request_stop();
    }
    log::info("Playback paused");
}

void PlaybackController::resume()
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_paused)
            return;

        _paused = false;
        if (_device.supportsPause())
            _device.resume();

        if (_clipActive)
            _session.transition(PlaybackState::Playing);
        else if (_stateBeforePause == PlaybackState::Playing)
            _session.transition(PlaybackState::Buffering);
        else
            _session.transition(_stateBeforePause);
    }
    _resumed.notify_all();
    log::info("Playback resumed");
}

void PlaybackController::skip()
{
    auto lock = std::lock_guard(_mutex);
    if (!_clipActive)
        return;

    _skipRequested = true;
    _clipStop.request_stop();
}

void PlaybackController::stop()
{
    log::info("Stopping playback");
    _stopSource.request_stop();

    auto const discarded = _buffer.clear();
    if (discarded > 0)
        log::debug("Released {} buffered artifact(s)", discarded);

    {
        auto lock = std::lock_guard(_mutex);
        _paused = false;
    }
    if (_device.supportsPause())
        _device.resume();
    _resumed.notify_all();
}

auto PlaybackController::isPaused() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _paused;
}

void PlaybackController::run(std::stop_token token)
{
    log::setThreadName("playback");
    auto const wake = std::stop_callback(token, [this] {
        {
            auto lock = std::lock_guard(_mutex);
            _clipStop.request_stop();
        }
        _resumed.notify_all();
    });

    auto end = PlaybackEnd::Stopped;
    auto error = std::optional<Error> {};
    auto buffering = true;
    auto const lowWatermark = _buffer.config().lowWatermark;

    while (!token.stop_requested())
    {
        if (buffering)
        {
            if (!_buffer.waitForLevel(lowWatermark, token))
                break;
            buffering = false;
        }

        if (!waitWhilePaused(token))
            break;

        auto artifact = _buffer.tryDequeue();
        if (!artifact)
        {
            if (_buffer.isDrained())
            {
                end = PlaybackEnd::Drained;
                break;
            }
            if (_session.transitionFrom(PlaybackState::Playing, PlaybackState::Buffering))
                log::info("Playback buffer underrun, waiting for {} chunk(s)", lowWatermark);
            buffering = true;
            continue;
        }

        if (!artifact->isReady())
        {
            log::warning("Skipping chunk {}: {}", artifact->index, *artifact->failure);
            _progress.chunkFailed(artifact->index, *artifact->failure);
            continue;
        }

        if (auto result = playArtifact(*artifact, token); !result)
        {
            log::error("{}", result.error());
            end = PlaybackEnd::DeviceFailed;
            error = result.error();
            break;
        }
    }

    log::debug("Playback loop finished");
    if (_finished)
        _finished(end, std::move(error));
}

auto PlaybackController::playArtifact(const AudioArtifact& artifact, std::stop_token token) -> VoidResult
{
    auto failures = 0;
    while (true)
    {
        auto clipToken = std::stop_token {};
        {
            auto lock = std::lock_guard(_mutex);
            _clipStop = std::stop_source {};
            if (token.stop_requested())
                _clipStop.request_stop();
            clipToken = _clipStop.get_token();
            _clipActive = true;
            _skipRequested = false;
            _restartRequested = false;
            if (!_paused)
                _session.transition(PlaybackState::Playing);
        }

        log::trace("Playing chunk {} ({}ms)", artifact.index, artifact.durationEstimate.count());
        auto outcome = _device.play(artifact.clip, clipToken);

        auto skipped = false;
        auto restart = false;
        {
            auto lock = std::lock_guard(_mutex);
            _clipActive = false;
            skipped = _skipRequested;
            restart = _restartRequested;
        }

        if (!outcome)
        {
            if (token.stop_requested())
                return {};
            if (++failures < MaxDeviceAttempts)
            {
                log::warning("Playback of chunk {} failed, retrying: {}", artifact.index, outcome.error());
                continue;
            }
            return makeError(ErrorCode::PlaybackError,
                             std::format("Playback of chunk {} failed: {}", artifact.index, outcome.error().message));
        }

        if (*outcome == PlaybackOutcome::Completed)
        {
            _progress.chunkPlayed(artifact.index, artifact.durationEstimate);
            return {};
        }

        if (token.stop_requested())
            return {};

        if (skipped)
        {
            log::info("Skipped chunk {}", artifact.index);
            _progress.chunkPlayed(artifact.index, artifact.durationEstimate);
            return {};
        }

        if (restart)
        {
            if (!waitWhilePaused(token))
                return {};
            continue;
        }

        return {};
    }
}

auto PlaybackController::waitWhilePaused(std::stop_token token) -> bool
{
    auto lock = std::unique_lock(_mutex);
    return _resumed.wait(lock, token, [this] { return !_paused; });
}

} // namespace speakstream
