// SPDX-License-Identifier: Apache-2.0
#include "SynthesisWorkerPool.hpp"

#include <audio/SilenceTrimmer.hpp>
#include <core/Log.hpp>
#include <pipeline/PlaybackBuffer.hpp>
#include <pipeline/ProgressTracker.hpp>

#include <condition_variable>
#include <format>
#include <optional>

namespace speakstream
{

/// @brief Result slot shared between a worker and the thread running its synthesis call.
///
/// A call abandoned on timeout or cancellation keeps its engine slot until the thread
/// exits; its late result is discarded.
struct SynthesisWorkerPool::PendingCall
{
    std::mutex mutex;
    std::condition_variable_any done;
    std::optional<Result<AudioClip>> result;
    std::atomic<bool> finished { false };
};

auto validate(const WorkerPoolConfig& config) -> VoidResult
{
    if (config.workers < 1)
        return makeError(ErrorCode::ConfigError, "synthesis.workers must be at least 1");
    if (config.timeout <= std::chrono::milliseconds::zero())
        return makeError(ErrorCode::ConfigError, "synthesis.timeoutMs must be positive");
    return {};
}

SynthesisWorkerPool::SynthesisWorkerPool(WorkerPoolConfig config,
                                         std::shared_ptr<Synthesizer> synthesizer,
                                         BoundedQueue<TextChunk>& workQueue,
                                         PlaybackBuffer& playbackBuffer,
                                         ProgressTracker& progress):
    _config(std::move(config)),
    _synthesizer(std::move(synthesizer)),
    _workQueue(workQueue),
    _playbackBuffer(playbackBuffer),
    _progress(progress),
    _engineLimit(_synthesizer->maxConcurrentCalls())
{
}

SynthesisWorkerPool::~SynthesisWorkerPool()
{
    join();
}

void SynthesisWorkerPool::start(std::stop_token token)
{
    _active = _config.workers;
    _workers.reserve(_config.workers);
    for (auto id = std::size_t { 0 }; id < _config.workers; ++id)
        _workers.emplace_back([this, token, id] { run(token, id); });

    log::debug("Started {} synthesis worker(s) using {}", _config.workers, _synthesizer->name());
}

void SynthesisWorkerPool::join()
{
    for (auto& worker: _workers)
        if (worker.joinable())
            worker.join();
    _workers.clear();

    auto abandoned = decltype(_abandonedCalls) {};
    {
        auto lock = std::lock_guard(_callMutex);
        abandoned.swap(_abandonedCalls);
    }
    if (!abandoned.empty())
        log::debug("Waiting for {} abandoned synthesis call(s) to clean up", abandoned.size());
    for (auto& [call, thread]: abandoned)
        thread.join();
}

void SynthesisWorkerPool::run(std::stop_token token, std::size_t workerId)
{
    log::setThreadName(std::format("worker-{}", workerId));
    while (!token.stop_requested())
    {
        if (!_playbackBuffer.reserve(token))
            break;

        auto chunk = _workQueue.pop(token);
        if (!chunk)
        {
            _playbackBuffer.releaseReservation();
            break;
        }

        log::trace("Worker {} synthesizing chunk {}", workerId, chunk->index);
        auto artifact = synthesizeChunk(*chunk, token);
        if (token.stop_requested())
            break;

        if (artifact.isReady())
            _progress.chunkSynthesized(artifact.durationEstimate);
        deliver(std::move(artifact), token);
    }

    if (_active.fetch_sub(1) == 1 && !token.stop_requested())
    {
        if (auto const stranded = _reorder.pendingCount(); stranded > 0)
            log::warning("{} synthesized chunk(s) never became playable", stranded);
        log::debug("All synthesis workers finished");
        _playbackBuffer.close();
    }
}

auto SynthesisWorkerPool::synthesizeChunk(const TextChunk& chunk, std::stop_token token) -> AudioArtifact
{
    auto lastError = Error {};
    for (auto attempt = 0u; attempt <= _config.retries; ++attempt)
    {
        auto const started = std::chrono::steady_clock::now();
        auto clip = callWithTimeout(chunk, token);
        if (clip)
        {
            if (_config.trimSilence)
                *clip = trimSilence(std::move(*clip));
            auto const elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            log::debug("Chunk {}: {} chars, synthesized in {}ms, {}ms of audio",
                       chunk.index,
                       chunk.charCount,
                       elapsed.count(),
                       clip->duration().count());
            return AudioArtifact::ready(chunk.index, std::move(*clip));
        }

        lastError = clip.error();
        if (lastError.code == ErrorCode::Cancelled)
            break;

        log::warning("Synthesis of chunk {} failed (attempt {}/{}): {}",
                     chunk.index,
                     attempt + 1,
                     _config.retries + 1,
                     lastError);
    }
    return AudioArtifact::failed(chunk.index, std::move(lastError));
}

auto SynthesisWorkerPool::callWithTimeout(const TextChunk& chunk, std::stop_token token) -> Result<AudioClip>
{
    if (!acquireEngine(token))
        return makeError(ErrorCode::Cancelled, "Synthesis cancelled");

    auto call = std::make_shared<PendingCall>();
    auto const deadline = std::chrono::steady_clock::now() + _config.timeout;

    auto thread = std::jthread(
        [this, call, text = chunk.text, name = std::format("{}/call", log::threadName())](std::stop_token abandon) {
            log::setThreadName(name);
            auto result = _synthesizer->synthesize(text, _config.options, abandon);
            {
                auto lock = std::lock_guard(call->mutex);
                call->result.emplace(std::move(result));
            }
            call->done.notify_all();
            releaseEngine();
            call->finished = true;
        });

    {
        auto lock = std::unique_lock(call->mutex);
        if (call->done.wait_until(lock, token, deadline, [&call] { return call->result.has_value(); }))
        {
            auto result = std::move(*call->result);
            lock.unlock();
            thread.join();
            return result;
        }
    }

    thread.request_stop();
    retire(std::move(call), std::move(thread));

    if (token.stop_requested())
        return makeError(ErrorCode::Cancelled, "Synthesis cancelled");
    return makeError(ErrorCode::TimeoutError,
                     std::format("Synthesis of chunk {} exceeded {}ms", chunk.index, _config.timeout.count()));
}

auto SynthesisWorkerPool::acquireEngine(std::stop_token token) -> bool
{
    auto lock = std::unique_lock(_callMutex);
    if (_engineLimit > 0 && !_engineFreed.wait(lock, token, [this] { return _runningCalls < _engineLimit; }))
        return false;
    ++_runningCalls;
    return true;
}

void SynthesisWorkerPool::releaseEngine()
{
    {
        auto lock = std::lock_guard(_callMutex);
        --_runningCalls;
    }
    _engineFreed.notify_all();
}

void SynthesisWorkerPool::retire(std::shared_ptr<PendingCall> call, std::jthread thread)
{
    auto lock = std::lock_guard(_callMutex);
    std::erase_if(_abandonedCalls, [](const auto& entry) { return entry.first->finished.load(); });
    _abandonedCalls.emplace_back(std::move(call), std::move(thread));
}

void SynthesisWorkerPool::deliver(AudioArtifact artifact, std::stop_token token)
{
    auto lock = std::lock_guard(_deliverMutex);
    _reorder.insert(std::move(artifact));
    for (auto& ready: _reorder.releaseReadyPrefix())
    {
        if (!_playbackBuffer.enqueue(std::move(ready), token))
            return;
    }
}

} // namespace speakstream
