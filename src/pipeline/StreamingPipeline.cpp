// SPDX-License-Identifier: Apache-2.0
#include "StreamingPipeline.hpp"

#include <core/Log.hpp>
#include <pipeline/BoundedQueue.hpp>
#include <pipeline/ContentFeeder.hpp>
#include <pipeline/PlaybackBuffer.hpp>
#include <pipeline/PlaybackController.hpp>
#include <pipeline/ProgressTracker.hpp>
#include <pipeline/Session.hpp>
#include <pipeline/SynthesisWorkerPool.hpp>
#include <text/Segmenter.hpp>

#include <format>
#include <mutex>
#include <thread>

namespace speakstream
{

struct StreamingPipeline::Impl
{
    PipelineConfig config;
    std::shared_ptr<Synthesizer> synthesizer;
    PlaybackDevice& device;
    ProgressSink* sink;

    std::stop_source stopSource;
    std::unique_ptr<TextSource> source;
    std::unique_ptr<Session> session;
    std::unique_ptr<Segmenter> segmenter;
    std::unique_ptr<BoundedQueue<TextChunk>> workQueue;
    std::unique_ptr<PlaybackBuffer> playbackBuffer;
    std::unique_ptr<ProgressTracker> progress;
    std::unique_ptr<ContentFeeder> feeder;
    std::unique_ptr<SynthesisWorkerPool> workers;
    std::unique_ptr<PlaybackController> controller;
    std::jthread feederThread;

    mutable std::mutex mutex;
    std::optional<Error> fetchError;

    std::mutex joinMutex;
    bool joined = false;

    Impl(PipelineConfig config, std::shared_ptr<Synthesizer> synthesizer, PlaybackDevice& device, ProgressSink* sink):
        config(std::move(config)), synthesizer(std::move(synthesizer)), device(device), sink(sink)
    {
    }

    void runFeeder(std::stop_token token)
    {
        log::setThreadName("feeder");
        auto result = feeder->feed(*source, *workQueue, token);
        if (!result && result.error().code != ErrorCode::Cancelled)
        {
            auto lock = std::lock_guard(mutex);
            fetchError = result.error();
        }
    }

    /// @brief Decides the terminal state once the playback loop has ended. Runs on the playback thread.
    void finish(PlaybackEnd end, std::optional<Error> error)
    {
        auto terminal = PlaybackState::Stopped;
        auto reason = std::optional<Error> {};

        switch (end)
        {
            case PlaybackEnd::Stopped: break;
            case PlaybackEnd::DeviceFailed:
                terminal = PlaybackState::Failed;
                reason = std::move(error);
                break;
            case PlaybackEnd::Drained: {
                // The feeder has closed the work queue; wait for it to record how reading ended.
                if (feederThread.joinable())
                    feederThread.join();

                auto const fetch = [this] {
                    auto lock = std::lock_guard(mutex);
                    return fetchError;
                }();
                auto const snapshot = progress->snapshot();

                if (snapshot.chunksPlayed > 0)
                {
                    terminal = PlaybackState::Completed;
                    if (fetch)
                    {
                        log::warning("Playback ended early, the source could not be read completely: {}", *fetch);
                        progress->notice(std::format("Playback ended early: {}", fetch->message));
                    }
                }
                else
                {
                    terminal = PlaybackState::Failed;
                    if (fetch)
                        reason = fetch;
                    else if (snapshot.chunksFailed > 0)
                        reason = Error { .code = ErrorCode::SynthesisError,
                                         .message = "None of the chunks could be synthesized" };
                    else
                        reason = Error { .code = ErrorCode::FetchError, .message = "The source contains no text" };
                }
                break;
            }
        }

        if (reason)
            log::error("Session '{}' failed: {}", session->sourceId(), *reason);
        session->finish(terminal, std::move(reason));
        log::info("Session '{}' {}", session->sourceId(), toString(session->state()));

        // Release workers still waiting for work or buffer space.
        stopSource.request_stop();
    }
};

StreamingPipeline::StreamingPipeline(PipelineConfig config,
                                     std::shared_ptr<Synthesizer> synthesizer,
                                     PlaybackDevice& device,
                                     ProgressSink* sink):
    _impl(std::make_unique<Impl>(std::move(config), std::move(synthesizer), device, sink))
{
}

StreamingPipeline::~StreamingPipeline()
{
    if (!_impl->session)
        return;

    if (!isTerminal(_impl->session->state()))
        cancel();
    wait();
}

auto StreamingPipeline::start(std::unique_ptr<TextSource> source) -> VoidResult
{
    if (_impl->session)
        return makeError(ErrorCode::InvalidArgument, "Pipeline already started");
    if (!source)
        return makeError(ErrorCode::InvalidArgument, "No text source given");
    if (!_impl->synthesizer)
        return makeError(ErrorCode::InvalidArgument, "No synthesizer given");
    if (auto result = validate(_impl->config); !result)
        return result;

    auto& impl = *_impl;
    auto const token = impl.stopSource.get_token();

    impl.source = std::move(source);
    impl.session = std::make_unique<Session>(impl.source->sourceId());
    impl.segmenter = std::make_unique<Segmenter>(impl.config.segmenter);
    impl.workQueue = std::make_unique<BoundedQueue<TextChunk>>(impl.config.workQueueCapacity);
    impl.playbackBuffer = std::make_unique<PlaybackBuffer>(impl.config.playback);
    impl.progress = std::make_unique<ProgressTracker>(
        *impl.session,
        [buffer = impl.playbackBuffer.get()] { return buffer->size(); },
        impl.sink,
        impl.config.publishInterval);
    impl.feeder = std::make_unique<ContentFeeder>(impl.config.feeder, *impl.segmenter, *impl.session, *impl.progress);
    impl.workers = std::make_unique<SynthesisWorkerPool>(
        impl.config.synthesis, impl.synthesizer, *impl.workQueue, *impl.playbackBuffer, *impl.progress);
    impl.controller = std::make_unique<PlaybackController>(
        *impl.playbackBuffer, impl.device, *impl.session, *impl.progress, impl.stopSource);

    impl.session->setObserver([progress = impl.progress.get()](PlaybackState state) {
        progress->stateChanged(state);
    });
    impl.controller->onFinished(
        [&impl](PlaybackEnd end, std::optional<Error> error) { impl.finish(end, std::move(error)); });

    log::info("Reading '{}' with {} {} worker(s)",
              impl.session->sourceId(),
              impl.config.synthesis.workers,
              impl.synthesizer->name());

    impl.progress->start();
    impl.session->transition(PlaybackState::Fetching);
    impl.workers->start(token);
    impl.feederThread = std::jthread([&impl, token] { impl.runFeeder(token); });
    impl.controller->start();
    return {};
}

void StreamingPipeline::pause()
{
    if (_impl->controller)
        _impl->controller->pause();
}

void StreamingPipeline::resume()
{
    if (_impl->controller)
        _impl->controller->resume();
}

void StreamingPipeline::skip()
{
    if (_impl->controller)
        _impl->controller->skip();
}

void StreamingPipeline::stop()
{
    if (_impl->controller)
        _impl->controller->stop();
}

void StreamingPipeline::cancel()
{
    if (!_impl->controller)
        return;
    log::info("Cancelling session '{}'", _impl->session->sourceId());
    _impl->controller->stop();
}

auto StreamingPipeline::wait() -> PlaybackState
{
    if (!_impl->session)
        return PlaybackState::Idle;

    auto const state = _impl->session->waitForTerminal();

    auto lock = std::lock_guard(_impl->joinMutex);
    if (!_impl->joined)
    {
        _impl->controller->join();
        if (_impl->feederThread.joinable())
            _impl->feederThread.join();
        _impl->workers->join();
        _impl->progress->stop();
        _impl->joined = true;
    }
    return state;
}

auto StreamingPipeline::waitFor(std::chrono::milliseconds timeout) -> std::optional<PlaybackState>
{
    if (!_impl->session)
        return std::nullopt;
    return _impl->session->waitForTerminal(timeout);
}

auto StreamingPipeline::session() const -> const Session*
{
    return _impl->session.get();
}

auto StreamingPipeline::state() const -> PlaybackState
{
    return _impl->session ? _impl->session->state() : PlaybackState::Idle;
}

auto StreamingPipeline::snapshot() const -> ProgressSnapshot
{
    return _impl->progress ? _impl->progress->snapshot() : ProgressSnapshot {};
}

auto StreamingPipeline::fetchError() const -> std::optional<Error>
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->fetchError;
}

} // namespace speakstream
