// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/PlaybackDevice.hpp>
#include <audio/Synthesizer.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <pipeline/PipelineConfig.hpp>
#include <source/TextSource.hpp>

#include <chrono>
#include <memory>
#include <optional>

namespace speakstream
{

class Session;

/// @brief Runs one reading session end to end: source -> segmenter -> workers -> playback.
///
/// start() spawns the feeder, the synthesis workers, the playback controller and the
/// progress publisher; all of them observe one stop source. The session reaches a
/// terminal state exactly once:
///  - Completed when every chunk was consumed and at least one was played,
///  - Stopped after stop() or cancel(),
///  - Failed when nothing could be played or the device failed persistently.
class StreamingPipeline
{
  public:
    /// @param config Stage configuration.
    /// @param synthesizer Engine shared by all workers.
    /// @param device Audio output; must outlive the pipeline.
    /// @param sink Progress receiver, or nullptr; must outlive the pipeline.
    StreamingPipeline(PipelineConfig config,
                      std::shared_ptr<Synthesizer> synthesizer,
                      PlaybackDevice& device,
                      ProgressSink* sink = nullptr);
    ~StreamingPipeline();

    StreamingPipeline(const StreamingPipeline&) = delete;
    StreamingPipeline& operator=(const StreamingPipeline&) = delete;

    /// @brief Starts reading the source. May be called once.
    /// @return Success, or a ConfigError / InvalidArgument.
    [[nodiscard]] auto start(std::unique_ptr<TextSource> source) -> VoidResult;

    void pause();
    void resume();
    void skip();

    /// @brief Stops playback and all upstream work; the session ends Stopped.
    void stop();

    /// @brief Aborts the session from outside (signal, shutdown); the session ends Stopped.
    void cancel();

    /// @brief Blocks until the session is terminal and every thread has exited.
    auto wait() -> PlaybackState;

    /// @brief Waits up to timeout for the session to become terminal.
    auto waitFor(std::chrono::milliseconds timeout) -> std::optional<PlaybackState>;

    /// @brief Returns the session, or nullptr before start().
    [[nodiscard]] auto session() const -> const Session*;

    [[nodiscard]] auto state() const -> PlaybackState;
    [[nodiscard]] auto snapshot() const -> ProgressSnapshot;

    /// @brief Returns the error that ended reading early, if any.
    [[nodiscard]] auto fetchError() const -> std::optional<Error>;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace speakstream
