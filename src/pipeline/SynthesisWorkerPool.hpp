// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Synthesizer.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <pipeline/BoundedQueue.hpp>
#include <pipeline/ReorderBuffer.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace speakstream
{

class PlaybackBuffer;
class ProgressTracker;

/// @brief Configuration of the synthesis worker pool.
struct WorkerPoolConfig
{
    std::size_t workers = 3;
    std::chrono::milliseconds timeout { 30000 }; ///< Per-call synthesis timeout.
    unsigned retries = 0;                        ///< Extra attempts after a failed or timed-out call.
    SynthesisOptions options;
    bool trimSilence = false; ///< Cut leading and trailing silence from every clip.
};

/// @brief Validates the worker count and timeout.
[[nodiscard]] auto validate(const WorkerPoolConfig& config) -> VoidResult;

/// @brief Runs synthesis for queued chunks on a fixed number of worker threads.
///
/// Each worker reserves a playback buffer slot, takes the next chunk from the work queue
/// and synthesizes it under a per-call timeout. Results, including failures, pass
/// through a reorder buffer so the playback buffer receives them in index order. When
/// the work queue is drained, the last worker to exit closes the playback buffer.
///
/// Every synthesis call runs on a thread owned by the pool. A call abandoned on timeout
/// or cancellation is asked to stop and joined by join(), so its cleanup (child
/// processes, temporary files) has finished once join() returns.
class SynthesisWorkerPool
{
  public:
    SynthesisWorkerPool(WorkerPoolConfig config,
                        std::shared_ptr<Synthesizer> synthesizer,
                        BoundedQueue<TextChunk>& workQueue,
                        PlaybackBuffer& playbackBuffer,
                        ProgressTracker& progress);
    ~SynthesisWorkerPool();

    SynthesisWorkerPool(const SynthesisWorkerPool&) = delete;
    SynthesisWorkerPool& operator=(const SynthesisWorkerPool&) = delete;

    /// @brief Spawns the workers.
    /// @param token Pipeline cancellation token, observed by every worker.
    void start(std::stop_token token);

    /// @brief Waits for all workers and all abandoned synthesis calls to exit.
    void join();

    /// @brief Returns the number of workers still running.
    [[nodiscard]] auto activeWorkers() const noexcept -> std::size_t { return _active.load(); }

    /// @brief Synthesizes one chunk with timeout and retries.
    /// @return A ready artifact, or a failed one carrying the last error.
    [[nodiscard]] auto synthesizeChunk(const TextChunk& chunk, std::stop_token token) -> AudioArtifact;

  private:
    struct PendingCall;

    void run(std::stop_token token, std::size_t workerId);

    /// @brief Runs one synthesis call, abandoning it on timeout or cancellation.
    ///
    /// The timeout starts once the engine has a free slot (see Synthesizer::maxConcurrentCalls).
    auto callWithTimeout(const TextChunk& chunk, std::stop_token token) -> Result<AudioClip>;

    /// @brief Waits until the engine accepts another call and claims the slot.
    /// @return false if token was stopped first.
    auto acquireEngine(std::stop_token token) -> bool;
    void releaseEngine();

    /// @brief Keeps an abandoned call thread until join(); drops threads that already finished.
    void retire(std::shared_ptr<PendingCall> call, std::jthread thread);

    /// @brief Passes an artifact through the reorder buffer into the playback buffer.
    void deliver(AudioArtifact artifact, std::stop_token token);

    WorkerPoolConfig _config;
    std::shared_ptr<Synthesizer> _synthesizer;
    BoundedQueue<TextChunk>& _workQueue;
    PlaybackBuffer& _playbackBuffer;
    ProgressTracker& _progress;

    ReorderBuffer _reorder;
    std::mutex _deliverMutex;
    std::atomic<std::size_t> _active { 0 };
    std::vector<std::jthread> _workers;

    std::size_t const _engineLimit;
    std::mutex _callMutex;
    std::condition_variable_any _engineFreed;
    std::size_t _runningCalls = 0;
    std::vector<std::pair<std::shared_ptr<PendingCall>, std::jthread>> _abandonedCalls;
};

} // namespace speakstream
