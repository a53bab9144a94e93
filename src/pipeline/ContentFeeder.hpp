// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <pipeline/BoundedQueue.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

namespace speakstream
{

class ProgressTracker;
class Segmenter;
class Session;
class TextSource;

/// @brief Configuration of the content feeder.
struct FeederConfig
{
    /// @brief Buffered bytes that trigger incremental segmentation.
    std::size_t segmentThreshold = 4096;

    /// @brief Maximum number of code points read from the source (0 = unlimited).
    std::size_t maxChars = 0;

    /// @brief Strip control and invisible characters before segmentation.
    bool cleanText = true;
};

/// @brief Pulls text from a source, segments it incrementally and feeds the work queue.
///
/// Text is buffered until segmentThreshold bytes are available; every chunk except the
/// last is then emitted, and the last one is carried over and re-segmented together with
/// the following text, so chunk boundaries never depend on where the source split its
/// reads. Chunks receive consecutive global indices starting at 0.
class ContentFeeder
{
  public:
    ContentFeeder(FeederConfig config, const Segmenter& segmenter, Session& session, ProgressTracker& progress);

    /// @brief Reads the source to exhaustion, pushing chunks into the work queue.
    ///
    /// The work queue is closed on every exit path. On a FetchError, the text received
    /// so far is still emitted before the error is returned.
    /// @return Success, Cancelled, or the FetchError of the source.
    [[nodiscard]] auto feed(TextSource& source, BoundedQueue<TextChunk>& workQueue, std::stop_token token)
        -> VoidResult;

    /// @brief Returns the number of chunks emitted so far.
    [[nodiscard]] auto chunksEmitted() const noexcept -> std::uint64_t { return _nextIndex; }

    /// @brief Returns true if the text was cut at maxChars.
    [[nodiscard]] auto truncated() const noexcept -> bool { return _truncated; }

  private:
    /// @brief Segments the buffered text and emits complete chunks.
    /// @param final Emit all chunks, including the last one.
    auto emitChunks(BoundedQueue<TextChunk>& workQueue, bool final, std::stop_token token) -> bool;

    /// @brief Appends a piece read from the source to the buffer.
    /// @return false once maxChars has been reached.
    auto append(std::string piece) -> bool;

    void updateEstimate(bool exact);

    FeederConfig _config;
    const Segmenter& _segmenter;
    Session& _session;
    ProgressTracker& _progress;

    std::string _buffer;
    std::string _partialSequence;
    std::uint64_t _nextIndex = 0;
    std::size_t _charsAccepted = 0;
    std::size_t _bytesEmitted = 0;
    std::size_t _bytesRead = 0;
    std::optional<std::size_t> _sizeHint;
    bool _truncated = false;
};

} // namespace speakstream
