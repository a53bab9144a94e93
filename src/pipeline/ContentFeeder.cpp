// SPDX-License-Identifier: Apache-2.0
#include "ContentFeeder.hpp"

#include <core/Log.hpp>
#include <pipeline/ProgressTracker.hpp>
#include <pipeline/Session.hpp>
#include <source/TextSource.hpp>
#include <text/Segmenter.hpp>
#include <text/TextCleaner.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace speakstream
{

namespace
{

    /// @brief Returns the byte length of the first maxCodePoints code points of text.
    auto utf8PrefixLength(std::string_view text, std::size_t maxCodePoints) noexcept -> std::size_t
    {
        auto count = std::size_t { 0 };
        for (auto i = std::size_t { 0 }; i < text.size(); ++i)
        {
            auto const byte = static_cast<unsigned char>(text[i]);
            if ((byte & 0xC0) == 0x80)
                continue;
            if (count == maxCodePoints)
                return i;
            ++count;
        }
        return text.size();
    }

} // namespace

ContentFeeder::ContentFeeder(FeederConfig config,
                             const Segmenter& segmenter,
                             Session& session,
                             ProgressTracker& progress):
    _config(config), _segmenter(segmenter), _session(session), _progress(progress)
{
}

auto ContentFeeder::feed(TextSource& source, BoundedQueue<TextChunk>& workQueue, std::stop_token token)
    -> VoidResult
{
    _sizeHint = source.sizeHint();
    auto outcome = VoidResult {};

    while (true)
    {
        auto piece = source.read(token);
        if (!piece)
        {
            if (piece.error().code == ErrorCode::Cancelled)
            {
                workQueue.close();
                return std::unexpected(piece.error());
            }
            log::error("Reading '{}' failed after {} bytes: {}", source.sourceId(), _bytesRead, piece.error());
            outcome = std::unexpected(piece.error());
            break;
        }

        if (!piece->has_value())
            break;

        _bytesRead += (*piece)->size();
        auto const withinLimit = append(std::move(**piece));

        if (_buffer.size() >= _config.segmentThreshold && !emitChunks(workQueue, false, token))
        {
            workQueue.close();
            return makeError(ErrorCode::Cancelled, "Feeding cancelled");
        }

        if (!withinLimit)
        {
            log::info("Reached the limit of {} characters, ignoring the rest of '{}'",
                      _config.maxChars,
                      source.sourceId());
            _progress.notice(std::format("Text truncated after {} characters", _config.maxChars));
            break;
        }
    }

    if (!_partialSequence.empty())
    {
        log::warning("Dropping {} bytes of an incomplete UTF-8 sequence at the end of '{}'",
                     _partialSequence.size(),
                     source.sourceId());
        _partialSequence.clear();
    }

    if (!emitChunks(workQueue, true, token))
    {
        workQueue.close();
        return makeError(ErrorCode::Cancelled, "Feeding cancelled");
    }

    updateEstimate(true);
    workQueue.close();
    log::debug("Finished feeding '{}': {} chunks from {} bytes", source.sourceId(), _nextIndex, _bytesRead);
    return outcome;
}

auto ContentFeeder::append(std::string piece) -> bool
{
    auto data = std::move(_partialSequence);
    _partialSequence.clear();
    data += piece;

    auto const tail = incompleteUtf8Tail(data);
    _partialSequence = data.substr(data.size() - tail);
    data.resize(data.size() - tail);

    auto text = _config.cleanText ? cleanText(data) : std::move(data);

    if (_config.maxChars > 0)
    {
        auto const remaining = _config.maxChars - _charsAccepted;
        auto const count = codePointCount(text);
        if (count > remaining)
        {
            text.resize(utf8PrefixLength(text, remaining));
            _charsAccepted = _config.maxChars;
            _truncated = true;
            _partialSequence.clear();
            _buffer += text;
            return false;
        }
        _charsAccepted += count;
    }

    _buffer += text;
    return true;
}

auto ContentFeeder::emitChunks(BoundedQueue<TextChunk>& workQueue, bool final, std::stop_token token) -> bool
{
    auto chunks = _segmenter.segment(_buffer, _nextIndex);
    if (chunks.empty())
    {
        if (final)
            _buffer.clear();
        return true;
    }

    auto carry = std::string {};
    if (!final)
    {
        // A single chunk may still grow with the next piece of text.
        if (chunks.size() < 2)
            return true;

        auto const trailingSpace = std::isspace(static_cast<unsigned char>(_buffer.back())) != 0;
        carry = std::move(chunks.back().text);
        if (trailingSpace)
            carry += ' ';
        chunks.pop_back();
    }
    _buffer = std::move(carry);

    for (auto& chunk: chunks)
    {
        chunk.index = _nextIndex++;
        _bytesEmitted += chunk.text.size();

        if (chunk.index == 0)
            _session.transitionFrom(PlaybackState::Fetching, PlaybackState::Buffering);
        _progress.chunkFetched();
        updateEstimate(false);

        log::debug("Chunk {} ready ({} chars)", chunk.index, chunk.charCount);
        if (!workQueue.push(std::move(chunk), token))
            return false;
    }
    return true;
}

void ContentFeeder::updateEstimate(bool exact)
{
    if (exact)
    {
        _session.setTotalChunksEstimate(_nextIndex);
        return;
    }

    if (!_sizeHint || _nextIndex == 0)
        return;

    auto const averageChunkBytes = std::max<std::size_t>(_bytesEmitted / _nextIndex, 1);
    auto const unreadBytes = *_sizeHint > _bytesRead ? *_sizeHint - _bytesRead : 0;
    auto const pendingBytes = unreadBytes + _buffer.size();
    auto const pendingChunks = (pendingBytes + averageChunkBytes - 1) / averageChunkBytes;
    _session.setTotalChunksEstimate(_nextIndex + pendingChunks);
}

} // namespace speakstream
