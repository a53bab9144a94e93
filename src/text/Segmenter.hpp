// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace speakstream
{

/// @brief Returns the built-in table of abbreviations and time markers
///        that must never be treated as sentence ends (English and Spanish).
[[nodiscard]] auto defaultProtectedPatterns() -> std::vector<std::string>;

/// @brief Chunk size band and protected-token table for the Segmenter.
struct SegmenterConfig
{
    /// @brief Minimum chunk size in code points (the final chunk may be shorter).
    std::size_t minSize = 40;

    /// @brief Maximum chunk size in code points.
    std::size_t maxSize = 300;

    /// @brief Tokens inside which no sentence boundary is recognized (case-sensitive).
    std::vector<std::string> protectedPatterns = defaultProtectedPatterns();
};

/// @brief Checks that the size band is usable.
[[nodiscard]] auto validate(const SegmenterConfig& config) -> VoidResult;

/// @brief Collapses every whitespace run to a single space and trims both ends.
[[nodiscard]] auto normalizeWhitespace(std::string_view text) -> std::string;

/// @brief Counts UTF-8 code points.
[[nodiscard]] auto codePointCount(std::string_view text) noexcept -> std::size_t;

/// @brief Joins chunk texts with single spaces.
///
/// For any input, joinChunks(segment(input)) == normalizeWhitespace(input).
[[nodiscard]] auto joinChunks(const std::vector<TextChunk>& chunks) -> std::string;

/// @brief Splits text into ordered, size-bounded chunks at linguistic boundaries.
///
/// Sentences end at '.', '!' or '?' (plus trailing closing quotes or brackets) followed by
/// whitespace and a capital letter, or at end of text, unless the punctuation lies inside
/// a protected token. Sentences are accumulated greedily up to maxSize. A chunk still below
/// minSize keeps accumulating and is force-closed at maxSize, preferring a comma followed by
/// a coordinating conjunction, then any word boundary. Words are never split.
///
/// Chunks are whitespace-normalized and trimmed; they are separated in the source by exactly
/// one space after normalization. The result depends only on the input and configuration.
class Segmenter
{
  public:
    explicit Segmenter(SegmenterConfig config);

    /// @brief Segments text into chunks numbered from firstIndex.
    /// @param text Arbitrary input text (need not be normalized).
    /// @param firstIndex Index assigned to the first chunk.
    /// @return The chunk sequence; empty if text contains no non-whitespace characters.
    [[nodiscard]] auto segment(std::string_view text, std::uint64_t firstIndex = 0) const
        -> std::vector<TextChunk>;

    /// @brief Returns the end offsets (exclusive) of the sentences of normalized text.
    ///
    /// The last offset is always normalized.size() for non-empty input.
    [[nodiscard]] auto sentenceEnds(std::string_view normalized) const -> std::vector<std::size_t>;

    [[nodiscard]] auto config() const noexcept -> const SegmenterConfig& { return _config; }

  private:
    [[nodiscard]] auto isProtected(std::string_view text, std::size_t runBegin, std::size_t runEnd) const
        -> bool;
    [[nodiscard]] auto forcedSplitPoint(std::string_view text, std::size_t begin, std::size_t end) const
        -> std::size_t;

    SegmenterConfig _config;
};

} // namespace speakstream
