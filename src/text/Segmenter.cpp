// SPDX-License-Identifier: Apache-2.0
#include "Segmenter.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <format>

namespace speakstream
{

namespace
{

    constexpr auto CoordinatingConjunctions = std::array<std::string_view, 10> {
        "and", "but", "or", "nor", "for", "so", "yet", "y", "pero", "o",
    };

    constexpr auto isSpace(char ch) noexcept -> bool
    {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
    }

    constexpr auto isTerminator(char ch) noexcept -> bool
    {
        return ch == '.' || ch == '!' || ch == '?';
    }

    constexpr auto isClosing(char ch) noexcept -> bool
    {
        return ch == '"' || ch == '\'' || ch == ')' || ch == ']';
    }

    constexpr auto isAsciiUpper(char ch) noexcept -> bool
    {
        return ch >= 'A' && ch <= 'Z';
    }

    constexpr auto isAsciiAlnum(char ch) noexcept -> bool
    {
        return (ch >= 'a' && ch <= 'z') || isAsciiUpper(ch) || (ch >= '0' && ch <= '9');
    }

    constexpr auto isContinuationByte(char ch) noexcept -> bool
    {
        return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
    }

    /// @brief True if a capital letter starts at pos: ASCII A-Z, Latin-1 capitals (U+00C0..U+00DE
    ///        except U+00D7), or the Spanish opening marks U+00BF and U+00A1.
    auto startsWithCapital(std::string_view text, std::size_t pos) noexcept -> bool
    {
        if (pos >= text.size())
            return false;

        auto const ch = text[pos];
        if (isAsciiUpper(ch))
            return true;

        if (pos + 1 < text.size())
        {
            auto const lead = static_cast<unsigned char>(ch);
            auto const next = static_cast<unsigned char>(text[pos + 1]);
            if (lead == 0xC3 && next >= 0x80 && next <= 0x9E && next != 0x97)
                return true;
            if (lead == 0xC2 && (next == 0xBF || next == 0xA1))
                return true;
        }
        return false;
    }

    /// @brief True if a new sentence starts at pos, allowing one opening quote or bracket.
    auto startsSentence(std::string_view text, std::size_t pos) noexcept -> bool
    {
        if (pos >= text.size())
            return false;
        auto const ch = text[pos];
        if (ch == '"' || ch == '\'' || ch == '(' || ch == '[')
            return startsWithCapital(text, pos + 1);
        return startsWithCapital(text, pos);
    }

    /// @brief Returns the byte offset reached after advancing count code points from begin.
    auto advanceCodePoints(std::string_view text, std::size_t begin, std::size_t count) noexcept
        -> std::size_t
    {
        auto pos = begin;
        while (pos < text.size() && count > 0)
        {
            ++pos;
            while (pos < text.size() && isContinuationByte(text[pos]))
                ++pos;
            --count;
        }
        return pos;
    }

    /// @brief True if the word starting at pos is a coordinating conjunction.
    auto isConjunctionAt(std::string_view text, std::size_t pos) noexcept -> bool
    {
        auto wordEnd = pos;
        while (wordEnd < text.size() && text[wordEnd] != ' ')
            ++wordEnd;
        auto const word = text.substr(pos, wordEnd - pos);

        return std::ranges::any_of(CoordinatingConjunctions, [word](std::string_view conjunction) {
            return std::ranges::equal(word, conjunction, [](char a, char b) {
                return (a >= 'A' && a <= 'Z' ? static_cast<char>(a - 'A' + 'a') : a) == b;
            });
        });
    }

} // namespace

auto defaultProtectedPatterns() -> std::vector<std::string>
{
    return {
        // Titles
        "Dr.", "Mr.", "Mrs.", "Ms.", "Prof.", "Sr.", "Jr.", "St.", "Dra.", "Sra.",
        // Degrees
        "Ph.D.", "M.D.", "B.A.", "M.A.", "B.S.", "M.S.",
        // Places
        "U.S.A.", "U.S.", "U.K.", "EE.UU.",
        // Latin and list markers
        "e.g.", "i.e.", "etc.", "vs.", "p.ej.",
        // Time markers
        "A.M.", "P.M.", "a.m.", "p.m.",
    };
}

auto validate(const SegmenterConfig& config) -> VoidResult
{
    if (config.minSize < 1)
        return makeError(ErrorCode::InvalidArgument, "Segmenter minSize must be at least 1");
    if (config.maxSize < config.minSize)
        return makeError(
            ErrorCode::InvalidArgument,
            std::format("Segmenter maxSize ({}) must not be below minSize ({})", config.maxSize, config.minSize));
    for (const auto& pattern: config.protectedPatterns)
    {
        if (pattern.empty())
            return makeError(ErrorCode::InvalidArgument, "Protected patterns must not be empty");
    }
    return {};
}

auto normalizeWhitespace(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto pendingSpace = false;
    for (auto const ch: text)
    {
        if (isSpace(ch))
        {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace)
        {
            result += ' ';
            pendingSpace = false;
        }
        result += ch;
    }
    return result;
}

auto codePointCount(std::string_view text) noexcept -> std::size_t
{
    return static_cast<std::size_t>(
        std::ranges::count_if(text, [](char ch) { return !isContinuationByte(ch); }));
}

auto joinChunks(const std::vector<TextChunk>& chunks) -> std::string
{
    auto result = std::string {};
    for (const auto& chunk: chunks)
    {
        if (!result.empty())
            result += ' ';
        result += chunk.text;
    }
    return result;
}

Segmenter::Segmenter(SegmenterConfig config): _config(std::move(config))
{
}

auto Segmenter::isProtected(std::string_view text, std::size_t runBegin, std::size_t runEnd) const -> bool
{
    for (auto pos = runBegin; pos < runEnd; ++pos)
    {
        for (const auto& pattern: _config.protectedPatterns)
        {
            auto const first = pos + 1 >= pattern.size() ? pos + 1 - pattern.size() : 0;
            for (auto start = first; start <= pos; ++start)
            {
                if (text.compare(start, pattern.size(), pattern) != 0)
                    continue;
                // Only match whole tokens: "Dr." must not match the tail of "Sandr."
                if (isAsciiAlnum(pattern.front()) && start > 0 && isAsciiAlnum(text[start - 1]))
                    continue;
                return true;
            }
        }
    }
    return false;
}

auto Segmenter::sentenceEnds(std::string_view normalized) const -> std::vector<std::size_t>
{
    auto ends = std::vector<std::size_t> {};
    auto const n = normalized.size();

    auto i = std::size_t { 0 };
    while (i < n)
    {
        if (!isTerminator(normalized[i]))
        {
            ++i;
            continue;
        }

        auto const runBegin = i;
        auto runEnd = i;
        while (runEnd < n && isTerminator(normalized[runEnd]))
            ++runEnd;
        auto boundary = runEnd;
        while (boundary < n && isClosing(normalized[boundary]))
            ++boundary;

        if (boundary < n && normalized[boundary] == ' ' && startsSentence(normalized, boundary + 1)
            && !isProtected(normalized, runBegin, runEnd))
        {
            ends.push_back(boundary);
        }
        i = boundary;
    }

    if (n > 0)
        ends.push_back(n);
    return ends;
}

auto Segmenter::forcedSplitPoint(std::string_view text, std::size_t begin, std::size_t end) const
    -> std::size_t
{
    auto const minEnd = advanceCodePoints(text, begin, _config.minSize);
    auto const maxEnd = advanceCodePoints(text, begin, _config.maxSize);

    // Clause level: ", <conjunction> " with the comma closing a piece inside the size band.
    for (auto pos = std::min(maxEnd, end - 1); pos >= minEnd && pos > begin; --pos)
    {
        if (text[pos] == ' ' && text[pos - 1] == ',' && isConjunctionAt(text, pos + 1))
            return pos;
    }

    log::debug("Segmenter: no clause boundary in [{}, {}), falling back to word split", begin, end);

    // Any word boundary inside the size band.
    for (auto pos = std::min(maxEnd, end - 1); pos >= minEnd && pos > begin; --pos)
    {
        if (text[pos] == ' ')
            return pos;
    }

    // A single word spans the band: close before it, or after it if it starts the piece.
    for (auto pos = std::min(minEnd, end - 1); pos > begin; --pos)
    {
        if (text[pos] == ' ')
            return pos;
    }
    auto const after = text.find(' ', maxEnd);
    if (after != std::string_view::npos && after < end)
        return after;

    log::warning("Segmenter: word of {} bytes exceeds maxSize {}, emitted oversize",
                 end - begin,
                 _config.maxSize);
    return end;
}

auto Segmenter::segment(std::string_view text, std::uint64_t firstIndex) const -> std::vector<TextChunk>
{
    auto const normalized = normalizeWhitespace(text);
    auto const view = std::string_view(normalized);

    auto chunks = std::vector<TextChunk> {};
    if (normalized.empty())
        return chunks;

    auto nextIndex = firstIndex;
    auto emit = [&](std::size_t begin, std::size_t end) {
        auto piece = std::string(view.substr(begin, end - begin));
        auto const count = codePointCount(piece);
        chunks.push_back(TextChunk { .index = nextIndex++, .text = std::move(piece), .charCount = count });
    };
    auto length = [view](std::size_t begin, std::size_t end) {
        return codePointCount(view.substr(begin, end - begin));
    };

    constexpr auto None = std::string_view::npos;
    auto start = std::size_t { 0 };
    auto lastFit = None;

    for (auto const sentenceEnd: sentenceEnds(view))
    {
        while (start < sentenceEnd)
        {
            if (length(start, sentenceEnd) <= _config.maxSize)
            {
                lastFit = sentenceEnd;
                break;
            }

            if (lastFit != None && length(start, lastFit) >= _config.minSize)
            {
                emit(start, lastFit);
                start = lastFit + 1;
                lastFit = None;
                continue;
            }

            auto const split = forcedSplitPoint(view, start, sentenceEnd);
            emit(start, split);
            start = split + 1;
            lastFit = None;
        }
    }

    if (start < view.size())
        emit(start, view.size());

    return chunks;
}

} // namespace speakstream
