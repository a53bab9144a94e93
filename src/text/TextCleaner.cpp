// SPDX-License-Identifier: Apache-2.0
#include "TextCleaner.hpp"

#include <array>

namespace speakstream
{

namespace
{

    /// @brief Invisible sequences removed outright.
    constexpr auto DroppedSequences = std::array<std::string_view, 5> {
        "\xEF\xBB\xBF", // byte order mark
        "\xE2\x80\x8B", // zero-width space
        "\xE2\x80\x8C", // zero-width non-joiner
        "\xE2\x80\x8D", // zero-width joiner
        "\xC2\xAD",     // soft hyphen
    };

    constexpr auto isKeptWhitespace(unsigned char ch) noexcept -> bool
    {
        return ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
    }

} // namespace

auto cleanText(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto dropped = false;
        for (auto const sequence: DroppedSequences)
        {
            if (text.substr(pos).starts_with(sequence))
            {
                pos += sequence.size();
                dropped = true;
                break;
            }
        }
        if (dropped)
            continue;

        auto const ch = static_cast<unsigned char>(text[pos]);
        if ((ch < 0x20 && !isKeptWhitespace(ch)) || ch == 0x7F)
            result += ' ';
        else
            result += text[pos];
        ++pos;
    }
    return result;
}

auto incompleteUtf8Tail(std::string_view text) noexcept -> std::size_t
{
    // Walk back over at most three continuation bytes to the lead byte.
    auto continuation = std::size_t { 0 };
    auto pos = text.size();
    while (pos > 0 && continuation < 4)
    {
        auto const ch = static_cast<unsigned char>(text[pos - 1]);
        if ((ch & 0xC0) != 0x80)
        {
            auto expected = std::size_t { 1 };
            if ((ch & 0xE0) == 0xC0)
                expected = 2;
            else if ((ch & 0xF0) == 0xE0)
                expected = 3;
            else if ((ch & 0xF8) == 0xF0)
                expected = 4;
            auto const present = continuation + 1;
            return present < expected ? present : 0;
        }
        ++continuation;
        --pos;
    }
    return 0;
}

} // namespace speakstream
