// SPDX-License-Identifier: Apache-2.0
#include <text/Segmenter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <random>
#include <string>
#include <vector>

using namespace speakstream;

namespace
{
auto bandConfig(std::size_t minSize, std::size_t maxSize) -> SegmenterConfig
{
    auto config = SegmenterConfig {};
    config.minSize = minSize;
    config.maxSize = maxSize;
    return config;
}

auto texts(const std::vector<TextChunk>& chunks) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    for (const auto& chunk: chunks)
        result.push_back(chunk.text);
    return result;
}
} // namespace

TEST_CASE("normalizeWhitespace collapses runs and trims", "[segmenter]")
{
    CHECK(normalizeWhitespace("  a \n\t b  ") == "a b");
    CHECK(normalizeWhitespace("\n\n") == "");
    CHECK(normalizeWhitespace("one") == "one");
}

TEST_CASE("codePointCount counts UTF-8 characters", "[segmenter]")
{
    CHECK(codePointCount("abc") == 3);
    CHECK(codePointCount("Ñandú") == 5);
    CHECK(codePointCount("") == 0);
}

TEST_CASE("Segmenter config validation", "[segmenter]")
{
    CHECK(validate(bandConfig(40, 300)).has_value());
    CHECK(validate(bandConfig(5, 5)).has_value());

    auto const zeroMin = validate(bandConfig(0, 10));
    REQUIRE(!zeroMin.has_value());
    CHECK(zeroMin.error().code == ErrorCode::InvalidArgument);

    auto const inverted = validate(bandConfig(50, 10));
    REQUIRE(!inverted.has_value());
    CHECK(inverted.error().code == ErrorCode::InvalidArgument);

    auto config = bandConfig(1, 10);
    config.protectedPatterns.push_back("");
    CHECK(!validate(config).has_value());
}

TEST_CASE("Segmenter returns no chunks for blank input", "[segmenter]")
{
    auto const segmenter = Segmenter(SegmenterConfig {});
    CHECK(segmenter.segment("").empty());
    CHECK(segmenter.segment(" \n\t  ").empty());
}

TEST_CASE("Segmenter recognizes sentence boundaries", "[segmenter]")
{
    auto const segmenter = Segmenter(SegmenterConfig {});

    SECTION("period followed by a capital")
    {
        CHECK(segmenter.sentenceEnds("It rained. We stayed.") == std::vector<std::size_t> { 10, 21 });
    }

    SECTION("lowercase continuation is not a boundary")
    {
        CHECK(segmenter.sentenceEnds("It rained. and we stayed.") == std::vector<std::size_t> { 25 });
    }

    SECTION("decimal point is not a boundary")
    {
        CHECK(segmenter.sentenceEnds("Pi is 3.14 today.") == std::vector<std::size_t> { 17 });
    }

    SECTION("terminator runs and closing quotes stay with the sentence")
    {
        CHECK(segmenter.sentenceEnds("Really?! Yes.") == std::vector<std::size_t> { 8, 13 });
        CHECK(segmenter.sentenceEnds("He said \"Stop.\" Then left.") == std::vector<std::size_t> { 15, 26 });
    }

    SECTION("Spanish opening question mark starts a sentence")
    {
        auto const text = std::string("Hola. ¿Cómo estás?");
        CHECK(segmenter.sentenceEnds(text) == std::vector<std::size_t> { 5, text.size() });
    }
}

TEST_CASE("Segmenter never splits inside protected tokens", "[segmenter]")
{
    auto const segmenter = Segmenter(SegmenterConfig {});

    SECTION("titles")
    {
        CHECK(segmenter.sentenceEnds("Dr. Smith arrived. He sat.") == std::vector<std::size_t> { 18, 26 });
        CHECK(segmenter.sentenceEnds("Mrs. Jones and Prof. Lee met.") == std::vector<std::size_t> { 29 });
    }

    SECTION("time markers, even at the end of a sentence")
    {
        auto const text = std::string("We met at 5 p.m. Then we left.");
        CHECK(segmenter.sentenceEnds(text) == std::vector<std::size_t> { text.size() });
    }

    SECTION("multi-period abbreviations")
    {
        auto const text = std::string("She moved to the U.S. After that she wrote.");
        CHECK(segmenter.sentenceEnds(text) == std::vector<std::size_t> { text.size() });
    }

    SECTION("pattern must start a word")
    {
        CHECK(segmenter.sentenceEnds("Ask XDr. Now go.") == std::vector<std::size_t> { 8, 16 });
    }

    SECTION("custom table replaces the default")
    {
        auto config = SegmenterConfig {};
        config.protectedPatterns = { "approx." };
        auto const custom = Segmenter(config);
        CHECK(custom.sentenceEnds("It weighs approx. Ten kilos.") == std::vector<std::size_t> { 28 });
        CHECK(custom.sentenceEnds("Dr. Smith arrived.") == std::vector<std::size_t> { 3, 18 });
    }
}

TEST_CASE("Segmenter keeps abbreviations and time markers intact", "[segmenter]")
{
    SECTION("titles and country abbreviations")
    {
        auto const segmenter = Segmenter(bandConfig(20, 40));
        auto const chunks = segmenter.segment("The U.S. economy grew. Dr. Lee explained why. It was a surprise.");
        CHECK(texts(chunks)
              == std::vector<std::string> { "The U.S. economy grew.", "Dr. Lee explained why.", "It was a surprise." });
    }

    SECTION("a time marker followed by more words")
    {
        auto const text = std::string("Dr. Smith arrived at 3:30 P.M. yesterday.");
        CHECK(Segmenter(SegmenterConfig {}).sentenceEnds(text) == std::vector<std::size_t> { text.size() });

        for (auto const [minSize, maxSize]: std::array<std::pair<std::size_t, std::size_t>, 3> {
                 { { 1, 300 }, { 10, 30 }, { 5, 12 } } })
        {
            auto const chunks = Segmenter(bandConfig(minSize, maxSize)).segment(text);
            CHECK(joinChunks(chunks) == text);
            for (const auto& chunk: chunks)
            {
                CHECK(!chunk.text.ends_with(" P."));
                CHECK(!chunk.text.starts_with("M."));
            }
        }
    }
}

TEST_CASE("Segmenter packs sentences greedily up to maxSize", "[segmenter]")
{
    auto const segmenter = Segmenter(bandConfig(10, 60));
    auto const chunks = segmenter.segment(
        "Alpha 0 is spoken now. Bravo 1 is spoken now. Charlie 2 is spoken now. Delta 3 is spoken now.");

    CHECK(texts(chunks)
          == std::vector<std::string> { "Alpha 0 is spoken now. Bravo 1 is spoken now.",
                                        "Charlie 2 is spoken now. Delta 3 is spoken now." });
    CHECK(chunks[0].index == 0);
    CHECK(chunks[1].index == 1);
    CHECK(chunks[0].charCount == 45);
}

TEST_CASE("Segmenter merges short sentences to reach minSize", "[segmenter]")
{
    auto const segmenter = Segmenter(bandConfig(10, 30));
    auto const chunks = segmenter.segment("Hi. Alpha 0 is spoken now. Bravo 1 is spoken now.");

    CHECK(texts(chunks) == std::vector<std::string> { "Hi. Alpha 0 is spoken now.", "Bravo 1 is spoken now." });
}

TEST_CASE("Segmenter force-splits long sentences", "[segmenter]")
{
    auto const segmenter = Segmenter(bandConfig(10, 30));

    SECTION("prefers a comma before a conjunction, then a word boundary")
    {
        auto const chunks = segmenter.segment("The quick brown fox jumps, and the lazy dog sleeps all day long");
        CHECK(texts(chunks)
              == std::vector<std::string> { "The quick brown fox jumps,", "and the lazy dog sleeps all", "day long" });
    }

    SECTION("a word longer than maxSize is emitted whole")
    {
        auto const narrow = Segmenter(bandConfig(1, 5));
        CHECK(texts(narrow.segment("abcdefghij klm")) == std::vector<std::string> { "abcdefghij", "klm" });
    }
}

TEST_CASE("Segmenter chunks respect the size band", "[segmenter]")
{
    auto const config = bandConfig(20, 50);
    auto const segmenter = Segmenter(config);
    auto const text = std::string(
        "Streaming speech should start quickly. The reader keeps going while the rest of the "
        "document arrives, and nobody waits for the whole page. Short one. Dr. Adams agreed at "
        "9 a.m. with the plan, but Mr. Brown did not. Why? Because nobody asked him first!");

    auto const chunks = segmenter.segment(text);
    REQUIRE(chunks.size() > 2);
    for (auto i = std::size_t { 0 }; i < chunks.size(); ++i)
    {
        CHECK(chunks[i].charCount <= config.maxSize);
        if (i + 1 < chunks.size())
            CHECK(chunks[i].charCount >= config.minSize);
        CHECK(chunks[i].charCount == codePointCount(chunks[i].text));
    }
}

TEST_CASE("Segmenter output reconstructs the normalized input", "[segmenter]")
{
    auto const segmenter = Segmenter(bandConfig(15, 40));
    auto const inputs = std::vector<std::string> {
        "One.",
        "  Leading and trailing   spaces.  Two   sentences here.  ",
        "Line one.\nLine two.\n\nParagraph three, and a long tail that will need a forced split somewhere.",
        "Ñandú corre rápido. ¿Lo viste? ¡Sí, y también el zorro!",
        "Supercalifragilisticexpialidocious-is-one-very-long-token indeed.",
    };

    for (const auto& input: inputs)
    {
        auto const chunks = segmenter.segment(input);
        CHECK(joinChunks(chunks) == normalizeWhitespace(input));
        for (const auto& chunk: chunks)
        {
            CHECK(!chunk.text.empty());
            CHECK(chunk.text.front() != ' ');
            CHECK(chunk.text.back() != ' ');
        }
    }
}

TEST_CASE("Segmenter numbering and determinism", "[segmenter]")
{
    auto const segmenter = Segmenter(bandConfig(10, 30));
    auto const text = std::string("Alpha 0 is spoken now. Bravo 1 is spoken now.");

    auto const first = segmenter.segment(text, 7);
    REQUIRE(first.size() == 2);
    CHECK(first[0].index == 7);
    CHECK(first[1].index == 8);

    auto const second = segmenter.segment(text, 7);
    CHECK(texts(first) == texts(second));
}

TEST_CASE("Segmenter counts code points, not bytes", "[segmenter]")
{
    auto const segmenter = Segmenter(bandConfig(1, 300));
    auto const chunks = segmenter.segment("Ñandú está aquí.");
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].charCount == 16);
}

TEST_CASE("Segmenter holds its invariants on generated text", "[segmenter]")
{
    static constexpr auto Words = std::array<std::string_view, 16> {
        "the", "economy", "Dr.", "U.S.", "grew", "Ñandú", "reader", "3:30",
        "P.M.", "and", "but", "quickly", "Lee", "e.g.", "was", "¿Sí?",
    };
    static constexpr auto Endings = std::array<std::string_view, 6> { "", "", ".", ",", "!", "?" };
    static constexpr auto Separators = std::array<std::string_view, 4> { " ", "  ", "\n", "\t " };

    // The longest generated word ("economy," or "quickly!") has 8 code points.
    constexpr auto LongestWord = std::size_t { 8 };

    auto random = std::mt19937 { 20240611 };
    auto pick = [&random](auto const& items) {
        return items[std::uniform_int_distribution<std::size_t>(0, items.size() - 1)(random)];
    };

    for (auto round = 0; round < 2000; ++round)
    {
        auto const minSize = std::uniform_int_distribution<std::size_t>(1, 30)(random);
        auto const maxSize = minSize + LongestWord + std::uniform_int_distribution<std::size_t>(1, 40)(random);
        auto const segmenter = Segmenter(bandConfig(minSize, maxSize));

        auto input = std::string {};
        auto const wordCount = std::uniform_int_distribution<int>(0, 60)(random);
        for (auto i = 0; i < wordCount; ++i)
        {
            input += pick(Separators);
            input += pick(Words);
            input += pick(Endings);
        }

        auto const chunks = segmenter.segment(input);
        REQUIRE(joinChunks(chunks) == normalizeWhitespace(input));
        for (auto i = std::size_t { 0 }; i < chunks.size(); ++i)
        {
            REQUIRE(!chunks[i].text.empty());
            REQUIRE(chunks[i].charCount == codePointCount(chunks[i].text));
            REQUIRE(chunks[i].charCount <= maxSize);
            if (i + 1 < chunks.size())
                REQUIRE(chunks[i].charCount >= minSize);
        }
    }
}
