// SPDX-License-Identifier: Apache-2.0
#include <pipeline/Session.hpp>
#include <pipeline/StreamingPipeline.hpp>
#include <source/StringTextSource.hpp>

#include "Fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <thread>

using namespace speakstream;
using namespace speakstream::test;

namespace
{
auto pipelineConfig(std::size_t workers = 3, std::chrono::milliseconds timeout = 2000ms) -> PipelineConfig
{
    auto config = PipelineConfig {};
    config.segmenter = SegmenterConfig { .minSize = 10, .maxSize = 30, .protectedPatterns = defaultProtectedPatterns() };
    config.synthesis = WorkerPoolConfig { .workers = workers, .timeout = timeout, .retries = 0, .options = {} };
    config.playback = PlaybackBufferConfig { .capacity = 8, .lowWatermark = 1, .highWatermark = 6 };
    config.publishInterval = 20ms;
    return config;
}

struct PipelineFixture
{
    std::shared_ptr<FakeSynthesizer> synthesizer;
    RecordingDevice device;
    RecordingSink sink;
    StreamingPipeline pipeline;

    explicit PipelineFixture(PipelineConfig config = pipelineConfig(), std::size_t framesPerClip = 400):
        synthesizer(std::make_shared<FakeSynthesizer>(framesPerClip)), pipeline(std::move(config), synthesizer, device, &sink)
    {
    }

    void startWith(std::string text)
    {
        REQUIRE(pipeline.start(std::make_unique<StringTextSource>(std::move(text), 16)).has_value());
    }

    auto failureCode() const -> std::optional<ErrorCode>
    {
        auto const* session = pipeline.session();
        if (!session || !session->failureReason())
            return std::nullopt;
        return session->failureReason()->code;
    }
};
} // namespace

TEST_CASE("StreamingPipeline reads a document to completion", "[pipeline]")
{
    auto fixture = PipelineFixture();
    auto const sentences = numberedSentences(5);
    fixture.startWith(joinSentences(sentences));

    CHECK(fixture.pipeline.wait() == PlaybackState::Completed);
    CHECK(fixture.device.rendered() == expectedAudio(*fixture.synthesizer, sentences));

    auto const snapshot = fixture.pipeline.snapshot();
    CHECK(snapshot.chunksFetched == 5);
    CHECK(snapshot.chunksSynthesized == 5);
    CHECK(snapshot.chunksPlayed == 5);
    CHECK(snapshot.chunksFailed == 0);
    CHECK(snapshot.totalChunksEstimate == 5u);
    CHECK(snapshot.estimatedRemaining == 0ms);

    CHECK(fixture.sink.sawState(PlaybackState::Fetching));
    CHECK(fixture.sink.sawState(PlaybackState::Playing));
    CHECK(fixture.sink.sawState(PlaybackState::Completed));
    CHECK(!fixture.sink.snapshots().empty());
    CHECK(!fixture.pipeline.fetchError().has_value());
}

TEST_CASE("StreamingPipeline skips a chunk whose synthesis times out", "[pipeline]")
{
    auto fixture = PipelineFixture(pipelineConfig(3, 200ms));
    fixture.synthesizer->script("Delta 3", SynthesisBehavior { .delay = {}, .fail = false, .hang = true });
    auto const sentences = numberedSentences(5);
    fixture.startWith(joinSentences(sentences));

    CHECK(fixture.pipeline.wait() == PlaybackState::Completed);
    CHECK(fixture.sink.failures() == std::vector<std::pair<std::uint64_t, ErrorCode>> { { 3, ErrorCode::TimeoutError } });

    auto played = sentences;
    played.erase(played.begin() + 3);
    CHECK(fixture.device.rendered() == expectedAudio(*fixture.synthesizer, played));
    CHECK(fixture.pipeline.snapshot().chunksPlayed == 4);
    CHECK(fixture.pipeline.snapshot().chunksFailed == 1);
}

TEST_CASE("StreamingPipeline pause and resume keep the audio intact", "[pipeline]")
{
    auto fixture = PipelineFixture(pipelineConfig(), 1200);
    auto const sentences = numberedSentences(4);
    fixture.startWith(joinSentences(sentences));

    REQUIRE(waitUntil([&] { return fixture.device.renderedCount() > 0; }));
    fixture.pipeline.pause();
    CHECK(fixture.pipeline.state() == PlaybackState::Paused);

    auto const heldAt = fixture.device.renderedCount();
    std::this_thread::sleep_for(80ms);
    CHECK(fixture.device.renderedCount() == heldAt);
    CHECK(!fixture.pipeline.waitFor(0ms).has_value());

    fixture.pipeline.resume();
    CHECK(fixture.pipeline.wait() == PlaybackState::Completed);
    CHECK(fixture.device.rendered() == expectedAudio(*fixture.synthesizer, sentences));
    CHECK(fixture.sink.sawState(PlaybackState::Paused));
}

TEST_CASE("StreamingPipeline fails when the only chunk cannot be synthesized", "[pipeline]")
{
    auto fixture = PipelineFixture();
    fixture.synthesizer->script("Alpha 0", SynthesisBehavior { .delay = {}, .fail = true, .hang = false });
    fixture.startWith("Alpha 0 is spoken now.");

    CHECK(fixture.pipeline.wait() == PlaybackState::Failed);
    CHECK(fixture.failureCode() == ErrorCode::SynthesisError);
    CHECK(fixture.sink.failures() == std::vector<std::pair<std::uint64_t, ErrorCode>> { { 0, ErrorCode::SynthesisError } });
    CHECK(fixture.device.playCalls() == 0);
}

TEST_CASE("StreamingPipeline fails on a source without text", "[pipeline]")
{
    auto fixture = PipelineFixture();
    fixture.startWith("  \n\n ");

    CHECK(fixture.pipeline.wait() == PlaybackState::Failed);
    CHECK(fixture.failureCode() == ErrorCode::FetchError);
    CHECK(fixture.synthesizer->callCount() == 0);
}

TEST_CASE("StreamingPipeline completes with what was read before a fetch error", "[pipeline]")
{
    auto fixture = PipelineFixture();
    REQUIRE(fixture.pipeline
                .start(std::make_unique<ScriptedTextSource>(
                    std::vector<std::string> { "Alpha 0 is spoken now. ", "Bravo 1 is spoken now." }, true))
                .has_value());

    CHECK(fixture.pipeline.wait() == PlaybackState::Completed);
    CHECK(fixture.pipeline.snapshot().chunksPlayed == 2);

    REQUIRE(fixture.pipeline.fetchError().has_value());
    CHECK(fixture.pipeline.fetchError()->code == ErrorCode::FetchError);
    CHECK(fixture.sink.notices() == std::vector<std::string> { "Playback ended early: Connection reset" });
}

TEST_CASE("StreamingPipeline stop ends the session", "[pipeline]")
{
    auto fixture = PipelineFixture(pipelineConfig(), 4000);
    fixture.startWith(joinSentences(numberedSentences(5)));
    REQUIRE(waitUntil([&] { return fixture.device.renderedCount() > 0; }));

    SECTION("stop")
    {
        fixture.pipeline.stop();
    }

    SECTION("cancel")
    {
        fixture.pipeline.cancel();
    }

    SECTION("stop while paused")
    {
        fixture.pipeline.pause();
        fixture.pipeline.stop();
    }

    CHECK(fixture.pipeline.wait() == PlaybackState::Stopped);
    CHECK(fixture.pipeline.snapshot().estimatedRemaining == 0ms);
    CHECK(fixture.device.completedClips() == 0);
    CHECK(!fixture.failureCode().has_value());
}

TEST_CASE("StreamingPipeline wait returns after abandoned synthesis has cleaned up", "[pipeline]")
{
    auto fixture = PipelineFixture(pipelineConfig(), 4000);
    fixture.synthesizer->script("Charlie 2",
                                SynthesisBehavior { .delay = {}, .fail = false, .hang = true, .cleanup = 250ms });
    fixture.startWith(joinSentences(numberedSentences(3)));
    REQUIRE(waitUntil([&] { return fixture.synthesizer->callCount() == 3 && fixture.device.renderedCount() > 0; }));

    fixture.pipeline.stop();

    CHECK(fixture.pipeline.wait() == PlaybackState::Stopped);
    CHECK(fixture.synthesizer->abandonedCalls() == 1);
}

TEST_CASE("StreamingPipeline skip moves to the next chunk", "[pipeline]")
{
    auto fixture = PipelineFixture(pipelineConfig(), 4000);
    fixture.startWith(joinSentences(numberedSentences(3)));
    REQUIRE(waitUntil([&] { return fixture.device.renderedCount() > 0; }));

    fixture.pipeline.skip();

    CHECK(fixture.pipeline.wait() == PlaybackState::Completed);
    CHECK(fixture.device.interruptedClips() == 1);
    CHECK(fixture.device.completedClips() == 2);
    CHECK(fixture.pipeline.snapshot().chunksPlayed == 3);
}

TEST_CASE("StreamingPipeline holds synthesis back while paused", "[pipeline]")
{
    auto config = pipelineConfig(2);
    config.playback = PlaybackBufferConfig { .capacity = 4, .lowWatermark = 1, .highWatermark = 3 };
    auto fixture = PipelineFixture(config);
    fixture.startWith(joinSentences(numberedSentences(10)));
    fixture.pipeline.pause();

    std::this_thread::sleep_for(150ms);
    auto const calls = fixture.synthesizer->callCount();
    // At most the high watermark is buffered, plus one clip held on the device.
    CHECK(calls <= 4);
    std::this_thread::sleep_for(100ms);
    CHECK(fixture.synthesizer->callCount() == calls);

    fixture.pipeline.stop();
    CHECK(fixture.pipeline.wait() == PlaybackState::Stopped);
}

TEST_CASE("StreamingPipeline start preconditions", "[pipeline]")
{
    SECTION("started twice")
    {
        auto fixture = PipelineFixture();
        fixture.startWith("Alpha 0 is spoken now.");
        auto const again = fixture.pipeline.start(std::make_unique<StringTextSource>("More text."));
        REQUIRE(!again.has_value());
        CHECK(again.error().code == ErrorCode::InvalidArgument);
        CHECK(fixture.pipeline.wait() == PlaybackState::Completed);
    }

    SECTION("no source")
    {
        auto fixture = PipelineFixture();
        auto const result = fixture.pipeline.start(nullptr);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
        CHECK(fixture.pipeline.state() == PlaybackState::Idle);
        CHECK(fixture.pipeline.session() == nullptr);
    }

    SECTION("invalid configuration")
    {
        auto fixture = PipelineFixture(pipelineConfig(0));
        auto const result = fixture.pipeline.start(std::make_unique<StringTextSource>("Text."));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}
