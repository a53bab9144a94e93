// SPDX-License-Identifier: Apache-2.0
#include <pipeline/PlaybackBuffer.hpp>

#include "Fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>

using namespace speakstream;
using namespace speakstream::test;

namespace
{
auto artifact(std::uint64_t index) -> AudioArtifact
{
    return AudioArtifact::ready(index, AudioClip { .samples = std::vector<float>(80, 0.25f), .sampleRate = 8000, .channels = 1 });
}
} // namespace

TEST_CASE("PlaybackBufferConfig validation", "[playback-buffer]")
{
    CHECK(validate(PlaybackBufferConfig {}).has_value());
    CHECK(validate(PlaybackBufferConfig { .capacity = 1, .lowWatermark = 1, .highWatermark = 1 }).has_value());
    CHECK(!validate(PlaybackBufferConfig { .capacity = 5, .lowWatermark = 0, .highWatermark = 5 }).has_value());
    CHECK(!validate(PlaybackBufferConfig { .capacity = 5, .lowWatermark = 4, .highWatermark = 3 }).has_value());

    auto const tooHigh = validate(PlaybackBufferConfig { .capacity = 3, .lowWatermark = 2, .highWatermark = 4 });
    REQUIRE(!tooHigh.has_value());
    CHECK(tooHigh.error().code == ErrorCode::ConfigError);
}

TEST_CASE("PlaybackBuffer is FIFO", "[playback-buffer]")
{
    auto buffer = PlaybackBuffer();
    CHECK(buffer.enqueue(artifact(0), {}));
    CHECK(buffer.enqueue(artifact(1), {}));
    CHECK(buffer.size() == 2);

    CHECK(buffer.dequeue({})->index == 0);
    CHECK(buffer.tryDequeue()->index == 1);
    CHECK(!buffer.tryDequeue().has_value());
}

TEST_CASE("PlaybackBuffer limits reservations to the high watermark", "[playback-buffer]")
{
    auto buffer = PlaybackBuffer(PlaybackBufferConfig { .capacity = 4, .lowWatermark = 1, .highWatermark = 2 });
    CHECK(buffer.reserve({}));
    CHECK(buffer.reserve({}));
    CHECK(buffer.reserved() == 2);

    auto third = std::atomic<bool> { false };
    auto worker = std::jthread([&] { third = buffer.reserve({}); });
    std::this_thread::sleep_for(50ms);
    CHECK(!third.load());

    SECTION("a returned reservation unblocks")
    {
        buffer.releaseReservation();
        CHECK(waitUntil([&] { return third.load(); }));
        CHECK(buffer.reserved() == 2);
    }

    SECTION("a dequeued artifact returns its reservation")
    {
        CHECK(buffer.enqueue(artifact(0), {}));
        CHECK(buffer.dequeue({}).has_value());
        CHECK(waitUntil([&] { return third.load(); }));
    }

    SECTION("close releases blocked reservers without granting")
    {
        buffer.close();
        worker.join();
        CHECK(!third.load());
        CHECK(!buffer.reserve({}));
    }
}

TEST_CASE("PlaybackBuffer enqueue blocks at capacity", "[playback-buffer]")
{
    auto buffer = PlaybackBuffer(PlaybackBufferConfig { .capacity = 1, .lowWatermark = 1, .highWatermark = 1 });
    CHECK(buffer.enqueue(artifact(0), {}));

    auto stop = std::stop_source {};
    auto outcome = std::atomic<int> { -1 };
    auto producer = std::jthread([&] { outcome = buffer.enqueue(artifact(1), stop.get_token()) ? 1 : 0; });
    std::this_thread::sleep_for(30ms);
    CHECK(outcome.load() == -1);

    stop.request_stop();
    REQUIRE(waitUntil([&] { return outcome.load() != -1; }));
    CHECK(outcome.load() == 0);
    CHECK(buffer.size() == 1);
}

TEST_CASE("PlaybackBuffer waitForLevel", "[playback-buffer]")
{
    auto buffer = PlaybackBuffer(PlaybackBufferConfig { .capacity = 5, .lowWatermark = 2, .highWatermark = 5 });
    auto reached = std::atomic<bool> { false };
    auto waiter = std::jthread([&] { reached = buffer.waitForLevel(2, {}); });

    CHECK(buffer.enqueue(artifact(0), {}));
    std::this_thread::sleep_for(30ms);
    CHECK(!reached.load());

    CHECK(buffer.enqueue(artifact(1), {}));
    CHECK(waitUntil([&] { return reached.load(); }));
}

TEST_CASE("PlaybackBuffer waitForLevel returns when closed below the level", "[playback-buffer]")
{
    auto buffer = PlaybackBuffer();
    CHECK(buffer.enqueue(artifact(0), {}));
    buffer.close();
    CHECK(buffer.waitForLevel(3, {}));
    CHECK(!buffer.isDrained());
    CHECK(buffer.tryDequeue().has_value());
    CHECK(buffer.isDrained());
    CHECK(!buffer.dequeue({}).has_value());
}

TEST_CASE("PlaybackBuffer clear discards artifacts and their reservations", "[playback-buffer]")
{
    auto buffer = PlaybackBuffer();
    CHECK(buffer.reserve({}));
    CHECK(buffer.reserve({}));
    CHECK(buffer.reserve({}));
    CHECK(buffer.enqueue(artifact(0), {}));
    CHECK(buffer.enqueue(artifact(1), {}));

    CHECK(buffer.clear() == 2);
    CHECK(buffer.size() == 0);
    CHECK(buffer.reserved() == 1);
}
