// SPDX-License-Identifier: Apache-2.0
#include <pipeline/Session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

using namespace speakstream;
using namespace std::chrono_literals;

TEST_CASE("Session state machine transitions", "[session]")
{
    CHECK(isValidTransition(PlaybackState::Idle, PlaybackState::Fetching));
    CHECK(isValidTransition(PlaybackState::Fetching, PlaybackState::Buffering));
    CHECK(isValidTransition(PlaybackState::Buffering, PlaybackState::Playing));
    CHECK(isValidTransition(PlaybackState::Playing, PlaybackState::Paused));
    CHECK(isValidTransition(PlaybackState::Paused, PlaybackState::Playing));
    CHECK(isValidTransition(PlaybackState::Playing, PlaybackState::Buffering));
    CHECK(isValidTransition(PlaybackState::Playing, PlaybackState::Completed));

    CHECK(!isValidTransition(PlaybackState::Idle, PlaybackState::Playing));
    CHECK(!isValidTransition(PlaybackState::Playing, PlaybackState::Idle));
    CHECK(!isValidTransition(PlaybackState::Playing, PlaybackState::Fetching));
    CHECK(!isValidTransition(PlaybackState::Completed, PlaybackState::Playing));
    CHECK(!isValidTransition(PlaybackState::Stopped, PlaybackState::Failed));
    CHECK(!isValidTransition(PlaybackState::Failed, PlaybackState::Completed));
}

TEST_CASE("Session starts idle and records transitions", "[session]")
{
    auto session = Session("doc.txt");
    CHECK(session.sourceId() == "doc.txt");
    CHECK(session.state() == PlaybackState::Idle);

    auto observed = std::vector<PlaybackState> {};
    session.setObserver([&](PlaybackState state) { observed.push_back(state); });

    CHECK(session.transition(PlaybackState::Fetching));
    CHECK(!session.transition(PlaybackState::Fetching));
    CHECK(!session.transition(PlaybackState::Idle));
    CHECK(session.transition(PlaybackState::Buffering));
    CHECK(observed == std::vector<PlaybackState> { PlaybackState::Fetching, PlaybackState::Buffering });
}

TEST_CASE("Session transitionFrom only applies from the expected state", "[session]")
{
    auto session = Session("x");
    CHECK(session.transition(PlaybackState::Fetching));
    CHECK(!session.transitionFrom(PlaybackState::Playing, PlaybackState::Buffering));
    CHECK(session.state() == PlaybackState::Fetching);
    CHECK(session.transitionFrom(PlaybackState::Fetching, PlaybackState::Buffering));
    CHECK(session.state() == PlaybackState::Buffering);
}

TEST_CASE("Session terminal states are absorbing", "[session]")
{
    auto session = Session("x");
    CHECK(session.transition(PlaybackState::Fetching));
    CHECK(session.finish(PlaybackState::Failed, Error { .code = ErrorCode::FetchError, .message = "404" }));

    CHECK(session.state() == PlaybackState::Failed);
    REQUIRE(session.failureReason().has_value());
    CHECK(session.failureReason()->code == ErrorCode::FetchError);

    CHECK(!session.finish(PlaybackState::Completed));
    CHECK(!session.transition(PlaybackState::Playing));
    CHECK(session.state() == PlaybackState::Failed);
}

TEST_CASE("Session waitForTerminal", "[session]")
{
    auto session = Session("x");
    CHECK(session.transition(PlaybackState::Fetching));
    CHECK(!session.waitForTerminal(20ms).has_value());

    auto finisher = std::jthread([&] {
        std::this_thread::sleep_for(20ms);
        session.finish(PlaybackState::Stopped);
    });
    CHECK(session.waitForTerminal() == PlaybackState::Stopped);
    CHECK(session.waitForTerminal(0ms) == PlaybackState::Stopped);
    CHECK(!session.failureReason().has_value());
}

TEST_CASE("Session total chunk estimate", "[session]")
{
    auto session = Session("x");
    CHECK(!session.totalChunksEstimate().has_value());
    session.setTotalChunksEstimate(12);
    CHECK(session.totalChunksEstimate() == 12u);
}
