// SPDX-License-Identifier: Apache-2.0
#include "ProgressSinks.hpp"

#include <core/Log.hpp>
#include <core/Process.hpp>

#include <format>
#include <map>
#include <stop_token>

namespace speakstream
{

namespace
{
    constexpr auto NotificationTitle = "speakstream";
    constexpr auto NotifyTimeout = std::chrono::seconds { 2 };
} // namespace

auto formatDuration(std::chrono::milliseconds duration) -> std::string
{
    auto const totalSeconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    auto const hours = totalSeconds / 3600;
    auto const minutes = (totalSeconds % 3600) / 60;
    auto const seconds = totalSeconds % 60;
    if (hours > 0)
        return std::format("{}:{:02}:{:02}", hours, minutes, seconds);
    return std::format("{}:{:02}", minutes, seconds);
}

auto formatProgress(const ProgressSnapshot& snapshot) -> std::string
{
    auto const total =
        snapshot.totalChunksEstimate ? std::format("{}", *snapshot.totalChunksEstimate) : std::string("?");
    auto line = std::format("[{}/{}] {}, {} buffered",
                            snapshot.chunksPlayed,
                            total,
                            toString(snapshot.state),
                            snapshot.bufferedCount);
    if (snapshot.chunksFailed > 0)
        line += std::format(", {} failed", snapshot.chunksFailed);
    if (!isTerminal(snapshot.state) && snapshot.estimatedRemaining.count() > 0)
        line += std::format(", ~{} left", formatDuration(snapshot.estimatedRemaining));
    return line;
}

void ConsoleProgressSink::onProgress(const ProgressSnapshot& snapshot)
{
    log::info("{}", formatProgress(snapshot));
}

void ConsoleProgressSink::onChunkFailed(std::uint64_t index, const Error& reason)
{
    log::warning("Chunk {} skipped ({}): {}", index, describe(reason.code), reason.message);
}

void ConsoleProgressSink::onStateChanged(PlaybackState state)
{
    log::info("State: {}", toString(state));
}

void ConsoleProgressSink::onNotice(std::string_view message)
{
    log::warning("{}", message);
}

CommandProgressSink::CommandProgressSink(std::string command, std::vector<std::string> args):
    _command(std::move(command)), _args(std::move(args))
{
}

void CommandProgressSink::onProgress(const ProgressSnapshot& /*snapshot*/)
{
}

void CommandProgressSink::onChunkFailed(std::uint64_t index, const Error& reason)
{
    notify(std::format("Skipped part {} ({})", index + 1, describe(reason.code)));
}

void CommandProgressSink::onStateChanged(PlaybackState state)
{
    switch (state)
    {
        case PlaybackState::Playing:
            if (!_announcedPlaying)
            {
                _announcedPlaying = true;
                notify("Reading started");
            }
            break;
        case PlaybackState::Paused: notify("Paused"); break;
        case PlaybackState::Completed: notify("Finished reading"); break;
        case PlaybackState::Stopped: notify("Stopped"); break;
        case PlaybackState::Failed: notify("Reading failed"); break;
        case PlaybackState::Idle:
        case PlaybackState::Fetching:
        case PlaybackState::Buffering: break;
    }
}

void CommandProgressSink::onNotice(std::string_view message)
{
    notify(message);
}

void CommandProgressSink::notify(std::string_view body)
{
    auto const values = std::map<std::string, std::string> {
        { "title", NotificationTitle },
        { "body", std::string(body) },
    };

    auto config = ProcessConfig {
        .command = _command,
        .args = {},
        .env = {},
        .pipeStdin = false,
        .pipeStdout = false,
        .silenceStderr = true,
    };
    for (const auto& arg: _args)
        config.args.push_back(substitutePlaceholders(arg, values));

    auto process = ChildProcess {};
    if (auto result = process.spawn(config); !result)
    {
        log::debug("Notification command failed: {}", result.error());
        return;
    }

    auto status = process.waitForExit(std::stop_token {}, std::chrono::steady_clock::now() + NotifyTimeout);
    if (!status)
        log::debug("Notification command did not finish: {}", status.error());
    else if (*status != 0)
        log::debug("Notification command exited with status {}", *status);
}

void FanOutProgressSink::add(std::unique_ptr<ProgressSink> sink)
{
    if (sink)
        _sinks.push_back(std::move(sink));
}

void FanOutProgressSink::onProgress(const ProgressSnapshot& snapshot)
{
    for (auto& sink: _sinks)
        sink->onProgress(snapshot);
}

void FanOutProgressSink::onChunkFailed(std::uint64_t index, const Error& reason)
{
    for (auto& sink: _sinks)
        sink->onChunkFailed(index, reason);
}

void FanOutProgressSink::onStateChanged(PlaybackState state)
{
    for (auto& sink: _sinks)
        sink->onStateChanged(state);
}

void FanOutProgressSink::onNotice(std::string_view message)
{
    for (auto& sink: _sinks)
        sink->onNotice(message);
}

} // namespace speakstream
