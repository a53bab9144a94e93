// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace speakstream
{

/// @brief Formats a duration as "m:ss" (or "h:mm:ss").
[[nodiscard]] auto formatDuration(std::chrono::milliseconds duration) -> std::string;

/// @brief Formats a snapshot as a one-line status, e.g. "[3/12] playing, 2 buffered, ~1:05 left".
[[nodiscard]] auto formatProgress(const ProgressSnapshot& snapshot) -> std::string;

/// @brief Reports progress through the logger.
class ConsoleProgressSink: public ProgressSink
{
  public:
    void onProgress(const ProgressSnapshot& snapshot) override;
    void onChunkFailed(std::uint64_t index, const Error& reason) override;
    void onStateChanged(PlaybackState state) override;
    void onNotice(std::string_view message) override;
};

/// @brief Runs a notification command (e.g. notify-send) for state changes, failures and notices.
///
/// Arguments may contain "{title}" and "{body}". Snapshots are not forwarded.
class CommandProgressSink: public ProgressSink
{
  public:
    CommandProgressSink(std::string command, std::vector<std::string> args);

    void onProgress(const ProgressSnapshot& snapshot) override;
    void onChunkFailed(std::uint64_t index, const Error& reason) override;
    void onStateChanged(PlaybackState state) override;
    void onNotice(std::string_view message) override;

  private:
    void notify(std::string_view body);

    std::string _command;
    std::vector<std::string> _args;
    bool _announcedPlaying = false;
};

/// @brief Forwards every call to several sinks in order.
class FanOutProgressSink: public ProgressSink
{
  public:
    void add(std::unique_ptr<ProgressSink> sink);

    [[nodiscard]] auto empty() const noexcept -> bool { return _sinks.empty(); }

    void onProgress(const ProgressSnapshot& snapshot) override;
    void onChunkFailed(std::uint64_t index, const Error& reason) override;
    void onStateChanged(PlaybackState state) override;
    void onNotice(std::string_view message) override;

  private:
    std::vector<std::unique_ptr<ProgressSink>> _sinks;
};

} // namespace speakstream
