// SPDX-License-Identifier: Apache-2.0
#pragma once

// Test doubles for the external collaborators of the pipeline: a scripted synthesizer,
// a playback device that renders in real time into memory, a progress sink that records
// everything, and text sources with controllable failures.

#include <audio/PlaybackDevice.hpp>
#include <audio/Synthesizer.hpp>
#include <core/Types.hpp>
#include <source/TextSource.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace speakstream::test
{

using namespace std::chrono_literals;

/// @brief Polls predicate until it holds or timeout expires.
inline auto waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5000ms) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

/// @brief Sentences of 22 to 25 characters; with minSize 10 / maxSize 30 every sentence is one chunk.
inline auto numberedSentences(std::size_t count) -> std::vector<std::string>
{
    static constexpr auto Words =
        std::array<std::string_view, 10> { "Alpha", "Bravo", "Charlie", "Delta", "Echo",
                                           "Foxtrot", "Golf", "Hotel", "India", "Juliet" };
    auto sentences = std::vector<std::string> {};
    for (auto i = std::size_t { 0 }; i < count; ++i)
        sentences.push_back(std::format("{} {} is spoken now.", Words[i % Words.size()], i));
    return sentences;
}

inline auto joinSentences(const std::vector<std::string>& sentences) -> std::string
{
    auto text = std::string {};
    for (const auto& sentence: sentences)
    {
        if (!text.empty())
            text += ' ';
        text += sentence;
    }
    return text;
}

/// @brief Behavior of the fake synthesizer for texts containing a marker.
struct SynthesisBehavior
{
    std::chrono::milliseconds delay { 0 };
    bool fail = false;
    bool hang = false; ///< Block until the call is abandoned.
    std::chrono::milliseconds cleanup { 0 }; ///< Time an abandoned call takes to return.
};

/// @brief Synthesizer whose output is a pure function of the text.
class FakeSynthesizer: public Synthesizer
{
  public:
    static constexpr unsigned SampleRate = 8000;

    explicit FakeSynthesizer(std::size_t framesPerClip = 400): _framesPerClip(framesPerClip) {}

    /// @brief Returns the clip synthesized for text.
    [[nodiscard]] static auto clipFor(std::string_view text, std::size_t frames) -> AudioClip
    {
        auto seed = std::uint32_t { 0 };
        for (auto const ch: text)
            seed = seed * 31 + static_cast<unsigned char>(ch);
        auto clip = AudioClip { .samples = {}, .sampleRate = SampleRate, .channels = 1 };
        clip.samples.reserve(frames);
        for (auto i = std::size_t { 0 }; i < frames; ++i)
            clip.samples.push_back(static_cast<float>(seed % 997) + (static_cast<float>(i) / 1024.0f));
        return clip;
    }

    [[nodiscard]] auto expectedClip(std::string_view text) const -> AudioClip { return clipFor(text, _framesPerClip); }

    /// @brief Applies behavior to every text containing marker.
    void script(std::string marker, SynthesisBehavior behavior)
    {
        auto lock = std::lock_guard(_mutex);
        _script[std::move(marker)] = behavior;
    }

    void setDefaultDelay(std::chrono::milliseconds delay)
    {
        auto lock = std::lock_guard(_mutex);
        _defaultDelay = delay;
    }

    void setMaxConcurrentCalls(std::size_t limit) { _maxConcurrentCalls = limit; }

    /// @brief Surrounds every clip with this many frames of silence on each side.
    void setSilencePadding(std::size_t frames) { _silencePadding = frames; }

    [[nodiscard]] auto maxConcurrentCalls() const -> std::size_t override { return _maxConcurrentCalls; }

    auto synthesize(std::string_view text, const SynthesisOptions& options, std::stop_token token)
        -> Result<AudioClip> override
    {
        auto behavior = SynthesisBehavior {};
        {
            auto lock = std::lock_guard(_mutex);
            behavior.delay = _defaultDelay;
            for (const auto& [marker, scripted]: _script)
                if (text.find(marker) != std::string_view::npos)
                    behavior = scripted;
            _texts.emplace_back(text);
            _lastOptions = options;
        }

        auto const active = ++_active;
        auto peak = _peak.load();
        while (active > peak && !_peak.compare_exchange_weak(peak, active))
            ;
        auto const leave = Finally { [this] { --_active; } };

        auto lock = std::unique_lock(_waitMutex);
        if (behavior.hang)
            _wakeup.wait(lock, token, [] { return false; });
        else if (behavior.delay > 0ms)
            _wakeup.wait_for(lock, token, behavior.delay, [] { return false; });
        if (token.stop_requested())
        {
            lock.unlock();
            std::this_thread::sleep_for(behavior.cleanup);
            ++_abandoned;
            return makeError(ErrorCode::Cancelled, "Synthesis abandoned");
        }
        if (behavior.fail)
            return makeError(ErrorCode::SynthesisError, std::format("Scripted failure for '{}'", text));
        auto clip = clipFor(text, _framesPerClip);
        if (auto const padding = _silencePadding.load(); padding > 0)
        {
            clip.samples.insert(clip.samples.begin(), padding, 0.0f);
            clip.samples.insert(clip.samples.end(), padding, 0.0f);
        }
        return clip;
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "fake"; }

    [[nodiscard]] auto callCount() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _texts.size();
    }

    [[nodiscard]] auto texts() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(_mutex);
        return _texts;
    }

    [[nodiscard]] auto lastOptions() const -> SynthesisOptions
    {
        auto lock = std::lock_guard(_mutex);
        return _lastOptions;
    }

    [[nodiscard]] auto peakConcurrency() const -> std::size_t { return _peak.load(); }
    [[nodiscard]] auto abandonedCalls() const -> std::size_t { return _abandoned.load(); }

  private:
    struct Finally
    {
        std::function<void()> action;
        ~Finally() { action(); }
    };

    std::size_t const _framesPerClip;
    mutable std::mutex _mutex;
    std::map<std::string, SynthesisBehavior> _script;
    std::chrono::milliseconds _defaultDelay { 0 };
    std::vector<std::string> _texts;
    SynthesisOptions _lastOptions;
    std::atomic<std::size_t> _active { 0 };
    std::atomic<std::size_t> _peak { 0 };
    std::atomic<std::size_t> _abandoned { 0 };
    std::atomic<std::size_t> _maxConcurrentCalls { 0 };
    std::atomic<std::size_t> _silencePadding { 0 };
    std::mutex _waitMutex;
    std::condition_variable_any _wakeup;
};

/// @brief Playback device that renders clips in real time into a sample log.
///
/// Pause holds the position and persists across clips. Devices created non-pausable
/// ignore pause() so the controller has to restart the clip.
class RecordingDevice: public PlaybackDevice
{
  public:
    static constexpr auto Tick = 5ms;

    explicit RecordingDevice(bool pausable = true, std::size_t framesPerTick = 40):
        _pausable(pausable), _framesPerTick(framesPerTick)
    {
    }

    auto play(const AudioClip& clip, std::stop_token interruptToken) -> Result<PlaybackOutcome> override
    {
        auto lock = std::unique_lock(_mutex);
        ++_playCalls;
        if (_failuresToInject > 0)
        {
            --_failuresToInject;
            return makeError(ErrorCode::PlaybackError, "Injected device failure");
        }

        auto position = std::size_t { 0 };
        auto const total = clip.samples.size();
        while (position < total)
        {
            if (!_cv.wait(lock, interruptToken, [this] { return !_paused; }))
            {
                ++_interrupted;
                return PlaybackOutcome::Interrupted;
            }
            auto const end = std::min(total, position + _framesPerTick);
            _rendered.insert(_rendered.end(), clip.samples.begin() + static_cast<std::ptrdiff_t>(position),
                             clip.samples.begin() + static_cast<std::ptrdiff_t>(end));
            position = end;
            _cv.wait_for(lock, interruptToken, Tick, [] { return false; });
            if (interruptToken.stop_requested() && position < total)
            {
                ++_interrupted;
                return PlaybackOutcome::Interrupted;
            }
        }
        ++_completed;
        return PlaybackOutcome::Completed;
    }

    void pause() override
    {
        if (!_pausable)
            return;
        auto lock = std::lock_guard(_mutex);
        _paused = true;
    }

    void resume() override
    {
        {
            auto lock = std::lock_guard(_mutex);
            _paused = false;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto supportsPause() const -> bool override { return _pausable; }

    void injectFailures(std::size_t count)
    {
        auto lock = std::lock_guard(_mutex);
        _failuresToInject = count;
    }

    [[nodiscard]] auto rendered() const -> std::vector<float>
    {
        auto lock = std::lock_guard(_mutex);
        return _rendered;
    }

    [[nodiscard]] auto renderedCount() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _rendered.size();
    }

    [[nodiscard]] auto playCalls() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _playCalls;
    }

    [[nodiscard]] auto completedClips() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _completed;
    }

    [[nodiscard]] auto interruptedClips() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _interrupted;
    }

  private:
    bool const _pausable;
    std::size_t const _framesPerTick;
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    bool _paused = false;
    std::size_t _failuresToInject = 0;
    std::vector<float> _rendered;
    std::size_t _playCalls = 0;
    std::size_t _completed = 0;
    std::size_t _interrupted = 0;
};

/// @brief Records everything a ProgressTracker publishes.
class RecordingSink: public ProgressSink
{
  public:
    void onProgress(const ProgressSnapshot& snapshot) override
    {
        auto lock = std::lock_guard(_mutex);
        _snapshots.push_back(snapshot);
    }

    void onChunkFailed(std::uint64_t index, const Error& reason) override
    {
        auto lock = std::lock_guard(_mutex);
        _failures.emplace_back(index, reason.code);
    }

    void onStateChanged(PlaybackState state) override
    {
        auto lock = std::lock_guard(_mutex);
        _states.push_back(state);
    }

    void onNotice(std::string_view message) override
    {
        auto lock = std::lock_guard(_mutex);
        _notices.emplace_back(message);
    }

    [[nodiscard]] auto snapshots() const -> std::vector<ProgressSnapshot>
    {
        auto lock = std::lock_guard(_mutex);
        return _snapshots;
    }

    [[nodiscard]] auto failures() const -> std::vector<std::pair<std::uint64_t, ErrorCode>>
    {
        auto lock = std::lock_guard(_mutex);
        return _failures;
    }

    [[nodiscard]] auto states() const -> std::vector<PlaybackState>
    {
        auto lock = std::lock_guard(_mutex);
        return _states;
    }

    [[nodiscard]] auto notices() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(_mutex);
        return _notices;
    }

    [[nodiscard]] auto sawState(PlaybackState state) const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return std::ranges::find(_states, state) != _states.end();
    }

  private:
    mutable std::mutex _mutex;
    std::vector<ProgressSnapshot> _snapshots;
    std::vector<std::pair<std::uint64_t, ErrorCode>> _failures;
    std::vector<PlaybackState> _states;
    std::vector<std::string> _notices;
};

/// @brief Serves fixed pieces, then optionally fails instead of reporting the end.
class ScriptedTextSource: public TextSource
{
  public:
    explicit ScriptedTextSource(std::vector<std::string> pieces, bool failAtEnd = false):
        _pieces(std::move(pieces)), _failAtEnd(failAtEnd)
    {
    }

    auto read(std::stop_token token) -> Result<std::optional<std::string>> override
    {
        if (token.stop_requested())
            return makeError(ErrorCode::Cancelled, "Read cancelled");
        if (_next < _pieces.size())
            return std::optional<std::string> { _pieces[_next++] };
        if (_failAtEnd)
            return makeError(ErrorCode::FetchError, "Connection reset");
        return std::optional<std::string> {};
    }

    [[nodiscard]] auto sourceId() const -> std::string override { return "scripted"; }

  private:
    std::vector<std::string> _pieces;
    std::size_t _next = 0;
    bool _failAtEnd;
};

/// @brief Concatenation of the expected clips of texts, in order.
inline auto expectedAudio(const FakeSynthesizer& synthesizer, const std::vector<std::string>& texts)
    -> std::vector<float>
{
    auto samples = std::vector<float> {};
    for (const auto& text: texts)
    {
        auto clip = synthesizer.expectedClip(text);
        samples.insert(samples.end(), clip.samples.begin(), clip.samples.end());
    }
    return samples;
}

} // namespace speakstream::test
