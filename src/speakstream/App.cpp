// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioPlayback.hpp>
#include <audio/CommandSynthesizer.hpp>
#include <audio/PiperSynthesizer.hpp>
#include <audio/WavFileWriter.hpp>
#include <core/Log.hpp>
#include <pipeline/ContentFeeder.hpp>
#include <pipeline/ProgressTracker.hpp>
#include <pipeline/Session.hpp>
#include <pipeline/StreamingPipeline.hpp>
#include <source/CommandTextSource.hpp>
#include <source/FileTextSource.hpp>
#include <speakstream/ConsoleControls.hpp>
#include <speakstream/ProgressSinks.hpp>
#include <text/Segmenter.hpp>

#include <chrono>
#include <format>
#include <print>
#include <stop_token>
#include <thread>

namespace speakstream
{

namespace
{
    constexpr auto ControlPollMs = 100;

    auto endsWith(std::string_view text, std::string_view suffix) -> bool
    {
        if (text.size() < suffix.size())
            return false;
        auto const tail = text.substr(text.size() - suffix.size());
        for (auto i = std::size_t { 0 }; i < suffix.size(); ++i)
        {
            auto const c = tail[i];
            auto const lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
            if (lower != suffix[i])
                return false;
        }
        return true;
    }

    auto exitCodeFor(PlaybackState state) -> int
    {
        return (state == PlaybackState::Completed || state == PlaybackState::Stopped) ? 0 : 1;
    }
} // namespace

auto classifySource(std::string_view source) -> SourceKind
{
    if (source == "-")
        return SourceKind::Stdin;
    if (source.starts_with("http://") || source.starts_with("https://"))
        return SourceKind::Url;
    if (endsWith(source, ".pdf"))
        return SourceKind::Pdf;
    return SourceKind::File;
}

auto openSource(std::string_view source, const AppConfig& config) -> Result<std::unique_ptr<TextSource>>
{
    auto const kind = classifySource(source);
    if (kind == SourceKind::Url || kind == SourceKind::Pdf)
    {
        auto const& command = kind == SourceKind::Url ? config.source.urlCommand : config.source.pdfCommand;
        auto const& args = kind == SourceKind::Url ? config.source.urlArgs : config.source.pdfArgs;

        auto extractor = std::make_unique<CommandTextSource>();
        if (auto result = extractor->start(command, args, std::string(source)); !result)
            return std::unexpected(result.error());
        return extractor;
    }

    auto file = std::make_unique<FileTextSource>();
    if (auto result = file->open(source, config.readBlockSize); !result)
        return std::unexpected(result.error());
    return file;
}

auto listChunks(TextSource& source, const AppConfig& config) -> Result<std::vector<TextChunk>>
{
    if (auto result = validate(config.segmenter); !result)
        return std::unexpected(result.error());

    auto const segmenter = Segmenter(config.segmenter);
    auto session = Session(source.sourceId());
    session.transition(PlaybackState::Fetching);
    auto progress = ProgressTracker(
        session, [] { return std::size_t { 0 }; }, nullptr, std::chrono::milliseconds { config.progress.publishIntervalMs });
    auto feeder = ContentFeeder(config.feeder, segmenter, session, progress);
    auto queue = BoundedQueue<TextChunk>(toPipelineConfig(config).workQueueCapacity);

    auto outcome = VoidResult {};
    auto feederThread = std::jthread([&] { outcome = feeder.feed(source, queue, {}); });

    auto chunks = std::vector<TextChunk> {};
    while (auto chunk = queue.pop({}))
        chunks.push_back(std::move(*chunk));
    feederThread.join();

    if (!outcome)
        return std::unexpected(outcome.error());
    return chunks;
}

struct App::Impl
{
    AppConfig config;
    std::shared_ptr<Synthesizer> synthesizer;
    std::unique_ptr<PlaybackDevice> device;
    WavFileWriter* writer = nullptr;
    FanOutProgressSink sinks;
    ConsoleControls controls;

    void createDevice()
    {
        if (config.outputPath.empty())
        {
            device = std::make_unique<AudioPlayback>();
            return;
        }
        auto file = std::make_unique<WavFileWriter>(config.outputPath);
        writer = file.get();
        device = std::move(file);
    }

    auto createSynthesizer() -> VoidResult
    {
        switch (config.synthesis.engine)
        {
            case SynthesisEngine::Piper: {
                auto piper = std::make_shared<PiperSynthesizer>();
                if (auto result = piper->initialize(config.synthesis.piper); !result)
                    return result;
                synthesizer = std::move(piper);
                return {};
            }
            case SynthesisEngine::Command:
                synthesizer = std::make_shared<CommandSynthesizer>(config.synthesis.command);
                return {};
        }
        return makeError(ErrorCode::ConfigError, "Unsupported synthesis engine");
    }

    void handle(ControlCommand command, StreamingPipeline& pipeline)
    {
        switch (command)
        {
            case ControlCommand::TogglePause:
                if (pipeline.state() == PlaybackState::Paused)
                    pipeline.resume();
                else
                    pipeline.pause();
                break;
            case ControlCommand::Skip: pipeline.skip(); break;
            case ControlCommand::Stop: pipeline.stop(); break;
        }
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App()
{
    _impl->controls.shutdown();
}

auto App::initialize() -> VoidResult
{
    if (auto result = _impl->createSynthesizer(); !result)
        return result;
    log::info("Synthesis engine: {} ({} workers)", _impl->synthesizer->name(), _impl->config.synthesis.workers);

    _impl->createDevice();
    if (_impl->writer)
        log::info("Writing audio to {}", _impl->config.outputPath);

    _impl->sinks.add(std::make_unique<ConsoleProgressSink>());
    if (!_impl->config.progress.notifyCommand.empty())
        _impl->sinks.add(std::make_unique<CommandProgressSink>(_impl->config.progress.notifyCommand,
                                                               _impl->config.progress.notifyArgs));

    if (auto result = _impl->controls.initialize(); !result)
        return result;
    if (_impl->controls.hasTerminal())
        log::info("Controls: space/p pause, n skip, s/q stop");
    return {};
}

auto App::run(std::string_view source) -> int
{
    auto opened = openSource(source, _impl->config);
    if (!opened)
    {
        log::error("Cannot read {}: {}", source, opened.error().message);
        return 1;
    }

    auto pipeline =
        StreamingPipeline(toPipelineConfig(_impl->config), _impl->synthesizer, *_impl->device, &_impl->sinks);
    if (auto result = pipeline.start(std::move(*opened)); !result)
    {
        log::error("Failed to start reading: {}", result.error());
        return 1;
    }

    while (!pipeline.waitFor(std::chrono::milliseconds { 0 }))
    {
        for (auto const command: _impl->controls.poll(ControlPollMs))
            _impl->handle(command, pipeline);
    }

    auto const finalState = pipeline.wait();
    auto const snapshot = pipeline.snapshot();
    if (_impl->writer)
    {
        _impl->writer->finish();
        if (_impl->writer->framesWritten() == 0)
            log::warning("No audio was written to {}", _impl->config.outputPath);
    }
    if (finalState == PlaybackState::Failed)
    {
        auto const* const session = pipeline.session();
        auto const reason = session ? session->failureReason() : std::optional<Error> {};
        if (reason)
            log::error("Reading failed: {}", *reason);
        else
            log::error("Reading failed");
    }
    else
    {
        log::info("Reading {}: {} chunks played, {} skipped",
                  toString(finalState),
                  snapshot.chunksPlayed,
                  snapshot.chunksFailed);
    }
    return exitCodeFor(finalState);
}

auto App::printChunks(std::string_view source) -> int
{
    auto opened = openSource(source, _impl->config);
    if (!opened)
    {
        log::error("Cannot read {}: {}", source, opened.error().message);
        return 1;
    }

    auto chunks = listChunks(**opened, _impl->config);
    if (!chunks)
    {
        log::error("Reading {} failed: {}", source, chunks.error().message);
        return 1;
    }

    for (auto const& chunk: *chunks)
        std::println("[{}] ({} chars) {}", chunk.index, chunk.charCount, chunk.text);
    std::println("{} chunks, {} characters", chunks->size(), codePointCount(joinChunks(*chunks)));
    return 0;
}

} // namespace speakstream
