// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace speakstream
{

namespace
{

    /// @brief Reads a non-negative size; negative values map to 0 and are rejected by validation.
    auto getSizeOr(const nlohmann::json& obj, std::string_view key, std::size_t defaultValue) -> std::size_t
    {
        auto const value = json::valueOr<int>(obj, key, static_cast<int>(defaultValue));
        return value < 0 ? 0 : static_cast<std::size_t>(value);
    }

} // namespace

auto toString(SynthesisEngine engine) -> std::string_view
{
    switch (engine)
    {
        case SynthesisEngine::Piper: return "piper";
        case SynthesisEngine::Command: return "command";
    }
    return "unknown";
}

auto engineFromString(std::string_view name) -> Result<SynthesisEngine>
{
    if (name == "piper")
        return SynthesisEngine::Piper;
    if (name == "command")
        return SynthesisEngine::Command;
    return makeError(ErrorCode::ConfigError,
                     std::format("Unknown synthesis engine '{}' (expected piper or command)", name));
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/speakstream";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/speakstream";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto toPipelineConfig(const AppConfig& config) -> PipelineConfig
{
    return PipelineConfig {
        .segmenter = config.segmenter,
        .feeder = config.feeder,
        .synthesis =
            WorkerPoolConfig {
                .workers = config.synthesis.workers,
                .timeout = std::chrono::milliseconds { config.synthesis.timeoutMs },
                .retries = config.synthesis.retries,
                .options = SynthesisOptions { .voice = config.synthesis.voice,
                                              .language = config.synthesis.language },
                .trimSilence = config.synthesis.trimSilence,
            },
        .playback = config.playback,
        .workQueueCapacity = std::max<std::size_t>(16, config.synthesis.workers * 2),
        .publishInterval = std::chrono::milliseconds { config.progress.publishIntervalMs },
    };
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (auto result = validate(toPipelineConfig(config)); !result)
        return result;

    if (config.readBlockSize == 0)
        return makeError(ErrorCode::ConfigError, "feeder.readBlockSize must be positive");

    if (config.synthesis.engine == SynthesisEngine::Command && config.synthesis.command.command.empty())
        return makeError(ErrorCode::ConfigError, "synthesis.command.command must name an executable");

    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content, path);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};
    config.logLevel = json::valueOr<std::string>(root, "logLevel", config.logLevel);

    // Segmenter section
    auto const segmenter = json::sectionOf(root, "segmenter");
    config.segmenter.minSize = getSizeOr(segmenter, "minSize", config.segmenter.minSize);
    config.segmenter.maxSize = getSizeOr(segmenter, "maxSize", config.segmenter.maxSize);
    config.segmenter.protectedPatterns =
        json::valueOr<std::vector<std::string>>(segmenter, "protectedPatterns", config.segmenter.protectedPatterns);

    // Feeder section
    auto const feeder = json::sectionOf(root, "feeder");
    config.feeder.segmentThreshold = getSizeOr(feeder, "segmentThreshold", config.feeder.segmentThreshold);
    config.feeder.maxChars = getSizeOr(feeder, "maxChars", config.feeder.maxChars);
    config.feeder.cleanText = json::valueOr<bool>(feeder, "cleanText", config.feeder.cleanText);
    config.readBlockSize = getSizeOr(feeder, "readBlockSize", config.readBlockSize);

    // Synthesis section
    auto const synthesis = json::sectionOf(root, "synthesis");
    auto const engineName =
        json::valueOr<std::string>(synthesis, "engine", std::string(toString(config.synthesis.engine)));
    auto engine = engineFromString(engineName);
    if (!engine)
        return std::unexpected(engine.error());
    config.synthesis.engine = *engine;
    config.synthesis.workers = getSizeOr(synthesis, "workers", config.synthesis.workers);
    config.synthesis.timeoutMs = json::valueOr<int>(synthesis, "timeoutMs", config.synthesis.timeoutMs);
    config.synthesis.retries =
        static_cast<unsigned>(getSizeOr(synthesis, "retries", config.synthesis.retries));
    config.synthesis.voice = json::valueOr<std::string>(synthesis, "voice", config.synthesis.voice);
    config.synthesis.language = json::valueOr<std::string>(synthesis, "language", config.synthesis.language);
    config.synthesis.trimSilence = json::valueOr<bool>(synthesis, "trimSilence", config.synthesis.trimSilence);

    auto const piper = json::sectionOf(synthesis, "piper");
    config.synthesis.piper.modelPath = json::valueOr<std::string>(piper, "modelPath", "");
    config.synthesis.piper.espeakDataPath = json::valueOr<std::string>(piper, "espeakDataPath", "");

    auto const command = json::sectionOf(synthesis, "command");
    config.synthesis.command.command =
        json::valueOr<std::string>(command, "command", config.synthesis.command.command);
    config.synthesis.command.args =
        json::valueOr<std::vector<std::string>>(command, "args", config.synthesis.command.args);

    // Playback section
    auto const playback = json::sectionOf(root, "playback");
    config.playback.capacity = getSizeOr(playback, "capacity", config.playback.capacity);
    config.playback.lowWatermark = getSizeOr(playback, "lowWatermark", config.playback.lowWatermark);
    config.playback.highWatermark = getSizeOr(playback, "highWatermark", config.playback.highWatermark);

    // Source section
    auto const source = json::sectionOf(root, "source");
    config.source.urlCommand = json::valueOr<std::string>(source, "urlCommand", config.source.urlCommand);
    config.source.urlArgs =
        json::valueOr<std::vector<std::string>>(source, "urlArgs", config.source.urlArgs);
    config.source.pdfCommand = json::valueOr<std::string>(source, "pdfCommand", config.source.pdfCommand);
    config.source.pdfArgs =
        json::valueOr<std::vector<std::string>>(source, "pdfArgs", config.source.pdfArgs);

    // Progress section
    auto const progress = json::sectionOf(root, "progress");
    config.progress.publishIntervalMs =
        json::valueOr<int>(progress, "publishIntervalMs", config.progress.publishIntervalMs);
    config.progress.notifyCommand = json::valueOr<std::string>(progress, "notifyCommand", "");
    config.progress.notifyArgs =
        json::valueOr<std::vector<std::string>>(progress, "notifyArgs", config.progress.notifyArgs);

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["logLevel"] = config.logLevel;

    // Segmenter section
    auto segmenter = nlohmann::json::object();
    segmenter["minSize"] = config.segmenter.minSize;
    segmenter["maxSize"] = config.segmenter.maxSize;
    segmenter["protectedPatterns"] = config.segmenter.protectedPatterns;
    root["segmenter"] = std::move(segmenter);

    // Feeder section
    auto feeder = nlohmann::json::object();
    feeder["segmentThreshold"] = config.feeder.segmentThreshold;
    feeder["readBlockSize"] = config.readBlockSize;
    feeder["maxChars"] = config.feeder.maxChars;
    feeder["cleanText"] = config.feeder.cleanText;
    root["feeder"] = std::move(feeder);

    // Synthesis section
    auto synthesis = nlohmann::json::object();
    synthesis["engine"] = std::string(toString(config.synthesis.engine));
    synthesis["workers"] = config.synthesis.workers;
    synthesis["timeoutMs"] = config.synthesis.timeoutMs;
    synthesis["retries"] = config.synthesis.retries;
    if (!config.synthesis.voice.empty())
        synthesis["voice"] = config.synthesis.voice;
    synthesis["language"] = config.synthesis.language;
    synthesis["trimSilence"] = config.synthesis.trimSilence;

    auto piper = nlohmann::json::object();
    if (!config.synthesis.piper.modelPath.empty())
        piper["modelPath"] = config.synthesis.piper.modelPath;
    if (!config.synthesis.piper.espeakDataPath.empty())
        piper["espeakDataPath"] = config.synthesis.piper.espeakDataPath;
    synthesis["piper"] = std::move(piper);

    auto command = nlohmann::json::object();
    command["command"] = config.synthesis.command.command;
    command["args"] = config.synthesis.command.args;
    synthesis["command"] = std::move(command);
    root["synthesis"] = std::move(synthesis);

    // Playback section
    auto playback = nlohmann::json::object();
    playback["capacity"] = config.playback.capacity;
    playback["lowWatermark"] = config.playback.lowWatermark;
    playback["highWatermark"] = config.playback.highWatermark;
    root["playback"] = std::move(playback);

    // Source section
    auto source = nlohmann::json::object();
    source["urlCommand"] = config.source.urlCommand;
    source["urlArgs"] = config.source.urlArgs;
    source["pdfCommand"] = config.source.pdfCommand;
    source["pdfArgs"] = config.source.pdfArgs;
    root["source"] = std::move(source);

    // Progress section
    auto progress = nlohmann::json::object();
    progress["publishIntervalMs"] = config.progress.publishIntervalMs;
    if (!config.progress.notifyCommand.empty())
        progress["notifyCommand"] = config.progress.notifyCommand;
    progress["notifyArgs"] = config.progress.notifyArgs;
    root["progress"] = std::move(progress);

    auto const filePath = std::filesystem::path(path);
    if (filePath.has_parent_path())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create config directory '{}': {}",
                                         filePath.parent_path().string(),
                                         ec.message()));
    }

    auto file = std::ofstream(filePath);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));

    log::info("Saved configuration to {}", path);
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace speakstream
