// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CommandSynthesizer.hpp>
#include <audio/PiperSynthesizer.hpp>
#include <core/Error.hpp>
#include <pipeline/PipelineConfig.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace speakstream
{

/// @brief Which synthesis backend the workers use.
enum class SynthesisEngine : std::uint8_t
{
    Piper,
    Command,
};

[[nodiscard]] auto toString(SynthesisEngine engine) -> std::string_view;

/// @brief Parses "piper" or "command".
[[nodiscard]] auto engineFromString(std::string_view name) -> Result<SynthesisEngine>;

/// @brief Synthesis configuration section.
struct SynthesisSettings
{
    SynthesisEngine engine = SynthesisEngine::Piper;
    std::size_t workers = 3;
    int timeoutMs = 30000;
    unsigned retries = 0;
    std::string voice;
    std::string language = "en-us";
    PiperSynthesizerConfig piper;
    CommandSynthesizerConfig command;
    bool trimSilence = false;
};

/// @brief Extractor commands for non-plain-text sources.
struct SourceSettings
{
    std::string urlCommand = "lynx";
    std::vector<std::string> urlArgs = { "-dump", "-nolist", "{source}" };
    std::string pdfCommand = "pdftotext";
    std::vector<std::string> pdfArgs = { "-layout", "{source}", "-" };
};

/// @brief Progress reporting section.
struct ProgressSettings
{
    int publishIntervalMs = 2000;

    /// @brief Optional desktop notification command (e.g. "notify-send"); empty disables it.
    std::string notifyCommand;
    std::vector<std::string> notifyArgs = { "{title}", "{body}" };
};

/// @brief Top-level application configuration.
struct AppConfig
{
    SegmenterConfig segmenter;
    FeederConfig feeder;
    std::size_t readBlockSize = 4096;
    SynthesisSettings synthesis;
    PlaybackBufferConfig playback;
    SourceSettings source;
    ProgressSettings progress;
    std::string logLevel = "info";

    /// @brief WAV file to write the audio to instead of playing it. Command line only, never saved.
    std::string outputPath;
};

/// @brief Maps the application configuration onto the pipeline stage configuration.
[[nodiscard]] auto toPipelineConfig(const AppConfig& config) -> PipelineConfig;

/// @brief Checks every section for values the pipeline cannot run with.
/// @return Success or a ConfigError naming the offending field.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns $XDG_CONFIG_HOME/speakstream or ~/.config/speakstream.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace speakstream
