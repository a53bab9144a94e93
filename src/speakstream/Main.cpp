// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <speakstream/App.hpp>
#include <speakstream/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "speakstream: read text, files and web pages aloud while they stream in" };

    auto source = std::string {};
    auto configPath = std::string {};
    auto minSize = std::size_t { 0 };
    auto maxSize = std::size_t { 0 };
    auto workers = std::size_t { 0 };
    auto engine = std::string {};
    auto modelPath = std::string {};
    auto voice = std::string {};
    auto language = std::string {};
    auto maxChars = std::size_t { 0 };
    auto dryRun = false;
    auto outputPath = std::string {};
    auto trimSilence = false;
    auto savePath = std::string {};
    auto verbose = false;

    app.add_option("source", source, "Text file, PDF, http(s) URL, or - for stdin")->required();
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--min-size", minSize, "Minimum chunk size in characters");
    app.add_option("--max-size", maxSize, "Maximum chunk size in characters");
    app.add_option("-w,--workers", workers, "Number of parallel synthesis workers");
    app.add_option("--engine", engine, "Synthesis engine (piper|command)");
    app.add_option("-m,--model", modelPath, "Path to piper voice model (.onnx)");
    app.add_option("--voice", voice, "Voice name or speaker id");
    app.add_option("-l,--lang", language, "Language code (e.g. en-us, es)");
    app.add_option("--max-chars", maxChars, "Read at most this many characters");
    app.add_flag("--chunks", dryRun, "Print the chunk sequence and exit");
    app.add_option("-o,--out", outputPath, "Write the audio to a WAV file instead of playing it");
    app.add_flag("--trim-silence", trimSilence, "Cut leading and trailing silence from every chunk");
    app.add_option("--save-config", savePath, "Write the effective configuration to this file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult =
        configPath.empty() ? speakstream::loadConfig() : speakstream::loadConfigFromFile(configPath);

    if (!configResult)
    {
        speakstream::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (minSize > 0)
        config.segmenter.minSize = minSize;
    if (maxSize > 0)
        config.segmenter.maxSize = maxSize;
    if (workers > 0)
        config.synthesis.workers = workers;
    if (!engine.empty())
    {
        auto parsed = speakstream::engineFromString(engine);
        if (!parsed)
        {
            speakstream::log::error("{}", parsed.error().message);
            return 1;
        }
        config.synthesis.engine = *parsed;
    }
    if (!modelPath.empty())
        config.synthesis.piper.modelPath = modelPath;
    if (!voice.empty())
        config.synthesis.voice = voice;
    if (!language.empty())
        config.synthesis.language = language;
    if (maxChars > 0)
        config.feeder.maxChars = maxChars;
    if (trimSilence)
        config.synthesis.trimSilence = true;
    if (verbose)
        config.logLevel = "debug";

    speakstream::log::setLevel(speakstream::log::levelFromString(config.logLevel));

    if (auto result = speakstream::validateConfig(config); !result)
    {
        speakstream::log::error("Invalid configuration: {}", result.error().message);
        return 1;
    }

    if (!savePath.empty())
    {
        if (auto result = speakstream::saveConfigToFile(savePath, config); !result)
        {
            speakstream::log::error("{}", result.error().message);
            return 1;
        }
    }

    config.outputPath = outputPath;

    auto application = speakstream::App(std::move(config));
    if (dryRun)
        return application.printChunks(source);

    auto initResult = application.initialize();
    if (!initResult)
    {
        speakstream::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(source);
}
