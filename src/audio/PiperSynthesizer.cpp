// SPDX-License-Identifier: Apache-2.0
#include "PiperSynthesizer.hpp"

#include <core/Log.hpp>

#include <charconv>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

extern "C"
{
#include <piper.h>
}

namespace speakstream
{

namespace
{

    /// @brief Piper output format: float32 PCM, 22050 Hz, mono.
    constexpr auto PiperSampleRate = 22050u;
    constexpr auto PiperChannels = 1u;

    /// @brief Parses a numeric voice selector into a piper speaker id.
    auto speakerIdOf(std::string_view voice) -> std::optional<int>
    {
        auto id = 0;
        auto const* const end = voice.data() + voice.size();
        auto const [ptr, ec] = std::from_chars(voice.data(), end, id);
        if (voice.empty() || ec != std::errc {} || ptr != end)
            return std::nullopt;
        return id;
    }

} // namespace

struct PiperSynthesizer::Impl
{
    PiperSynthesizerConfig config;
    piper_synthesizer* synth = nullptr;
    std::mutex mutex;

    ~Impl()
    {
        if (synth)
            piper_free(synth);
    }
};

PiperSynthesizer::PiperSynthesizer(): _impl(std::make_unique<Impl>())
{
}

PiperSynthesizer::~PiperSynthesizer() = default;

auto PiperSynthesizer::initialize(const PiperSynthesizerConfig& config) -> VoidResult
{
    _impl->config = config;

    if (config.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "No piper voice model configured (synthesis.piper.modelPath)");

    auto const configPath = config.modelPath + ".json";

    auto const& espeakData =
        config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

    _impl->synth = piper_create(config.modelPath.c_str(), configPath.c_str(), espeakData.c_str());
    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError,
                         std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                     config.modelPath,
                                     configPath,
                                     espeakData));

    log::info("Piper synthesizer initialized (model: {}, espeak: {})", config.modelPath, espeakData);
    return {};
}

auto PiperSynthesizer::synthesize(std::string_view text, const SynthesisOptions& options, std::stop_token token)
    -> Result<AudioClip>
{
    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError, "Piper synthesizer not initialized");

    auto lock = std::lock_guard(_impl->mutex);
    if (token.stop_requested())
        return makeError(ErrorCode::Cancelled, "Synthesis cancelled");

    auto opts = piper_default_synthesize_options(_impl->synth);
    if (auto const speaker = speakerIdOf(options.voice); speaker)
        opts.speaker_id = *speaker;

    auto const input = std::string(text);
    auto const startResult = piper_synthesize_start(_impl->synth, input.c_str(), &opts);
    if (startResult != 0)
        return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", startResult));

    auto clip = AudioClip { .samples = {}, .sampleRate = PiperSampleRate, .channels = PiperChannels };
    auto chunk = piper_audio_chunk {};

    while (true)
    {
        auto const rc = piper_synthesize_next(_impl->synth, &chunk);
        if (rc == 1) // PIPER_DONE
            break;
        if (rc < 0) // PIPER_ERR_GENERIC
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));

        // rc == 0: PIPER_OK
        clip.samples.insert(clip.samples.end(), chunk.samples, chunk.samples + chunk.num_samples);

        if (token.stop_requested())
        {
            // Drain the remaining chunks so the synthesizer is ready for the next call.
            while (piper_synthesize_next(_impl->synth, &chunk) == 0)
                ;
            return makeError(ErrorCode::Cancelled, "Synthesis cancelled");
        }
    }

    if (clip.samples.empty())
        return makeError(ErrorCode::SynthesisError, "Piper produced no audio");

    log::trace("Piper synthesized {} samples for {} bytes of text", clip.samples.size(), text.size());
    return clip;
}

} // namespace speakstream
