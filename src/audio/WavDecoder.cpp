// SPDX-License-Identifier: Apache-2.0
#include "WavDecoder.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <cstddef>
#include <format>
#include <vector>

namespace speakstream
{

namespace
{
    constexpr auto DecodeBlockFrames = ma_uint64 { 4096 };
} // namespace

auto decodeAudioFile(const std::filesystem::path& path) -> Result<AudioClip>
{
    auto config = ma_decoder_config_init(ma_format_f32, 0, 0);
    auto decoder = ma_decoder {};

    auto const initResult = ma_decoder_init_file(path.c_str(), &config, &decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::SynthesisError,
                         std::format("Cannot decode audio file '{}': {}", path.string(), static_cast<int>(initResult)));

    auto clip = AudioClip {
        .samples = {},
        .sampleRate = decoder.outputSampleRate,
        .channels = decoder.outputChannels,
    };

    auto block = std::vector<float>(DecodeBlockFrames * clip.channels);
    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const result = ma_decoder_read_pcm_frames(&decoder, block.data(), DecodeBlockFrames, &framesRead);
        auto const samplesRead = static_cast<std::ptrdiff_t>(framesRead * clip.channels);
        clip.samples.insert(clip.samples.end(), block.begin(), block.begin() + samplesRead);
        if (result == MA_AT_END || framesRead == 0)
            break;
        if (result != MA_SUCCESS)
        {
            ma_decoder_uninit(&decoder);
            return makeError(ErrorCode::SynthesisError,
                             std::format("Failed reading audio file '{}': {}", path.string(), static_cast<int>(result)));
        }
    }

    ma_decoder_uninit(&decoder);

    if (clip.samples.empty())
        return makeError(ErrorCode::SynthesisError, std::format("Audio file '{}' contains no samples", path.string()));

    log::trace("Decoded '{}': {} frames, {}Hz, {} channel(s)",
               path.string(),
               clip.frameCount(),
               clip.sampleRate,
               clip.channels);
    return clip;
}

} // namespace speakstream
