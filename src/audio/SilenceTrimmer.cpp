// SPDX-License-Identifier: Apache-2.0
#include "SilenceTrimmer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace speakstream
{

auto trimSilence(AudioClip clip, const SilenceTrimConfig& config) -> AudioClip
{
    auto const frames = clip.frameCount();
    if (frames == 0)
        return clip;

    auto const threshold = std::pow(10.0f, config.thresholdDb / 20.0f);
    auto const channels = static_cast<std::size_t>(clip.channels);
    auto audible = [&](std::size_t frame) {
        auto const* const first = clip.samples.data() + frame * channels;
        return std::any_of(
            first, first + channels, [threshold](float sample) { return std::abs(sample) >= threshold; });
    };

    auto begin = std::size_t { 0 };
    while (begin < frames && !audible(begin))
        ++begin;
    if (begin == frames)
    {
        clip.samples.clear();
        return clip;
    }

    auto end = frames;
    while (end > begin && !audible(end - 1))
        --end;

    auto const marginFrames =
        static_cast<std::size_t>(clip.sampleRate) * static_cast<std::size_t>(config.margin.count()) / 1000;
    begin = begin > marginFrames ? begin - marginFrames : 0;
    end = std::min(frames, end + marginFrames);

    clip.samples.erase(clip.samples.begin() + static_cast<std::ptrdiff_t>(end * channels), clip.samples.end());
    clip.samples.erase(clip.samples.begin(), clip.samples.begin() + static_cast<std::ptrdiff_t>(begin * channels));
    return clip;
}

} // namespace speakstream
