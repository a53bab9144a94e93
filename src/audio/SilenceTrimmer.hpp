// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>

namespace speakstream
{

/// @brief Level below which a frame counts as silence, and the margin kept around speech.
struct SilenceTrimConfig
{
    float thresholdDb = -40.0f; ///< dBFS; -40 dB is an amplitude of 0.01.
    std::chrono::milliseconds margin { 10 };
};

/// @brief Removes leading and trailing silence from a clip.
///
/// A frame is silent when every channel stays below the threshold. Up to margin of
/// audio is kept before the first and after the last audible frame. A clip without
/// any audible frame becomes empty.
[[nodiscard]] auto trimSilence(AudioClip clip, const SilenceTrimConfig& config = {}) -> AudioClip;

} // namespace speakstream
