// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>

namespace speakstream
{

/// @brief Decodes an audio file (WAV, FLAC or MP3) into float32 PCM using miniaudio.
///
/// The native sample rate and channel count of the file are preserved.
/// @param path The file to decode.
/// @return The decoded clip or a SynthesisError when the file is missing, empty or unreadable.
[[nodiscard]] auto decodeAudioFile(const std::filesystem::path& path) -> Result<AudioClip>;

} // namespace speakstream
