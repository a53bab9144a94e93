// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Synthesizer.hpp>

#include <string>
#include <vector>

namespace speakstream
{

/// @brief Configuration for an external synthesis command.
///
/// Arguments may contain "{output}" (temporary WAV path), "{voice}" and "{lang}".
/// The chunk text is written to the command's stdin.
struct CommandSynthesizerConfig
{
    std::string command = "espeak-ng";
    std::vector<std::string> args = { "-v", "{lang}", "--stdin", "-w", "{output}" };
};

/// @brief Synthesizes speech by running an external TTS program once per chunk.
///
/// Each call owns its own child process and temporary file, so calls run in parallel.
/// Abandoned calls terminate their child and remove the file.
class CommandSynthesizer: public Synthesizer
{
  public:
    explicit CommandSynthesizer(CommandSynthesizerConfig config);

    [[nodiscard]] auto synthesize(std::string_view text, const SynthesisOptions& options, std::stop_token token)
        -> Result<AudioClip> override;

    [[nodiscard]] auto name() const -> std::string_view override { return _config.command; }

  private:
    CommandSynthesizerConfig _config;
};

} // namespace speakstream
