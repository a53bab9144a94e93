// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Synthesizer.hpp>

#include <memory>
#include <string>

namespace speakstream
{

/// @brief Configuration for the piper engine.
struct PiperSynthesizerConfig
{
    /// @brief Path to the piper voice model (.onnx file). The model config is expected at modelPath + ".json".
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;
};

/// @brief Synthesizes speech in-process using the piper library (linked at build time).
///
/// Produces float32 PCM, 22050 Hz, mono. The piper synthesizer is not reentrant, so
/// concurrent calls are serialized and maxConcurrentCalls() reports 1. Cancellation
/// is checked between audio chunks.
class PiperSynthesizer: public Synthesizer
{
  public:
    PiperSynthesizer();
    ~PiperSynthesizer() override;

    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    /// @brief Loads the voice model.
    /// @param config The engine configuration.
    /// @return Success or a SynthesisError.
    [[nodiscard]] auto initialize(const PiperSynthesizerConfig& config) -> VoidResult;

    [[nodiscard]] auto synthesize(std::string_view text, const SynthesisOptions& options, std::stop_token token)
        -> Result<AudioClip> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "piper"; }

    /// @brief One call at a time; the piper engine is not reentrant.
    [[nodiscard]] auto maxConcurrentCalls() const -> std::size_t override { return 1; }

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace speakstream
