// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>

namespace speakstream
{

/// @brief Voice and language parameters passed with every synthesis call.
struct SynthesisOptions
{
    std::string voice;
    std::string language = "en-us";
};

/// @brief Abstract speech synthesis capability (local engine, external command, test fake).
///
/// synthesize() is called concurrently from every synthesis worker, so implementations
/// must be thread-safe. A call whose token is stopped has been abandoned by the pipeline
/// (cancellation or timeout); implementations should return as soon as they notice.
class Synthesizer
{
  public:
    virtual ~Synthesizer() = default;

    /// @brief Converts text into audio.
    /// @param text The chunk text.
    /// @param options Voice and language parameters.
    /// @param token Stop token of this call.
    /// @return The synthesized clip or a SynthesisError / Cancelled error.
    [[nodiscard]] virtual auto synthesize(std::string_view text, const SynthesisOptions& options, std::stop_token token)
        -> Result<AudioClip> = 0;

    /// @brief Returns a short engine name for logging.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// @brief Maximum number of calls the engine runs at once, 0 for no limit.
    ///
    /// Callers beyond the limit wait for a free engine before their timeout starts.
    [[nodiscard]] virtual auto maxConcurrentCalls() const -> std::size_t { return 0; }
};

} // namespace speakstream
