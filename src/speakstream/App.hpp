// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <source/TextSource.hpp>
#include <speakstream/Config.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace speakstream
{

/// @brief How a source argument is read.
enum class SourceKind : std::uint8_t
{
    Stdin, ///< "-"
    Url,   ///< http:// or https://, through the URL extractor command
    Pdf,   ///< *.pdf, through the PDF extractor command
    File,  ///< anything else, read as plain text
};

/// @brief Classifies a source argument.
[[nodiscard]] auto classifySource(std::string_view source) -> SourceKind;

/// @brief Opens the text source for a source argument.
/// @return The source or a FetchError.
[[nodiscard]] auto openSource(std::string_view source, const AppConfig& config)
    -> Result<std::unique_ptr<TextSource>>;

/// @brief Returns the chunks the pipeline would read from source, without synthesizing.
///
/// Runs the same incremental feeder as playback, so the boundaries match what is spoken.
/// @return The chunk sequence, or the FetchError of the source.
[[nodiscard]] auto listChunks(TextSource& source, const AppConfig& config) -> Result<std::vector<TextChunk>>;

/// @brief Wires the synthesizer, the audio device, the progress sinks and the terminal
///        controls around one streaming pipeline.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the synthesis engine and installs the terminal controls.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Reads the source aloud until it is finished, stopped or fails.
    /// @return Exit code (0 for Completed or Stopped, 1 otherwise).
    [[nodiscard]] auto run(std::string_view source) -> int;

    /// @brief Prints the chunk sequence of the source to stdout without synthesizing.
    /// @return Exit code.
    [[nodiscard]] auto printChunks(std::string_view source) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace speakstream
