// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Process.hpp>
#include <source/TextSource.hpp>

#include <memory>
#include <string>
#include <vector>

namespace speakstream
{

/// @brief Streams the stdout of an extractor process (e.g. "lynx -dump URL", "pdftotext FILE -").
///
/// Output is handed to the feeder as it arrives, so reading can start before the
/// extractor has finished. A non-zero exit status is reported as FetchError.
class CommandTextSource: public TextSource
{
  public:
    CommandTextSource();
    ~CommandTextSource() override;

    CommandTextSource(const CommandTextSource&) = delete;
    CommandTextSource& operator=(const CommandTextSource&) = delete;

    /// @brief Spawns the extractor.
    /// @param command Executable name or path.
    /// @param args Arguments; "{source}" is replaced by source.
    /// @param source The URL or path being extracted.
    /// @return Success or a FetchError.
    [[nodiscard]] auto start(const std::string& command, const std::vector<std::string>& args, const std::string& source)
        -> VoidResult;

    [[nodiscard]] auto read(std::stop_token token) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto sourceId() const -> std::string override;

  private:
    ChildProcess _process;
    std::string _source;
    std::string _command;
    bool _exhausted = false;
};

} // namespace speakstream
