// SPDX-License-Identifier: Apache-2.0
#include "CommandTextSource.hpp"

#include <core/Log.hpp>

#include <format>

namespace speakstream
{

namespace
{
    constexpr auto ReadSlice = std::chrono::milliseconds { 100 };
} // namespace

CommandTextSource::CommandTextSource() = default;

CommandTextSource::~CommandTextSource() = default;

auto CommandTextSource::start(const std::string& command,
                              const std::vector<std::string>& args,
                              const std::string& source) -> VoidResult
{
    _source = source;
    _command = command;

    auto config = ProcessConfig {
        .command = command,
        .args = {},
        .env = {},
        .pipeStdin = false,
        .pipeStdout = true,
        .silenceStderr = true,
    };
    for (const auto& arg: args)
        config.args.push_back(substitutePlaceholders(arg, { { "source", source } }));

    auto result = _process.spawn(config);
    if (!result)
        return makeError(ErrorCode::FetchError, result.error().message);

    log::info("Extracting '{}' with {}", source, command);
    return {};
}

auto CommandTextSource::read(std::stop_token token) -> Result<std::optional<std::string>>
{
    if (_exhausted)
        return std::optional<std::string> {};

    while (!token.stop_requested())
    {
        auto output = _process.readStdout(ReadSlice);
        if (!output)
            return makeError(ErrorCode::FetchError, output.error().message);

        if (!output->data.empty())
            return std::optional<std::string> { std::move(output->data) };

        if (!output->endOfStream)
            continue;

        _exhausted = true;
        auto status = _process.waitForExit(token);
        if (!status)
            return std::unexpected(status.error());
        if (*status != 0)
            return makeError(ErrorCode::FetchError,
                             std::format("'{}' exited with status {} while extracting '{}'", _command, *status, _source));
        return std::optional<std::string> {};
    }

    _process.terminate();
    return makeError(ErrorCode::Cancelled, "Read cancelled");
}

auto CommandTextSource::sourceId() const -> std::string
{
    return _source;
}

} // namespace speakstream
