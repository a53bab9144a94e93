// SPDX-License-Identifier: Apache-2.0
#include "CommandSynthesizer.hpp"

#include <audio/WavDecoder.hpp>
#include <core/Process.hpp>
#include <core/TemporaryFile.hpp>

#include <format>
#include <map>

namespace speakstream
{

CommandSynthesizer::CommandSynthesizer(CommandSynthesizerConfig config): _config(std::move(config))
{
}

auto CommandSynthesizer::synthesize(std::string_view text, const SynthesisOptions& options, std::stop_token token)
    -> Result<AudioClip>
{
    if (token.stop_requested())
        return makeError(ErrorCode::Cancelled, "Synthesis cancelled");

    auto output = TemporaryFile::create("speakstream-", ".wav");
    if (!output)
        return std::unexpected(output.error());

    auto const values = std::map<std::string, std::string> {
        { "output", output->path().string() },
        { "voice", options.voice },
        { "lang", options.language },
    };

    auto config = ProcessConfig {
        .command = _config.command,
        .args = {},
        .env = {},
        .pipeStdin = true,
        .pipeStdout = false,
        .silenceStderr = true,
    };
    for (const auto& arg: _config.args)
        config.args.push_back(substitutePlaceholders(arg, values));

    auto process = ChildProcess {};
    if (auto result = process.spawn(config); !result)
        return makeError(ErrorCode::SynthesisError, result.error().message);

    if (auto result = process.writeStdin(text); !result)
        return makeError(ErrorCode::SynthesisError,
                         std::format("'{}' did not take the text: {}", _config.command, result.error().message));
    process.closeStdin();

    auto status = process.waitForExit(token);
    if (!status)
        return std::unexpected(status.error());
    if (*status != 0)
        return makeError(ErrorCode::SynthesisError, std::format("'{}' exited with status {}", _config.command, *status));

    return decodeAudioFile(output->path());
}

} // namespace speakstream
