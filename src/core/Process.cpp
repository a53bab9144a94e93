// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace speakstream
{

namespace
{

    constexpr auto TerminateGracePeriod = std::chrono::milliseconds { 500 };
    constexpr auto ExitPollInterval = std::chrono::milliseconds { 10 };

    /// @brief Creates a pipe whose both ends are close-on-exec.
    ///
    /// Workers spawn children concurrently; without CLOEXEC one child would inherit
    /// another child's pipe ends and keep them open.
    auto makePipe(int (&fds)[2]) -> bool
    {
        if (::pipe(fds) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto exitCodeOf(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

    void ignoreSigpipeOnce()
    {
        static auto flag = std::once_flag {};
        std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

} // namespace

auto substitutePlaceholders(std::string_view text, const std::map<std::string, std::string>& values)
    -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const open = text.find('{', pos);
        if (open == std::string_view::npos)
            break;
        auto const close = text.find('}', open + 1);
        if (close == std::string_view::npos)
            break;

        result.append(text.substr(pos, open - pos));
        auto const key = std::string(text.substr(open + 1, close - open - 1));
        if (auto const it = values.find(key); it != values.end())
            result.append(it->second);
        else
            result.append(text.substr(open, close - open + 1));
        pos = close + 1;
    }

    result.append(text.substr(pos));
    return result;
}

struct ChildProcess::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::string command;
};

ChildProcess::ChildProcess(): _impl(std::make_unique<Impl>())
{
}

ChildProcess::~ChildProcess()
{
    closeStdin();
    closeFd(_impl->stdoutRead);
    terminate();
}

auto ChildProcess::spawn(const ProcessConfig& config) -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::ProcessError, "Process already running");

    ignoreSigpipeOnce();

    int stdinPipe[2] = { -1, -1 };
    int stdoutPipe[2] = { -1, -1 };

    if (config.pipeStdin && !makePipe(stdinPipe))
        return makeError(ErrorCode::ProcessError, "Failed to create stdin pipe");
    if (config.pipeStdout && !makePipe(stdoutPipe))
    {
        closeFd(stdinPipe[0]);
        closeFd(stdinPipe[1]);
        return makeError(ErrorCode::ProcessError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);

    if (config.pipeStdin)
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    else
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    if (config.pipeStdout)
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    if (config.silenceStderr)
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
            envStrings.emplace_back(*e);
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);

    if (status != 0)
    {
        closeFd(stdinPipe[1]);
        closeFd(stdoutPipe[0]);
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->command = config.command;

    log::trace("Spawned '{}' (pid {})", config.command, pid);
    return {};
}

auto ChildProcess::writeStdin(std::string_view data) -> VoidResult
{
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::ProcessError, "Process stdin is not connected");

    while (!data.empty())
    {
        auto const written = ::write(_impl->stdinWrite, data.data(), data.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::ProcessError,
                             std::format("Failed to write to '{}' stdin: {}", _impl->command, strerror(errno)));
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return {};
}

void ChildProcess::closeStdin()
{
    closeFd(_impl->stdinWrite);
}

auto ChildProcess::readStdout(std::chrono::milliseconds timeout) -> Result<ProcessOutput>
{
    if (_impl->stdoutRead < 0)
        return ProcessOutput { .data = {}, .endOfStream = true };

    auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
    auto const pollResult = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (pollResult == 0)
        return ProcessOutput {};
    if (pollResult < 0)
    {
        if (errno == EINTR)
            return ProcessOutput {};
        return makeError(ErrorCode::IoError, std::format("poll() failed: {}", strerror(errno)));
    }

    auto buf = std::array<char, 4096> {};
    auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
    if (bytesRead < 0)
    {
        if (errno == EINTR || errno == EAGAIN)
            return ProcessOutput {};
        return makeError(ErrorCode::IoError,
                         std::format("Failed to read from '{}': {}", _impl->command, strerror(errno)));
    }
    if (bytesRead == 0)
    {
        closeFd(_impl->stdoutRead);
        return ProcessOutput { .data = {}, .endOfStream = true };
    }

    return ProcessOutput { .data = std::string(buf.data(), static_cast<std::size_t>(bytesRead)),
                           .endOfStream = false };
}

auto ChildProcess::waitForExit(std::stop_token token, std::chrono::steady_clock::time_point deadline)
    -> Result<int>
{
    if (_impl->childPid <= 0)
        return makeError(ErrorCode::ProcessError, "No process to wait for");

    while (true)
    {
        int status = 0;
        auto const result = ::waitpid(_impl->childPid, &status, WNOHANG);
        if (result == _impl->childPid)
        {
            _impl->childPid = -1;
            return exitCodeOf(status);
        }
        if (result < 0 && errno != EINTR)
        {
            _impl->childPid = -1;
            return makeError(ErrorCode::ProcessError, std::format("waitpid() failed: {}", strerror(errno)));
        }

        if (token.stop_requested())
        {
            terminate();
            return makeError(ErrorCode::Cancelled, std::format("'{}' cancelled", _impl->command));
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            terminate();
            return makeError(ErrorCode::TimeoutError, std::format("'{}' timed out", _impl->command));
        }

        std::this_thread::sleep_for(ExitPollInterval);
    }
}

void ChildProcess::terminate()
{
    if (_impl->childPid <= 0)
        return;

    ::kill(_impl->childPid, SIGTERM);

    auto const giveUp = std::chrono::steady_clock::now() + TerminateGracePeriod;
    int status = 0;
    while (std::chrono::steady_clock::now() < giveUp)
    {
        if (::waitpid(_impl->childPid, &status, WNOHANG) == _impl->childPid)
        {
            _impl->childPid = -1;
            return;
        }
        std::this_thread::sleep_for(ExitPollInterval);
    }

    ::kill(_impl->childPid, SIGKILL);
    ::waitpid(_impl->childPid, &status, 0);
    log::debug("Killed '{}' after grace period", _impl->command);
    _impl->childPid = -1;
}

auto ChildProcess::running() const -> bool
{
    return _impl->childPid > 0;
}

} // namespace speakstream
