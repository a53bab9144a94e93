// SPDX-License-Identifier: Apache-2.0
#include "ConsoleControls.hpp"

#include <core/Log.hpp>

#include <array>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace speakstream
{

namespace
{
    // Global pointer for the signal handler to notify the ConsoleControls instance.
    // Only one ConsoleControls instance should be active at a time.
    ConsoleControls* gActiveControls = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigint {};           // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigterm {};          // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    constexpr auto CtrlC = char { 0x03 };

    void stopSignalHandler(int /*sig*/)
    {
        if (gActiveControls != nullptr)
            gActiveControls->notifySignal();
    }
} // namespace

auto parseControlKeys(std::string_view input) -> std::vector<ControlCommand>
{
    auto commands = std::vector<ControlCommand> {};
    for (auto const ch: input)
    {
        switch (ch)
        {
            case ' ':
            case 'p':
            case 'P': commands.push_back(ControlCommand::TogglePause); break;
            case 'n':
            case 'N': commands.push_back(ControlCommand::Skip); break;
            case 's':
            case 'S':
            case 'q':
            case 'Q':
            case CtrlC: commands.push_back(ControlCommand::Stop); break;
            default: break;
        }
    }
    return commands;
}

ConsoleControls::ConsoleControls() = default;

ConsoleControls::~ConsoleControls()
{
    shutdown();
}

auto ConsoleControls::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    if (::pipe(_signalPipe) == -1)
        return makeError(ErrorCode::IoError, "Failed to create signal notification pipe");

    for (auto const fd: _signalPipe)
    {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
    }

    gActiveControls = this;
    struct sigaction sa {};
    sa.sa_handler = stopSignalHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, &gPrevSigint);
    sigaction(SIGTERM, &sa, &gPrevSigterm);

    _ttyFd = ::open("/dev/tty", O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (_ttyFd < 0)
        log::debug("No controlling terminal, keyboard controls disabled");
    else
        enableRawMode();

    _initialized = true;
    return {};
}

void ConsoleControls::shutdown()
{
    if (!_initialized)
        return;

    disableRawMode();
    if (_ttyFd >= 0)
    {
        ::close(_ttyFd);
        _ttyFd = -1;
    }

    sigaction(SIGINT, &gPrevSigint, nullptr);
    sigaction(SIGTERM, &gPrevSigterm, nullptr);
    gActiveControls = nullptr;

    ::close(_signalPipe[0]);
    ::close(_signalPipe[1]);
    _signalPipe[0] = -1;
    _signalPipe[1] = -1;
    _initialized = false;
}

auto ConsoleControls::poll(int timeoutMs) -> std::vector<ControlCommand>
{
    auto fds = std::array<struct pollfd, 2> {};
    fds[0] = { .fd = _signalPipe[0], .events = POLLIN, .revents = 0 };
    fds[1] = { .fd = _ttyFd, .events = POLLIN, .revents = 0 };

    auto const nfds = (_ttyFd >= 0) ? 2 : 1;
    auto const pollResult = ::poll(fds.data(), static_cast<nfds_t>(nfds), timeoutMs);
    if (pollResult <= 0)
        return {};

    auto commands = std::vector<ControlCommand> {};

    if ((fds[0].revents & POLLIN) != 0)
    {
        // Drain the pipe
        auto buf = char {};
        while (::read(_signalPipe[0], &buf, 1) > 0)
            ;
        commands.push_back(ControlCommand::Stop);
    }

    if (nfds >= 2 && (fds[1].revents & POLLIN) != 0)
    {
        auto buf = std::array<char, 64> {};
        auto const n = ::read(_ttyFd, buf.data(), buf.size());
        if (n > 0)
        {
            auto keys = parseControlKeys(std::string_view(buf.data(), static_cast<std::size_t>(n)));
            commands.insert(commands.end(), keys.begin(), keys.end());
        }
    }

    return commands;
}

void ConsoleControls::notifySignal()
{
    if (_signalPipe[1] != -1)
    {
        auto const byte = char { 1 };
        auto const result = ::write(_signalPipe[1], &byte, 1);
        static_cast<void>(result);
    }
}

void ConsoleControls::enableRawMode()
{
    if (tcgetattr(_ttyFd, &_origTermios) != 0)
        return;
    auto raw = _origTermios;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(_ttyFd, TCSANOW, &raw);
    _rawMode = true;
}

void ConsoleControls::disableRawMode()
{
    if (_rawMode)
    {
        tcsetattr(_ttyFd, TCSANOW, &_origTermios);
        _rawMode = false;
    }
}

} // namespace speakstream
