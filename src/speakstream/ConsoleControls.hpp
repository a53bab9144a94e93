// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

#include <termios.h>

namespace speakstream
{

/// @brief A playback command entered on the controlling terminal.
enum class ControlCommand : std::uint8_t
{
    TogglePause,
    Skip,
    Stop,
};

/// @brief Maps key presses to commands: space/p toggle pause, n skips, s/q/Ctrl-C stop.
[[nodiscard]] auto parseControlKeys(std::string_view input) -> std::vector<ControlCommand>;

/// @brief Reads single key presses from the controlling terminal (/dev/tty).
///
/// The terminal is put into non-canonical, no-echo mode for the lifetime of the object,
/// so keys act immediately even while stdin carries the text being read. SIGINT and
/// SIGTERM are delivered as Stop commands through a self-pipe.
class ConsoleControls
{
  public:
    ConsoleControls();
    ~ConsoleControls();

    ConsoleControls(ConsoleControls const&) = delete;
    auto operator=(ConsoleControls const&) -> ConsoleControls& = delete;
    ConsoleControls(ConsoleControls&&) = delete;
    auto operator=(ConsoleControls&&) -> ConsoleControls& = delete;

    /// @brief Installs the signal handlers and opens the terminal.
    ///
    /// A missing terminal is not an error: keys are unavailable but signals still work.
    /// @return Success or an IoError.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the terminal mode and the previous signal handlers.
    void shutdown();

    /// @brief Waits up to timeoutMs for commands.
    /// @return The commands entered (empty on timeout).
    [[nodiscard]] auto poll(int timeoutMs) -> std::vector<ControlCommand>;

    /// @brief Returns true if key presses can be read.
    [[nodiscard]] auto hasTerminal() const noexcept -> bool { return _ttyFd >= 0; }

    /// @brief Writes a byte to the self-pipe. Async-signal-safe.
    void notifySignal();

  private:
    int _ttyFd = -1;
    struct termios _origTermios {};
    bool _rawMode = false;
    int _signalPipe[2] = { -1, -1 }; ///< Self-pipe for SIGINT/SIGTERM.
    bool _initialized = false;

    void enableRawMode();
    void disableRawMode();
};

} // namespace speakstream
