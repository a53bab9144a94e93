// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace speakstream
{

/// @brief Configuration for spawning a child process.
struct ProcessConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief Connect a pipe to the child's stdin (otherwise /dev/null).
    bool pipeStdin = false;

    /// @brief Connect a pipe to the child's stdout (otherwise inherited).
    bool pipeStdout = false;

    /// @brief Redirect the child's stderr to /dev/null.
    bool silenceStderr = true;
};

/// @brief Outcome of a single read from the child's stdout.
struct ProcessOutput
{
    std::string data;
    bool endOfStream = false;
};

/// @brief Replaces every "{key}" in text with the matching value.
///
/// Unknown placeholders are left untouched.
[[nodiscard]] auto substitutePlaceholders(std::string_view text,
                                          const std::map<std::string, std::string>& values) -> std::string;

/// @brief Owns a spawned child process and the pipe ends connected to it.
///
/// The destructor closes all pipes and terminates the child if it is still running,
/// so every exit path releases the process handle.
class ChildProcess
{
  public:
    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// @brief Spawns the process described by config.
    /// @return Success or a ProcessError.
    [[nodiscard]] auto spawn(const ProcessConfig& config) -> VoidResult;

    /// @brief Writes all bytes to the child's stdin.
    [[nodiscard]] auto writeStdin(std::string_view data) -> VoidResult;

    /// @brief Closes the child's stdin so it sees end-of-file.
    void closeStdin();

    /// @brief Reads whatever is available on the child's stdout.
    /// @param timeout Maximum time to wait for data.
    /// @return Data read (empty on timeout), endOfStream once the pipe is closed, or an IoError.
    [[nodiscard]] auto readStdout(std::chrono::milliseconds timeout) -> Result<ProcessOutput>;

    /// @brief Waits for the child to exit, polling the stop token.
    ///
    /// If stop is requested the child is terminated and Cancelled is returned.
    /// @param token Cancellation token.
    /// @param deadline Optional absolute deadline; on expiry the child is terminated and TimeoutError returned.
    /// @return The exit status of the child.
    [[nodiscard]] auto waitForExit(std::stop_token token,
                                   std::chrono::steady_clock::time_point deadline =
                                       std::chrono::steady_clock::time_point::max()) -> Result<int>;

    /// @brief Sends SIGTERM (then SIGKILL after a grace period) and reaps the child.
    void terminate();

    /// @brief Returns true while a child has been spawned and not yet reaped.
    [[nodiscard]] auto running() const -> bool;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace speakstream
