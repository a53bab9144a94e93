// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <print>

namespace speakstream::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto outputMutex = std::mutex {};
    auto const processStart = std::chrono::steady_clock::now();

    thread_local auto currentThreadName = std::string { "main" };

    constexpr auto levelTag(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelFromString(std::string_view name, Level fallback) -> Level
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return fallback;
}

void setThreadName(std::string name)
{
    currentThreadName = std::move(name);
}

auto threadName() -> std::string_view
{
    return currentThreadName;
}

void write(Level level, std::string_view message)
{
    auto const elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - processStart).count();

    auto lock = std::lock_guard(outputMutex);
    std::println(stderr, "{:9.3f} [{}] {:<9} {}", elapsed, levelTag(level), currentThreadName, message);
}

} // namespace speakstream::log
