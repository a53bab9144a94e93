// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/ContentFeeder.hpp>
#include <pipeline/PlaybackBuffer.hpp>
#include <pipeline/SynthesisWorkerPool.hpp>
#include <text/Segmenter.hpp>

#include <chrono>
#include <cstddef>

namespace speakstream
{

/// @brief Tunables of every pipeline stage.
struct PipelineConfig
{
    SegmenterConfig segmenter;
    FeederConfig feeder;
    WorkerPoolConfig synthesis;
    PlaybackBufferConfig playback;

    /// @brief Chunks waiting for a synthesis worker before the feeder blocks.
    std::size_t workQueueCapacity = 16;

    /// @brief Minimum time between two progress snapshots.
    std::chrono::milliseconds publishInterval { 2000 };
};

/// @brief Validates all stage configurations.
[[nodiscard]] inline auto validate(const PipelineConfig& config) -> VoidResult
{
    if (auto result = validate(config.segmenter); !result)
        return result;
    if (auto result = validate(config.synthesis); !result)
        return result;
    if (auto result = validate(config.playback); !result)
        return result;
    if (config.feeder.segmentThreshold == 0)
        return makeError(ErrorCode::ConfigError, "feeder.segmentThreshold must be positive");
    if (config.workQueueCapacity == 0)
        return makeError(ErrorCode::ConfigError, "workQueueCapacity must be positive");
    if (config.publishInterval <= std::chrono::milliseconds::zero())
        return makeError(ErrorCode::ConfigError, "progress.publishIntervalMs must be positive");
    return {};
}

} // namespace speakstream
