/**
 * @file recorder.hpp
 * @brief idle/recording state machine that samples stress histories or a node's sway uwu
 *
 * the recorder takes one sample per externally driven tick (not per sub-step),
 * so the sample interval is dt * sub_steps. two flavors:
 *
 * - StressVector: every element's stress, column order frozen at start()
 * - NodeDisplacement: the tracked node's vertical offset from its original
 *   position (what the impulse test wants for free-vibration analysis)
 *
 * once accumulated time reaches the requested duration, sample() hands back the
 * finished Recording and the recorder drops back to idle. cancel() throws the
 * in-progress data away without emitting anything.
 *
 * @author TrussFlex contributors
 * @date 2026-10-12
 * @version 0.1
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "tfx/common/error.hpp"
#include "tfx/model/structure.hpp"

namespace tfx::post
{

enum class RecorderState : std::uint8_t
{
    Idle,
    Recording
};

enum class RecordingMode : std::uint8_t
{
    StressVector,
    NodeDisplacement
};

/**
 * @brief what to record (mode + tracked node for displacement mode)
 */
struct RecordingRequest
{
    RecordingMode mode{RecordingMode::StressVector};
    model::NodeId tracked_node{}; ///< only read in NodeDisplacement mode
    double        duration{0.0};  ///< [s] > 0
    double        interval{0.0};  ///< [s] > 0, time between samples
};

/**
 * @brief finished sample sequence handed to the exporter
 */
struct Recording
{
    RecordingMode                    mode{RecordingMode::StressVector};
    double                           interval{0.0};
    std::vector<model::ElementId>    columns{};      ///< StressVector column order
    model::NodeId                    tracked_node{}; ///< NodeDisplacement source
    std::vector<std::vector<double>> samples{};      ///< one row per tick

    /// time of row @p index; sample i is taken after tick i + 1, so (index + 1) * interval
    [[nodiscard]] auto time_at(std::size_t index) const noexcept -> double
    {
        return static_cast<double>(index + 1U) * interval;
    }
};

/**
 * @brief (elapsed, duration) pair for progress bars
 */
struct RecorderProgress
{
    double elapsed{0.0};
    double duration{0.0};
};

/**
 * @class Recorder
 */
class Recorder
{
public:
    /**
     * @brief enter the recording state
     *
     * @param request what/how long to record
     * @param structure used to freeze the stress column order / validate the node
     * @param simulation_running recording a stopped simulation is rejected
     *
     * @return InvalidOperationState (not running / already recording),
     *         InvalidArgument (bad duration/interval), InvalidReference (dead node)
     */
    auto start(const RecordingRequest &request, const model::Structure &structure, bool simulation_running)
        -> Status;

    /**
     * @brief append one sample after a completed tick
     *
     * ⚠️ IMPURE FUNCTION (grows the in-progress sample buffer)
     *
     * @return the finished recording when this sample reached the duration,
     *         nullopt otherwise (including when idle)
     */
    auto sample(const model::Structure &structure) -> std::optional<Recording>;

    /**
     * @brief abort and discard the in-progress recording
     *
     * @return true when a recording was actually running
     */
    auto cancel() noexcept -> bool;

    [[nodiscard]] auto state() const noexcept -> RecorderState { return state_; }
    [[nodiscard]] auto is_recording() const noexcept -> bool { return state_ == RecorderState::Recording; }
    [[nodiscard]] auto mode() const noexcept -> RecordingMode { return current_.mode; }
    [[nodiscard]] auto progress() const noexcept -> RecorderProgress { return {elapsed_, duration_}; }
    [[nodiscard]] auto sample_count() const noexcept -> std::size_t { return current_.samples.size(); }

private:
    RecorderState state_{RecorderState::Idle};
    Recording     current_{};
    double        elapsed_{0.0};
    double        duration_{0.0};
};

} // namespace tfx::post
