/**
 * @file recorder.cpp
 * @brief recorder state machine implementation uwu
 */
#include "tfx/post/recorder.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <utility>

namespace tfx::post
{
namespace
{

constexpr double kTimeSlack = 1.0e-9;

[[nodiscard]] auto is_positive(double value) noexcept -> bool
{
    return std::isfinite(value) && value > 0.0;
}

[[nodiscard]] auto stress_row(const model::Structure &structure, const std::vector<model::ElementId> &columns)
    -> std::vector<double>
{
    std::vector<double> row;
    row.reserve(columns.size());
    for (const auto id : columns)
    {
        const auto measured = structure.measure(id);
        row.push_back(measured ? measured->stress : std::numeric_limits<double>::quiet_NaN());
    }
    return row;
}

} // namespace

auto Recorder::start(const RecordingRequest &request, const model::Structure &structure, bool simulation_running)
    -> Status
{
    if (!simulation_running)
    {
        return make_error(ErrorCode::InvalidOperationState, "recording requires a running simulation",
                          {"recorder", "start"});
    }
    if (state_ == RecorderState::Recording)
    {
        return make_error(ErrorCode::InvalidOperationState, "a recording is already in progress",
                          {"recorder", "start"});
    }
    if (!is_positive(request.duration))
    {
        return make_error(ErrorCode::InvalidArgument,
                          std::format("duration must be finite and > 0 (got {})", request.duration),
                          {"recorder", "start", "duration"});
    }
    if (!is_positive(request.interval))
    {
        return make_error(ErrorCode::InvalidArgument,
                          std::format("interval must be finite and > 0 (got {})", request.interval),
                          {"recorder", "start", "interval"});
    }

    Recording next{};
    next.mode     = request.mode;
    next.interval = request.interval;
    if (request.mode == RecordingMode::NodeDisplacement)
    {
        if (auto node = structure.node(request.tracked_node); !node)
        {
            auto err = node.error();
            err.context.insert(err.context.begin(), {"recorder", "start"});
            return std::unexpected(std::move(err));
        }
        next.tracked_node = request.tracked_node;
    }
    else
    {
        next.columns = structure.element_ids();
    }

    current_  = std::move(next);
    elapsed_  = 0.0;
    duration_ = request.duration;
    state_    = RecorderState::Recording;
    return {};
}

auto Recorder::sample(const model::Structure &structure) -> std::optional<Recording>
{
    if (state_ != RecorderState::Recording)
    {
        return std::nullopt;
    }

    if (current_.mode == RecordingMode::NodeDisplacement)
    {
        const auto node = structure.node(current_.tracked_node);
        current_.samples.push_back(
            {node ? (*node)->vertical_displacement() : std::numeric_limits<double>::quiet_NaN()});
    }
    else
    {
        current_.samples.push_back(stress_row(structure, current_.columns));
    }

    // elapsed from the sample count so 10 x 0.1 s reaches 1.0 s exactly
    elapsed_ = static_cast<double>(current_.samples.size()) * current_.interval;
    if (elapsed_ + kTimeSlack * current_.interval < duration_)
    {
        return std::nullopt;
    }

    state_ = RecorderState::Idle;
    auto finished = std::move(current_);
    current_      = Recording{};
    return finished;
}

auto Recorder::cancel() noexcept -> bool
{
    if (state_ != RecorderState::Recording)
    {
        return false;
    }
    state_    = RecorderState::Idle;
    current_  = Recording{};
    elapsed_  = 0.0;
    duration_ = 0.0;
    return true;
}

} // namespace tfx::post
