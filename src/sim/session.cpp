/**
 * @file session.cpp
 * @brief session run-state machine and edit forwarding uwu
 */
#include "tfx/sim/session.hpp"

#include <cmath>
#include <format>
#include <string_view>

#include "tfx/common/log.hpp"
#include "tfx/sim/presets.hpp"

namespace tfx::sim
{
namespace
{

constexpr std::string_view kSimLogTag = "[tfx::sim]";

} // namespace

auto integrator_settings(const config::Config &config) -> physics::IntegratorSettings
{
    physics::IntegratorSettings settings{};
    settings.dt        = config.simulation.dt;
    settings.sub_steps = config.simulation.sub_steps;
    settings.gravity   = config.simulation.gravity;
    settings.rayleigh  = {config.damping.alpha, config.damping.beta};
    return settings;
}

auto Session::create(physics::IntegratorSettings settings) -> Result<Session>
{
    auto integrator = physics::Integrator::create(settings);
    if (!integrator)
    {
        auto err = integrator.error();
        err.context.insert(err.context.begin(), "session");
        return std::unexpected(std::move(err));
    }
    return Session{std::move(*integrator)};
}

auto Session::add_node(common::Vec2 position, bool fixed) -> model::NodeId
{
    return structure_.add_node(position, fixed);
}

auto Session::remove_node(model::NodeId node) -> Result<model::NodeRemoval>
{
    return structure_.remove_node(node);
}

auto Session::toggle_fixed(model::NodeId node) -> Result<bool>
{
    return structure_.toggle_fixed(node);
}

auto Session::add_element(model::NodeId a, model::NodeId b, physics::materials::MaterialKind material)
    -> Result<model::ElementId>
{
    return structure_.add_element(a, b, material);
}

auto Session::remove_element(model::ElementId element) -> Status
{
    return structure_.remove_element(element);
}

auto Session::add_load(model::NodeId node, double mass) -> Result<model::LoadId>
{
    return structure_.add_load(node, mass);
}

auto Session::remove_load(model::LoadId load) -> Status
{
    return structure_.remove_load(load);
}

void Session::set_simulation_running(bool running)
{
    if (running == running_)
    {
        return;
    }
    if (!running)
    {
        if (recorder_.cancel())
        {
            log::info(kSimLogTag, "stop: recording cancelled, samples discarded");
        }
        restore_damping();
    }
    running_ = running;
    log::info(kSimLogTag, "simulation {} at t = {:.4f} s", running_ ? "running" : "stopped", simulated_time_);
}

void Session::reset() noexcept
{
    structure_.reset();
    simulated_time_ = 0.0;
}

void Session::clear()
{
    set_simulation_running(false);
    structure_.clear();
    simulated_time_ = 0.0;
}

auto Session::load_preset(std::size_t index) -> Status
{
    const auto preset = preset_from_index(index);
    if (!preset)
    {
        return make_error(ErrorCode::InvalidArgument,
                          std::format("preset index {} out of range (0..{})", index, kPresetCount - 1U),
                          {"load_preset"});
    }

    set_simulation_running(false);
    simulated_time_ = 0.0;
    if (auto built = build_preset(structure_, *preset); !built)
    {
        return built;
    }
    log::info(kSimLogTag, "preset '{}': {} nodes, {} elements, {:.1f} kg", preset_name(*preset),
              structure_.node_count(), structure_.element_count(), structure_.total_mass());
    return {};
}

auto Session::start_recording(double duration) -> Status
{
    post::RecordingRequest request{};
    request.mode     = post::RecordingMode::StressVector;
    request.duration = duration;
    request.interval = integrator_.settings().tick_duration();
    if (auto started = recorder_.start(request, structure_, running_); !started)
    {
        return started;
    }
    log::info(kSimLogTag, "recording {} element stresses for {:.3f} s", structure_.element_count(), duration);
    return {};
}

auto Session::run_impulse_test(double magnitude, double duration) -> Result<ImpulseReport>
{
    return sim::run_impulse_test(*this, magnitude, duration);
}

auto Session::begin_free_vibration(model::NodeId node, common::Vec2 velocity, double duration) -> Status
{
    if (running_)
    {
        return make_error(ErrorCode::InvalidOperationState, "impulse test requires a stopped simulation",
                          {"impulse"});
    }
    const auto target = structure_.node(node);
    if (!target)
    {
        auto err = target.error();
        err.context.insert(err.context.begin(), "impulse");
        return std::unexpected(std::move(err));
    }
    if ((*target)->fixed)
    {
        return make_error(ErrorCode::InvalidOperationState, "cannot excite a fixed node",
                          {"impulse", common::describe("node", node)});
    }
    if (!common::is_finite(velocity))
    {
        return make_error(ErrorCode::InvalidArgument, "impulse velocity must be finite", {"impulse", "velocity"});
    }
    if (!std::isfinite(duration) || duration <= 0.0)
    {
        return make_error(ErrorCode::InvalidArgument,
                          std::format("duration must be finite and > 0 (got {})", duration), {"impulse", "duration"});
    }

    structure_.reset();
    simulated_time_ = 0.0;

    const auto previous = integrator_.settings().rayleigh;
    if (auto undamped = integrator_.set_damping({0.0, 0.0}); !undamped)
    {
        return undamped;
    }
    saved_damping_ = previous;

    if (auto kicked = structure_.set_velocity(node, velocity); !kicked)
    {
        restore_damping();
        return kicked;
    }

    post::RecordingRequest request{};
    request.mode         = post::RecordingMode::NodeDisplacement;
    request.tracked_node = node;
    request.duration     = duration;
    request.interval     = integrator_.settings().tick_duration();
    if (auto started = recorder_.start(request, structure_, true); !started)
    {
        structure_.reset();
        restore_damping();
        return started;
    }

    running_ = true;
    log::info(kSimLogTag, "impulse test: {} kicked to {:.4f} m/s, recording {:.3f} s undamped",
              common::describe("node", node), velocity[1], duration);
    return {};
}

auto Session::tick() -> TickReport
{
    TickReport report{};
    if (!running_)
    {
        return report;
    }

    report.steps = integrator_.tick(structure_);
    simulated_time_ += integrator_.settings().tick_duration();
    if (report.steps.newly_yielded > 0U || report.steps.newly_broken > 0U)
    {
        const auto counts = structure_.failure_counts();
        log::info(kSimLogTag, "t = {:.4f} s: {} newly yielded, {} newly broken ({} yielded, {} broken total)",
                  simulated_time_, report.steps.newly_yielded, report.steps.newly_broken, counts.yielded,
                  counts.broken);
    }

    if (auto finished = recorder_.sample(structure_))
    {
        restore_damping();
        log::info(kSimLogTag, "recording finished: {} samples every {:.4f} s", finished->samples.size(),
                  finished->interval);
        report.finished = std::move(finished);
    }
    return report;
}

void Session::restore_damping()
{
    if (!saved_damping_)
    {
        return;
    }
    if (auto restored = integrator_.set_damping(*saved_damping_); !restored)
    {
        log::error(kSimLogTag, "failed to restore damping: {}", restored.error().message);
    }
    saved_damping_.reset();
}

} // namespace tfx::sim
