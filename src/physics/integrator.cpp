/**
 * @file integrator.cpp
 * @brief four-phase semi-implicit Euler step + sub-stepped ticks uwu
 */
#include "tfx/physics/integrator.hpp"

#include <cmath>
#include <format>

namespace tfx::physics
{
namespace
{

[[nodiscard]] auto is_non_negative(double value) noexcept -> bool
{
    return std::isfinite(value) && value >= 0.0;
}

[[nodiscard]] auto validate_damping(const materials::RayleighCoefficients &rayleigh) -> Status
{
    if (!is_non_negative(rayleigh.alpha))
    {
        return make_error(ErrorCode::InvalidArgument,
                          std::format("damping alpha must be finite and >= 0 (got {})", rayleigh.alpha),
                          {"integrator", "rayleigh", "alpha"});
    }
    if (!is_non_negative(rayleigh.beta))
    {
        return make_error(ErrorCode::InvalidArgument,
                          std::format("damping beta must be finite and >= 0 (got {})", rayleigh.beta),
                          {"integrator", "rayleigh", "beta"});
    }
    return {};
}

} // namespace

auto validate_settings(const IntegratorSettings &settings) -> Status
{
    if (!std::isfinite(settings.dt) || settings.dt <= 0.0)
    {
        return make_error(ErrorCode::InvalidArgument, std::format("dt must be finite and > 0 (got {})", settings.dt),
                          {"integrator", "dt"});
    }
    if (settings.sub_steps == 0U)
    {
        return make_error(ErrorCode::InvalidArgument, "sub_steps must be >= 1", {"integrator", "sub_steps"});
    }
    if (!common::is_finite(settings.gravity))
    {
        return make_error(ErrorCode::InvalidArgument, "gravity must be finite", {"integrator", "gravity"});
    }
    return validate_damping(settings.rayleigh);
}

auto Integrator::create(IntegratorSettings settings) -> Result<Integrator>
{
    if (auto valid = validate_settings(settings); !valid)
    {
        return std::unexpected(valid.error());
    }
    return Integrator{settings};
}

auto Integrator::set_damping(materials::RayleighCoefficients rayleigh) -> Status
{
    if (auto valid = validate_damping(rayleigh); !valid)
    {
        return valid;
    }
    settings_.rayleigh = rayleigh;
    return {};
}

void Integrator::apply_gravity(model::NodeArena &nodes) const noexcept
{
    const auto gravity = settings_.gravity;
    nodes.for_each([&gravity](model::NodeId, model::Node &node) {
        if (node.fixed)
        {
            node.force = {0.0, 0.0};
            return;
        }
        node.force = common::scale(gravity, node.total_mass());
    });
}

void Integrator::apply_element_forces(model::Structure &structure) const noexcept
{
    auto        &nodes = structure.nodes_for_step();
    const double beta  = settings_.rayleigh.beta;

    structure.elements_for_step().for_each([&nodes, beta](model::ElementId, model::Element &element) {
        if (element.broken())
        {
            return;
        }
        auto *a = nodes.get(element.node_a());
        auto *b = nodes.get(element.node_b());

        const auto   delta     = common::subtract(b->position, a->position);
        const double length    = common::magnitude(delta);
        const auto   direction = common::safe_normalize(delta);
        if (direction[0] == 0.0 && direction[1] == 0.0)
        {
            // collapsed member has no line of action this step
            return;
        }

        const double elastic         = element.axial_force(length);
        const double elongation_rate = common::dot(common::subtract(b->velocity, a->velocity), direction);
        const double damping         = beta * element.stiffness() * elongation_rate;
        const auto   pull            = common::scale(direction, elastic + damping);

        // tension (positive) pulls A toward B and B toward A
        a->force = common::add(a->force, pull);
        b->force = common::subtract(b->force, pull);
    });
}

void Integrator::integrate(model::NodeArena &nodes) const noexcept
{
    const double dt    = settings_.dt;
    const double alpha = settings_.rayleigh.alpha;

    nodes.for_each([dt, alpha](model::NodeId, model::Node &node) {
        if (node.fixed)
        {
            return;
        }
        const double mass = node.total_mass();
        if (!(mass > 0.0))
        {
            // a free node with nothing attached has no inertia to integrate
            return;
        }
        const auto force        = common::subtract(node.force, common::scale(node.velocity, alpha * mass));
        const auto acceleration = common::scale(force, 1.0 / mass);
        node.velocity           = common::add(node.velocity, common::scale(acceleration, dt));
        node.position           = common::add(node.position, common::scale(node.velocity, dt));
    });
}

auto Integrator::check_failures(model::Structure &structure) const noexcept -> StepReport
{
    const auto &nodes = structure.nodes();
    StepReport  report{};
    structure.elements_for_step().for_each([&nodes, &report](model::ElementId, model::Element &element) {
        const auto *a          = nodes.get(element.node_a());
        const auto *b          = nodes.get(element.node_b());
        const auto  transition = element.check_failure(common::distance(a->position, b->position));
        if (transition.yielded)
        {
            ++report.newly_yielded;
        }
        if (transition.broken)
        {
            ++report.newly_broken;
        }
    });
    return report;
}

auto Integrator::step(model::Structure &structure) const noexcept -> StepReport
{
    auto &nodes = structure.nodes_for_step();
    apply_gravity(nodes);
    apply_element_forces(structure);
    integrate(nodes);
    auto report  = check_failures(structure);
    report.steps = 1U;
    return report;
}

auto Integrator::tick(model::Structure &structure) const noexcept -> StepReport
{
    StepReport total{};
    for (std::uint32_t i = 0; i < settings_.sub_steps; ++i)
    {
        total += step(structure);
    }
    return total;
}

} // namespace tfx::physics
