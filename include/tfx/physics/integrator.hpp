/**
 * @file integrator.hpp
 * @brief explicit semi-implicit Euler stepper with Rayleigh damping for truss dynamics uwu
 *
 * one step is four ordered phases over the structure's arenas:
 *
 *  1. gravity: free nodes get force = g * (mass + applied_mass); fixed nodes get zero
 *  2. element forces: every intact member pushes/pulls its endpoints along the
 *     A->B unit vector (tension pulls them together) plus beta * k * elongation-rate
 *     stiffness-proportional damping, equal and opposite on both ends
 *  3. integration: free nodes with mass subtract alpha * m * v, then v += a dt,
 *     x += v dt (velocity first, that's the symplectic part)
 *  4. failure: check_failure() on every element, counting fresh transitions
 *
 * there is no linear solve anywhere: stability comes from a small fixed dt and
 * sub-stepping. a tick runs `sub_steps` steps back to back with the same dt.
 * nothing in step()/tick() allocates; the node arena doubles as the force
 * scratch buffer.
 *
 * @author TrussFlex contributors
 * @date 2026-10-10
 * @version 0.1
 *
 * @note targets C++26/GCC 15.2+ with std::expected everywhere
 */
#pragma once

#include <cstddef>
#include <cstdint>

#include "tfx/common/error.hpp"
#include "tfx/common/math.hpp"
#include "tfx/model/structure.hpp"
#include "tfx/physics/materials.hpp"

namespace tfx::physics
{

/**
 * @brief fixed integration parameters
 */
struct IntegratorSettings
{
    double                          dt{1.0 / 1200.0};    ///< step size [s]
    std::uint32_t                   sub_steps{20U};      ///< steps per externally driven tick
    common::Vec2                    gravity{0.0, 9.81};  ///< [m/s^2], +y is down
    materials::RayleighCoefficients rayleigh{0.5, 2.0e-4};

    /// simulated time covered by one tick (the recorder sample interval)
    [[nodiscard]] auto tick_duration() const noexcept -> double { return dt * static_cast<double>(sub_steps); }
};

/**
 * @brief failure transitions observed during a step or tick
 */
struct StepReport
{
    std::size_t newly_yielded{0U};
    std::size_t newly_broken{0U};
    std::size_t steps{0U};

    auto operator+=(const StepReport &other) noexcept -> StepReport &
    {
        newly_yielded += other.newly_yielded;
        newly_broken += other.newly_broken;
        steps += other.steps;
        return *this;
    }
};

/**
 * @brief check dt > 0, sub_steps >= 1, finite gravity, alpha/beta >= 0
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto validate_settings(const IntegratorSettings &settings) -> Status;

/**
 * @class Integrator
 * @brief owns validated settings and advances a structure one step or one tick at a time
 */
class Integrator
{
public:
    /**
     * @brief validate @p settings and build an integrator
     */
    [[nodiscard]] static auto create(IntegratorSettings settings) -> Result<Integrator>;

    /**
     * @brief run the four phases once
     *
     * ⚠️ IMPURE FUNCTION (mutates node kinematics + element failure flags)
     */
    auto step(model::Structure &structure) const noexcept -> StepReport;

    /**
     * @brief run `sub_steps` consecutive steps
     */
    auto tick(model::Structure &structure) const noexcept -> StepReport;

    [[nodiscard]] auto settings() const noexcept -> const IntegratorSettings & { return settings_; }

    /**
     * @brief swap damping coefficients (impulse tests zero them)
     *
     * @return InvalidArgument for negative or non-finite coefficients
     */
    auto set_damping(materials::RayleighCoefficients rayleigh) -> Status;

private:
    explicit Integrator(IntegratorSettings settings) noexcept : settings_{settings} {}

    void apply_gravity(model::NodeArena &nodes) const noexcept;
    void apply_element_forces(model::Structure &structure) const noexcept;
    void integrate(model::NodeArena &nodes) const noexcept;
    [[nodiscard]] auto check_failures(model::Structure &structure) const noexcept -> StepReport;

    IntegratorSettings settings_;
};

} // namespace tfx::physics
