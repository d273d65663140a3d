/**
 * @file node.hpp
 * @brief pin joint / point mass record living in the structure's node arena
 *
 * @author TrussFlex contributors
 * @date 2026-10-07
 * @version 0.1
 */
#pragma once

#include "tfx/common/arena.hpp"
#include "tfx/common/math.hpp"

namespace tfx::model
{

struct NodeTag
{
};

using NodeId = common::Handle<NodeTag>;

/**
 * @brief point mass with kinematic state and mass bookkeeping
 *
 * `mass` and `applied_mass` are derived by the Structure from the live element
 * and load sets; nothing else should write them. `force` is transient scratch
 * that the integrator rebuilds every step.
 */
struct Node
{
    common::Vec2 position{};          ///< current position [m]
    common::Vec2 original_position{}; ///< snapshot at creation, target of reset()
    common::Vec2 velocity{};          ///< [m/s]
    common::Vec2 force{};             ///< accumulated force of the current step [N]
    double       mass{0.0};           ///< half-masses of incident live elements [kg]
    double       applied_mass{0.0};   ///< sum of point loads on this node [kg]
    bool         fixed{false};        ///< fixed nodes are never integrated

    [[nodiscard]] auto total_mass() const noexcept -> double { return mass + applied_mass; }

    /// vertical offset from the creation position (+y is down)
    [[nodiscard]] auto vertical_displacement() const noexcept -> double
    {
        return position[1] - original_position[1];
    }
};

} // namespace tfx::model
