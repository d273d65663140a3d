/**
 * @file element.hpp
 * @brief axial two-node member: rest geometry, stiffness, stress/strain, failure flags uwu
 *
 * an element only knows its endpoints by NodeId, so every mechanical query
 * takes the live length (or the two live positions) from the caller. the
 * structure wraps this in measure() for convenience; the integrator feeds the
 * numbers straight from the node arena in its hot loop.
 *
 * sign convention everywhere: positive stress/strain/force = tension.
 *
 * @author TrussFlex contributors
 * @date 2026-10-07
 * @version 0.1
 */
#pragma once

#include "tfx/common/arena.hpp"
#include "tfx/common/math.hpp"
#include "tfx/model/node.hpp"
#include "tfx/physics/materials.hpp"

namespace tfx::model
{

struct ElementTag
{
};

using ElementId = common::Handle<ElementTag>;

/**
 * @brief flags newly raised by a single check_failure() call
 */
struct FailureTransition
{
    bool yielded{false}; ///< element went from not-yielded to yielded
    bool broken{false};  ///< element went from intact to broken
};

/**
 * @brief snapshot of an element's mechanical state at the current positions
 */
struct ElementMeasurement
{
    double length{};       ///< current length [m]
    double strain{};       ///< (L - L0) / L0
    double stress{};       ///< E * strain [Pa]
    double axial_force{};  ///< stress * A [N]
    double stress_ratio{}; ///< |stress| / ultimate, unclamped
};

/**
 * @class Element
 * @brief axial rod between two nodes carrying one catalog material
 *
 * rest length, stiffness, and mass are frozen at construction. `broken` and
 * `yielded` only ever go false -> true here; reset() on the structure is the
 * single place that clears them.
 */
class Element
{
public:
    /**
     * @pre rest_length > 0 (the structure rejects degenerate endpoints first)
     */
    Element(NodeId a, NodeId b, physics::materials::MaterialKind material, double rest_length) noexcept;

    [[nodiscard]] auto node_a() const noexcept -> NodeId { return a_; }
    [[nodiscard]] auto node_b() const noexcept -> NodeId { return b_; }
    [[nodiscard]] auto material() const noexcept -> physics::materials::MaterialKind { return material_; }
    [[nodiscard]] auto properties() const noexcept -> const physics::materials::Properties &
    {
        return physics::materials::properties(material_);
    }
    [[nodiscard]] auto rest_length() const noexcept -> double { return rest_length_; }

    /// k = E * A / L0 [N/m]
    [[nodiscard]] auto stiffness() const noexcept -> double { return stiffness_; }

    /// density * L0 [kg], split evenly onto the endpoints
    [[nodiscard]] auto mass() const noexcept -> double { return mass_; }
    [[nodiscard]] auto broken() const noexcept -> bool { return broken_; }
    [[nodiscard]] auto yielded() const noexcept -> bool { return yielded_; }
    [[nodiscard]] auto connects(NodeId node) const noexcept -> bool { return a_ == node || b_ == node; }

    [[nodiscard]] auto strain(double current_length) const noexcept -> double;
    [[nodiscard]] auto stress(double current_length) const noexcept -> double;
    [[nodiscard]] auto axial_force(double current_length) const noexcept -> double;
    [[nodiscard]] auto stress_ratio(double current_length) const noexcept -> double;
    [[nodiscard]] auto measure(const common::Vec2 &position_a, const common::Vec2 &position_b) const noexcept
        -> ElementMeasurement;

    /**
     * @brief raise yielded/broken when |stress| exceeds the material thresholds
     *
     * ⚠️ IMPURE FUNCTION (mutates the monotone flags)
     *
     * @return which flags this call flipped (both false when nothing changed)
     */
    auto check_failure(double current_length) noexcept -> FailureTransition;

    /// clear both flags (structure reset only)
    void clear_failure() noexcept;

private:
    NodeId                           a_;
    NodeId                           b_;
    physics::materials::MaterialKind material_;
    double                           rest_length_;
    double                           stiffness_;
    double                           mass_;
    bool                             broken_{false};
    bool                             yielded_{false};
};

} // namespace tfx::model
