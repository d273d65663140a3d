/**
 * @file structure.hpp
 * @brief owner of the node/element/load arenas + every topology edit uwu
 *
 * the structure is the single owner of the truss state. elements and loads
 * point at nodes through generational handles, so removing a node has to
 * cascade: every incident element and every load on it goes too, and no
 * surviving record can ever reference a dead node.
 *
 * mass bookkeeping is derived state. after any edit that touches elements or
 * loads we rebuild every node's `mass` (half of each live incident element) and
 * `applied_mass` (sum of live loads) from scratch. that is O(nodes + elements +
 * loads) per edit, never per step, and it cannot drift no matter how many
 * add/remove cycles happen.
 *
 * every edit is all-or-nothing: validation runs before the first mutation, so a
 * rejected call leaves the structure bit-for-bit unchanged.
 *
 * example:
 * @code
 * tfx::model::Structure s{};
 * const auto left  = s.add_node({0.0, 0.0}, true);
 * const auto right = s.add_node({4.0, 0.0});
 * auto beam = s.add_element(left, right, tfx::physics::materials::MaterialKind::Steel);
 * if (!beam) {
 *     // beam.error().code == ErrorCode::DegenerateElement etc.
 * }
 * @endcode
 *
 * @author TrussFlex contributors
 * @date 2026-10-08
 * @version 0.1
 *
 * @note documented with Doxygen 1.15 beta because documentation supremacy is mandatory
 */
#pragma once

#include <cstddef>
#include <vector>

#include "tfx/common/arena.hpp"
#include "tfx/common/error.hpp"
#include "tfx/common/math.hpp"
#include "tfx/model/element.hpp"
#include "tfx/model/node.hpp"
#include "tfx/physics/materials.hpp"

namespace tfx::model
{

struct LoadTag
{
};

using LoadId = common::Handle<LoadTag>;

/**
 * @brief point load: extra mass hung on one node
 */
struct LoadWeight
{
    NodeId node{}; ///< loaded node (must be alive)
    double mass{}; ///< [kg], > 0
};

/**
 * @brief (broken, yielded) element counts
 */
struct FailureCounts
{
    std::size_t broken{0U};
    std::size_t yielded{0U};
};

/**
 * @brief what a cascading node removal took down with it
 */
struct NodeRemoval
{
    std::vector<ElementId> elements; ///< incident elements removed
    std::vector<LoadId>    loads;    ///< loads on the node removed
};

using NodeArena    = common::SlotArena<Node, NodeTag>;
using ElementArena = common::SlotArena<Element, ElementTag>;
using LoadArena    = common::SlotArena<LoadWeight, LoadTag>;

/**
 * @class Structure
 * @brief arena owner with validated, cascading topology edits
 */
class Structure
{
public:
    /// endpoints closer than this are considered coincident [m]
    static constexpr double kMinElementLength = 1.0e-9;

    // --- edits ---------------------------------------------------------------

    /**
     * @brief create a node at @p position; always succeeds
     */
    auto add_node(common::Vec2 position, bool fixed = false) -> NodeId;

    /**
     * @brief connect two live nodes with a member of @p material
     *
     * @return ElementId, or InvalidReference (dead handle) / DegenerateElement
     *         (same node or coincident positions)
     */
    auto add_element(NodeId a, NodeId b, physics::materials::MaterialKind material) -> Result<ElementId>;

    /**
     * @brief hang @p mass kilograms on @p node
     *
     * @return LoadId, or InvalidReference / InvalidArgument (mass not finite and > 0)
     */
    auto add_load(NodeId node, double mass) -> Result<LoadId>;

    /**
     * @brief remove a node plus every incident element and every load on it
     */
    auto remove_node(NodeId node) -> Result<NodeRemoval>;

    auto remove_element(ElementId element) -> Status;
    auto remove_load(LoadId load) -> Status;

    /**
     * @brief flip the fixed flag; a node that becomes fixed is stopped
     *
     * @return the new flag value
     */
    auto toggle_fixed(NodeId node) -> Result<bool>;

    /**
     * @brief overwrite a free node's velocity (impulse injection)
     */
    auto set_velocity(NodeId node, common::Vec2 velocity) -> Status;

    /**
     * @brief back to rest: original positions, zero velocity/force, no failure flags
     *
     * topology, materials, and loads stay untouched.
     */
    void reset() noexcept;

    /**
     * @brief drop every node, element, and load (outstanding handles go stale)
     */
    void clear();

    // --- queries -------------------------------------------------------------

    [[nodiscard]] auto node(NodeId id) const -> Result<const Node *>;
    [[nodiscard]] auto element(ElementId id) const -> Result<const Element *>;
    [[nodiscard]] auto load(LoadId id) const -> Result<const LoadWeight *>;

    /// live stress/strain/force of an element at the current node positions
    [[nodiscard]] auto measure(ElementId id) const -> Result<ElementMeasurement>;

    /// position of the node a load hangs from (what the renderer draws)
    [[nodiscard]] auto load_position(LoadId id) const -> Result<common::Vec2>;

    /// element masses + load masses [kg]
    [[nodiscard]] auto total_mass() const noexcept -> double;
    [[nodiscard]] auto failure_counts() const noexcept -> FailureCounts;

    [[nodiscard]] auto node_count() const noexcept -> std::size_t { return nodes_.size(); }
    [[nodiscard]] auto element_count() const noexcept -> std::size_t { return elements_.size(); }
    [[nodiscard]] auto load_count() const noexcept -> std::size_t { return loads_.size(); }

    [[nodiscard]] auto node_ids() const -> std::vector<NodeId> { return nodes_.handles(); }
    [[nodiscard]] auto element_ids() const -> std::vector<ElementId> { return elements_.handles(); }
    [[nodiscard]] auto load_ids() const -> std::vector<LoadId> { return loads_.handles(); }

    [[nodiscard]] auto nodes() const noexcept -> const NodeArena & { return nodes_; }
    [[nodiscard]] auto elements() const noexcept -> const ElementArena & { return elements_; }
    [[nodiscard]] auto loads() const noexcept -> const LoadArena & { return loads_; }

    /**
     * @brief mutable arena access for the integrator's step loop
     *
     * the step writes kinematic state and failure flags only; topology and mass
     * fields must go through the edit API above.
     */
    [[nodiscard]] auto nodes_for_step() noexcept -> NodeArena & { return nodes_; }
    [[nodiscard]] auto elements_for_step() noexcept -> ElementArena & { return elements_; }

private:
    void rebuild_mass_bookkeeping() noexcept;

    NodeArena    nodes_{};
    ElementArena elements_{};
    LoadArena    loads_{};
};

} // namespace tfx::model
