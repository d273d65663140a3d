/**
 * @file structure.cpp
 * @brief topology edits, cascading removal, and derived mass bookkeeping uwu
 */
#include "tfx/model/structure.hpp"

#include <cmath>
#include <format>
#include <string>

namespace tfx::model
{

auto Structure::add_node(common::Vec2 position, bool fixed) -> NodeId
{
    Node node{};
    node.position          = position;
    node.original_position = position;
    node.fixed             = fixed;
    return nodes_.insert(node);
}

auto Structure::add_element(NodeId a, NodeId b, physics::materials::MaterialKind material)
    -> Result<ElementId>
{
    const auto *node_a = nodes_.get(a);
    const auto *node_b = nodes_.get(b);
    if (node_a == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "element endpoint A is not a live node",
                          {"add_element", common::describe("node", a)});
    }
    if (node_b == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "element endpoint B is not a live node",
                          {"add_element", common::describe("node", b)});
    }
    if (a == b)
    {
        return make_error(ErrorCode::DegenerateElement, "element cannot connect a node to itself",
                          {"add_element", common::describe("node", a)});
    }

    const double rest_length = common::distance(node_a->position, node_b->position);
    if (!(rest_length > kMinElementLength))
    {
        return make_error(ErrorCode::DegenerateElement,
                          std::format("endpoints coincide (length {:.3e} m)", rest_length),
                          {"add_element", common::describe("node", a), common::describe("node", b)});
    }

    const auto id = elements_.insert(Element{a, b, material, rest_length});
    rebuild_mass_bookkeeping();
    return id;
}

auto Structure::add_load(NodeId node, double mass) -> Result<LoadId>
{
    if (!nodes_.contains(node))
    {
        return make_error(ErrorCode::InvalidReference, "load target is not a live node",
                          {"add_load", common::describe("node", node)});
    }
    if (!std::isfinite(mass) || mass <= 0.0)
    {
        return make_error(ErrorCode::InvalidArgument, std::format("load mass must be finite and > 0 (got {})", mass),
                          {"add_load", "mass"});
    }
    const auto id = loads_.insert(LoadWeight{node, mass});
    rebuild_mass_bookkeeping();
    return id;
}

auto Structure::remove_node(NodeId node) -> Result<NodeRemoval>
{
    if (!nodes_.contains(node))
    {
        return make_error(ErrorCode::InvalidReference, "node is not alive",
                          {"remove_node", common::describe("node", node)});
    }

    NodeRemoval removal{};
    elements_.for_each([&](ElementId id, const Element &element) {
        if (element.connects(node))
        {
            removal.elements.push_back(id);
        }
    });
    loads_.for_each([&](LoadId id, const LoadWeight &load) {
        if (load.node == node)
        {
            removal.loads.push_back(id);
        }
    });

    for (const auto id : removal.elements)
    {
        elements_.erase(id);
    }
    for (const auto id : removal.loads)
    {
        loads_.erase(id);
    }
    nodes_.erase(node);
    rebuild_mass_bookkeeping();
    return removal;
}

auto Structure::remove_element(ElementId element) -> Status
{
    if (!elements_.erase(element))
    {
        return make_error(ErrorCode::InvalidReference, "element is not alive",
                          {"remove_element", common::describe("element", element)});
    }
    rebuild_mass_bookkeeping();
    return {};
}

auto Structure::remove_load(LoadId load) -> Status
{
    if (!loads_.erase(load))
    {
        return make_error(ErrorCode::InvalidReference, "load is not alive",
                          {"remove_load", common::describe("load", load)});
    }
    rebuild_mass_bookkeeping();
    return {};
}

auto Structure::toggle_fixed(NodeId node) -> Result<bool>
{
    auto *target = nodes_.get(node);
    if (target == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "node is not alive",
                          {"toggle_fixed", common::describe("node", node)});
    }
    target->fixed = !target->fixed;
    if (target->fixed)
    {
        target->velocity = {0.0, 0.0};
        target->force    = {0.0, 0.0};
    }
    return target->fixed;
}

auto Structure::set_velocity(NodeId node, common::Vec2 velocity) -> Status
{
    auto *target = nodes_.get(node);
    if (target == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "node is not alive",
                          {"set_velocity", common::describe("node", node)});
    }
    if (target->fixed)
    {
        return make_error(ErrorCode::InvalidOperationState, "fixed nodes cannot move",
                          {"set_velocity", common::describe("node", node)});
    }
    if (!common::is_finite(velocity))
    {
        return make_error(ErrorCode::InvalidArgument, "velocity must be finite",
                          {"set_velocity", common::describe("node", node)});
    }
    target->velocity = velocity;
    return {};
}

void Structure::reset() noexcept
{
    nodes_.for_each([](NodeId, Node &node) {
        node.position = node.original_position;
        node.velocity = {0.0, 0.0};
        node.force    = {0.0, 0.0};
    });
    elements_.for_each([](ElementId, Element &element) { element.clear_failure(); });
}

void Structure::clear()
{
    loads_.clear();
    elements_.clear();
    nodes_.clear();
}

auto Structure::node(NodeId id) const -> Result<const Node *>
{
    const auto *found = nodes_.get(id);
    if (found == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "node is not alive", {common::describe("node", id)});
    }
    return found;
}

auto Structure::element(ElementId id) const -> Result<const Element *>
{
    const auto *found = elements_.get(id);
    if (found == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "element is not alive", {common::describe("element", id)});
    }
    return found;
}

auto Structure::load(LoadId id) const -> Result<const LoadWeight *>
{
    const auto *found = loads_.get(id);
    if (found == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "load is not alive", {common::describe("load", id)});
    }
    return found;
}

auto Structure::measure(ElementId id) const -> Result<ElementMeasurement>
{
    const auto *found = elements_.get(id);
    if (found == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "element is not alive",
                          {"measure", common::describe("element", id)});
    }
    // endpoints are alive by the cascade invariant
    const auto *a = nodes_.get(found->node_a());
    const auto *b = nodes_.get(found->node_b());
    return found->measure(a->position, b->position);
}

auto Structure::load_position(LoadId id) const -> Result<common::Vec2>
{
    const auto *found = loads_.get(id);
    if (found == nullptr)
    {
        return make_error(ErrorCode::InvalidReference, "load is not alive",
                          {"load_position", common::describe("load", id)});
    }
    return nodes_.get(found->node)->position;
}

auto Structure::total_mass() const noexcept -> double
{
    double total = 0.0;
    elements_.for_each([&total](ElementId, const Element &element) { total += element.mass(); });
    loads_.for_each([&total](LoadId, const LoadWeight &load) { total += load.mass; });
    return total;
}

auto Structure::failure_counts() const noexcept -> FailureCounts
{
    FailureCounts counts{};
    elements_.for_each([&counts](ElementId, const Element &element) {
        if (element.broken())
        {
            ++counts.broken;
        }
        if (element.yielded())
        {
            ++counts.yielded;
        }
    });
    return counts;
}

void Structure::rebuild_mass_bookkeeping() noexcept
{
    nodes_.for_each([](NodeId, Node &node) {
        node.mass         = 0.0;
        node.applied_mass = 0.0;
    });
    elements_.for_each([this](ElementId, const Element &element) {
        const double half = 0.5 * element.mass();
        nodes_.get(element.node_a())->mass += half;
        nodes_.get(element.node_b())->mass += half;
    });
    loads_.for_each([this](LoadId, const LoadWeight &load) { nodes_.get(load.node)->applied_mass += load.mass; });
}

} // namespace tfx::model
