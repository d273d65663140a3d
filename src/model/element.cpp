/**
 * @file element.cpp
 * @brief axial member mechanics (stress, strain, force, failure) uwu
 */
#include "tfx/model/element.hpp"

#include <cmath>

namespace tfx::model
{

Element::Element(NodeId a, NodeId b, physics::materials::MaterialKind material, double rest_length) noexcept
    : a_{a}, b_{b}, material_{material}, rest_length_{rest_length}
{
    const auto &props = physics::materials::properties(material_);
    stiffness_        = props.youngs_modulus * props.cross_section_area / rest_length_;
    mass_             = props.density * rest_length_;
}

auto Element::strain(double current_length) const noexcept -> double
{
    return (current_length - rest_length_) / rest_length_;
}

auto Element::stress(double current_length) const noexcept -> double
{
    return properties().youngs_modulus * strain(current_length);
}

auto Element::axial_force(double current_length) const noexcept -> double
{
    return stress(current_length) * properties().cross_section_area;
}

auto Element::stress_ratio(double current_length) const noexcept -> double
{
    return std::abs(stress(current_length)) / properties().ultimate_strength;
}

auto Element::measure(const common::Vec2 &position_a, const common::Vec2 &position_b) const noexcept
    -> ElementMeasurement
{
    const double length = common::distance(position_a, position_b);
    return ElementMeasurement{length, strain(length), stress(length), axial_force(length),
                              stress_ratio(length)};
}

auto Element::check_failure(double current_length) noexcept -> FailureTransition
{
    const auto  &props = properties();
    const double s     = std::abs(stress(current_length));

    FailureTransition transition{};
    if (s > props.yield_strength && !yielded_)
    {
        yielded_           = true;
        transition.yielded = true;
    }
    if (s > props.ultimate_strength && !broken_)
    {
        broken_           = true;
        transition.broken = true;
    }
    return transition;
}

void Element::clear_failure() noexcept
{
    broken_  = false;
    yielded_ = false;
}

} // namespace tfx::model
