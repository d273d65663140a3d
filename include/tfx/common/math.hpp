/**
 * @file math.hpp
 * @brief vibey 2D vector helpers for pin-jointed truss math uwu!!!
 *
 * this header centralizes the tiny slice of planar vector math the truss core
 * needs: sums, scaling, dot products, lengths, and a normalization that never
 * explodes into NaNs when two nodes sit on top of each other. keeping these
 * helpers in a header ensures constexpr goodness and lets the integrator hot
 * loop inline everything without paying abstraction tax.
 *
 * no third-party deps, no Eigen, no GLM – just crisp STL + constexpr. results
 * go brrr ✨
 *
 * @author TrussFlex contributors
 * @date 2026-10-05
 * @version 0.1
 *
 * @note compiled with GCC 15.2+ in -std=c++2c mode (C++26 baby!)
 * @note screen-space convention: +y points down, so gravity is (0, +g)
 *
 * example (basic usage):
 * @code
 * using namespace tfx::common;
 * constexpr Vec2 a{3.0, 0.0};
 * constexpr Vec2 b{0.0, 4.0};
 * const auto len = distance(a, b);
 * // len == 5.0 because pythagoras never misses uwu
 * @endcode
 */
#pragma once

#include <array>
#include <cmath>
#include <limits>

namespace tfx::common {

/**
 * @brief spicy 2D vector alias that keeps STL friendly vibes
 *
 * ✨ PURE FUNCTION ✨
 *
 * just a type alias, zero allocations, zero side effects, zero drama fr fr
 */
using Vec2 = std::array<double, 2>;

/**
 * @brief component-wise sum
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto add(const Vec2& lhs, const Vec2& rhs) noexcept -> Vec2
{
    return Vec2{lhs[0] + rhs[0], lhs[1] + rhs[1]};
}

/**
 * @brief component-wise difference (lhs - rhs)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto subtract(const Vec2& lhs, const Vec2& rhs) noexcept -> Vec2
{
    return Vec2{lhs[0] - rhs[0], lhs[1] - rhs[1]};
}

/**
 * @brief uniform scale
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto scale(const Vec2& value, double factor) noexcept -> Vec2
{
    return Vec2{value[0] * factor, value[1] * factor};
}

/**
 * @brief blasts a 2D dot product in pure functional style
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - referential transparency applies (same inputs = same output)
 * - no side effects, no throws, just math uwu
 *
 * @param[in] lhs left vector operand
 * @param[in] rhs right vector operand
 * @return scalar dot product
 *
 * @complexity O(1) time (two multiplies + one add)
 */
[[nodiscard]] constexpr auto dot(const Vec2& lhs, const Vec2& rhs) noexcept -> double
{
    return (lhs[0] * rhs[0]) + (lhs[1] * rhs[1]);
}

/**
 * @brief grabs the Euclidean magnitude with denormal clamping
 *
 * ✨ PURE FUNCTION ✨
 *
 * subnormal magnitudes clamp to zero so callers dividing by the length can
 * guard with a plain `> 0.0` check.
 *
 * @param[in] value vector under inspection
 * @return non-negative magnitude
 *
 * @post return value >= 0.0 (never negative)
 * @warning NaN inputs propagate per IEEE 754
 */
[[nodiscard]] inline auto magnitude(const Vec2& value) noexcept -> double
{
    const auto hypot = std::hypot(value[0], value[1]);
    if (hypot < std::numeric_limits<double>::denorm_min()) {
        return 0.0;
    }
    return hypot;
}

/**
 * @brief distance between two points (aka element length)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] inline auto distance(const Vec2& lhs, const Vec2& rhs) noexcept -> double
{
    return magnitude(subtract(rhs, lhs));
}

/**
 * @brief normalizes a vector but never bulldozes tiny magnitudes
 *
 * ✨ PURE FUNCTION ✨
 *
 * returns the zero vector when the magnitude is too tiny to trust, which the
 * integrator treats as "no direction, no force" for collapsed elements.
 *
 * @param[in] value vector to normalize
 * @return unit vector or zero vector when magnitude tiny
 *
 * @note threshold tuned to 1e-12 to balance precision vs stability
 */
[[nodiscard]] inline auto safe_normalize(const Vec2& value) noexcept -> Vec2
{
    constexpr double kThreshold = 1.0e-12;
    const auto mag = magnitude(value);
    if (mag < kThreshold || !std::isfinite(mag)) {
        return Vec2{0.0, 0.0};
    }
    const auto inv = 1.0 / mag;
    return Vec2{value[0] * inv, value[1] * inv};
}

/**
 * @brief true when both components are finite
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] inline auto is_finite(const Vec2& value) noexcept -> bool
{
    return std::isfinite(value[0]) && std::isfinite(value[1]);
}

}  // namespace tfx::common
