/**
 * @file materials.hpp
 * @brief closed material catalog + Rayleigh damping math for axial truss members uwu
 *
 * this header bundles the static material table every element resolves its
 * properties from. materials form a tiny closed enum (WOOD, STEEL, ROAD) with an
 * immutable property record looked up by value: no virtual dispatch, no heap,
 * everything constexpr so the invariants get checked at compile time.
 *
 * the numbers are a tuned game-grade catalog: axial wave speed sqrt(E·A/ρ) sits
 * around 1.1 km/s so the explicit integrator stays stable at dt = 1/1200 s even
 * for 2 m members, while the strength ratios still read like real materials.
 *
 * the Rayleigh helper from the YAML (xi, w1, w2) triple lives here too so config
 * and integrator agree on the alpha/beta mapping.
 *
 * @author TrussFlex contributors
 * @date 2026-10-06
 * @version 0.1
 *
 * @note uses C++26 constexpr goodness compiled with GCC 15.2+ in -std=c++2c mode
 * @note documented with Doxygen 1.15 beta because documentation supremacy is mandatory
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tfx::physics::materials
{

/**
 * @brief closed set of member materials
 */
enum class MaterialKind : std::uint8_t
{
    Wood  = 0U,
    Steel = 1U,
    Road  = 2U
};

inline constexpr std::size_t kMaterialCount = 3U;

/**
 * @brief immutable per-material property record (SI units)
 */
struct Properties
{
    std::string_view name;               ///< catalog name ("WOOD", "STEEL", "ROAD")
    double           density;            ///< mass per unit length [kg/m]
    double           youngs_modulus;     ///< E [Pa]
    double           cross_section_area; ///< A [m^2]
    double           yield_strength;     ///< |stress| above this marks the member yielded [Pa]
    double           ultimate_strength;  ///< |stress| above this breaks the member [Pa]
};

/**
 * @brief rayleigh damping coefficients (alpha, beta) in SI units uwu
 */
struct RayleighCoefficients
{
    double alpha; ///< mass-proportional term [1/s]
    double beta;  ///< stiffness-proportional term [s]
};

inline constexpr std::array<Properties, kMaterialCount> kCatalog{{
    {"WOOD", 64.0, 11.0e9, 8.0e-3, 30.0e6, 40.0e6},
    {"STEEL", 150.0, 200.0e9, 1.0e-3, 250.0e6, 400.0e6},
    {"ROAD", 200.0, 30.0e9, 8.0e-3, 30.0e6, 45.0e6},
}};

/**
 * @brief catalog lookup by value
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto properties(MaterialKind kind) noexcept -> const Properties &
{
    return kCatalog[static_cast<std::size_t>(kind)];
}

/**
 * @brief catalog name for CSV columns and logs
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto name(MaterialKind kind) noexcept -> std::string_view
{
    return properties(kind).name;
}

/**
 * @brief parse a catalog name (case-insensitive) back into the enum
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] text e.g. "steel", "ROAD"
 * @return kind or nullopt for unknown names
 */
[[nodiscard]] constexpr auto parse_kind(std::string_view text) noexcept -> std::optional<MaterialKind>
{
    const auto upper = [](char c) constexpr {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    };
    for (std::size_t i = 0; i < kMaterialCount; ++i)
    {
        const auto candidate = kCatalog[i].name;
        if (candidate.size() != text.size())
        {
            continue;
        }
        bool match = true;
        for (std::size_t c = 0; c < text.size(); ++c)
        {
            if (upper(text[c]) != candidate[c])
            {
                match = false;
                break;
            }
        }
        if (match)
        {
            return static_cast<MaterialKind>(i);
        }
    }
    return std::nullopt;
}

/**
 * @brief the catalog invariant: ultimate >= yield > 0, E > 0, A > 0, density > 0
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto is_valid(const Properties &props) noexcept -> bool
{
    return props.density > 0.0 && props.youngs_modulus > 0.0 && props.cross_section_area > 0.0 &&
           props.yield_strength > 0.0 && props.ultimate_strength >= props.yield_strength;
}

[[nodiscard]] constexpr auto catalog_is_valid() noexcept -> bool
{
    for (const auto &props : kCatalog)
    {
        if (!is_valid(props))
        {
            return false;
        }
    }
    return true;
}

static_assert(catalog_is_valid(), "material catalog violates ultimate >= yield > 0, E > 0, A > 0");

/**
 * @brief compute rayleigh damping coefficients from a (xi, w1, w2) fit
 *
 * ✨ PURE FUNCTION ✨
 *
 * picks alpha/beta so the damping ratio equals @p xi at both angular
 * frequencies @p w1 and @p w2.
 *
 * @param xi target damping ratio
 * @param w1 lower angular frequency [rad/s]
 * @param w2 upper angular frequency [rad/s]
 * @return (alpha, beta) pair
 */
[[nodiscard]] constexpr auto compute_rayleigh(double xi, double w1, double w2) noexcept -> RayleighCoefficients
{
    const double denom = w1 + w2;
    const double alpha = 2.0 * xi * w1 * w2 / denom;
    const double beta  = 2.0 * xi / denom;
    return RayleighCoefficients{alpha, beta};
}

} // namespace tfx::physics::materials
