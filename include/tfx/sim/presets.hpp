/**
 * @file presets.hpp
 * @brief hard-coded fixture structures: Warren truss, arch, simple beam uwu
 *
 * each preset clears the structure and rebuilds a fixed layout from constants,
 * deterministically, so tests and the headless driver always see the same
 * arena order. geometry is in metres with +y pointing down, decks at y = 0 and
 * superstructure at negative y.
 *
 * Warren and arch carry their own weight: under default settings they settle
 * into a damped oscillation with nothing broken. the simple beam is the failure
 * demo. a collinear pin-jointed deck has no bending stiffness, so it can only
 * carry gravity by sagging, and the drop from rest stretches the ROAD segments
 * past ultimate within the first second. the members break and the free nodes
 * fall away.
 *
 * @author TrussFlex contributors
 * @date 2026-10-14
 * @version 0.1
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "tfx/common/error.hpp"
#include "tfx/model/structure.hpp"

namespace tfx::sim
{

enum class Preset : std::uint8_t
{
    WarrenTruss = 0U,
    Arch        = 1U,
    SimpleBeam  = 2U
};

inline constexpr std::size_t kPresetCount = 3U;

/**
 * @brief config-facing name of a preset ("warren", "arch", "simple_beam")
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto preset_name(Preset preset) noexcept -> std::string_view
{
    switch (preset)
    {
    case Preset::WarrenTruss:
        return "warren";
    case Preset::Arch:
        return "arch";
    case Preset::SimpleBeam:
        return "simple_beam";
    }
    return "unknown";
}

/**
 * @brief map a preset index (0, 1, 2) to the enum
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto preset_from_index(std::size_t index) noexcept -> std::optional<Preset>
{
    if (index >= kPresetCount)
    {
        return std::nullopt;
    }
    return static_cast<Preset>(index);
}

/**
 * @brief map a preset name to the enum
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto parse_preset(std::string_view text) noexcept -> std::optional<Preset>
{
    for (std::size_t i = 0; i < kPresetCount; ++i)
    {
        if (preset_name(static_cast<Preset>(i)) == text)
        {
            return static_cast<Preset>(i);
        }
    }
    return std::nullopt;
}

/**
 * @brief clear @p structure and build @p preset into it
 *
 * ⚠️ IMPURE FUNCTION (rewrites the whole structure)
 *
 * @return Status; the fixed geometry never produces degenerate members, so an
 *         error here means the constants were edited into something invalid
 */
auto build_preset(model::Structure &structure, Preset preset) -> Status;

} // namespace tfx::sim
