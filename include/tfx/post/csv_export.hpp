/**
 * @file csv_export.hpp
 * @brief CSV writers for the per-element table and recorded time histories uwu
 *
 * two export forms:
 *
 * - element table: one row per live element (arena order) with
 *   `ID,Material,Yielded,Broken,Stress_Pa,Strain,Force_N,Length_m,Mass_kg,Density,Modulus_Pa,Area_m2,Yield_Pa,Ultimate_Pa`
 * - recording: `Time_s` plus one `E<id>` stress column per recorded element, or a
 *   single `Displacement_m` column for impulse recordings; row i sits at (i + 1) * interval
 *
 * element IDs in both files are arena slot indices, so `E3` and table row `3`
 * name the same member even after elements were removed mid-recording.
 *
 * formatting is split from file I/O so tests can pin the exact text.
 *
 * @author TrussFlex contributors
 * @date 2026-10-13
 * @version 0.1
 *
 * @note CSV text is plain std::ostream output, precision 9, no locale games
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "tfx/model/structure.hpp"
#include "tfx/post/recorder.hpp"

namespace tfx::post
{

struct ExportError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief render the element table
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto format_element_table(const model::Structure &structure) -> std::string;

/**
 * @brief render a finished recording
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto format_recording(const Recording &recording) -> std::string;

/**
 * @brief write the element table to @p path (parent directories created)
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 */
[[nodiscard]] auto write_element_table(const std::filesystem::path &path, const model::Structure &structure)
    -> std::expected<void, ExportError>;

/**
 * @brief write a finished recording to @p path (parent directories created)
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 */
[[nodiscard]] auto write_recording(const std::filesystem::path &path, const Recording &recording)
    -> std::expected<void, ExportError>;

} // namespace tfx::post
