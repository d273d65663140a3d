/**
 * @file config.hpp
 * @brief YAML-powered run config loader that absolutely slaps uwu
 *
 * this header defines the configuration model for the headless truss driver.
 * it parses YAML documents into strongly typed C++ structs, validates them
 * aggressively, and bubbles up ergonomic errors via std::expected. nothing here
 * touches the simulation core; the session turns a Config into integrator
 * settings and a preset once validation passes.
 *
 * schema (required sections unless marked optional):
 * - simulation: dt, sub_steps, gravity [gx, gy]
 * - damping: either {alpha, beta} or a Rayleigh fit {xi, w1, w2}
 * - scenario: preset (name or index), optional loads [{node, mass}]
 * - run: ticks
 * - recorder (optional): duration
 * - impulse (optional): magnitude, duration
 * - output: directory, optional element_csv flag
 *
 * @author TrussFlex contributors
 * @date 2026-10-09
 * @version 0.1
 *
 * @note requires GCC 15.2+ with -std=c++2c for std::expected
 * @note yaml-cpp 0.7.0+ powers parsing
 *
 * example (basic usage):
 * @code
 * auto config_result = tfx::config::load_config_from_file("scenarios/warren.yaml");
 * if (!config_result) {
 *     std::println(stderr, "config error: {}", config_result.error().message);
 *     return EXIT_FAILURE;
 * }
 * const auto& config = *config_result;
 * @endcode
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace YAML
{
class Node;
} // namespace YAML

namespace tfx::config
{

/**
 * @brief config error payload with context breadcrumbs for days
 *
 * the loader never throws; context strings form a breadcrumb trail (e.g.
 * "scenario", "loads", "[1]", "mass") so YAML typos are painless to find.
 */
struct ConfigError
{
    std::string              message; ///< human-readable error message
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

/**
 * @brief fixed time step integration knobs
 */
struct SimulationSettings
{
    double                dt;        ///< step size [s], > 0
    std::uint32_t         sub_steps; ///< steps per tick, >= 1
    std::array<double, 2> gravity;   ///< [m/s^2], +y is down
};

/**
 * @brief resolved Rayleigh coefficients (a YAML xi/w1/w2 fit is converted on load)
 */
struct Damping
{
    double alpha; ///< mass-proportional [1/s], >= 0
    double beta;  ///< stiffness-proportional [s], >= 0
};

/**
 * @brief point load hung on a preset node (index in preset arena order)
 */
struct LoadSpec
{
    std::uint32_t node; ///< node ordinal within the preset
    double        mass; ///< [kg], > 0
};

/**
 * @brief which fixture to build and what to hang on it
 */
struct ScenarioSettings
{
    std::uint32_t         preset; ///< 0 warren, 1 arch, 2 simple_beam
    std::vector<LoadSpec> loads;  ///< optional extra masses
};

struct RunSettings
{
    std::uint32_t ticks; ///< externally driven ticks to simulate, >= 1
};

struct RecorderSettings
{
    double duration; ///< stress recording length [s], > 0
};

struct ImpulseSettings
{
    double magnitude; ///< impulse J [N s], > 0
    double duration;  ///< free-vibration recording length [s], > 0
};

struct OutputSettings
{
    std::filesystem::path directory;   ///< where CSVs land
    bool                  element_csv; ///< write the element table at the end of the run
};

/**
 * @brief main configuration object bundling all run inputs
 */
struct Config
{
    SimulationSettings              simulation;
    Damping                         damping;
    ScenarioSettings                scenario;
    RunSettings                     run;
    std::optional<RecorderSettings> recorder; ///< absent = no stress recording
    std::optional<ImpulseSettings>  impulse;  ///< absent = no impulse test
    OutputSettings                  output;
};

using ConfigResult = std::expected<Config, ConfigError>;

/**
 * @brief parses YAML config from a file path with aggressive validation
 *
 * ⚠️ IMPURE FUNCTION (has side effects)
 *
 * - hits the file system to read YAML
 * - yaml-cpp exceptions are caught and mapped into ConfigError
 *
 * @param[in] path filesystem location of YAML document
 * @return ConfigResult containing parsed Config or detailed ConfigError
 */
[[nodiscard]] auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult;

/**
 * @brief parses YAML config directly from a string buffer (test-friendly)
 *
 * @param[in] yaml_text YAML document contents (UTF-8)
 * @return ConfigResult identical semantics to file loader
 */
[[nodiscard]] auto load_config_from_string(std::string_view yaml_text) -> ConfigResult;

/**
 * @brief low-level parser for already-loaded YAML nodes
 *
 * @param[in] root YAML root node produced by yaml-cpp
 * @return ConfigResult success or ConfigError with breadcrumbs
 */
[[nodiscard]] auto parse_config_node(const YAML::Node &root) -> ConfigResult;

} // namespace tfx::config
