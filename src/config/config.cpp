/**
 * @file config.cpp
 * @brief implementation of the YAML run config loader with bougie validation uwu
 *
 * this translation unit backs config.hpp with the full YAML parsing pipeline.
 * it leans on yaml-cpp 0.7.0+, wraps everything in std::expected, and emits
 * error breadcrumbs so humans can fix typos without doom scrolling logs.
 */
#include "tfx/config/config.hpp"

#include <cmath>
#include <format>
#include <yaml-cpp/yaml.h>

#include "tfx/physics/materials.hpp"
#include "tfx/sim/presets.hpp"

namespace tfx::config
{
namespace
{

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> ConfigResult
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto is_positive(double value) noexcept -> bool
{
    return std::isfinite(value) && value > 0.0;
}

[[nodiscard]] auto node_to_vec2(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<std::array<double, 2>, ConfigError>
{
    if (!node || !node.IsSequence() || node.size() != 2U)
    {
        return std::unexpected(ConfigError{"expected sequence[2] for vector", std::move(ctx)});
    }
    std::array<double, 2> values{};
    for (std::size_t i = 0; i < 2; ++i)
    {
        try
        {
            values[i] = node[i].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            auto child_ctx = ctx;
            child_ctx.emplace_back(std::format("[{}]", i));
            return std::unexpected(ConfigError{ex.what(), std::move(child_ctx)});
        }
        if (!std::isfinite(values[i]))
        {
            auto child_ctx = ctx;
            child_ctx.emplace_back(std::format("[{}]", i));
            return std::unexpected(ConfigError{"vector components must be finite", std::move(child_ctx)});
        }
    }
    return values;
}

// preset accepts either a name ("warren") or an index (0..2)
[[nodiscard]] auto node_to_preset(const YAML::Node &node) -> std::expected<std::uint32_t, ConfigError>
{
    if (!node || !node.IsScalar())
    {
        return std::unexpected(ConfigError{"scenario.preset must be a scalar", {"scenario", "preset"}});
    }
    const auto text = node.as<std::string>();
    if (const auto named = sim::parse_preset(text))
    {
        return static_cast<std::uint32_t>(*named);
    }
    std::uint32_t index{};
    try
    {
        index = node.as<std::uint32_t>();
    }
    catch (const YAML::Exception &)
    {
        return std::unexpected(ConfigError{std::format("unknown preset '{}' (warren | arch | simple_beam | 0..{})",
                                                       text, sim::kPresetCount - 1U),
                                           {"scenario", "preset"}});
    }
    if (!sim::preset_from_index(index))
    {
        return std::unexpected(ConfigError{std::format("preset index must be < {}", sim::kPresetCount),
                                           {"scenario", "preset"}});
    }
    return index;
}

} // namespace

auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        return parse_config_node(node);
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(std::format("unable to open config file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_config_from_string(std::string_view yaml_text) -> ConfigResult
{
    try
    {
        const auto node = YAML::Load(std::string{yaml_text});
        return parse_config_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_config_node(const YAML::Node &root) -> ConfigResult
{
    if (!root || !root.IsMap())
    {
        return make_error("config root must be a mapping", {});
    }

    Config cfg{};

    // simulation
    const auto sim_node = root["simulation"];
    if (!sim_node || !sim_node.IsMap())
    {
        return make_error("missing 'simulation' section", {"simulation"});
    }
    std::int64_t sub_steps{};
    try
    {
        cfg.simulation.dt = sim_node["dt"].as<double>();
        sub_steps         = sim_node["sub_steps"].as<std::int64_t>();
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(ex.what(), {"simulation"});
    }
    if (!is_positive(cfg.simulation.dt))
    {
        return make_error("simulation.dt must be > 0", {"simulation", "dt"});
    }
    if (sub_steps < 1)
    {
        return make_error("simulation.sub_steps must be >= 1", {"simulation", "sub_steps"});
    }
    cfg.simulation.sub_steps = static_cast<std::uint32_t>(sub_steps);
    {
        auto gravity_result = node_to_vec2(sim_node["gravity"], {"simulation", "gravity"});
        if (!gravity_result)
        {
            return std::unexpected(gravity_result.error());
        }
        cfg.simulation.gravity = gravity_result.value();
    }

    // damping: explicit pair or a two-frequency fit, never both
    const auto damping_node = root["damping"];
    if (!damping_node || !damping_node.IsMap())
    {
        return make_error("missing 'damping' section", {"damping"});
    }
    const bool has_pair = damping_node["alpha"].IsDefined() || damping_node["beta"].IsDefined();
    const bool has_fit  = damping_node["xi"].IsDefined() || damping_node["w1"].IsDefined() ||
                         damping_node["w2"].IsDefined();
    if (has_pair == has_fit)
    {
        return make_error("damping needs either alpha/beta or xi/w1/w2, not both", {"damping"});
    }
    if (has_pair)
    {
        try
        {
            cfg.damping.alpha = damping_node["alpha"].as<double>();
            cfg.damping.beta  = damping_node["beta"].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), {"damping"});
        }
    }
    else
    {
        double xi{};
        double w1{};
        double w2{};
        try
        {
            xi = damping_node["xi"].as<double>();
            w1 = damping_node["w1"].as<double>();
            w2 = damping_node["w2"].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), {"damping"});
        }
        if (!std::isfinite(xi) || xi < 0.0)
        {
            return make_error("damping.xi must be >= 0", {"damping", "xi"});
        }
        if (!is_positive(w1) || !is_positive(w2))
        {
            return make_error("damping frequencies must be > 0", {"damping"});
        }
        const auto fit    = physics::materials::compute_rayleigh(xi, w1, w2);
        cfg.damping.alpha = fit.alpha;
        cfg.damping.beta  = fit.beta;
    }
    if (!std::isfinite(cfg.damping.alpha) || cfg.damping.alpha < 0.0)
    {
        return make_error("damping.alpha must be >= 0", {"damping", "alpha"});
    }
    if (!std::isfinite(cfg.damping.beta) || cfg.damping.beta < 0.0)
    {
        return make_error("damping.beta must be >= 0", {"damping", "beta"});
    }

    // scenario
    const auto scenario_node = root["scenario"];
    if (!scenario_node || !scenario_node.IsMap())
    {
        return make_error("missing 'scenario' section", {"scenario"});
    }
    {
        auto preset_result = node_to_preset(scenario_node["preset"]);
        if (!preset_result)
        {
            return std::unexpected(preset_result.error());
        }
        cfg.scenario.preset = preset_result.value();
    }
    const auto loads_node = scenario_node["loads"];
    if (loads_node && !loads_node.IsNull())
    {
        if (!loads_node.IsSequence())
        {
            return make_error("scenario.loads must be a sequence", {"scenario", "loads"});
        }
        cfg.scenario.loads.reserve(loads_node.size());
        for (std::size_t i = 0; i < loads_node.size(); ++i)
        {
            const auto entry = loads_node[i];
            if (!entry.IsMap())
            {
                return make_error("load entry must be a map", {"scenario", "loads", std::format("[{}]", i)});
            }
            LoadSpec load{};
            try
            {
                load.node = entry["node"].as<std::uint32_t>();
                load.mass = entry["mass"].as<double>();
            }
            catch (const YAML::Exception &ex)
            {
                return make_error(ex.what(), {"scenario", "loads", std::format("[{}]", i)});
            }
            if (!is_positive(load.mass))
            {
                return make_error("load.mass must be > 0", {"scenario", "loads", std::format("[{}]", i), "mass"});
            }
            cfg.scenario.loads.push_back(load);
        }
    }

    // run
    const auto run_node = root["run"];
    if (!run_node || !run_node.IsMap())
    {
        return make_error("missing 'run' section", {"run"});
    }
    std::int64_t ticks{};
    try
    {
        ticks = run_node["ticks"].as<std::int64_t>();
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(ex.what(), {"run", "ticks"});
    }
    if (ticks < 1)
    {
        return make_error("run.ticks must be >= 1", {"run", "ticks"});
    }
    cfg.run.ticks = static_cast<std::uint32_t>(ticks);

    // recorder (optional)
    const auto recorder_node = root["recorder"];
    if (recorder_node && !recorder_node.IsNull())
    {
        if (!recorder_node.IsMap())
        {
            return make_error("recorder must be a map", {"recorder"});
        }
        RecorderSettings recorder{};
        try
        {
            recorder.duration = recorder_node["duration"].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), {"recorder", "duration"});
        }
        if (!is_positive(recorder.duration))
        {
            return make_error("recorder.duration must be > 0", {"recorder", "duration"});
        }
        cfg.recorder = recorder;
    }

    // impulse (optional)
    const auto impulse_node = root["impulse"];
    if (impulse_node && !impulse_node.IsNull())
    {
        if (!impulse_node.IsMap())
        {
            return make_error("impulse must be a map", {"impulse"});
        }
        ImpulseSettings impulse{};
        try
        {
            impulse.magnitude = impulse_node["magnitude"].as<double>();
            impulse.duration  = impulse_node["duration"].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), {"impulse"});
        }
        if (!is_positive(impulse.magnitude))
        {
            return make_error("impulse.magnitude must be > 0", {"impulse", "magnitude"});
        }
        if (!is_positive(impulse.duration))
        {
            return make_error("impulse.duration must be > 0", {"impulse", "duration"});
        }
        cfg.impulse = impulse;
    }

    // output
    const auto output_node = root["output"];
    if (!output_node || !output_node.IsMap())
    {
        return make_error("missing output map", {"output"});
    }
    const auto directory_node = output_node["directory"];
    if (!directory_node || !directory_node.IsScalar())
    {
        return make_error("output.directory must be a scalar string", {"output", "directory"});
    }
    cfg.output.directory   = std::filesystem::path(directory_node.as<std::string>());
    cfg.output.element_csv = true;
    if (output_node["element_csv"].IsDefined())
    {
        try
        {
            cfg.output.element_csv = output_node["element_csv"].as<bool>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), {"output", "element_csv"});
        }
    }

    return cfg;
}

} // namespace tfx::config
