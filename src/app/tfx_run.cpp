/**
 * @file tfx_run.cpp
 * @brief headless driver: YAML scenario in, CSV files out uwu
 *
 * usage: `tfx_run <scenario.yaml>`
 *
 * the driver loads and validates the config, builds the requested preset,
 * hangs the configured loads on it, and ticks the session `run.ticks` times
 * (recording element stresses when a `recorder` section is present). if an
 * `impulse` section is present, a free-vibration test follows on the same
 * structure and runs until its recording finishes. everything lands in
 * `output.directory`:
 *
 * - stress_history.csv (recorder section)
 * - impulse_response.csv (impulse section)
 * - elements.csv (unless output.element_csv is false)
 *
 * @note targets the usual GCC 15.2 + C++26 toolchain per repo defaults
 */

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "tfx/common/error.hpp"
#include "tfx/common/log.hpp"
#include "tfx/config/config.hpp"
#include "tfx/post/csv_export.hpp"
#include "tfx/post/recorder.hpp"
#include "tfx/sim/impulse_test.hpp"
#include "tfx/sim/session.hpp"

namespace
{

constexpr std::string_view kAppLogTag = "[tfx::app]";

[[nodiscard]] auto join_context(const std::vector<std::string> &context) -> std::string
{
    std::string joined;
    for (const auto &item : context)
    {
        if (!joined.empty())
        {
            joined += '.';
        }
        joined += item;
    }
    return joined.empty() ? std::string{"<root>"} : joined;
}

void report(std::string_view what, const tfx::CoreError &err)
{
    tfx::log::error(kAppLogTag, "{} failed ({}): {} at {}", what, tfx::to_string(err.code), err.message,
                    join_context(err.context));
}

/**
 * @brief hang the configured masses on preset nodes (ordinal = arena order)
 *
 * ⚠️ IMPURE FUNCTION (mutates the session structure)
 */
[[nodiscard]] auto apply_loads(tfx::sim::Session &session, const std::vector<tfx::config::LoadSpec> &loads) -> bool
{
    const auto nodes = session.structure().node_ids();
    for (const auto &load : loads)
    {
        if (load.node >= nodes.size())
        {
            tfx::log::error(kAppLogTag, "load on node {} but preset has only {} nodes", load.node, nodes.size());
            return false;
        }
        if (auto added = session.add_load(nodes[load.node], load.mass); !added)
        {
            report("add_load", added.error());
            return false;
        }
    }
    return true;
}

[[nodiscard]] auto export_recording(const std::filesystem::path &path, const tfx::post::Recording &recording) -> bool
{
    if (auto written = tfx::post::write_recording(path, recording); !written)
    {
        tfx::log::error(kAppLogTag, "export error: {} at {}", written.error().message,
                        join_context(written.error().context));
        return false;
    }
    tfx::log::info(kAppLogTag, "wrote {} ({} samples)", path.string(), recording.samples.size());
    return true;
}

/**
 * @brief tick until the in-flight impulse recording completes
 */
[[nodiscard]] auto drain_impulse(tfx::sim::Session &session, const std::filesystem::path &directory) -> bool
{
    const auto    interval = session.integrator_settings().tick_duration();
    const auto    progress = session.recorder_progress();
    const auto    budget   = static_cast<std::uint64_t>(std::ceil(progress.duration / interval)) + 1U;
    std::uint64_t ticks    = 0U;
    while (ticks < budget)
    {
        auto tick = session.tick();
        ++ticks;
        if (tick.finished)
        {
            return export_recording(directory / "impulse_response.csv", *tick.finished);
        }
    }
    tfx::log::error(kAppLogTag, "impulse recording did not finish within {} ticks", budget);
    return false;
}

} // namespace

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        tfx::log::error(kAppLogTag, "usage: {} <scenario.yaml>", argc > 0 ? argv[0] : "tfx_run");
        return EXIT_FAILURE;
    }

    const auto config_result = tfx::config::load_config_from_file(argv[1]);
    if (!config_result)
    {
        tfx::log::error(kAppLogTag, "config error: {} at {}", config_result.error().message,
                        join_context(config_result.error().context));
        return EXIT_FAILURE;
    }
    const auto &config = config_result.value();

    auto session_result = tfx::sim::Session::create(tfx::sim::integrator_settings(config));
    if (!session_result)
    {
        report("session", session_result.error());
        return EXIT_FAILURE;
    }
    auto &session = session_result.value();

    if (auto built = session.load_preset(config.scenario.preset); !built)
    {
        report("load_preset", built.error());
        return EXIT_FAILURE;
    }
    if (!apply_loads(session, config.scenario.loads))
    {
        return EXIT_FAILURE;
    }

    const auto &directory = config.output.directory;
    session.set_simulation_running(true);
    if (config.recorder)
    {
        if (auto started = session.start_recording(config.recorder->duration); !started)
        {
            report("start_recording", started.error());
            return EXIT_FAILURE;
        }
    }

    tfx::log::info(kAppLogTag, "running {} ticks ({:.3f} s simulated)", config.run.ticks,
                   config.run.ticks * session.integrator_settings().tick_duration());
    bool ok = true;
    for (std::uint32_t i = 0; i < config.run.ticks; ++i)
    {
        auto tick = session.tick();
        if (tick.finished)
        {
            ok = export_recording(directory / "stress_history.csv", *tick.finished) && ok;
        }
    }
    if (session.recorder().is_recording())
    {
        const auto progress = session.recorder_progress();
        tfx::log::info(kAppLogTag, "run ended with recording at {:.3f}/{:.3f} s, discarding it", progress.elapsed,
                       progress.duration);
    }
    session.set_simulation_running(false);

    const auto counts = session.structure().failure_counts();
    tfx::log::info(kAppLogTag, "after {:.3f} s: {} yielded, {} broken of {} elements", session.simulated_time(),
                   counts.yielded, counts.broken, session.structure().element_count());

    if (config.output.element_csv)
    {
        const auto path = directory / "elements.csv";
        if (auto written = tfx::post::write_element_table(path, session.structure()); !written)
        {
            tfx::log::error(kAppLogTag, "export error: {} at {}", written.error().message,
                            join_context(written.error().context));
            ok = false;
        }
        else
        {
            tfx::log::info(kAppLogTag, "wrote {}", path.string());
        }
    }

    if (config.impulse)
    {
        const auto impulse = session.run_impulse_test(config.impulse->magnitude, config.impulse->duration);
        if (!impulse)
        {
            report("impulse test", impulse.error());
            return EXIT_FAILURE;
        }
        tfx::log::info(kAppLogTag, "impulse of {:.1f} N s on {} -> {:.4f} m/s", config.impulse->magnitude,
                       tfx::common::describe("node", impulse->node), impulse->velocity[1]);
        ok = drain_impulse(session, directory) && ok;
        session.set_simulation_running(false);
    }

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
