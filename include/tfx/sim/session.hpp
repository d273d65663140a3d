/**
 * @file session.hpp
 * @brief explicit simulation context: structure + integrator + recorder + run flag uwu
 *
 * the session is what an editor or a headless driver talks to. it owns every
 * piece of mutable simulation state, so there are no globals anywhere: create
 * one per scene, forward edits between ticks, and call tick() at a fixed rate.
 *
 * run-state rules:
 * - tick() does nothing while stopped
 * - stopping the simulation cancels an in-progress recording (samples are
 *   discarded) and restores damping the impulse test switched off
 * - clear() and load_preset() stop the simulation first
 *
 * example:
 * @code
 * auto session = tfx::sim::Session::create({});
 * if (!session || !session->load_preset(0)) {
 *     return EXIT_FAILURE;
 * }
 * session->set_simulation_running(true);
 * for (int i = 0; i < 600; ++i) {
 *     const auto report = session->tick();
 * }
 * @endcode
 *
 * @author TrussFlex contributors
 * @date 2026-10-16
 * @version 0.1
 *
 * @note targets C++26/GCC 15.2+; single-threaded by contract
 */
#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "tfx/common/error.hpp"
#include "tfx/common/math.hpp"
#include "tfx/config/config.hpp"
#include "tfx/model/structure.hpp"
#include "tfx/physics/integrator.hpp"
#include "tfx/physics/materials.hpp"
#include "tfx/post/recorder.hpp"
#include "tfx/sim/impulse_test.hpp"

namespace tfx::sim
{

/**
 * @brief what one tick did
 */
struct TickReport
{
    physics::StepReport            steps{};    ///< aggregated failure transitions
    std::optional<post::Recording> finished{}; ///< set on the tick a recording completed
};

/**
 * @brief convert validated config values into integrator settings
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto integrator_settings(const config::Config &config) -> physics::IntegratorSettings;

/**
 * @class Session
 * @brief single owner of the simulation state with the editor-facing operations
 */
class Session
{
public:
    /**
     * @brief validate @p settings and build an empty, stopped session
     */
    [[nodiscard]] static auto create(physics::IntegratorSettings settings) -> Result<Session>;

    // --- structure edits -----------------------------------------------------

    auto add_node(common::Vec2 position, bool fixed = false) -> model::NodeId;
    auto remove_node(model::NodeId node) -> Result<model::NodeRemoval>;
    auto toggle_fixed(model::NodeId node) -> Result<bool>;
    auto add_element(model::NodeId a, model::NodeId b, physics::materials::MaterialKind material)
        -> Result<model::ElementId>;
    auto remove_element(model::ElementId element) -> Status;
    auto add_load(model::NodeId node, double mass) -> Result<model::LoadId>;
    auto remove_load(model::LoadId load) -> Status;

    // --- run control ---------------------------------------------------------

    /**
     * @brief start or stop ticking; stopping cancels any recording
     */
    void set_simulation_running(bool running);

    /**
     * @brief structure back to rest (topology kept, run state untouched)
     */
    void reset() noexcept;

    /**
     * @brief stop and drop the whole structure
     */
    void clear();

    /**
     * @brief stop and rebuild the structure from preset @p index
     *
     * @return InvalidArgument for an index outside {0, 1, 2}
     */
    auto load_preset(std::size_t index) -> Status;

    /**
     * @brief record every element's stress for @p duration seconds, one sample per tick
     *
     * @return recorder errors (simulation stopped, already recording, bad duration)
     */
    auto start_recording(double duration) -> Status;

    /**
     * @brief scripted free-vibration test, see impulse_test.hpp
     */
    auto run_impulse_test(double magnitude, double duration) -> Result<ImpulseReport>;

    /**
     * @brief inject @p velocity into @p node from rest with damping off and record its sway
     *
     * the building block behind run_impulse_test(): resets the structure,
     * zeroes Rayleigh damping (remembered for restoration), sets the velocity,
     * starts a displacement recording and resumes the simulation. arguments
     * are validated before the reset; a later failure puts damping back.
     *
     * @return InvalidOperationState when already running, plus recorder/structure errors
     */
    auto begin_free_vibration(model::NodeId node, common::Vec2 velocity, double duration) -> Status;

    /**
     * @brief advance one tick (sub_steps integrator steps) and feed the recorder
     *
     * ⚠️ IMPURE FUNCTION (mutates the structure, may finish a recording)
     */
    auto tick() -> TickReport;

    // --- queries -------------------------------------------------------------

    [[nodiscard]] auto structure() const noexcept -> const model::Structure & { return structure_; }
    [[nodiscard]] auto running() const noexcept -> bool { return running_; }
    [[nodiscard]] auto integrator_settings() const noexcept -> const physics::IntegratorSettings &
    {
        return integrator_.settings();
    }
    [[nodiscard]] auto recorder() const noexcept -> const post::Recorder & { return recorder_; }
    [[nodiscard]] auto recorder_progress() const noexcept -> post::RecorderProgress { return recorder_.progress(); }

    /// simulated seconds since the last reset/clear/preset while running
    [[nodiscard]] auto simulated_time() const noexcept -> double { return simulated_time_; }

private:
    explicit Session(physics::Integrator integrator) noexcept : integrator_{std::move(integrator)} {}

    void restore_damping();

    model::Structure    structure_{};
    physics::Integrator integrator_;
    post::Recorder      recorder_{};
    bool                running_{false};
    double              simulated_time_{0.0};

    std::optional<physics::materials::RayleighCoefficients> saved_damping_{}; ///< set while an impulse test runs
};

} // namespace tfx::sim
