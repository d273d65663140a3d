/**
 * @file impulse_controller_test.cpp
 * @brief free-vibration scenario: node selection, preconditions, damping hand-off uwu
 */

#include <cmath>
#include <cstddef>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <utility>

#include "tfx/common/error.hpp"
#include "tfx/model/structure.hpp"
#include "tfx/sim/impulse_test.hpp"
#include "tfx/sim/presets.hpp"
#include "tfx/sim/session.hpp"

using ::testing::ElementsAre;
using ::testing::SizeIs;

namespace
{

constexpr double kEpsilon = 1.0e-12;

[[nodiscard]] auto make_session(std::size_t preset) -> tfx::sim::Session
{
    auto session = tfx::sim::Session::create(tfx::physics::IntegratorSettings{});
    if (!session || !session->load_preset(preset))
    {
        throw std::runtime_error("expected a default session with a preset");
    }
    return std::move(*session);
}

} // namespace

/**
 * @test Warren: supports at x = 0 and 20, the top node at x = 10 is dead centre
 */
TEST(ImpulseSelection, PicksMidSpanNodeOnWarren)
{
    tfx::model::Structure structure{};
    ASSERT_TRUE(tfx::sim::build_preset(structure, tfx::sim::Preset::WarrenTruss).has_value());
    const auto selected = tfx::sim::select_impulse_node(structure);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, structure.node_ids()[8]);
}

/**
 * @test simple beam: x = 4 and x = 6 tie around the midpoint, first in arena order wins
 */
TEST(ImpulseSelection, TiesGoToFirstInArenaOrder)
{
    tfx::model::Structure structure{};
    ASSERT_TRUE(tfx::sim::build_preset(structure, tfx::sim::Preset::SimpleBeam).has_value());
    const auto selected = tfx::sim::select_impulse_node(structure);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, structure.node_ids()[2]);
}

/**
 * @test without supports the extremes of every node define the span
 */
TEST(ImpulseSelection, FallsBackToAllNodesWithoutSupports)
{
    tfx::model::Structure structure{};
    const auto            left   = structure.add_node({0.0, 0.0});
    const auto            centre = structure.add_node({5.0, 0.0});
    const auto            right  = structure.add_node({9.0, 0.0});
    ASSERT_TRUE(structure.add_element(left, centre, tfx::physics::materials::MaterialKind::Wood).has_value());
    ASSERT_TRUE(structure.add_element(centre, right, tfx::physics::materials::MaterialKind::Wood).has_value());

    const auto selected = tfx::sim::select_impulse_node(structure);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, centre);
}

/**
 * @test nothing free with mass means nothing to kick
 */
TEST(ImpulseSelection, RejectsStructuresWithoutFreeMass)
{
    tfx::model::Structure structure{};
    EXPECT_EQ(tfx::sim::select_impulse_node(structure).error().code, tfx::ErrorCode::InvalidOperationState);

    const auto a = structure.add_node({0.0, 0.0}, true);
    const auto b = structure.add_node({2.0, 0.0}, true);
    static_cast<void>(structure.add_node({1.0, -1.0}));
    ASSERT_TRUE(structure.add_element(a, b, tfx::physics::materials::MaterialKind::Steel).has_value());
    EXPECT_EQ(tfx::sim::select_impulse_node(structure).error().code, tfx::ErrorCode::InvalidOperationState);
}

/**
 * @test kicking a running simulation is refused and nothing changes
 */
TEST(ImpulseTest, RejectedWhileRunning)
{
    auto session = make_session(0U);
    session.set_simulation_running(true);
    const auto report = session.run_impulse_test(1.0e4, 1.0);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, tfx::ErrorCode::InvalidOperationState);
    EXPECT_FALSE(session.recorder().is_recording());
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.alpha, 0.5);
}

/**
 * @test non-positive impulse or duration are argument errors and leave the session stopped
 */
TEST(ImpulseTest, RejectsBadArguments)
{
    auto session = make_session(0U);
    EXPECT_EQ(session.run_impulse_test(0.0, 1.0).error().code, tfx::ErrorCode::InvalidArgument);
    EXPECT_EQ(session.run_impulse_test(std::nan(""), 1.0).error().code, tfx::ErrorCode::InvalidArgument);
    EXPECT_EQ(session.run_impulse_test(1.0e4, 0.0).error().code, tfx::ErrorCode::InvalidArgument);
    EXPECT_FALSE(session.running());
    EXPECT_FALSE(session.recorder().is_recording());
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.beta, 2.0e-4);
}

/**
 * @test the kick is J / m downward from rest, with damping off and a displacement recording running
 */
TEST(ImpulseTest, InjectsVelocityFromRestWithoutDamping)
{
    auto session = make_session(0U);
    session.set_simulation_running(true);
    for (int i = 0; i < 10; ++i)
    {
        static_cast<void>(session.tick());
    }
    session.set_simulation_running(false);

    const auto report = tfx::sim::run_impulse_test(session, 5.0e4, 0.5);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    const auto *node = *session.structure().node(report->node);
    EXPECT_NEAR(report->velocity[1], 5.0e4 / node->total_mass(), kEpsilon);
    EXPECT_THAT(node->velocity, ElementsAre(0.0, report->velocity[1]));
    EXPECT_EQ(node->position, node->original_position);

    EXPECT_TRUE(session.running());
    EXPECT_TRUE(session.recorder().is_recording());
    EXPECT_EQ(session.recorder().mode(), tfx::post::RecordingMode::NodeDisplacement);
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.alpha, 0.0);
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.beta, 0.0);
}

/**
 * @test the recording completes at one sample per tick, moves downward first, and damping comes back
 */
TEST(ImpulseTest, RecordingFinishesAndRestoresDamping)
{
    auto       session  = make_session(0U);
    const auto interval = session.integrator_settings().tick_duration();
    ASSERT_TRUE(session.run_impulse_test(5.0e4, 10.0 * interval).has_value());

    std::optional<tfx::post::Recording> finished;
    for (int i = 0; i < 10 && !finished; ++i)
    {
        finished = session.tick().finished;
    }
    ASSERT_TRUE(finished.has_value());
    EXPECT_THAT(finished->samples, SizeIs(10U));
    EXPECT_GT(finished->samples.front().front(), 0.0);
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.alpha, 0.5);
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.beta, 2.0e-4);
    EXPECT_TRUE(session.running());
}

/**
 * @test stopping mid-test discards the recording and still restores damping
 */
TEST(ImpulseTest, CancelRestoresDamping)
{
    auto session = make_session(2U);
    ASSERT_TRUE(session.run_impulse_test(1.0e4, 1.0).has_value());
    static_cast<void>(session.tick());
    session.set_simulation_running(false);

    EXPECT_FALSE(session.recorder().is_recording());
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.alpha, 0.5);
    EXPECT_DOUBLE_EQ(session.integrator_settings().rayleigh.beta, 2.0e-4);
}
