/**
 * @file recorder_test.cpp
 * @brief recorder state machine: start rules, completion, cancel, NaN columns uwu
 */

#include <cmath>
#include <cstddef>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <optional>
#include <vector>

#include "tfx/common/error.hpp"
#include "tfx/model/structure.hpp"
#include "tfx/post/recorder.hpp"
#include "tfx/sim/presets.hpp"

using ::testing::Each;
using ::testing::SizeIs;

namespace
{

constexpr double kEpsilon = 1.0e-12;

[[nodiscard]] auto stress_request(double duration, double interval) -> tfx::post::RecordingRequest
{
    tfx::post::RecordingRequest request{};
    request.mode     = tfx::post::RecordingMode::StressVector;
    request.duration = duration;
    request.interval = interval;
    return request;
}

class RecorderFixture : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tfx::sim::build_preset(structure_, tfx::sim::Preset::SimpleBeam).has_value());
    }

    tfx::model::Structure structure_{};
    tfx::post::Recorder   recorder_{};
};

} // namespace

/**
 * @test recording a stopped simulation is refused and the recorder stays idle
 */
TEST_F(RecorderFixture, StartWhileStoppedIsRejected)
{
    const auto started = recorder_.start(stress_request(1.0, 0.1), structure_, false);
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, tfx::ErrorCode::InvalidOperationState);
    EXPECT_EQ(recorder_.state(), tfx::post::RecorderState::Idle);
    EXPECT_FALSE(recorder_.sample(structure_).has_value());
}

/**
 * @test a second start while recording is refused without disturbing the first
 */
TEST_F(RecorderFixture, StartWhileRecordingIsRejected)
{
    ASSERT_TRUE(recorder_.start(stress_request(1.0, 0.1), structure_, true).has_value());
    static_cast<void>(recorder_.sample(structure_));

    const auto again = recorder_.start(stress_request(2.0, 0.1), structure_, true);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, tfx::ErrorCode::InvalidOperationState);
    EXPECT_TRUE(recorder_.is_recording());
    EXPECT_EQ(recorder_.sample_count(), 1U);
    EXPECT_DOUBLE_EQ(recorder_.progress().duration, 1.0);
}

/**
 * @test non-positive or non-finite duration/interval are argument errors
 */
TEST_F(RecorderFixture, RejectsBadDurationAndInterval)
{
    EXPECT_EQ(recorder_.start(stress_request(0.0, 0.1), structure_, true).error().code,
              tfx::ErrorCode::InvalidArgument);
    EXPECT_EQ(recorder_.start(stress_request(std::nan(""), 0.1), structure_, true).error().code,
              tfx::ErrorCode::InvalidArgument);
    EXPECT_EQ(recorder_.start(stress_request(1.0, -0.1), structure_, true).error().code,
              tfx::ErrorCode::InvalidArgument);
    EXPECT_FALSE(recorder_.is_recording());
}

/**
 * @test displacement mode needs a live node to track
 */
TEST_F(RecorderFixture, RejectsDeadTrackedNode)
{
    const auto doomed = structure_.add_node({50.0, 50.0});
    ASSERT_TRUE(structure_.remove_node(doomed).has_value());

    auto request         = stress_request(1.0, 0.1);
    request.mode         = tfx::post::RecordingMode::NodeDisplacement;
    request.tracked_node = doomed;
    const auto started   = recorder_.start(request, structure_, true);
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, tfx::ErrorCode::InvalidReference);
    EXPECT_FALSE(recorder_.is_recording());
}

/**
 * @test 1.0 s at 0.1 s per sample finishes on exactly the tenth sample
 */
TEST_F(RecorderFixture, FinishesWhenDurationIsReached)
{
    ASSERT_TRUE(recorder_.start(stress_request(1.0, 0.1), structure_, true).has_value());
    for (int i = 0; i < 9; ++i)
    {
        ASSERT_FALSE(recorder_.sample(structure_).has_value()) << "finished early at sample " << i;
    }
    EXPECT_NEAR(recorder_.progress().elapsed, 0.9, kEpsilon);

    const auto finished = recorder_.sample(structure_);
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->mode, tfx::post::RecordingMode::StressVector);
    EXPECT_THAT(finished->samples, SizeIs(10U));
    EXPECT_THAT(finished->columns, SizeIs(structure_.element_count()));
    EXPECT_THAT(finished->samples.front(), SizeIs(structure_.element_count()));
    EXPECT_THAT(finished->samples.front(), Each(0.0));
    EXPECT_NEAR(finished->time_at(0), 0.1, kEpsilon);
    EXPECT_NEAR(finished->time_at(9), 1.0, kEpsilon);
    EXPECT_EQ(recorder_.state(), tfx::post::RecorderState::Idle);
}

/**
 * @test a duration that is not a multiple of the interval rounds up to the next sample
 */
TEST_F(RecorderFixture, PartialIntervalRoundsUp)
{
    ASSERT_TRUE(recorder_.start(stress_request(0.25, 0.1), structure_, true).has_value());
    EXPECT_FALSE(recorder_.sample(structure_).has_value());
    EXPECT_FALSE(recorder_.sample(structure_).has_value());
    const auto finished = recorder_.sample(structure_);
    ASSERT_TRUE(finished.has_value());
    EXPECT_THAT(finished->samples, SizeIs(3U));
}

/**
 * @test cancel discards everything and is a no-op when idle
 */
TEST_F(RecorderFixture, CancelDiscardsSamples)
{
    ASSERT_TRUE(recorder_.start(stress_request(1.0, 0.1), structure_, true).has_value());
    static_cast<void>(recorder_.sample(structure_));
    static_cast<void>(recorder_.sample(structure_));

    EXPECT_TRUE(recorder_.cancel());
    EXPECT_EQ(recorder_.state(), tfx::post::RecorderState::Idle);
    EXPECT_EQ(recorder_.sample_count(), 0U);
    EXPECT_FALSE(recorder_.cancel());
    EXPECT_FALSE(recorder_.sample(structure_).has_value());
}

/**
 * @test elements removed mid-recording keep their column and sample as NaN
 */
TEST_F(RecorderFixture, RemovedElementSamplesAsNaN)
{
    ASSERT_TRUE(recorder_.start(stress_request(0.2, 0.1), structure_, true).has_value());
    static_cast<void>(recorder_.sample(structure_));

    const auto victim = structure_.element_ids().front();
    ASSERT_TRUE(structure_.remove_element(victim).has_value());
    const auto finished = recorder_.sample(structure_);
    ASSERT_TRUE(finished.has_value());
    ASSERT_EQ(finished->samples.size(), 2U);
    EXPECT_DOUBLE_EQ(finished->samples[0][0], 0.0);
    EXPECT_TRUE(std::isnan(finished->samples[1][0]));
    EXPECT_FALSE(std::isnan(finished->samples[1][1]));
}

/**
 * @test displacement mode samples the tracked node's vertical offset (+y is down)
 */
TEST_F(RecorderFixture, DisplacementModeTracksVerticalOffset)
{
    const auto tracked = structure_.node_ids()[2];

    auto request         = stress_request(0.1, 0.1);
    request.mode         = tfx::post::RecordingMode::NodeDisplacement;
    request.tracked_node = tracked;
    ASSERT_TRUE(recorder_.start(request, structure_, true).has_value());
    EXPECT_EQ(recorder_.mode(), tfx::post::RecordingMode::NodeDisplacement);

    structure_.nodes_for_step().get(tracked)->position[1] += 0.015;
    const auto finished = recorder_.sample(structure_);
    ASSERT_TRUE(finished.has_value());
    ASSERT_EQ(finished->samples.size(), 1U);
    ASSERT_EQ(finished->samples[0].size(), 1U);
    EXPECT_NEAR(finished->samples[0][0], 0.015, kEpsilon);
    EXPECT_EQ(finished->tracked_node, tracked);
    EXPECT_TRUE(finished->columns.empty());
}

/**
 * @test each row is stamped with the elapsed time at which it was sampled, never t = 0
 */
TEST_F(RecorderFixture, RowTimesMatchElapsedAtSampling)
{
    ASSERT_TRUE(recorder_.start(stress_request(0.3, 0.1), structure_, true).has_value());

    std::vector<double> elapsed_after_sample;
    std::optional<tfx::post::Recording> finished;
    while (!finished)
    {
        finished = recorder_.sample(structure_);
        elapsed_after_sample.push_back(finished ? 0.3 : recorder_.progress().elapsed);
    }

    ASSERT_EQ(finished->samples.size(), elapsed_after_sample.size());
    for (std::size_t row = 0; row < elapsed_after_sample.size(); ++row)
    {
        EXPECT_NEAR(finished->time_at(row), elapsed_after_sample[row], kEpsilon) << "row " << row;
    }
    EXPECT_GT(finished->time_at(0), 0.0);
}
