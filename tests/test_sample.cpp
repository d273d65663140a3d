#include <array>
#include <cmath>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

#include "tfx/common/arena.hpp"
#include "tfx/common/math.hpp"

using testing::DoubleNear;
using testing::ElementsAre;
using testing::ElementsAreArray;

namespace
{

constexpr double kEps = 1.0e-12;

struct SlotTag
{
};

using SlotStore = tfx::common::SlotArena<std::string, SlotTag>;

[[nodiscard]] auto make_sample_vectors() -> std::vector<tfx::common::Vec2>
{
    return {tfx::common::Vec2{0.0, 0.0},  tfx::common::Vec2{1.0, 0.0},   tfx::common::Vec2{0.0, 1.0},
            tfx::common::Vec2{1.0, 1.0},  tfx::common::Vec2{-1.0, -1.0}, tfx::common::Vec2{2.5, -3.0},
            tfx::common::Vec2{-4.0, 2.0}, tfx::common::Vec2{1.0e-3, 7.0}};
}

} // namespace

/**
 * @test verifies dot product symmetry for a chunky dataset of vectors
 */
TEST(CommonMathDot, SymmetryForAllPairs)
{
    const auto vectors = make_sample_vectors();
    for (const auto &lhs : vectors)
    {
        for (const auto &rhs : vectors)
        {
            EXPECT_DOUBLE_EQ(tfx::common::dot(lhs, rhs), tfx::common::dot(rhs, lhs))
                << "dot product symmetry broke for pair";
        }
    }
}

/**
 * @test add/subtract/scale compose componentwise and are usable in constant expressions
 */
TEST(CommonMathArithmetic, ComponentwiseAndConstexpr)
{
    constexpr tfx::common::Vec2 a{1.5, -2.0};
    constexpr tfx::common::Vec2 b{0.5, 4.0};
    static_assert(tfx::common::dot(a, b) == 0.75 - 8.0);

    EXPECT_THAT(tfx::common::add(a, b), ElementsAre(2.0, 2.0));
    EXPECT_THAT(tfx::common::subtract(a, b), ElementsAre(1.0, -6.0));
    EXPECT_THAT(tfx::common::scale(a, -2.0), ElementsAre(-3.0, 4.0));
}

/**
 * @test distance is the 3-4-5 triangle and symmetric
 */
TEST(CommonMathDistance, PythagoreanTriple)
{
    const tfx::common::Vec2 origin{0.0, 0.0};
    const tfx::common::Vec2 corner{3.0, -4.0};
    EXPECT_NEAR(tfx::common::distance(origin, corner), 5.0, kEps);
    EXPECT_NEAR(tfx::common::distance(corner, origin), 5.0, kEps);
}

/**
 * @test safe_normalize yields unit vectors and maps tiny vectors to zero
 */
TEST(CommonMathNormalize, UnitLengthOrZero)
{
    for (const auto &vector : make_sample_vectors())
    {
        const auto normalized = tfx::common::safe_normalize(vector);
        if (tfx::common::magnitude(vector) == 0.0)
        {
            EXPECT_THAT(normalized, ElementsAre(0.0, 0.0));
            continue;
        }
        EXPECT_THAT(tfx::common::magnitude(normalized), DoubleNear(1.0, kEps));
    }
    EXPECT_THAT(tfx::common::safe_normalize({1.0e-14, 0.0}), ElementsAre(0.0, 0.0));
}

/**
 * @test is_finite trips on NaN and infinity in either component
 */
TEST(CommonMathFinite, RejectsNanAndInfinity)
{
    constexpr double kNan = std::numeric_limits<double>::quiet_NaN();
    constexpr double kInf = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(tfx::common::is_finite({1.0, -2.0}));
    EXPECT_FALSE(tfx::common::is_finite({kNan, 0.0}));
    EXPECT_FALSE(tfx::common::is_finite({0.0, kInf}));
}

/**
 * @test erased handles go stale even after their slot is reused
 */
TEST(SlotArena, StaleHandleAfterReuse)
{
    SlotStore arena;
    const auto first = arena.insert("first");
    ASSERT_TRUE(arena.erase(first));
    EXPECT_FALSE(arena.erase(first));

    const auto second = arena.insert("second");
    EXPECT_EQ(second.index, first.index);
    EXPECT_NE(second.generation, first.generation);
    EXPECT_FALSE(arena.contains(first));
    EXPECT_EQ(arena.get(first), nullptr);
    ASSERT_NE(arena.get(second), nullptr);
    EXPECT_EQ(*arena.get(second), "second");
}

/**
 * @test for_each and handles() walk live entries in slot order, skipping holes
 */
TEST(SlotArena, IterationSkipsHolesInSlotOrder)
{
    SlotStore arena;
    const auto a = arena.insert("a");
    const auto b = arena.insert("b");
    const auto c = arena.insert("c");
    ASSERT_TRUE(arena.erase(b));

    std::vector<std::string> seen;
    arena.for_each([&seen](SlotStore::HandleType, const std::string &value) { seen.push_back(value); });
    EXPECT_THAT(seen, ElementsAre("a", "c"));
    EXPECT_THAT(arena.handles(), ElementsAre(a, c));
    EXPECT_EQ(arena.size(), 2U);
    EXPECT_EQ(arena.capacity(), 3U);
}

/**
 * @test clear() invalidates every outstanding handle and restarts at slot 0
 */
TEST(SlotArena, ClearInvalidatesOutstandingHandles)
{
    SlotStore arena;
    const auto a = arena.insert("a");
    const auto b = arena.insert("b");
    arena.clear();

    EXPECT_TRUE(arena.empty());
    EXPECT_FALSE(arena.contains(a));
    EXPECT_FALSE(arena.contains(b));

    const auto fresh = arena.insert("fresh");
    EXPECT_EQ(fresh.index, 0U);
    EXPECT_NE(fresh, a);
    EXPECT_EQ(tfx::common::describe("slot", fresh), "slot[0:1]");
}
