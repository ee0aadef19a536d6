#include <gtest/gtest.h>

#include "engine/core/Time.hpp"

using engine::core::Time;

namespace
{
int RunSteps(Time& time)
{
    int steps = 0;
    while (time.ShouldRunFixedStep())
    {
        time.ConsumeFixedStep();
        ++steps;
    }
    return steps;
}
} // namespace

TEST(Time, FirstFrameHasNoDelta)
{
    Time time(1.0 / 60.0);
    time.BeginFrame(5.0);
    EXPECT_DOUBLE_EQ(time.DeltaSeconds(), 0.0);
    EXPECT_EQ(RunSteps(time), 0);
    EXPECT_EQ(time.SimulationMilliseconds(), 0);
}

TEST(Time, AccumulatesWholeFixedSteps)
{
    Time time(1.0 / 60.0);
    time.BeginFrame(0.0);
    time.BeginFrame(0.04);
    EXPECT_EQ(RunSteps(time), 2);
    EXPECT_EQ(time.FixedStepIndex(), 2U);
    EXPECT_EQ(time.SimulationMilliseconds(), 33);

    time.BeginFrame(0.06);
    EXPECT_EQ(RunSteps(time), 1);
    EXPECT_EQ(time.SimulationMilliseconds(), 50);
}

TEST(Time, ClampsLongFrames)
{
    Time time(1.0 / 60.0);
    time.BeginFrame(0.0);
    time.BeginFrame(10.0);
    EXPECT_DOUBLE_EQ(time.DeltaSeconds(), 0.25);
    EXPECT_LE(RunSteps(time), 15);
}

TEST(Time, FixedDeltaIsClamped)
{
    Time time;
    time.SetFixedDeltaSeconds(1.0);
    EXPECT_DOUBLE_EQ(time.FixedDeltaSeconds(), 1.0 / 15.0);
    time.SetFixedDeltaSeconds(0.0);
    EXPECT_DOUBLE_EQ(time.FixedDeltaSeconds(), 1.0 / 240.0);
}

TEST(Time, ReportsWaitUntilNextTick)
{
    Time time(0.02);
    time.BeginFrame(1.0);
    EXPECT_NEAR(time.SecondsUntilNextTick(1.005), 0.015, 1e-9);
    EXPECT_DOUBLE_EQ(time.SecondsUntilNextTick(1.5), 0.0);
}
