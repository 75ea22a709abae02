#include <gtest/gtest.h>
#include "fatigue_check/blink_state_machine.h"
#include "fatigue_check/errors.h"

using namespace FatigueCheck;

namespace
{
    FrameDecision feed(BlinkStateMachine &machine, EyeStatus status, int frames)
    {
        FrameDecision last;
        for (int i = 0; i < frames; ++i)
            last = machine.update(status);
        return last;
    }
}

TEST(BlinkStateMachineTest, OpenEyesNeverChangeState)
{
    BlinkStateMachine machine(3, 20);

    for (int i = 0; i < 500; ++i)
    {
        FrameDecision decision = machine.update(EyeStatus::OPEN);
        EXPECT_EQ(decision.phase, BlinkPhase::AWAKE);
        EXPECT_FALSE(decision.drowsy);
        EXPECT_FALSE(decision.alert);
    }
    EXPECT_EQ(machine.blinkCount(), 0);
    EXPECT_EQ(machine.closedFrames(), 0);
}

TEST(BlinkStateMachineTest, ClosureReachingBlinkLimitCountsOneBlink)
{
    BlinkStateMachine machine(3, 20);

    FrameDecision closed = feed(machine, EyeStatus::CLOSED, 3);
    EXPECT_EQ(closed.phase, BlinkPhase::BLINK_WINDOW);

    FrameDecision opened = machine.update(EyeStatus::OPEN);
    EXPECT_TRUE(opened.blink_completed);
    EXPECT_EQ(opened.blink_count, 1);
    EXPECT_EQ(opened.phase, BlinkPhase::AWAKE);
    EXPECT_EQ(machine.closedFrames(), 0);
}

TEST(BlinkStateMachineTest, ClosureShortOfBlinkLimitIsNotABlink)
{
    BlinkStateMachine machine(3, 20);

    FrameDecision closed = feed(machine, EyeStatus::CLOSED, 2);
    EXPECT_EQ(closed.phase, BlinkPhase::AWAKE);

    FrameDecision opened = machine.update(EyeStatus::OPEN);
    EXPECT_FALSE(opened.blink_completed);
    EXPECT_EQ(machine.blinkCount(), 0);
}

TEST(BlinkStateMachineTest, FractionalLimitsCompareWithGreaterOrEqual)
{
    BlinkStateMachine machine(2.5, 10.2);

    EXPECT_EQ(feed(machine, EyeStatus::CLOSED, 2).phase, BlinkPhase::AWAKE);
    EXPECT_EQ(machine.update(EyeStatus::CLOSED).phase, BlinkPhase::BLINK_WINDOW);
    EXPECT_EQ(feed(machine, EyeStatus::CLOSED, 7).phase, BlinkPhase::BLINK_WINDOW);
    EXPECT_EQ(machine.update(EyeStatus::CLOSED).phase, BlinkPhase::DROWSY);
}

TEST(BlinkStateMachineTest, LimitsJustAboveAnIntegerAreReachedOnThatFrame)
{
    // What 0.15 s and 1.5 s become after calibrating at a measured 0.05 s per frame
    BlinkStateMachine machine(3.0000000000000058, 30.000000000000057);

    EXPECT_EQ(feed(machine, EyeStatus::CLOSED, 3).phase, BlinkPhase::BLINK_WINDOW);
    EXPECT_EQ(feed(machine, EyeStatus::CLOSED, 27).phase, BlinkPhase::DROWSY);
    EXPECT_EQ(machine.update(EyeStatus::OPEN).blink_count, 1);
}

TEST(BlinkStateMachineTest, DrowsyFlagSetOnceAndHeldUntilEyesOpen)
{
    BlinkStateMachine machine(3, 20);
    int drowsy_entries = 0;
    int alerts = 0;

    for (int frame = 1; frame <= 25; ++frame)
    {
        FrameDecision decision = machine.update(EyeStatus::CLOSED);
        drowsy_entries += decision.drowsy_entered ? 1 : 0;
        alerts += decision.alert ? 1 : 0;
        EXPECT_EQ(decision.drowsy, frame >= 20) << "frame " << frame;
        if (frame >= 20)
            EXPECT_EQ(decision.phase, BlinkPhase::DROWSY);
    }
    EXPECT_EQ(drowsy_entries, 1);
    EXPECT_EQ(alerts, 1);

    FrameDecision opened = machine.update(EyeStatus::OPEN);
    EXPECT_FALSE(opened.drowsy);
    EXPECT_TRUE(opened.drowsy_cleared);
    EXPECT_TRUE(opened.blink_completed);
    EXPECT_EQ(opened.blink_count, 1);
    EXPECT_EQ(opened.phase, BlinkPhase::AWAKE);
}

TEST(BlinkStateMachineTest, AlertRepeatsAtConfiguredInterval)
{
    BlinkStateMachine machine(3, 20, 10);
    int alerts = 0;

    // entry at frame 20, repeats at 30 and 40
    for (int frame = 1; frame <= 45; ++frame)
        alerts += machine.update(EyeStatus::CLOSED).alert ? 1 : 0;

    EXPECT_EQ(alerts, 3);
}

TEST(BlinkStateMachineTest, ResetKeepsBlinkTotal)
{
    BlinkStateMachine machine(3, 20);
    feed(machine, EyeStatus::CLOSED, 4);
    machine.update(EyeStatus::OPEN);
    feed(machine, EyeStatus::CLOSED, 22);
    ASSERT_TRUE(machine.isDrowsy());

    machine.reset();

    EXPECT_FALSE(machine.isDrowsy());
    EXPECT_EQ(machine.phase(), BlinkPhase::AWAKE);
    EXPECT_EQ(machine.closedFrames(), 0);
    EXPECT_EQ(machine.blinkCount(), 1);

    machine.resetBlinkCount();
    EXPECT_EQ(machine.blinkCount(), 0);
}

TEST(BlinkStateMachineTest, EyesStillClosedAfterResetStartNewEpisode)
{
    BlinkStateMachine machine(3, 20);
    feed(machine, EyeStatus::CLOSED, 20);
    machine.reset();

    FrameDecision decision = feed(machine, EyeStatus::CLOSED, 19);
    EXPECT_FALSE(decision.drowsy);
    decision = machine.update(EyeStatus::CLOSED);
    EXPECT_TRUE(decision.drowsy_entered);
}

TEST(BlinkStateMachineTest, RejectsInconsistentLimits)
{
    EXPECT_THROW(BlinkStateMachine(0, 20), ConfigError);
    EXPECT_THROW(BlinkStateMachine(20, 3), ConfigError);
    EXPECT_THROW(BlinkStateMachine(3, 20, -1), ConfigError);
}
