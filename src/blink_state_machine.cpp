#include "fatigue_check/blink_state_machine.h"
#include "fatigue_check/constants.h"
#include "fatigue_check/errors.h"

namespace FatigueCheck
{
    BlinkStateMachine::BlinkStateMachine(double blink_frame_limit, double drowsy_frame_limit,
                                         double alert_repeat_frames)
        : blink_frame_limit_(blink_frame_limit),
          drowsy_frame_limit_(drowsy_frame_limit),
          alert_repeat_frames_(alert_repeat_frames)
    {
        if (blink_frame_limit_ <= 0.0 || drowsy_frame_limit_ <= blink_frame_limit_)
            throw ConfigError("frame limits must satisfy 0 < blink limit < drowsy limit");
        if (alert_repeat_frames_ < 0.0)
            throw ConfigError("alert repeat interval must not be negative");
    }

    // Limits come from time / spf and may sit a rounding error above an integer
    BlinkPhase BlinkStateMachine::phaseFor(int closed_frames) const
    {
        if (closed_frames + Constants::EPSILON >= drowsy_frame_limit_)
            return BlinkPhase::DROWSY;
        if (closed_frames + Constants::EPSILON >= blink_frame_limit_)
            return BlinkPhase::BLINK_WINDOW;
        return BlinkPhase::AWAKE;
    }

    FrameDecision BlinkStateMachine::update(EyeStatus eye_status)
    {
        FrameDecision decision;

        if (eye_status == EyeStatus::OPEN)
        {
            // Any closure that reached the blink window counts as one blink
            if (state_.phase != BlinkPhase::AWAKE)
            {
                state_.blink_count++;
                decision.blink_completed = true;
            }
            if (state_.drowsy)
            {
                state_.drowsy = false;
                decision.drowsy_cleared = true;
            }
            state_.closed_frames = 0;
            state_.phase = BlinkPhase::AWAKE;
            frames_since_alert_ = 0;
        }
        else
        {
            state_.closed_frames++;
            state_.phase = phaseFor(state_.closed_frames);

            if (state_.phase == BlinkPhase::DROWSY)
            {
                if (!state_.drowsy)
                {
                    state_.drowsy = true;
                    decision.drowsy_entered = true;
                    decision.alert = true;
                    frames_since_alert_ = 0;
                }
                else if (alert_repeat_frames_ > 0.0 &&
                         ++frames_since_alert_ + Constants::EPSILON >= alert_repeat_frames_)
                {
                    decision.alert = true;
                    frames_since_alert_ = 0;
                }
            }
        }

        decision.phase = state_.phase;
        decision.blink_count = state_.blink_count;
        decision.drowsy = state_.drowsy;
        return decision;
    }

    void BlinkStateMachine::reset()
    {
        state_.closed_frames = 0;
        state_.phase = BlinkPhase::AWAKE;
        state_.drowsy = false;
        frames_since_alert_ = 0;
    }

    void BlinkStateMachine::resetBlinkCount()
    {
        state_.blink_count = 0;
    }

    const char *BlinkStateMachine::phaseToString(BlinkPhase phase)
    {
        switch (phase)
        {
        case BlinkPhase::AWAKE:
            return "AWAKE";
        case BlinkPhase::BLINK_WINDOW:
            return "BLINK_WINDOW";
        case BlinkPhase::DROWSY:
            return "DROWSY";
        default:
            return "UNKNOWN";
        }
    }
}
