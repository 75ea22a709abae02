#ifndef FATIGUE_CHECK_BLINK_STATE_MACHINE_H
#define FATIGUE_CHECK_BLINK_STATE_MACHINE_H

#include "ear_calculator.h"

namespace FatigueCheck
{
    enum class BlinkPhase
    {
        AWAKE,        // closed frames in [0, blink limit)
        BLINK_WINDOW, // closed frames in [blink limit, drowsy limit)
        DROWSY        // closed frames >= drowsy limit
    };

    struct DetectorState
    {
        int closed_frames = 0;
        BlinkPhase phase = BlinkPhase::AWAKE;
        bool drowsy = false;
        int blink_count = 0;
    };

    // What one frame did to the detector
    struct FrameDecision
    {
        BlinkPhase phase = BlinkPhase::AWAKE;
        int blink_count = 0;
        bool drowsy = false;
        bool blink_completed = false;
        bool drowsy_entered = false;
        bool drowsy_cleared = false;
        bool alert = false;
    };

    class BlinkStateMachine
    {
    private:
        double blink_frame_limit_;
        double drowsy_frame_limit_;
        double alert_repeat_frames_;
        int frames_since_alert_ = 0;
        DetectorState state_;

        BlinkPhase phaseFor(int closed_frames) const;

    public:
        /**
         * Limits are real-valued frame counts and are reached when the
         * closed-frame counter is >= the limit. alert_repeat_frames of 0
         * raises a single alert per drowsy episode.
         */
        BlinkStateMachine(double blink_frame_limit, double drowsy_frame_limit,
                          double alert_repeat_frames = 0.0);

        // Frames without a face must not be passed here
        FrameDecision update(EyeStatus eye_status);

        // Back to AWAKE, blink total untouched
        void reset();
        void resetBlinkCount();

        const DetectorState &state() const { return state_; }
        BlinkPhase phase() const { return state_.phase; }
        bool isDrowsy() const { return state_.drowsy; }
        int blinkCount() const { return state_.blink_count; }
        int closedFrames() const { return state_.closed_frames; }
        double blinkFrameLimit() const { return blink_frame_limit_; }
        double drowsyFrameLimit() const { return drowsy_frame_limit_; }

        static const char *phaseToString(BlinkPhase phase);
    };
}

#endif // FATIGUE_CHECK_BLINK_STATE_MACHINE_H
