#ifndef FATIGUE_CHECK_DROWSINESS_MONITOR_H
#define FATIGUE_CHECK_DROWSINESS_MONITOR_H

#include <optional>
#include <string>
#include "alarm_dispatcher.h"
#include "blink_state_machine.h"
#include "calibrator.h"
#include "config.h"
#include "ear_calculator.h"
#include "session_tracker.h"

namespace FatigueCheck
{
    struct FrameResult
    {
        bool face_found = false;
        bool ear_valid = false; // false for no-face and degenerate frames
        double ear = 0.0;
        EyeStatus eye_status = EyeStatus::OPEN;
        FrameDecision decision;
        std::string hint;
    };

    /**
     * One monitoring run: detector state, session record and alarm control.
     * Frames must be fed in capture order from a single thread.
     */
    class DrowsinessMonitor
    {
    private:
        Config config_;
        CalibrationProfile profile_;
        BlinkStateMachine state_machine_;
        SessionTracker session_;
        AlarmDispatcher &alarm_;

    public:
        DrowsinessMonitor(const Config &config, const CalibrationProfile &profile, AlarmDispatcher &alarm);
        ~DrowsinessMonitor();

        DrowsinessMonitor(const DrowsinessMonitor &) = delete;
        DrowsinessMonitor &operator=(const DrowsinessMonitor &) = delete;

        void startSession();
        FrameResult processFrame(const std::optional<LandmarkSet> &landmarks);

        // Manual reset: detector back to AWAKE and alarm stopped
        void reset();
        void resetBlinkCount();

        // Stops the alarm and closes the session; zero summary if none is active
        SessionSummary endSession();

        const BlinkStateMachine &stateMachine() const { return state_machine_; }
        const SessionTracker &session() const { return session_; }
        const CalibrationProfile &profile() const { return profile_; }
    };
}

#endif // FATIGUE_CHECK_DROWSINESS_MONITOR_H
