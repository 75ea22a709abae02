#include "fatigue_check/drowsiness_monitor.h"
#include "fatigue_check/constants.h"
#include "fatigue_check/errors.h"

namespace FatigueCheck
{
    namespace
    {
        const char *NO_FACE_HINT = "Unable to detect face, please check proper lighting or field of view";
    }

    DrowsinessMonitor::DrowsinessMonitor(const Config &config, const CalibrationProfile &profile,
                                         AlarmDispatcher &alarm)
        : config_(config),
          profile_(profile),
          state_machine_(profile.blink_frame_limit, profile.drowsy_frame_limit,
                         config.alert_repeat_seconds > 0.0 ? profile.framesFor(config.alert_repeat_seconds) : 0.0),
          session_(config.max_session_samples),
          alarm_(alarm)
    {
    }

    DrowsinessMonitor::~DrowsinessMonitor()
    {
        alarm_.stop();
    }

    void DrowsinessMonitor::startSession()
    {
        session_.start();
        state_machine_.reset();
        state_machine_.resetBlinkCount();
    }

    FrameResult DrowsinessMonitor::processFrame(const std::optional<LandmarkSet> &landmarks)
    {
        FrameResult result;
        result.decision.phase = state_machine_.phase();
        result.decision.blink_count = state_machine_.blinkCount();
        result.decision.drowsy = state_machine_.isDrowsy();

        if (!landmarks)
        {
            result.hint = NO_FACE_HINT;
            return result;
        }
        result.face_found = true;

        try
        {
            result.ear = EarCalculator::averageEyeAspectRatio(*landmarks, LandmarkIndices::LEFT_EYE,
                                                              LandmarkIndices::RIGHT_EYE);
        }
        catch (const DegenerateEyeGeometry &e)
        {
            result.hint = e.what();
            return result;
        }
        result.ear_valid = true;

        if (session_.isActive())
            session_.recordSample(result.ear);

        result.eye_status = EarCalculator::classifyEye(result.ear, config_.ear_threshold);
        result.decision = state_machine_.update(result.eye_status);

        if (result.decision.alert && session_.isActive())
            session_.recordAlert();
        // No-op while the previous alarm is still sounding
        if (result.decision.alert)
            alarm_.trigger();
        if (result.decision.drowsy_cleared)
            alarm_.stop();

        return result;
    }

    void DrowsinessMonitor::reset()
    {
        state_machine_.reset();
        alarm_.stop();
    }

    void DrowsinessMonitor::resetBlinkCount()
    {
        state_machine_.resetBlinkCount();
    }

    SessionSummary DrowsinessMonitor::endSession()
    {
        alarm_.stop();
        return session_.end(state_machine_.blinkCount());
    }
}
