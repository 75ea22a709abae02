#ifndef FATIGUE_CHECK_CALIBRATOR_H
#define FATIGUE_CHECK_CALIBRATOR_H

#include <functional>
#include <opencv2/core.hpp>
#include "config.h"
#include "capture_source.h"
#include "landmark_provider.h"

namespace FatigueCheck
{
    struct CalibrationProfile
    {
        double spf = 0.0; // seconds per frame
        double blink_frame_limit = 0.0;
        double drowsy_frame_limit = 0.0;
        int frames_used = 0;
        int frames_missed = 0;

        double framesFor(double seconds) const { return seconds / spf; }
    };

    /**
     * Accumulates detection latency over the first N frames with a face and
     * turns the blink and drowsy time constants into frame-count limits.
     * Frames without a face are counted against a miss budget only.
     */
    class Calibrator
    {
    private:
        int target_frames_;
        double blink_time_;
        double drowsy_time_;
        int max_misses_;
        double total_latency_ = 0.0;
        int valid_frames_ = 0;
        int missed_frames_ = 0;

    public:
        Calibrator(int target_frames, double blink_time_seconds, double drowsy_time_seconds,
                   int max_misses);
        explicit Calibrator(const Config &config);

        // Returns true once the target frame count is reached
        bool addFrame(double latency_seconds);

        // Throws CalibrationFailed when the miss budget is exhausted
        void addMiss();

        bool isComplete() const { return valid_frames_ >= target_frames_; }
        int validFrames() const { return valid_frames_; }
        int missedFrames() const { return missed_frames_; }
        int targetFrames() const { return target_frames_; }

        CalibrationProfile profile() const;
    };

    // Called after every calibration frame; returning false aborts calibration
    using CalibrationObserver = std::function<bool(const cv::Mat &frame, bool face_found,
                                                   const Calibrator &calibrator)>;

    /**
     * @brief Runs the startup calibration against live frames.
     * @throws CalibrationFailed on miss budget, timeout, abort, end of
     *         stream or exhausted capture retries
     */
    CalibrationProfile runCalibration(const Config &config, FrameReader &reader,
                                      LandmarkProvider &provider,
                                      const CalibrationObserver &observer = {});
}

#endif // FATIGUE_CHECK_CALIBRATOR_H
