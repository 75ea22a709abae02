#include "fatigue_check/calibrator.h"
#include "fatigue_check/errors.h"
#include <chrono>
#include <iostream>
#include <string>

namespace FatigueCheck
{
    Calibrator::Calibrator(int target_frames, double blink_time_seconds, double drowsy_time_seconds,
                           int max_misses)
        : target_frames_(target_frames),
          blink_time_(blink_time_seconds),
          drowsy_time_(drowsy_time_seconds),
          max_misses_(max_misses)
    {
        if (target_frames_ <= 0)
            throw ConfigError("calibration needs at least one frame");
    }

    Calibrator::Calibrator(const Config &config)
        : Calibrator(config.calibration_frames, config.blink_time_seconds,
                     config.drowsy_time_seconds, config.calibration_max_misses)
    {
    }

    bool Calibrator::addFrame(double latency_seconds)
    {
        if (!isComplete())
        {
            total_latency_ += latency_seconds;
            valid_frames_++;
        }
        return isComplete();
    }

    void Calibrator::addMiss()
    {
        if (++missed_frames_ > max_misses_)
        {
            throw CalibrationFailed("no face found in " + std::to_string(missed_frames_) +
                                    " frames (" + std::to_string(valid_frames_) + "/" +
                                    std::to_string(target_frames_) + " collected)");
        }
    }

    CalibrationProfile Calibrator::profile() const
    {
        if (!isComplete())
        {
            throw CalibrationFailed("only " + std::to_string(valid_frames_) + " of " +
                                    std::to_string(target_frames_) + " frames collected");
        }
        if (total_latency_ <= 0.0)
            throw CalibrationFailed("measured zero processing time");

        CalibrationProfile profile;
        profile.spf = total_latency_ / target_frames_;
        profile.drowsy_frame_limit = drowsy_time_ / profile.spf;
        profile.blink_frame_limit = blink_time_ / profile.spf;
        profile.frames_used = valid_frames_;
        profile.frames_missed = missed_frames_;
        return profile;
    }

    CalibrationProfile runCalibration(const Config &config, FrameReader &reader,
                                      LandmarkProvider &provider,
                                      const CalibrationObserver &observer)
    {
        Calibrator calibrator(config);
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                  std::chrono::duration<double>(config.calibration_timeout_seconds));

        std::cout << "Calibration in progress (" << calibrator.targetFrames() << " frames)" << std::endl;

        cv::Mat frame;
        while (!calibrator.isComplete())
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                throw CalibrationFailed("timed out after " + std::to_string(config.calibration_timeout_seconds) +
                                        " s with " + std::to_string(calibrator.validFrames()) + " frames");
            }

            auto t0 = std::chrono::steady_clock::now();
            bool have_frame = false;
            try
            {
                have_frame = reader.next(frame);
            }
            catch (const CaptureFailure &e)
            {
                throw CalibrationFailed(e.what());
            }
            if (!have_frame)
                throw CalibrationFailed("capture source ended before calibration completed");

            std::optional<LandmarkSet> landmarks = provider.detect(frame);
            std::chrono::duration<double> latency = std::chrono::steady_clock::now() - t0;

            if (landmarks)
                calibrator.addFrame(latency.count());
            else
                calibrator.addMiss();

            if (observer && !observer(frame, landmarks.has_value(), calibrator))
                throw CalibrationFailed("calibration aborted");
        }

        CalibrationProfile profile = calibrator.profile();
        std::cout << "Calibration complete: SPF " << profile.spf * 1000.0 << " ms, blink limit "
                  << profile.blink_frame_limit << " frames, drowsy limit "
                  << profile.drowsy_frame_limit << " frames" << std::endl;
        return profile;
    }
}
