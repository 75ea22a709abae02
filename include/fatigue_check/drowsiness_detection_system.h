#ifndef FATIGUE_CHECK_DROWSINESS_DETECTION_SYSTEM_H
#define FATIGUE_CHECK_DROWSINESS_DETECTION_SYSTEM_H

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <opencv2/opencv.hpp>
#include "alarm_dispatcher.h"
#include "audio_player.h"
#include "calibrator.h"
#include "capture_source.h"
#include "config.h"
#include "drowsiness_monitor.h"
#include "landmark_provider.h"
#include "session_tracker.h"

namespace FatigueCheck
{
    class DrowsinessDetectionSystem
    {
    private:
        Config config_;
        std::unique_ptr<CaptureSource> capture_;
        std::unique_ptr<LandmarkProvider> detector_;
        std::unique_ptr<AudioPlayer> audio_player_;
        std::unique_ptr<AlarmDispatcher> alarm_;
        std::unique_ptr<DrowsinessMonitor> monitor_;
        std::optional<CalibrationProfile> profile_;
        std::atomic<bool> stop_requested_{false};
        bool initialized_ = false;
        bool face_visible_ = true;
        SessionSummary last_summary_;
        std::string failure_reason_;

    public:
        explicit DrowsinessDetectionSystem(const Config &config);

        // Components left null are replaced by the camera, dlib and PortAudio defaults
        DrowsinessDetectionSystem(const Config &config,
                                  std::unique_ptr<CaptureSource> capture,
                                  std::unique_ptr<LandmarkProvider> detector,
                                  std::unique_ptr<AudioPlayer> audio_player);
        ~DrowsinessDetectionSystem();

        bool initialize();

        // Calibrates, then monitors until quit, end of stream or a fatal error
        int run();

        // Safe to call from a signal handler
        void requestStop() { stop_requested_ = true; }

        const SessionSummary &lastSummary() const { return last_summary_; }
        const std::string &failureReason() const { return failure_reason_; }
        const std::optional<CalibrationProfile> &calibrationProfile() const { return profile_; }
        const DrowsinessMonitor *monitor() const { return monitor_.get(); }

    private:
        bool calibrationObserver(const cv::Mat &frame, bool face_found, const Calibrator &calibrator);
        void processFrame(cv::Mat &frame);
        void logFrameEvents(const FrameResult &result, const cv::Mat &frame);
        bool handleKey(int key);
        void drawNoFaceDetected(cv::Mat &frame, const std::string &hint);
        void drawVisualization(cv::Mat &frame, const LandmarkSet &landmarks, const FrameResult &result);
        void finishSession();
        void cleanup();
    };
}

#endif // FATIGUE_CHECK_DROWSINESS_DETECTION_SYSTEM_H
