#ifndef FATIGUE_CHECK_CONFIG_H
#define FATIGUE_CHECK_CONFIG_H

#include <cstddef>
#include <string>
#include <opencv2/opencv.hpp>

namespace FatigueCheck
{

    struct Config
    {
        // Detection thresholds
        double ear_threshold = 0.27;
        double blink_time_seconds = 0.15;
        double drowsy_time_seconds = 1.5;
        double alert_repeat_seconds = 0.0; // 0 = one alert per drowsy episode

        // Calibration
        int calibration_frames = 100;
        int calibration_max_misses = 1000;
        double calibration_timeout_seconds = 60.0;

        // Capture
        int camera_index = 0;
        std::string video_path;
        int capture_retry_limit = 30;
        int resize_height = 460;
        double face_downsample_ratio = 1.5;

        // Session
        std::size_t max_session_samples = 0; // 0 = keep every sample

        // Alarm
        std::string alarm_sound_path = "alarm.wav";
        bool alarm_repeat = false;

        // logging options
        bool enable_console_logging = false;
        bool enable_file_logging = true;
        bool enable_file_logging_json = true;
        bool save_snapshots = false;

        // Paths
        std::string snapshot_path = "snapshots/";
        std::string log_path = "logs/";
        std::string log_filename = "fatigue_log.jsonl";
        std::string summary_filename = "sessions.jsonl";
        std::string model_path = "models/shape_predictor_68_face_landmarks.dat";

        // Zero Mq Configurations
        std::string zmq_endpoint = "tcp://*:5555";
        bool enable_publishing = false;

        // Display settings
        bool show_window = true;
        bool show_debug_info = true;
        cv::Scalar alert_color = cv::Scalar(0, 255, 0);
        cv::Scalar warning_color = cv::Scalar(0, 165, 255);
        cv::Scalar danger_color = cv::Scalar(0, 0, 255);

        // Throws ConfigError on the first inconsistent value
        void validate() const;
    };

    // Defaults overridden by the keys present in a JSON file
    Config loadConfig(const std::string &path);
}

#endif // FATIGUE_CHECK_CONFIG_H
