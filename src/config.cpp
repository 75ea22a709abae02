#include "fatigue_check/config.h"
#include "fatigue_check/errors.h"
#include <fstream>
#include <nlohmann/json.hpp>

namespace FatigueCheck
{
    void Config::validate() const
    {
        if (ear_threshold <= 0.0)
            throw ConfigError("ear_threshold must be positive");
        if (blink_time_seconds <= 0.0 || drowsy_time_seconds <= 0.0)
            throw ConfigError("blink_time_seconds and drowsy_time_seconds must be positive");
        if (blink_time_seconds >= drowsy_time_seconds)
            throw ConfigError("blink_time_seconds must be shorter than drowsy_time_seconds");
        if (alert_repeat_seconds < 0.0)
            throw ConfigError("alert_repeat_seconds must not be negative");
        if (calibration_frames <= 0)
            throw ConfigError("calibration_frames must be positive");
        if (calibration_max_misses < 0)
            throw ConfigError("calibration_max_misses must not be negative");
        if (calibration_timeout_seconds <= 0.0)
            throw ConfigError("calibration_timeout_seconds must be positive");
        if (capture_retry_limit <= 0)
            throw ConfigError("capture_retry_limit must be positive");
        if (resize_height <= 0)
            throw ConfigError("resize_height must be positive");
        if (face_downsample_ratio < 1.0)
            throw ConfigError("face_downsample_ratio must be at least 1.0");
        if (alarm_sound_path.empty())
            throw ConfigError("alarm_sound_path must not be empty");
    }

    Config loadConfig(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw ConfigError("cannot open config file " + path);

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ConfigError(path + ": " + e.what());
        }
        if (!j.is_object())
            throw ConfigError(path + ": top level must be an object");

        Config config;
        try
        {
            config.ear_threshold = j.value("ear_threshold", config.ear_threshold);
            config.blink_time_seconds = j.value("blink_time_seconds", config.blink_time_seconds);
            config.drowsy_time_seconds = j.value("drowsy_time_seconds", config.drowsy_time_seconds);
            config.alert_repeat_seconds = j.value("alert_repeat_seconds", config.alert_repeat_seconds);

            config.calibration_frames = j.value("calibration_frames", config.calibration_frames);
            config.calibration_max_misses = j.value("calibration_max_misses", config.calibration_max_misses);
            config.calibration_timeout_seconds = j.value("calibration_timeout_seconds", config.calibration_timeout_seconds);

            config.camera_index = j.value("camera_index", config.camera_index);
            config.video_path = j.value("video_path", config.video_path);
            config.capture_retry_limit = j.value("capture_retry_limit", config.capture_retry_limit);
            config.resize_height = j.value("resize_height", config.resize_height);
            config.face_downsample_ratio = j.value("face_downsample_ratio", config.face_downsample_ratio);

            config.max_session_samples = j.value("max_session_samples", config.max_session_samples);

            config.alarm_sound_path = j.value("alarm_sound_path", config.alarm_sound_path);
            config.alarm_repeat = j.value("alarm_repeat", config.alarm_repeat);

            config.enable_console_logging = j.value("enable_console_logging", config.enable_console_logging);
            config.enable_file_logging = j.value("enable_file_logging", config.enable_file_logging);
            config.enable_file_logging_json = j.value("enable_file_logging_json", config.enable_file_logging_json);
            config.save_snapshots = j.value("save_snapshots", config.save_snapshots);

            config.snapshot_path = j.value("snapshot_path", config.snapshot_path);
            config.log_path = j.value("log_path", config.log_path);
            config.log_filename = j.value("log_filename", config.log_filename);
            config.summary_filename = j.value("summary_filename", config.summary_filename);
            config.model_path = j.value("model_path", config.model_path);

            config.zmq_endpoint = j.value("zmq_endpoint", config.zmq_endpoint);
            config.enable_publishing = j.value("enable_publishing", config.enable_publishing);

            config.show_window = j.value("show_window", config.show_window);
            config.show_debug_info = j.value("show_debug_info", config.show_debug_info);
        }
        catch (const nlohmann::json::type_error &e)
        {
            throw ConfigError(path + ": " + e.what());
        }

        config.validate();
        return config;
    }
}
