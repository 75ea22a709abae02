#ifndef FATIGUE_CHECK_LOGGER_H
#define FATIGUE_CHECK_LOGGER_H

#include <string>
#include <chrono>
#include <queue>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <fstream>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "message_publisher.h"
#include "session_tracker.h"

namespace FatigueCheck
{
    enum class MonitorEvent
    {
        CALIBRATED,
        BLINK,
        DROWSY,
        ALERT,
        AWAKE,
        NO_FACE,
        RESET,
        SESSION_END,
        ERROR
    };

    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        MonitorEvent event;
        std::string message;
        double ear_value;
        int blink_count;
        std::string image_filename;
        LogEntry(MonitorEvent e, const std::string &msg, double ear, int blinks, const std::string &img = "");
    };

    class Logger
    {
    private:
        // Static members for singleton
        static std::unique_ptr<Logger> instance_;
        static std::once_flag once_flag_;
        static std::mutex instance_mutex_;

        std::unique_ptr<MessagePublisher> message_publisher_;

        // Instance members
        std::queue<LogEntry> log_queue_;
        std::mutex queue_mutex_;
        std::mutex console_mutex_;
        std::thread worker_thread_;
        std::atomic<bool> should_stop_{false};
        std::atomic<bool> queue_enabled_{false};
        Config config_;
        std::atomic<bool> is_initialized_{false};

        // Private constructor - prevents direct instantiation
        Logger() : message_publisher_(nullptr) {}

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;
        Logger(Logger &&) = delete;
        Logger &operator=(Logger &&) = delete;

    public:
        static Logger &getInstance();

        // Setup configuration - must be called before using the logger
        void setupConfig(const Config &config);

        static void log(MonitorEvent event, const std::string &message,
                        double ear, int blink_count, const cv::Mat &frame = cv::Mat());

        // Appends the summary to the summary file and publishes it
        static void logSessionSummary(const SessionSummary &summary);

        static void shutdown();

        ~Logger();

        static std::string eventToString(MonitorEvent event);

    private:
        void shutdownImpl();
        void logImpl(MonitorEvent event, const std::string &message, double ear, int blink_count,
                     const cv::Mat &frame);
        void logSessionSummaryImpl(const SessionSummary &summary);

        void setupDirectories();
        std::string GetCurrentTimeStamp();
        std::string saveSnapshot(const cv::Mat &frame);
        void printToConsole(const LogEntry &entry);
        void processLogQueue();
        std::string LogEntryToJsonString(const LogEntry &entry);
        void writeToFile(std::ofstream &file, const LogEntry &entry);
        void publishMessage(const std::string &topic, const std::string &json_entry);
        std::string formatLogTimestamp(const std::chrono::system_clock::time_point &tp);
    };
}

#endif // FATIGUE_CHECK_LOGGER_H
