#include "fatigue_check/logger.h"
#include "fatigue_check/constants.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace FatigueCheck
{
    // Static member definitions
    std::unique_ptr<Logger> Logger::instance_ = nullptr;
    std::once_flag Logger::once_flag_;
    std::mutex Logger::instance_mutex_;

    LogEntry::LogEntry(MonitorEvent e, const std::string &msg, double ear, int blinks, const std::string &img)
        : timestamp(std::chrono::system_clock::now()), event(e), message(msg),
          ear_value(ear), blink_count(blinks), image_filename(img) {}

    Logger &Logger::getInstance()
    {
        std::call_once(once_flag_, []()
                       { instance_ = std::unique_ptr<Logger>(new Logger()); });
        return *instance_;
    }

    void Logger::setupConfig(const Config &config)
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);

        if (is_initialized_)
        {
            std::cerr << "Warning: Logger already initialized. Config changes ignored." << "\n";
            return;
        }

        config_ = config;
        should_stop_ = false;
        setupDirectories();

        if (config_.enable_publishing)
        {
            message_publisher_ = std::make_unique<MessagePublisher>();
            if (!message_publisher_->initialize(config_.zmq_endpoint))
            {
                std::cerr << "Logger: Failed to initialize ZeroMQ publisher, continuing without publishing" << "\n";
                message_publisher_.reset();
            }
        }

        if (config_.enable_file_logging || message_publisher_)
        {
            worker_thread_ = std::thread(&Logger::processLogQueue, this);
            queue_enabled_ = true;
        }

        is_initialized_ = true;
        std::cout << "Logger initialized successfully" << "\n";
    }

    void Logger::log(MonitorEvent event, const std::string &message, double ear, int blink_count,
                     const cv::Mat &frame)
    {
        Logger &logger = getInstance();
        if (!logger.is_initialized_)
        {
            std::cerr << "Error: Logger not initialized. Call setupConfig() first." << "\n";
            return;
        }

        logger.logImpl(event, message, ear, blink_count, frame);
    }

    void Logger::logSessionSummary(const SessionSummary &summary)
    {
        Logger &logger = getInstance();
        if (!logger.is_initialized_)
        {
            std::cerr << "Error: Logger not initialized. Call setupConfig() first." << "\n";
            return;
        }

        logger.logSessionSummaryImpl(summary);
    }

    void Logger::shutdown()
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (instance_ && instance_->is_initialized_)
        {
            instance_->shutdownImpl();
        }
    }

    Logger::~Logger()
    {
        if (is_initialized_)
        {
            shutdownImpl();
        }
    }

    std::string Logger::eventToString(MonitorEvent event)
    {
        switch (event)
        {
        case MonitorEvent::CALIBRATED:
            return "CALIBRATED";
        case MonitorEvent::BLINK:
            return "BLINK";
        case MonitorEvent::DROWSY:
            return "DROWSY";
        case MonitorEvent::ALERT:
            return "ALERT";
        case MonitorEvent::AWAKE:
            return "AWAKE";
        case MonitorEvent::NO_FACE:
            return "NO_FACE";
        case MonitorEvent::RESET:
            return "RESET";
        case MonitorEvent::SESSION_END:
            return "SESSION_END";
        case MonitorEvent::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }

    void Logger::shutdownImpl()
    {
        queue_enabled_ = false;
        should_stop_ = true;
        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
        is_initialized_ = false;

        if (message_publisher_)
        {
            message_publisher_->shutdown();
            message_publisher_.reset();
        }

        std::cout << "Logger shutdown complete" << "\n";
    }

    void Logger::logImpl(MonitorEvent event, const std::string &message, double ear, int blink_count,
                         const cv::Mat &frame)
    {
        std::string image_filename;
        if (config_.save_snapshots && !frame.empty() && event == MonitorEvent::DROWSY)
        {
            image_filename = saveSnapshot(frame);
        }

        LogEntry entry(event, message, ear, blink_count, image_filename);

        if (config_.enable_console_logging || event == MonitorEvent::ERROR)
            printToConsole(entry);

        if (queue_enabled_)
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(entry);

            // Prevent queue from growing too large
            while (log_queue_.size() > Constants::MAX_LOG_ENTRIES)
            {
                log_queue_.pop();
            }
        }
    }

    void Logger::logSessionSummaryImpl(const SessionSummary &summary)
    {
        std::string json = summaryToJsonString(summary);

        if (config_.enable_file_logging)
        {
            std::ofstream file(config_.log_path + config_.summary_filename, std::ios::app);
            if (file.is_open())
                file << json << "\n";
            else
                std::cerr << "Logger: Cannot write session summary to "
                          << config_.log_path + config_.summary_filename << std::endl;
        }

        publishMessage(Topics::SUMMARY, json);
        logImpl(MonitorEvent::SESSION_END, "Session ended", summary.average_ear, summary.blink_count, cv::Mat());
    }

    void Logger::setupDirectories()
    {
        std::error_code ec;
        if (config_.save_snapshots && !std::filesystem::exists(config_.snapshot_path))
        {
            std::filesystem::create_directories(config_.snapshot_path, ec);
        }
        if (config_.enable_file_logging && !std::filesystem::exists(config_.log_path))
        {
            std::filesystem::create_directories(config_.log_path, ec);
        }
        if (ec)
            std::cerr << "Logger: Cannot create log directories: " << ec.message() << "\n";
    }

    std::string Logger::GetCurrentTimeStamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::stringstream ss;

        ss << std::put_time(std::localtime(&time_t), "%b%d_%Y_%Hh%Mm%Ss");
        ss << "_" << std::setw(3) << std::setfill('0') << ms.count();
        return ss.str();
    }

    std::string Logger::saveSnapshot(const cv::Mat &frame)
    {
        std::string filename = config_.snapshot_path + "drowsy_detected_" + GetCurrentTimeStamp() + ".jpg";
        try
        {
            if (cv::imwrite(filename, frame))
                return filename;
        }
        catch (const cv::Exception &e)
        {
            std::cerr << "Logger: " << e.what() << std::endl;
        }
        std::cerr << "Logger: Error saving image " << filename << std::endl;
        return "";
    }

    void Logger::printToConsole(const LogEntry &entry)
    {
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::ostream &out = entry.event == MonitorEvent::ERROR ? std::cerr : std::cout;
        out << this->formatLogTimestamp(entry.timestamp)
            << " | " << eventToString(entry.event)
            << " | EAR: " << std::fixed << std::setprecision(3) << entry.ear_value
            << " | Blinks: " << entry.blink_count
            << " | " << entry.message << "\n";
    }

    void Logger::processLogQueue()
    {
        std::ofstream log_file;
        if (config_.enable_file_logging)
        {
            log_file.open(config_.log_path + config_.log_filename, std::ios::app);
            if (!log_file.is_open())
                std::cerr << "Logger: Cannot open " << config_.log_path + config_.log_filename << std::endl;
        }

        while (true)
        {
            bool stopping = should_stop_;
            std::queue<LogEntry> temp_queue;

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                temp_queue.swap(log_queue_);
            }

            while (!temp_queue.empty())
            {
                const auto &entry = temp_queue.front();
                writeToFile(log_file, entry);
                publishMessage(Topics::EVENT, LogEntryToJsonString(entry));
                temp_queue.pop();
            }

            log_file.flush();
            if (stopping)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    void Logger::publishMessage(const std::string &topic, const std::string &json_entry)
    {
        if (message_publisher_ && message_publisher_->isReady())
        {
            message_publisher_->publish(topic, json_entry);
        }
    }

    std::string Logger::formatLogTimestamp(const std::chrono::system_clock::time_point &tp)
    {
        std::time_t time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%dT%H:%M:%S")
           << "." << std::setw(3) << std::setfill('0') << ms.count();
        return ss.str();
    }

    std::string Logger::LogEntryToJsonString(const LogEntry &entry)
    {
        nlohmann::json log_json;
        log_json["timestamp"] = this->formatLogTimestamp(entry.timestamp);
        log_json["event"] = eventToString(entry.event);
        log_json["ear"] = entry.ear_value;
        log_json["blink_count"] = entry.blink_count;
        log_json["message"] = entry.message;
        if (!entry.image_filename.empty())
            log_json["image"] = entry.image_filename;

        return log_json.dump();
    }

    void Logger::writeToFile(std::ofstream &file, const LogEntry &entry)
    {
        if (!file.is_open())
            return;
        if (config_.enable_file_logging_json)
        {
            file << LogEntryToJsonString(entry) << "\n";
        }
        else
        {
            // Plain text log entry
            file << this->formatLogTimestamp(entry.timestamp)
                 << " | Event: " << eventToString(entry.event)
                 << " | EAR: " << entry.ear_value
                 << " | Blinks: " << entry.blink_count
                 << " | Message: " << entry.message;

            if (!entry.image_filename.empty())
                file << " | Image: " << entry.image_filename;

            file << "\n";
        }
    }
}
