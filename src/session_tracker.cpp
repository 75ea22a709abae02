#include "fatigue_check/session_tracker.h"
#include "fatigue_check/errors.h"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

namespace FatigueCheck
{
    namespace
    {
        std::string formatIsoTime(const std::chrono::system_clock::time_point &tp)
        {
            std::time_t time_t = std::chrono::system_clock::to_time_t(tp);
            std::stringstream ss;
            ss << std::put_time(std::localtime(&time_t), "%Y-%m-%dT%H:%M:%S");
            return ss.str();
        }
    }

    SessionTracker::SessionTracker(std::size_t max_samples)
        : max_samples_(max_samples)
    {
    }

    void SessionTracker::start()
    {
        if (active_)
            throw SessionError("a session is already active; end it before starting another");

        samples_.clear();
        sample_count_ = 0;
        ear_sum_ = 0.0;
        current_ear_ = 0.0;
        alert_count_ = 0;
        start_wall_time_ = std::chrono::system_clock::now();
        start_time_ = std::chrono::steady_clock::now();
        active_ = true;
    }

    void SessionTracker::recordSample(double ear)
    {
        if (!active_)
            throw SessionError("recordSample called without an active session");

        samples_.push_back({ear, std::chrono::steady_clock::now()});
        if (max_samples_ > 0 && samples_.size() > max_samples_)
            samples_.pop_front();

        sample_count_++;
        ear_sum_ += ear;
        current_ear_ = ear;
    }

    void SessionTracker::recordAlert()
    {
        if (!active_)
            throw SessionError("recordAlert called without an active session");
        alert_count_++;
    }

    SessionSummary SessionTracker::end(int final_blink_count)
    {
        SessionSummary summary;
        if (!active_)
            return summary;

        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        summary.start_time = start_wall_time_;
        summary.end_time = std::chrono::system_clock::now();
        summary.duration_seconds = elapsed.count();
        summary.duration_minutes = summary.duration_seconds / 60.0;
        summary.sample_count = sample_count_;
        summary.average_ear = sample_count_ > 0 ? ear_sum_ / static_cast<double>(sample_count_) : 0.0;
        summary.alert_count = alert_count_;
        summary.blink_count = final_blink_count;

        active_ = false;
        return summary;
    }

    SessionSnapshot SessionTracker::snapshot() const
    {
        SessionSnapshot snap;
        snap.active = active_;
        if (!active_)
            return snap;

        snap.current_ear = current_ear_;
        snap.sample_count = sample_count_;
        snap.alert_count = alert_count_;
        snap.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
        return snap;
    }

    std::string summaryToJsonString(const SessionSummary &summary)
    {
        nlohmann::json j;
        j["start_time"] = formatIsoTime(summary.start_time);
        j["end_time"] = formatIsoTime(summary.end_time);
        j["duration_seconds"] = summary.duration_seconds;
        j["duration_minutes"] = summary.duration_minutes;
        j["sample_count"] = summary.sample_count;
        j["average_ear"] = summary.average_ear;
        j["alert_count"] = summary.alert_count;
        j["blink_count"] = summary.blink_count;
        return j.dump();
    }

    void printSummary(std::ostream &os, const SessionSummary &summary)
    {
        os << "\n=== Session Summary ===\n"
           << "Duration: " << std::fixed << std::setprecision(2) << summary.duration_minutes << " minutes\n"
           << "Total EAR readings: " << summary.sample_count << "\n"
           << "Average EAR: " << std::setprecision(4) << summary.average_ear << "\n"
           << "Alerts triggered: " << summary.alert_count << "\n"
           << "Total blinks: " << summary.blink_count << std::endl;
    }
}
