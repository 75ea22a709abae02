#ifndef FATIGUE_CHECK_SESSION_TRACKER_H
#define FATIGUE_CHECK_SESSION_TRACKER_H

#include <chrono>
#include <cstddef>
#include <deque>
#include <ostream>
#include <string>

namespace FatigueCheck
{
    struct EarSample
    {
        double ear;
        std::chrono::steady_clock::time_point timestamp;
    };

    struct SessionSummary
    {
        std::chrono::system_clock::time_point start_time;
        std::chrono::system_clock::time_point end_time;
        double duration_seconds = 0.0;
        double duration_minutes = 0.0;
        std::size_t sample_count = 0;
        double average_ear = 0.0;
        int alert_count = 0;
        int blink_count = 0;
    };

    // Live view of the running session
    struct SessionSnapshot
    {
        bool active = false;
        double current_ear = 0.0;
        std::size_t sample_count = 0;
        int alert_count = 0;
        double elapsed_seconds = 0.0;
    };

    /**
     * @brief One monitoring session: EAR samples, alerts and the final summary.
     *
     * Sessions must be ended explicitly before a new one starts. Sample count
     * and mean EAR cover every recorded sample; only the stored history is
     * capped when max_samples is non-zero.
     */
    class SessionTracker
    {
    private:
        std::size_t max_samples_;
        bool active_ = false;
        std::chrono::system_clock::time_point start_wall_time_;
        std::chrono::steady_clock::time_point start_time_;
        std::deque<EarSample> samples_;
        std::size_t sample_count_ = 0;
        double ear_sum_ = 0.0;
        double current_ear_ = 0.0;
        int alert_count_ = 0;

    public:
        explicit SessionTracker(std::size_t max_samples = 0);

        // Throws SessionError if a session is already active
        void start();
        void recordSample(double ear);
        void recordAlert();

        // Zero summary when no session is active
        SessionSummary end(int final_blink_count);

        bool isActive() const { return active_; }
        double currentEar() const { return current_ear_; }
        SessionSnapshot snapshot() const;
        const std::deque<EarSample> &samples() const { return samples_; }
    };

    std::string summaryToJsonString(const SessionSummary &summary);
    void printSummary(std::ostream &os, const SessionSummary &summary);
}

#endif // FATIGUE_CHECK_SESSION_TRACKER_H
