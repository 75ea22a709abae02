#ifndef FATIGUE_CHECK_ALARM_DISPATCHER_H
#define FATIGUE_CHECK_ALARM_DISPATCHER_H

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include "audio_player.h"

namespace FatigueCheck
{
    /**
     * @brief Plays the alarm asset on a worker thread, one task at a time.
     *
     * trigger() starts playback unless a task is still running. stop() only
     * signals the worker; it is joined by the next trigger() or shutdown().
     * Playback errors are logged and end the task.
     */
    class AlarmDispatcher
    {
    private:
        std::unique_ptr<AudioPlayer> player_;
        std::string sound_path_;
        bool repeat_;
        std::thread worker_;
        std::atomic<bool> is_playing_{false};
        std::atomic<bool> stop_requested_{false};
        std::atomic<int> failures_{0};
        int dispatched_ = 0;

        void playbackLoop();
        void joinWorker();
        void reportFailure(const std::exception &e);

    protected:
        // Launches playbackLoop on worker_; throws std::system_error if no thread can be created
        virtual void startWorker();

    public:
        AlarmDispatcher(std::unique_ptr<AudioPlayer> player, std::string sound_path, bool repeat = false);
        virtual ~AlarmDispatcher();

        AlarmDispatcher(const AlarmDispatcher &) = delete;
        AlarmDispatcher &operator=(const AlarmDispatcher &) = delete;

        // Returns true when a new playback task was started
        bool trigger();
        void stop();
        void shutdown();

        bool isPlaying() const { return is_playing_.load(); }
        int dispatchCount() const { return dispatched_; }
        int failureCount() const { return failures_.load(); }
    };
}

#endif // FATIGUE_CHECK_ALARM_DISPATCHER_H
