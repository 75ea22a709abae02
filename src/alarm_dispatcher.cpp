#include "fatigue_check/alarm_dispatcher.h"
#include "fatigue_check/errors.h"
#include "fatigue_check/logger.h"
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace FatigueCheck
{
    AlarmDispatcher::AlarmDispatcher(std::unique_ptr<AudioPlayer> player, std::string sound_path, bool repeat)
        : player_(std::move(player)), sound_path_(std::move(sound_path)), repeat_(repeat)
    {
    }

    AlarmDispatcher::~AlarmDispatcher()
    {
        shutdown();
    }

    bool AlarmDispatcher::trigger()
    {
        if (!player_ || is_playing_.load())
            return false;

        // Previous task has finished on its own or after stop()
        joinWorker();

        stop_requested_ = false;
        is_playing_ = true;
        try
        {
            startWorker();
        }
        catch (const std::system_error &e)
        {
            is_playing_ = false;
            reportFailure(AudioPlaybackFailure(std::string("cannot start alarm task: ") + e.what()));
            return false;
        }
        dispatched_++;
        return true;
    }

    void AlarmDispatcher::startWorker()
    {
        worker_ = std::thread(&AlarmDispatcher::playbackLoop, this);
    }

    void AlarmDispatcher::reportFailure(const std::exception &e)
    {
        failures_++;
        std::cerr << "AlarmDispatcher: " << e.what() << std::endl;
        Logger::log(MonitorEvent::ERROR, std::string("Alarm playback failed: ") + e.what(), 0.0, 0);
    }

    void AlarmDispatcher::stop()
    {
        stop_requested_ = true;
    }

    void AlarmDispatcher::shutdown()
    {
        stop();
        joinWorker();
    }

    void AlarmDispatcher::joinWorker()
    {
        if (worker_.joinable())
            worker_.join();
    }

    void AlarmDispatcher::playbackLoop()
    {
        try
        {
            do
            {
                player_->play(sound_path_, stop_requested_);
            } while (repeat_ && !stop_requested_.load());
        }
        catch (const std::exception &e)
        {
            reportFailure(e);
        }
        is_playing_ = false;
    }
}
