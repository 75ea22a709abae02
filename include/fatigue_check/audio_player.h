#ifndef FATIGUE_CHECK_AUDIO_PLAYER_H
#define FATIGUE_CHECK_AUDIO_PLAYER_H

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace FatigueCheck
{
    // Interleaved 16-bit PCM
    struct WavData
    {
        int sample_rate = 0;
        int channels = 0;
        std::vector<int16_t> samples;

        std::size_t frameCount() const { return channels > 0 ? samples.size() / channels : 0; }
    };

    // Throws AudioPlaybackFailure for anything but a 16-bit PCM RIFF/WAVE file
    WavData loadWav(const std::string &path);

    class AudioPlayer
    {
    public:
        virtual ~AudioPlayer() = default;

        /**
         * @brief Plays the asset once, blocking the calling thread.
         * @param stop_requested polled while playing; playback ends early once set
         * @throws AudioPlaybackFailure on a missing asset or device error
         */
        virtual void play(const std::string &path, const std::atomic<bool> &stop_requested) = 0;
    };

    /**
     * @brief Blocking PortAudio output on the default device.
     *
     * Decoded assets are cached by path. Samples are written in small chunks
     * so a stop request takes effect within one chunk.
     */
    class PortAudioPlayer : public AudioPlayer
    {
    private:
        std::map<std::string, WavData> cache_;
        std::mutex cache_mutex_;

        const WavData &asset(const std::string &path);

    public:
        PortAudioPlayer() = default;

        PortAudioPlayer(const PortAudioPlayer &) = delete;
        PortAudioPlayer &operator=(const PortAudioPlayer &) = delete;

        void play(const std::string &path, const std::atomic<bool> &stop_requested) override;
    };
}

#endif // FATIGUE_CHECK_AUDIO_PLAYER_H
