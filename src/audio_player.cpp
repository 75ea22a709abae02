#include "fatigue_check/audio_player.h"
#include "fatigue_check/errors.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <portaudio.h>

namespace FatigueCheck
{
    namespace
    {
        constexpr unsigned long FRAMES_PER_CHUNK = 1024;

        uint32_t readLE32(const std::vector<char> &bytes, std::size_t offset)
        {
            return static_cast<uint32_t>(static_cast<unsigned char>(bytes[offset])) |
                   static_cast<uint32_t>(static_cast<unsigned char>(bytes[offset + 1])) << 8 |
                   static_cast<uint32_t>(static_cast<unsigned char>(bytes[offset + 2])) << 16 |
                   static_cast<uint32_t>(static_cast<unsigned char>(bytes[offset + 3])) << 24;
        }

        uint16_t readLE16(const std::vector<char> &bytes, std::size_t offset)
        {
            return static_cast<uint16_t>(static_cast<unsigned char>(bytes[offset]) |
                                         static_cast<unsigned char>(bytes[offset + 1]) << 8);
        }

        // Pa_Initialize / Pa_Terminate are reference counted by PortAudio
        class PortAudioSession
        {
        public:
            PortAudioSession()
            {
                PaError err = Pa_Initialize();
                if (err != paNoError)
                    throw AudioPlaybackFailure(std::string("Pa_Initialize: ") + Pa_GetErrorText(err));
            }
            ~PortAudioSession() { Pa_Terminate(); }

            PortAudioSession(const PortAudioSession &) = delete;
            PortAudioSession &operator=(const PortAudioSession &) = delete;
        };

        class OutputStream
        {
        private:
            PaStream *stream_ = nullptr;

        public:
            OutputStream(int channels, int sample_rate)
            {
                PaStreamParameters params{};
                params.device = Pa_GetDefaultOutputDevice();
                if (params.device == paNoDevice)
                    throw AudioPlaybackFailure("no default output device");

                params.channelCount = channels;
                params.sampleFormat = paInt16;
                params.suggestedLatency = Pa_GetDeviceInfo(params.device)->defaultHighOutputLatency;
                params.hostApiSpecificStreamInfo = nullptr;

                PaError err = Pa_OpenStream(&stream_, nullptr, &params, sample_rate,
                                            FRAMES_PER_CHUNK, paClipOff, nullptr, nullptr);
                if (err != paNoError)
                    throw AudioPlaybackFailure(std::string("Pa_OpenStream: ") + Pa_GetErrorText(err));

                err = Pa_StartStream(stream_);
                if (err != paNoError)
                {
                    Pa_CloseStream(stream_);
                    throw AudioPlaybackFailure(std::string("Pa_StartStream: ") + Pa_GetErrorText(err));
                }
            }

            ~OutputStream()
            {
                Pa_StopStream(stream_);
                Pa_CloseStream(stream_);
            }

            OutputStream(const OutputStream &) = delete;
            OutputStream &operator=(const OutputStream &) = delete;

            void write(const int16_t *samples, unsigned long frames)
            {
                PaError err = Pa_WriteStream(stream_, samples, frames);
                // An underflow only means a short gap in the sound
                if (err != paNoError && err != paOutputUnderflowed)
                    throw AudioPlaybackFailure(std::string("Pa_WriteStream: ") + Pa_GetErrorText(err));
            }
        };
    }

    WavData loadWav(const std::string &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw AudioPlaybackFailure("cannot open " + path);

        std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (bytes.size() < 12 || std::string(bytes.data(), 4) != "RIFF" || std::string(bytes.data() + 8, 4) != "WAVE")
            throw AudioPlaybackFailure(path + " is not a RIFF/WAVE file");

        WavData wav;
        uint16_t bits_per_sample = 0;
        bool have_format = false;
        bool have_data = false;

        std::size_t offset = 12;
        while (offset + 8 <= bytes.size())
        {
            std::string chunk_id(bytes.data() + offset, 4);
            std::size_t chunk_size = readLE32(bytes, offset + 4);
            std::size_t body = offset + 8;
            if (body + chunk_size > bytes.size())
                chunk_size = bytes.size() - body; // truncated file, keep what is there

            if (chunk_id == "fmt " && chunk_size >= 16)
            {
                uint16_t audio_format = readLE16(bytes, body);
                wav.channels = readLE16(bytes, body + 2);
                wav.sample_rate = static_cast<int>(readLE32(bytes, body + 4));
                bits_per_sample = readLE16(bytes, body + 14);
                if (audio_format != 1 || bits_per_sample != 16)
                    throw AudioPlaybackFailure(path + ": only 16-bit PCM is supported");
                have_format = true;
            }
            else if (chunk_id == "data")
            {
                wav.samples.resize(chunk_size / 2);
                for (std::size_t i = 0; i < wav.samples.size(); ++i)
                    wav.samples[i] = static_cast<int16_t>(readLE16(bytes, body + 2 * i));
                have_data = true;
            }

            // chunks are word aligned
            offset = body + chunk_size + (chunk_size & 1);
        }

        if (!have_format || !have_data)
            throw AudioPlaybackFailure(path + ": missing fmt or data chunk");
        if (wav.channels <= 0 || wav.sample_rate <= 0)
            throw AudioPlaybackFailure(path + ": invalid channel count or sample rate");
        if (wav.frameCount() == 0)
            throw AudioPlaybackFailure(path + ": no audio frames");
        return wav;
    }

    const WavData &PortAudioPlayer::asset(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(path);
        if (it == cache_.end())
            it = cache_.emplace(path, loadWav(path)).first;
        return it->second;
    }

    void PortAudioPlayer::play(const std::string &path, const std::atomic<bool> &stop_requested)
    {
        const WavData &wav = asset(path);
        PortAudioSession session;
        OutputStream stream(wav.channels, wav.sample_rate);

        const std::size_t total_frames = wav.frameCount();
        std::size_t frame = 0;
        while (frame < total_frames && !stop_requested.load())
        {
            unsigned long frames = static_cast<unsigned long>(
                std::min<std::size_t>(FRAMES_PER_CHUNK, total_frames - frame));
            stream.write(wav.samples.data() + frame * wav.channels, frames);
            frame += frames;
        }
    }
}
