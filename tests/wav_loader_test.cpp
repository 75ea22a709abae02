#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include "fatigue_check/audio_player.h"
#include "fatigue_check/errors.h"

using namespace FatigueCheck;

namespace
{
    void put16(std::ofstream &out, uint16_t v)
    {
        out.put(static_cast<char>(v & 0xFF));
        out.put(static_cast<char>((v >> 8) & 0xFF));
    }

    void put32(std::ofstream &out, uint32_t v)
    {
        put16(out, static_cast<uint16_t>(v & 0xFFFF));
        put16(out, static_cast<uint16_t>(v >> 16));
    }

    std::string writeWav(const std::string &name, uint16_t format, uint16_t bits,
                         const std::vector<int16_t> &samples)
    {
        std::string path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream out(path, std::ios::binary);
        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);

        out.write("RIFF", 4);
        put32(out, 36 + 4 + 8 + data_size);
        out.write("WAVE", 4);

        out.write("fmt ", 4);
        put32(out, 16);
        put16(out, format);
        put16(out, 2);         // channels
        put32(out, 8000);      // sample rate
        put32(out, 8000 * 4);  // byte rate
        put16(out, 4);         // block align
        put16(out, bits);

        // unknown chunk with odd size, padded
        out.write("LIST", 4);
        put32(out, 3);
        out.write("abc", 3);
        out.put('\0');

        out.write("data", 4);
        put32(out, data_size);
        for (int16_t s : samples)
            put16(out, static_cast<uint16_t>(s));
        return path;
    }
}

TEST(WavLoaderTest, ReadsStereoPcm16)
{
    std::string path = writeWav("fatigue_check_alarm_test.wav", 1, 16, {100, -100, 32767, -32768, 0, 5});

    WavData wav = loadWav(path);

    EXPECT_EQ(wav.sample_rate, 8000);
    EXPECT_EQ(wav.channels, 2);
    EXPECT_EQ(wav.frameCount(), 3u);
    EXPECT_EQ(wav.samples[1], -100);
    EXPECT_EQ(wav.samples[2], 32767);
    EXPECT_EQ(wav.samples[3], -32768);
    std::remove(path.c_str());
}

TEST(WavLoaderTest, RejectsNonPcmFormat)
{
    std::string path = writeWav("fatigue_check_float_test.wav", 3, 32, {1, 2});

    EXPECT_THROW(loadWav(path), AudioPlaybackFailure);
    std::remove(path.c_str());
}

TEST(WavLoaderTest, RejectsEmptyDataChunk)
{
    std::string path = writeWav("fatigue_check_silent_test.wav", 1, 16, {});

    EXPECT_THROW(loadWav(path), AudioPlaybackFailure);
    std::remove(path.c_str());
}

TEST(WavLoaderTest, RejectsPartialFrame)
{
    // One sample cannot fill a stereo frame
    std::string path = writeWav("fatigue_check_partial_test.wav", 1, 16, {7});

    EXPECT_THROW(loadWav(path), AudioPlaybackFailure);
    std::remove(path.c_str());
}

TEST(WavLoaderTest, MissingAssetIsPlaybackFailure)
{
    EXPECT_THROW(loadWav("/nonexistent/alarm.wav"), AudioPlaybackFailure);
}

TEST(WavLoaderTest, RejectsNonRiffFile)
{
    std::string path = (std::filesystem::temp_directory_path() / "fatigue_check_not_wav.wav").string();
    {
        std::ofstream out(path);
        out << "definitely not audio";
    }

    EXPECT_THROW(loadWav(path), AudioPlaybackFailure);
    std::remove(path.c_str());
}
