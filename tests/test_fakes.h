#ifndef FATIGUE_CHECK_TESTS_TEST_FAKES_H
#define FATIGUE_CHECK_TESTS_TEST_FAKES_H

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include "fatigue_check/audio_player.h"
#include "fatigue_check/capture_source.h"
#include "fatigue_check/constants.h"
#include "fatigue_check/errors.h"
#include "fatigue_check/landmark_provider.h"

namespace FatigueCheck
{
    namespace Testing
    {
        // Eye of width 30 px and lid offset h: EAR = h / 15
        inline void placeEye(LandmarkSet &landmarks, const EyeIndices &indices, int x, int y, int h)
        {
            landmarks[indices[0]] = cv::Point(x, y);
            landmarks[indices[1]] = cv::Point(x + 10, y - h);
            landmarks[indices[2]] = cv::Point(x + 20, y - h);
            landmarks[indices[3]] = cv::Point(x + 30, y);
            landmarks[indices[4]] = cv::Point(x + 20, y + h);
            landmarks[indices[5]] = cv::Point(x + 10, y + h);
        }

        inline LandmarkSet makeFace(int left_lid, int right_lid)
        {
            LandmarkSet landmarks(Constants::FACE_LANDMARK_COUNT, cv::Point(0, 0));
            placeEye(landmarks, LandmarkIndices::LEFT_EYE, 100, 100, left_lid);
            placeEye(landmarks, LandmarkIndices::RIGHT_EYE, 200, 100, right_lid);
            return landmarks;
        }

        inline LandmarkSet openFace() { return makeFace(5, 5); }   // EAR 0.333
        inline LandmarkSet closedFace() { return makeFace(1, 1); } // EAR 0.067

        class FakeCaptureSource : public CaptureSource
        {
        public:
            std::deque<ReadStatus> script;
            ReadStatus after_script = ReadStatus::END_OF_STREAM;
            int reads = 0;
            int throw_on_read = 0; // 1-based read that throws, 0 for never

            ReadStatus read(cv::Mat &frame) override
            {
                reads++;
                if (reads == throw_on_read)
                    throw std::runtime_error("camera driver crashed");
                ReadStatus status = after_script;
                if (!script.empty())
                {
                    status = script.front();
                    script.pop_front();
                }
                if (status == ReadStatus::OK)
                    frame = cv::Mat(48, 64, CV_8UC3, cv::Scalar(40, 40, 40));
                return status;
            }
        };

        class FakeLandmarkProvider : public LandmarkProvider
        {
        public:
            std::deque<std::optional<LandmarkSet>> script;
            std::optional<LandmarkSet> after_script = openFace();
            std::chrono::microseconds delay{0};
            int calls = 0;
            int throw_on_call = 0; // 1-based call that throws, 0 for never

            std::optional<LandmarkSet> detect(const cv::Mat &) override
            {
                calls++;
                if (calls == throw_on_call)
                    throw std::runtime_error("landmark model failure");
                if (delay.count() > 0)
                    std::this_thread::sleep_for(delay);
                if (script.empty())
                    return after_script;
                std::optional<LandmarkSet> next = script.front();
                script.pop_front();
                return next;
            }
        };

        class FakeAudioPlayer : public AudioPlayer
        {
        public:
            std::atomic<int> plays{0};
            std::atomic<bool> block_until_stopped{false};
            std::atomic<bool> fail{false};

            void play(const std::string &path, const std::atomic<bool> &stop_requested) override
            {
                plays++;
                if (fail)
                    throw AudioPlaybackFailure("cannot open " + path);
                while (block_until_stopped && !stop_requested.load())
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        };

        inline bool waitUntil(const std::function<bool()> &condition,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
        {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (condition())
                    return true;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return condition();
        }
    }
}

#endif // FATIGUE_CHECK_TESTS_TEST_FAKES_H
