#include <gtest/gtest.h>
#include <cstdlib>
#include "fatigue_check/drowsiness_detection_system.h"
#include "fatigue_check/logger.h"
#include "test_fakes.h"

using namespace FatigueCheck;
using Testing::FakeAudioPlayer;
using Testing::FakeCaptureSource;
using Testing::FakeLandmarkProvider;

class DrowsinessDetectionSystemTest : public ::testing::Test
{
protected:
    Config config;
    std::unique_ptr<FakeCaptureSource> capture = std::make_unique<FakeCaptureSource>();
    std::unique_ptr<FakeLandmarkProvider> provider = std::make_unique<FakeLandmarkProvider>();

    void SetUp() override
    {
        config.show_window = false;
        config.enable_file_logging = false;
        config.enable_publishing = false;
        config.calibration_frames = 5;
        config.calibration_max_misses = 3;
        config.capture_retry_limit = 2;
        Logger::getInstance().setupConfig(config);

        provider->delay = std::chrono::microseconds(200);
    }

    void TearDown() override
    {
        Logger::shutdown();
    }

    void queueFrames(int count)
    {
        capture->script.insert(capture->script.end(), count, ReadStatus::OK);
    }

    std::unique_ptr<DrowsinessDetectionSystem> makeSystem()
    {
        auto system = std::make_unique<DrowsinessDetectionSystem>(
            config, std::move(capture), std::move(provider), std::make_unique<FakeAudioPlayer>());
        EXPECT_TRUE(system->initialize());
        return system;
    }
};

TEST_F(DrowsinessDetectionSystemTest, EndOfStreamClosesSessionNormally)
{
    queueFrames(5 + 8);
    capture->after_script = ReadStatus::END_OF_STREAM;
    auto system = makeSystem();

    EXPECT_EQ(system->run(), EXIT_SUCCESS);

    ASSERT_TRUE(system->calibrationProfile().has_value());
    EXPECT_EQ(system->calibrationProfile()->frames_used, 5);
    EXPECT_EQ(system->lastSummary().sample_count, 8u);
    EXPECT_FALSE(system->monitor()->session().isActive());
    EXPECT_TRUE(system->failureReason().empty());
}

TEST_F(DrowsinessDetectionSystemTest, ExhaustedCaptureRetriesStillFlushSession)
{
    queueFrames(5 + 6);
    capture->after_script = ReadStatus::FAILED;
    auto system = makeSystem();

    EXPECT_EQ(system->run(), EXIT_FAILURE);

    EXPECT_NE(system->failureReason().find("Capture failure"), std::string::npos);
    EXPECT_EQ(system->lastSummary().sample_count, 6u);
    EXPECT_FALSE(system->monitor()->session().isActive());
}

TEST_F(DrowsinessDetectionSystemTest, DetectorExceptionOnlySkipsThatFrame)
{
    queueFrames(5 + 8);
    capture->after_script = ReadStatus::END_OF_STREAM;
    provider->throw_on_call = 5 + 3;
    auto system = makeSystem();

    EXPECT_EQ(system->run(), EXIT_SUCCESS);

    EXPECT_EQ(system->lastSummary().sample_count, 7u);
    EXPECT_FALSE(system->monitor()->session().isActive());
    EXPECT_TRUE(system->failureReason().empty());
}

TEST_F(DrowsinessDetectionSystemTest, UnexpectedLoopExceptionStillFlushesSession)
{
    queueFrames(5 + 4);
    capture->throw_on_read = 5 + 4 + 1;
    auto system = makeSystem();

    EXPECT_EQ(system->run(), EXIT_FAILURE);

    EXPECT_NE(system->failureReason().find("camera driver crashed"), std::string::npos);
    EXPECT_EQ(system->lastSummary().sample_count, 4u);
    EXPECT_FALSE(system->monitor()->session().isActive());
}

TEST_F(DrowsinessDetectionSystemTest, CalibrationWithoutFaceFails)
{
    capture->after_script = ReadStatus::OK;
    provider->after_script = std::nullopt;
    auto system = makeSystem();

    EXPECT_EQ(system->run(), EXIT_FAILURE);

    EXPECT_NE(system->failureReason().find("Calibration failed"), std::string::npos);
    EXPECT_FALSE(system->calibrationProfile().has_value());
    EXPECT_EQ(system->monitor(), nullptr);
    EXPECT_EQ(system->lastSummary().sample_count, 0u);
}

TEST_F(DrowsinessDetectionSystemTest, DetectorExceptionDuringCalibrationFails)
{
    capture->after_script = ReadStatus::OK;
    provider->throw_on_call = 2;
    auto system = makeSystem();

    EXPECT_EQ(system->run(), EXIT_FAILURE);

    EXPECT_NE(system->failureReason().find("landmark model failure"), std::string::npos);
    EXPECT_EQ(system->monitor(), nullptr);
}

TEST_F(DrowsinessDetectionSystemTest, NoFaceFramesAreNotSampled)
{
    queueFrames(5 + 4 + 3);
    capture->after_script = ReadStatus::END_OF_STREAM;
    for (int i = 0; i < 5; ++i)
        provider->script.push_back(Testing::openFace());
    for (int i = 0; i < 4; ++i)
        provider->script.push_back(std::nullopt);
    auto system = makeSystem();

    EXPECT_EQ(system->run(), EXIT_SUCCESS);

    EXPECT_EQ(system->lastSummary().sample_count, 3u);
}

TEST_F(DrowsinessDetectionSystemTest, StopRequestAbortsCalibration)
{
    capture->after_script = ReadStatus::OK;
    auto system = makeSystem();
    system->requestStop();

    EXPECT_EQ(system->run(), EXIT_FAILURE);
    EXPECT_NE(system->failureReason().find("aborted"), std::string::npos);
}

TEST_F(DrowsinessDetectionSystemTest, RunBeforeInitializeFails)
{
    DrowsinessDetectionSystem system(config, std::move(capture), std::move(provider),
                                     std::make_unique<FakeAudioPlayer>());

    EXPECT_EQ(system.run(), EXIT_FAILURE);
}
