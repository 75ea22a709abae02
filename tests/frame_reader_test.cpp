#include <gtest/gtest.h>
#include "fatigue_check/capture_source.h"
#include "fatigue_check/errors.h"
#include "test_fakes.h"

using namespace FatigueCheck;

TEST(FrameReaderTest, TransientFailuresAreRetried)
{
    Testing::FakeCaptureSource capture;
    capture.script = {ReadStatus::FAILED, ReadStatus::FAILED, ReadStatus::OK};
    FrameReader reader(capture, 3);
    cv::Mat frame;

    EXPECT_TRUE(reader.next(frame));
    EXPECT_FALSE(frame.empty());
    EXPECT_EQ(reader.consecutiveFailures(), 0);
    EXPECT_EQ(reader.totalFailures(), 2);
}

TEST(FrameReaderTest, TooManyConsecutiveFailuresThrow)
{
    Testing::FakeCaptureSource capture;
    capture.after_script = ReadStatus::FAILED;
    FrameReader reader(capture, 3);
    cv::Mat frame;

    EXPECT_THROW(reader.next(frame), CaptureFailure);
    EXPECT_EQ(capture.reads, 4);
}

TEST(FrameReaderTest, SuccessResetsFailureStreak)
{
    Testing::FakeCaptureSource capture;
    capture.script = {ReadStatus::FAILED, ReadStatus::FAILED, ReadStatus::OK,
                      ReadStatus::FAILED, ReadStatus::FAILED, ReadStatus::OK};
    FrameReader reader(capture, 2);
    cv::Mat frame;

    EXPECT_TRUE(reader.next(frame));
    EXPECT_TRUE(reader.next(frame));
}

TEST(FrameReaderTest, EndOfStreamIsNotAFailure)
{
    Testing::FakeCaptureSource capture;
    capture.script = {ReadStatus::OK};
    FrameReader reader(capture, 1);
    cv::Mat frame;

    EXPECT_TRUE(reader.next(frame));
    EXPECT_FALSE(reader.next(frame));
}
