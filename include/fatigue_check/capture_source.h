#ifndef FATIGUE_CHECK_CAPTURE_SOURCE_H
#define FATIGUE_CHECK_CAPTURE_SOURCE_H

#include <string>
#include <opencv2/opencv.hpp>
#include "config.h"

namespace FatigueCheck
{
    enum class ReadStatus
    {
        OK,
        FAILED,
        END_OF_STREAM
    };

    class CaptureSource
    {
    public:
        virtual ~CaptureSource() = default;
        virtual ReadStatus read(cv::Mat &frame) = 0;
    };

    // Camera or video file through cv::VideoCapture, scaled to a fixed height
    class VideoCaptureSource : public CaptureSource
    {
    private:
        cv::VideoCapture cap_;
        bool is_file_ = false;
        int resize_height_ = 0;
        std::string description_;

    public:
        VideoCaptureSource() = default;
        ~VideoCaptureSource() override;

        bool open(const Config &config);
        ReadStatus read(cv::Mat &frame) override;
        void release();

        bool isOpened() const { return cap_.isOpened(); }
        const std::string &description() const { return description_; }
    };

    /**
     * @brief Pulls frames from a CaptureSource, absorbing transient failures.
     *
     * Up to retry_limit consecutive failed reads are retried; the next one
     * throws CaptureFailure. A successful read resets the failure streak.
     */
    class FrameReader
    {
    private:
        CaptureSource &source_;
        int retry_limit_;
        int consecutive_failures_ = 0;
        int total_failures_ = 0;

    public:
        FrameReader(CaptureSource &source, int retry_limit);

        // false at end of stream
        bool next(cv::Mat &frame);

        int consecutiveFailures() const { return consecutive_failures_; }
        int totalFailures() const { return total_failures_; }
    };
}

#endif // FATIGUE_CHECK_CAPTURE_SOURCE_H
