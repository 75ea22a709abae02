#include "fatigue_check/capture_source.h"
#include "fatigue_check/cv_utils.h"
#include "fatigue_check/errors.h"
#include <iostream>
#include <filesystem>

namespace FatigueCheck
{
    VideoCaptureSource::~VideoCaptureSource()
    {
        release();
    }

    bool VideoCaptureSource::open(const Config &config)
    {
        resize_height_ = config.resize_height;

        // Try to open video file or camera
        if (!config.video_path.empty() && std::filesystem::exists(config.video_path))
        {
            cap_.open(config.video_path);
            is_file_ = true;
            description_ = config.video_path;
        }
        else
        {
            if (!config.video_path.empty())
                std::cerr << "CaptureSource: " << config.video_path << " not found, falling back to camera" << std::endl;
            cap_.open(config.camera_index);
            is_file_ = false;
            description_ = "camera " + std::to_string(config.camera_index);
        }

        if (!cap_.isOpened())
        {
            std::cerr << "CaptureSource: Failed to open " << description_ << std::endl;
            return false;
        }
        return true;
    }

    ReadStatus VideoCaptureSource::read(cv::Mat &frame)
    {
        if (!cap_.isOpened())
            return ReadStatus::FAILED;

        if (!cap_.read(frame) || frame.empty())
            return is_file_ ? ReadStatus::END_OF_STREAM : ReadStatus::FAILED;

        if (resize_height_ > 0)
            CVUtils::resizeToHeight(frame, resize_height_);
        return ReadStatus::OK;
    }

    void VideoCaptureSource::release()
    {
        if (cap_.isOpened())
            cap_.release();
    }

    FrameReader::FrameReader(CaptureSource &source, int retry_limit)
        : source_(source), retry_limit_(retry_limit)
    {
    }

    bool FrameReader::next(cv::Mat &frame)
    {
        while (true)
        {
            switch (source_.read(frame))
            {
            case ReadStatus::OK:
                consecutive_failures_ = 0;
                return true;
            case ReadStatus::END_OF_STREAM:
                return false;
            case ReadStatus::FAILED:
                ++total_failures_;
                if (++consecutive_failures_ > retry_limit_)
                {
                    throw CaptureFailure(std::to_string(consecutive_failures_) +
                                         " consecutive frame reads failed");
                }
                break;
            }
        }
    }
}
