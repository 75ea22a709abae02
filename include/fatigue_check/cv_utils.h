#ifndef FATIGUE_CHECK_CV_UTILS_H
#define FATIGUE_CHECK_CV_UTILS_H

#include <string>
#include <opencv2/opencv.hpp>
#include "blink_state_machine.h"
#include "config.h"

namespace FatigueCheck
{
    namespace CVUtils
    {
        void resizeToHeight(cv::Mat &frame, int height);
        cv::Mat equalizedGray(const cv::Mat &frame);
        cv::Scalar getPhaseColor(BlinkPhase phase, const Config &config);
        std::string formatDouble(double value, int precision = 3);
    }
}

#endif // FATIGUE_CHECK_CV_UTILS_H
