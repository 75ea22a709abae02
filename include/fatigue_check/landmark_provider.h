#ifndef FATIGUE_CHECK_LANDMARK_PROVIDER_H
#define FATIGUE_CHECK_LANDMARK_PROVIDER_H

#include <optional>
#include <opencv2/core.hpp>
#include "ear_calculator.h"

namespace FatigueCheck
{
    class LandmarkProvider
    {
    public:
        virtual ~LandmarkProvider() = default;

        // std::nullopt when no face is found in the frame
        virtual std::optional<LandmarkSet> detect(const cv::Mat &frame) = 0;
    };
}

#endif // FATIGUE_CHECK_LANDMARK_PROVIDER_H
