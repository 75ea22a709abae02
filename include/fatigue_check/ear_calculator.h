#ifndef FATIGUE_CHECK_EAR_CALCULATOR_H
#define FATIGUE_CHECK_EAR_CALCULATOR_H

#include <array>
#include <vector>
#include <opencv2/core.hpp>

namespace FatigueCheck
{
    // One detected face, in detector order
    using LandmarkSet = std::vector<cv::Point>;
    using EyeIndices = std::array<int, 6>;
    using EyeContour = std::array<cv::Point2f, 6>;

    enum class EyeStatus
    {
        OPEN,
        CLOSED
    };

    namespace EarCalculator
    {
        EyeContour extractEye(const LandmarkSet &landmarks, const EyeIndices &indices);

        /**
         * @brief Eye aspect ratio of one eye: (|p1-p5| + |p2-p4|) / (2 |p0-p3|)
         * @throws DegenerateEyeGeometry when |p0-p3| is zero
         */
        double eyeAspectRatio(const EyeContour &eye);

        /**
         * @brief Mean EAR of both eyes.
         *
         * A degenerate eye is left out of the mean; the call throws
         * DegenerateEyeGeometry only when neither eye is usable.
         */
        double averageEyeAspectRatio(const LandmarkSet &landmarks,
                                     const EyeIndices &left,
                                     const EyeIndices &right);

        EyeStatus classifyEye(double ear, double threshold);
    }
}

#endif // FATIGUE_CHECK_EAR_CALCULATOR_H
