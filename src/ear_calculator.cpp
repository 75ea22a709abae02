#include "fatigue_check/ear_calculator.h"
#include "fatigue_check/constants.h"
#include "fatigue_check/errors.h"
#include <initializer_list>
#include <string>

namespace FatigueCheck
{
    namespace EarCalculator
    {
        EyeContour extractEye(const LandmarkSet &landmarks, const EyeIndices &indices)
        {
            EyeContour eye;
            for (std::size_t i = 0; i < indices.size(); ++i)
            {
                int index = indices[i];
                if (index < 0 || static_cast<std::size_t>(index) >= landmarks.size())
                {
                    throw DegenerateEyeGeometry("landmark index " + std::to_string(index) +
                                                " outside a set of " + std::to_string(landmarks.size()) + " points");
                }
                eye[i] = cv::Point2f(static_cast<float>(landmarks[index].x),
                                     static_cast<float>(landmarks[index].y));
            }
            return eye;
        }

        double eyeAspectRatio(const EyeContour &eye)
        {
            double vertical1 = cv::norm(eye[1] - eye[5]);
            double vertical2 = cv::norm(eye[2] - eye[4]);
            double horizontal = cv::norm(eye[0] - eye[3]);

            if (horizontal < Constants::EPSILON)
                throw DegenerateEyeGeometry("eye corners coincide");

            return (vertical1 + vertical2) / (2.0 * horizontal);
        }

        double averageEyeAspectRatio(const LandmarkSet &landmarks,
                                     const EyeIndices &left,
                                     const EyeIndices &right)
        {
            double total = 0.0;
            int usable = 0;
            for (const EyeIndices *indices : {&left, &right})
            {
                try
                {
                    total += eyeAspectRatio(extractEye(landmarks, *indices));
                    ++usable;
                }
                catch (const DegenerateEyeGeometry &)
                {
                    // the other eye may still be usable
                }
            }

            if (usable == 0)
                throw DegenerateEyeGeometry("no usable eye contour in landmark set");
            return total / usable;
        }

        EyeStatus classifyEye(double ear, double threshold)
        {
            return ear < threshold ? EyeStatus::CLOSED : EyeStatus::OPEN;
        }
    }
}
