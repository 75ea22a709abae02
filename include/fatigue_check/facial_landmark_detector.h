#ifndef FATIGUE_CHECK_FACIAL_LANDMARK_DETECTOR_H
#define FATIGUE_CHECK_FACIAL_LANDMARK_DETECTOR_H

#include <string>
#include <opencv2/opencv.hpp>
#include <dlib/opencv.h>
#include <dlib/image_processing/frontal_face_detector.h>
#include <dlib/image_processing.h>
#include "landmark_provider.h"

namespace FatigueCheck
{
    // dlib HOG face detector + 68-point shape predictor
    class FacialLandmarkDetector : public LandmarkProvider
    {
    private:
        dlib::frontal_face_detector face_detector_;
        dlib::shape_predictor landmark_predictor_;
        double downsample_ratio_ = 1.5;
        bool is_initialized_ = false;

    public:
        bool initialize(const std::string &model_path, double downsample_ratio);
        std::optional<LandmarkSet> detect(const cv::Mat &frame) override;
    };
}

#endif // FATIGUE_CHECK_FACIAL_LANDMARK_DETECTOR_H
