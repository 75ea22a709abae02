#include "fatigue_check/facial_landmark_detector.h"
#include "fatigue_check/constants.h"
#include "fatigue_check/cv_utils.h"
#include <iostream>
#include <algorithm>

namespace FatigueCheck
{
    bool FacialLandmarkDetector::initialize(const std::string &model_path, double downsample_ratio)
    {
        try
        {
            face_detector_ = dlib::get_frontal_face_detector();
            dlib::deserialize(model_path) >> landmark_predictor_;
            downsample_ratio_ = std::max(1.0, downsample_ratio);
            is_initialized_ = true;
            return true;
        }
        catch (const std::exception &e)
        {
            std::cerr << "Failed to initialize face detector: " << e.what() << std::endl;
            return false;
        }
    }

    std::optional<LandmarkSet> FacialLandmarkDetector::detect(const cv::Mat &frame)
    {
        if (!is_initialized_ || frame.empty())
            return std::nullopt;

        try
        {
            cv::Mat gray = CVUtils::equalizedGray(frame);

            // Face search runs on a downsampled copy, landmarks on the full frame
            cv::Mat small;
            cv::resize(gray, small, cv::Size(), 1.0 / downsample_ratio_, 1.0 / downsample_ratio_,
                       cv::INTER_LINEAR);
            dlib::cv_image<unsigned char> dlib_small(small);
            std::vector<dlib::rectangle> faces = face_detector_(dlib_small);

            if (faces.empty())
                return std::nullopt;

            // Use the largest face (most confident detection)
            dlib::rectangle face = *std::max_element(faces.begin(), faces.end(),
                                                     [](const dlib::rectangle &a, const dlib::rectangle &b)
                                                     {
                                                         return a.area() < b.area();
                                                     });
            dlib::rectangle scaled(static_cast<long>(face.left() * downsample_ratio_),
                                   static_cast<long>(face.top() * downsample_ratio_),
                                   static_cast<long>(face.right() * downsample_ratio_),
                                   static_cast<long>(face.bottom() * downsample_ratio_));

            dlib::cv_image<unsigned char> dlib_img(gray);
            dlib::full_object_detection shape = landmark_predictor_(dlib_img, scaled);
            if (shape.num_parts() != Constants::FACE_LANDMARK_COUNT)
                return std::nullopt;

            LandmarkSet landmarks;
            landmarks.reserve(shape.num_parts());
            for (unsigned long i = 0; i < shape.num_parts(); ++i)
            {
                landmarks.emplace_back(static_cast<int>(shape.part(i).x()),
                                       static_cast<int>(shape.part(i).y()));
            }
            return landmarks;
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error in face detection: " << e.what() << std::endl;
            return std::nullopt;
        }
    }
}
