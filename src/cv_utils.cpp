#include "fatigue_check/cv_utils.h"
#include <sstream>
#include <iomanip>

namespace FatigueCheck
{
    namespace CVUtils
    {
        void resizeToHeight(cv::Mat &frame, int height)
        {
            if (frame.empty() || frame.rows == height)
                return;

            double scale = static_cast<double>(height) / frame.rows;
            cv::resize(frame, frame, cv::Size(), scale, scale, cv::INTER_LINEAR);
        }

        cv::Mat equalizedGray(const cv::Mat &frame)
        {
            cv::Mat gray;
            if (frame.channels() == 3)
                cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
            else if (frame.channels() == 4)
                cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
            else
                gray = frame.clone();

            cv::equalizeHist(gray, gray);
            return gray;
        }

        cv::Scalar getPhaseColor(BlinkPhase phase, const Config &config)
        {
            switch (phase)
            {
            case BlinkPhase::AWAKE:
                return config.alert_color;
            case BlinkPhase::BLINK_WINDOW:
                return config.warning_color;
            case BlinkPhase::DROWSY:
                return config.danger_color;
            default:
                return cv::Scalar(128, 128, 128); // Gray for unknown states
            }
        }

        std::string formatDouble(double value, int precision)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }
    }
}
