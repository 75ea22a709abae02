#ifndef FATIGUE_CHECK_CONSTANTS_H
#define FATIGUE_CHECK_CONSTANTS_H

#include <array>

namespace FatigueCheck
{
    namespace Constants
    {
        constexpr int ESC_KEY = 27;
        constexpr int RESET_KEY = 'r';
        constexpr int QUIT_KEY = 'q';
        constexpr int WAIT_KEY_MS = 1;
        constexpr double EPSILON = 1e-6;
        constexpr int MAX_LOG_ENTRIES = 1000;
        constexpr int FACE_LANDMARK_COUNT = 68;
        constexpr int EYE_POINT_COUNT = 6;
        constexpr const char *WINDOW_NAME = "Blink Detection";
    }

    namespace LandmarkIndices
    {
        // p0 outer corner, p1 p2 upper lid, p3 inner corner, p4 p5 lower lid
        constexpr std::array<int, 6> LEFT_EYE = {36, 37, 38, 39, 40, 41};
        constexpr std::array<int, 6> RIGHT_EYE = {42, 43, 44, 45, 46, 47};
    }
}

#endif // FATIGUE_CHECK_CONSTANTS_H
