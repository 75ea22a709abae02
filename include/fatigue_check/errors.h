#ifndef FATIGUE_CHECK_ERRORS_H
#define FATIGUE_CHECK_ERRORS_H

#include <stdexcept>
#include <string>

namespace FatigueCheck
{
    class FatigueCheckError : public std::runtime_error
    {
    public:
        explicit FatigueCheckError(const std::string &what) : std::runtime_error(what) {}
    };

    // Zero horizontal span between the eye corners
    class DegenerateEyeGeometry : public FatigueCheckError
    {
    public:
        explicit DegenerateEyeGeometry(const std::string &what) : FatigueCheckError(what) {}
    };

    class CalibrationFailed : public FatigueCheckError
    {
    public:
        explicit CalibrationFailed(const std::string &what)
            : FatigueCheckError("Calibration failed: " + what) {}
    };

    class CaptureFailure : public FatigueCheckError
    {
    public:
        explicit CaptureFailure(const std::string &what)
            : FatigueCheckError("Capture failure: " + what) {}
    };

    class AudioPlaybackFailure : public FatigueCheckError
    {
    public:
        explicit AudioPlaybackFailure(const std::string &what)
            : FatigueCheckError("Audio playback failure: " + what) {}
    };

    class ConfigError : public FatigueCheckError
    {
    public:
        explicit ConfigError(const std::string &what)
            : FatigueCheckError("Invalid configuration: " + what) {}
    };

    class SessionError : public FatigueCheckError
    {
    public:
        explicit SessionError(const std::string &what) : FatigueCheckError(what) {}
    };
}

#endif // FATIGUE_CHECK_ERRORS_H
