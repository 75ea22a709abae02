#include "fatigue_check/drowsiness_detection_system.h"
#include "fatigue_check/constants.h"
#include "fatigue_check/cv_utils.h"
#include "fatigue_check/errors.h"
#include "fatigue_check/facial_landmark_detector.h"
#include "fatigue_check/logger.h"
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>

namespace FatigueCheck
{
    DrowsinessDetectionSystem::DrowsinessDetectionSystem(const Config &config)
        : DrowsinessDetectionSystem(config, nullptr, nullptr, nullptr)
    {
    }

    DrowsinessDetectionSystem::DrowsinessDetectionSystem(const Config &config,
                                                         std::unique_ptr<CaptureSource> capture,
                                                         std::unique_ptr<LandmarkProvider> detector,
                                                         std::unique_ptr<AudioPlayer> audio_player)
        : config_(config),
          capture_(std::move(capture)),
          detector_(std::move(detector)),
          audio_player_(std::move(audio_player))
    {
    }

    DrowsinessDetectionSystem::~DrowsinessDetectionSystem()
    {
        // Monitor holds a reference to the alarm
        monitor_.reset();
        alarm_.reset();
    }

    bool DrowsinessDetectionSystem::initialize()
    {
        if (!capture_)
        {
            auto source = std::make_unique<VideoCaptureSource>();
            if (!source->open(config_))
                return false;
            std::cout << "Capturing from " << source->description() << std::endl;
            capture_ = std::move(source);
        }

        if (!detector_)
        {
            auto detector = std::make_unique<FacialLandmarkDetector>();
            if (!detector->initialize(config_.model_path, config_.face_downsample_ratio))
                return false;
            detector_ = std::move(detector);
        }

        if (!audio_player_)
            audio_player_ = std::make_unique<PortAudioPlayer>();

        alarm_ = std::make_unique<AlarmDispatcher>(std::move(audio_player_), config_.alarm_sound_path,
                                                   config_.alarm_repeat);
        initialized_ = true;
        return true;
    }

    int DrowsinessDetectionSystem::run()
    {
        if (!initialized_)
        {
            std::cerr << "DrowsinessDetectionSystem: run() called before initialize()" << std::endl;
            return EXIT_FAILURE;
        }

        FrameReader reader(*capture_, config_.capture_retry_limit);

        try
        {
            profile_ = runCalibration(config_, reader, *detector_,
                                      [this](const cv::Mat &frame, bool face_found, const Calibrator &calibrator)
                                      { return calibrationObserver(frame, face_found, calibrator); });
        }
        catch (const CalibrationFailed &e)
        {
            failure_reason_ = e.what();
            std::cerr << failure_reason_ << std::endl;
            Logger::log(MonitorEvent::ERROR, failure_reason_, 0.0, 0);
            cleanup();
            return EXIT_FAILURE;
        }
        catch (const std::exception &e)
        {
            failure_reason_ = std::string("Calibration failed: ") + e.what();
            std::cerr << failure_reason_ << std::endl;
            Logger::log(MonitorEvent::ERROR, failure_reason_, 0.0, 0);
            cleanup();
            return EXIT_FAILURE;
        }

        monitor_ = std::make_unique<DrowsinessMonitor>(config_, *profile_, *alarm_);
        monitor_->startSession();
        Logger::log(MonitorEvent::CALIBRATED,
                    "SPF " + CVUtils::formatDouble(profile_->spf * 1000.0, 2) + " ms, blink limit " +
                        CVUtils::formatDouble(profile_->blink_frame_limit, 2) + ", drowsy limit " +
                        CVUtils::formatDouble(profile_->drowsy_frame_limit, 2),
                    0.0, 0);

        std::cout << "Monitoring started. Press 'r' to reset, 'q' or ESC to quit" << std::endl;

        int exit_code = EXIT_SUCCESS;
        cv::Mat frame;
        int processed_frames = 0;
        try
        {
            while (!stop_requested_)
            {
                if (!reader.next(frame))
                    break; // end of video file

                processFrame(frame);
                processed_frames++;

                if (config_.show_window && !handleKey(cv::waitKey(Constants::WAIT_KEY_MS) & 0xFF))
                    break;
            }
        }
        catch (const CaptureFailure &e)
        {
            failure_reason_ = e.what();
            std::cerr << failure_reason_ << std::endl;
            Logger::log(MonitorEvent::ERROR, failure_reason_, 0.0, monitor_->stateMachine().blinkCount());
            exit_code = EXIT_FAILURE;
        }
        catch (const std::exception &e)
        {
            failure_reason_ = std::string("Monitoring stopped: ") + e.what();
            std::cerr << failure_reason_ << std::endl;
            Logger::log(MonitorEvent::ERROR, failure_reason_, 0.0, monitor_->stateMachine().blinkCount());
            exit_code = EXIT_FAILURE;
        }

        std::cout << "Total Processed Frames: " << processed_frames << std::endl;
        finishSession();
        cleanup();
        return exit_code;
    }

    bool DrowsinessDetectionSystem::calibrationObserver(const cv::Mat &frame, bool face_found,
                                                        const Calibrator &calibrator)
    {
        if (stop_requested_)
            return false;
        if (!config_.show_window)
            return true;

        cv::Mat display = frame.clone();
        if (!face_found)
        {
            drawNoFaceDetected(display, "Unable to detect face, please check proper lighting");
        }
        cv::putText(display, "Calibrating " + std::to_string(calibrator.validFrames()) + "/" +
                                 std::to_string(calibrator.targetFrames()),
                    cv::Point(10, display.rows - 20), cv::FONT_HERSHEY_COMPLEX, 0.6,
                    cv::Scalar(255, 255, 0), 1, cv::LINE_AA);
        cv::imshow(Constants::WINDOW_NAME, display);

        int key = cv::waitKey(Constants::WAIT_KEY_MS) & 0xFF;
        return key != Constants::ESC_KEY && key != Constants::QUIT_KEY;
    }

    void DrowsinessDetectionSystem::processFrame(cv::Mat &frame)
    {
        // Per-frame failures stay inside the frame
        try
        {
            std::optional<LandmarkSet> landmarks = detector_->detect(frame);
            FrameResult result = monitor_->processFrame(landmarks);

            logFrameEvents(result, frame);

            if (!config_.show_window)
                return;

            if (!result.face_found || !result.ear_valid)
                drawNoFaceDetected(frame, result.hint);
            else
                drawVisualization(frame, *landmarks, result);

            cv::imshow(Constants::WINDOW_NAME, frame);
        }
        catch (const cv::Exception &e)
        {
            std::cerr << "DrowsinessDetectionSystem: OpenCV error: " << e.what() << std::endl;
            Logger::log(MonitorEvent::ERROR, e.what(), 0.0, monitor_->stateMachine().blinkCount());
        }
        catch (const std::exception &e)
        {
            std::cerr << "DrowsinessDetectionSystem: " << e.what() << std::endl;
            Logger::log(MonitorEvent::ERROR, e.what(), 0.0, monitor_->stateMachine().blinkCount());
        }
    }

    void DrowsinessDetectionSystem::logFrameEvents(const FrameResult &result, const cv::Mat &frame)
    {
        if (!result.face_found)
        {
            if (face_visible_)
                Logger::log(MonitorEvent::NO_FACE, result.hint, 0.0, result.decision.blink_count);
            face_visible_ = false;
            return;
        }
        face_visible_ = true;

        const FrameDecision &decision = result.decision;
        if (decision.blink_completed)
            Logger::log(MonitorEvent::BLINK, "Blink completed", result.ear, decision.blink_count);
        if (decision.drowsy_entered)
            Logger::log(MonitorEvent::DROWSY, "Eyes closed beyond drowsy limit", result.ear,
                        decision.blink_count, frame);
        if (decision.alert)
            Logger::log(MonitorEvent::ALERT, "Drowsiness alert", result.ear, decision.blink_count);
        if (decision.drowsy_cleared)
            Logger::log(MonitorEvent::AWAKE, "Eyes reopened", result.ear, decision.blink_count);
    }

    bool DrowsinessDetectionSystem::handleKey(int key)
    {
        if (key == Constants::ESC_KEY || key == Constants::QUIT_KEY)
            return false;

        if (key == Constants::RESET_KEY)
        {
            monitor_->reset();
            Logger::log(MonitorEvent::RESET, "Manual reset", 0.0, monitor_->stateMachine().blinkCount());
        }
        return true;
    }

    void DrowsinessDetectionSystem::drawNoFaceDetected(cv::Mat &frame, const std::string &hint)
    {
        cv::putText(frame, hint, cv::Point(10, 30),
                    cv::FONT_HERSHEY_COMPLEX, 0.5, cv::Scalar(0, 0, 255), 1, cv::LINE_AA);
        cv::putText(frame, "or decrease face_downsample_ratio", cv::Point(10, 50),
                    cv::FONT_HERSHEY_COMPLEX, 0.5, cv::Scalar(0, 0, 255), 1, cv::LINE_AA);
    }

    void DrowsinessDetectionSystem::drawVisualization(cv::Mat &frame, const LandmarkSet &landmarks,
                                                      const FrameResult &result)
    {
        const FrameDecision &decision = result.decision;
        cv::Scalar color = CVUtils::getPhaseColor(decision.phase, config_);

        for (const auto *indices : {&LandmarkIndices::LEFT_EYE, &LandmarkIndices::RIGHT_EYE})
        {
            for (int index : *indices)
            {
                if (static_cast<std::size_t>(index) < landmarks.size())
                    cv::circle(frame, landmarks[index], 1, cv::Scalar(0, 0, 255), -1, cv::LINE_AA);
            }
        }
        cv::rectangle(frame, cv::boundingRect(landmarks), color, 2);

        if (decision.drowsy)
        {
            cv::putText(frame, "! ! ! DROWSINESS ALERT ! ! !", cv::Point(70, 50),
                        cv::FONT_HERSHEY_COMPLEX, 1, cv::Scalar(0, 0, 255), 2, cv::LINE_AA);
        }
        else
        {
            cv::putText(frame, "Blinks : " + std::to_string(decision.blink_count),
                        cv::Point(frame.cols - 180, 80), cv::FONT_HERSHEY_COMPLEX, 0.8,
                        cv::Scalar(0, 0, 255), 2, cv::LINE_AA);
        }

        if (config_.show_debug_info)
        {
            const BlinkStateMachine &machine = monitor_->stateMachine();
            cv::putText(frame, "EAR: " + CVUtils::formatDouble(result.ear),
                        cv::Point(10, 90), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);
            cv::putText(frame, BlinkStateMachine::phaseToString(decision.phase),
                        cv::Point(10, 115), cv::FONT_HERSHEY_SIMPLEX, 0.6, color, 2);
            cv::putText(frame, "Closed frames: " + std::to_string(machine.closedFrames()),
                        cv::Point(10, 140), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 0), 2);

            cv::putText(frame, "EAR Thresh: " + CVUtils::formatDouble(config_.ear_threshold),
                        cv::Point(10, frame.rows - 60), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
            cv::putText(frame, "Blink limit: " + CVUtils::formatDouble(machine.blinkFrameLimit(), 1) +
                                   "  Drowsy limit: " + CVUtils::formatDouble(machine.drowsyFrameLimit(), 1),
                        cv::Point(10, frame.rows - 40), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
        }
    }

    void DrowsinessDetectionSystem::finishSession()
    {
        if (!monitor_)
            return;

        last_summary_ = monitor_->endSession();
        printSummary(std::cout, last_summary_);
        Logger::logSessionSummary(last_summary_);
    }

    void DrowsinessDetectionSystem::cleanup()
    {
        if (alarm_)
            alarm_->shutdown();
        if (config_.show_window)
            cv::destroyAllWindows();
        std::cout << "System shutdown complete" << std::endl;
    }
}
