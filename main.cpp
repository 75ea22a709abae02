#include "fatigue_check/drowsiness_detection_system.h"
#include "fatigue_check/logger.h"
#include "fatigue_check/config.h"
#include "fatigue_check/errors.h"
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace
{
    FatigueCheck::DrowsinessDetectionSystem *g_system = nullptr;

    void handleSignal(int)
    {
        if (g_system)
            g_system->requestStop();
    }

    // Keeps the signal handler target valid only while the system is alive
    class SignalTarget
    {
    public:
        explicit SignalTarget(FatigueCheck::DrowsinessDetectionSystem &system)
        {
            g_system = &system;
            std::signal(SIGINT, handleSignal);
            std::signal(SIGTERM, handleSignal);
        }

        ~SignalTarget()
        {
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            g_system = nullptr;
        }

        SignalTarget(const SignalTarget &) = delete;
        SignalTarget &operator=(const SignalTarget &) = delete;
    };
}

int main(int argc, char **argv)
{
    try
    {
        FatigueCheck::Config config;
        if (argc > 1)
        {
            config = FatigueCheck::loadConfig(argv[1]);
            std::cout << "Loaded configuration from " << argv[1] << std::endl;
        }
        else
        {
            config.validate();
        }

        // Initialize logger with configuration
        FatigueCheck::Logger::getInstance().setupConfig(config);

        FatigueCheck::DrowsinessDetectionSystem system(config);
        if (!system.initialize())
        {
            std::cerr << "Failed to initialize drowsiness detection system" << std::endl;
            FatigueCheck::Logger::shutdown();
            return EXIT_FAILURE;
        }

        int result;
        {
            SignalTarget signal_target(system);
            result = system.run();
        }

        FatigueCheck::Logger::shutdown();
        return result;
    }
    catch (const FatigueCheck::ConfigError &e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        FatigueCheck::Logger::shutdown();
        return EXIT_FAILURE;
    }
}
