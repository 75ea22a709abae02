#include "fatigue_check/message_publisher.h"
#include <iostream>

namespace FatigueCheck
{
    MessagePublisher::MessagePublisher()
        : context_(nullptr),
          publisher_(nullptr),
          is_initialized_(false),
          messages_sent_(0),
          failed_sends_(0)
    {
    }

    MessagePublisher::~MessagePublisher()
    {
        shutdown();
    }

    bool MessagePublisher::initialize(const std::string &endpoint)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);

        try
        {
            if (is_initialized_)
                shutdownLocked();

            endpoint_ = endpoint;
            context_ = std::make_unique<zmq::context_t>(1);
            publisher_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

            publisher_->set(zmq::sockopt::linger, 1000);
            publisher_->set(zmq::sockopt::sndhwm, 1000);
            publisher_->bind(endpoint_);

            is_initialized_ = true;
            messages_sent_ = 0;
            failed_sends_ = 0;

            std::cout << "MessagePublisher: Bound to " << endpoint_ << std::endl;
            return true;
        }
        catch (const zmq::error_t &e)
        {
            std::cerr << "MessagePublisher: ZeroMQ error during initialization: " << e.what() << std::endl;
            publisher_.reset();
            context_.reset();
            is_initialized_ = false;
            return false;
        }
    }

    bool MessagePublisher::publish(const std::string &topic, const std::string &json_message)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);

        if (!is_initialized_ || !publisher_)
        {
            failed_sends_++;
            return false;
        }

        try
        {
            zmq::send_result_t topic_result =
                publisher_->send(zmq::buffer(topic), zmq::send_flags::sndmore | zmq::send_flags::dontwait);
            if (!topic_result.has_value())
            {
                failed_sends_++;
                std::cerr << "MessagePublisher: Send would block - message queue full" << std::endl;
                return false;
            }

            // PUB sockets deliver multipart messages atomically once the first part is queued
            publisher_->send(zmq::buffer(json_message), zmq::send_flags::none);
            messages_sent_++;
            return true;
        }
        catch (const zmq::error_t &e)
        {
            failed_sends_++;
            std::cerr << "MessagePublisher: ZeroMQ error during send: " << e.what() << std::endl;
            return false;
        }
    }

    bool MessagePublisher::isReady() const
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        return is_initialized_ && publisher_ != nullptr;
    }

    void MessagePublisher::shutdown()
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        shutdownLocked();
    }

    void MessagePublisher::shutdownLocked()
    {
        if (!is_initialized_)
            return;

        try
        {
            if (publisher_)
            {
                publisher_->close();
                publisher_.reset();
            }
            if (context_)
            {
                context_->close();
                context_.reset();
            }
        }
        catch (const zmq::error_t &e)
        {
            std::cerr << "MessagePublisher: Error during shutdown: " << e.what() << std::endl;
        }
        is_initialized_ = false;

        std::cout << "MessagePublisher: Shutdown complete. Stats - Sent: "
                  << messages_sent_ << ", Failed: " << failed_sends_ << std::endl;
    }
}
