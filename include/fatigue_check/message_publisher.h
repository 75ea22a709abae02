#ifndef FATIGUE_CHECK_MESSAGE_PUBLISHER_H
#define FATIGUE_CHECK_MESSAGE_PUBLISHER_H

#include <zmq.hpp>
#include <string>
#include <memory>
#include <mutex>

namespace FatigueCheck
{
    namespace Topics
    {
        constexpr const char *EVENT = "fatigue.event";
        constexpr const char *SUMMARY = "fatigue.summary";
    }

    /**
     * @brief Publishes monitor events and session summaries on a ZeroMQ PUB socket
     *
     * Every message is two frames: the topic, then a JSON payload, so
     * subscribers can filter on "fatigue.event" or "fatigue.summary".
     */
    class MessagePublisher
    {
    private:
        std::unique_ptr<zmq::context_t> context_;
        std::unique_ptr<zmq::socket_t> publisher_;
        std::string endpoint_;
        bool is_initialized_;
        mutable std::mutex publisher_mutex_;

        // Statistics for monitoring
        size_t messages_sent_;
        size_t failed_sends_;

        void shutdownLocked();

    public:
        MessagePublisher();
        ~MessagePublisher();

        /**
         * @brief Bind the publisher socket
         * @param endpoint ZeroMQ endpoint (e.g., "tcp://*:5555" or "ipc:///tmp/fatigue_events")
         * @return true if successful, false otherwise
         */
        bool initialize(const std::string &endpoint);

        /**
         * @brief Publish one topic + JSON message without blocking
         * @return false if the socket is not ready or its queue is full
         */
        bool publish(const std::string &topic, const std::string &json_message);

        bool isReady() const;

        void shutdown();

        MessagePublisher(const MessagePublisher &) = delete;
        MessagePublisher &operator=(const MessagePublisher &) = delete;
    };
}

#endif // FATIGUE_CHECK_MESSAGE_PUBLISHER_H
