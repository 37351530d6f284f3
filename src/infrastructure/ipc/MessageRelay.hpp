#pragma once

#include "core/types/WindowMessage.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace pipeweaver::infra {

/**
 * @brief Multi-producer, single-consumer queue of window messages.
 *
 * Carries events from the background channels (control listener, liveness
 * client) to the UI thread. Producers never block on the consumer; the queue
 * is unbounded and nothing is dropped once enqueued. Messages from a single
 * producer are received in send order, with no ordering across producers.
 *
 * @note Thread-safe for concurrent send(). tryReceive() and drain() are meant
 *       for a single consumer thread.
 */
class MessageRelay {
public:
    MessageRelay() = default;

    MessageRelay(const MessageRelay&) = delete;
    MessageRelay& operator=(const MessageRelay&) = delete;

    /**
     * @brief Enqueues a message.
     * @param message Message to deliver to the consumer.
     */
    void send(core::WindowMessage message);

    /**
     * @brief Removes the oldest pending message without blocking.
     * @return The message, or nullopt if the queue is empty.
     */
    std::optional<core::WindowMessage> tryReceive();

    /**
     * @brief Removes every pending message without blocking.
     * @return Pending messages in dequeue order.
     */
    std::vector<core::WindowMessage> drain();

    /**
     * @brief Number of messages waiting for the consumer.
     */
    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<core::WindowMessage> queue_;
};

} // namespace pipeweaver::infra
