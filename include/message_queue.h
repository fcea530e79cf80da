#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voice_relay {

/**
 * @brief Unbounded FIFO of serialized upstream messages
 *
 * Multi-producer, single-consumer. close() wakes a blocked consumer; after
 * close, pop() returns nullopt and pushes are rejected. Entries still queued
 * at close are discarded.
 */
class MessageQueue {
public:
    MessageQueue() = default;

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /// @return false if the queue is closed
    bool push(std::string message);

    /**
     * @brief Append several messages as one contiguous run
     *
     * No other producer's message can land between them.
     * @return false if the queue is closed (nothing is added)
     */
    bool push_batch(std::vector<std::string> messages);

    /// Block until a message is available or the queue is closed
    std::optional<std::string> pop();

    void close();

    bool is_closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> messages_;
    bool closed_ = false;
};

} // namespace voice_relay
