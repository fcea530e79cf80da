#include "message_queue.h"

namespace voice_relay {

bool MessageQueue::push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        messages_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

bool MessageQueue::push_batch(std::vector<std::string> messages) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        for (auto& message : messages) {
            messages_.push_back(std::move(message));
        }
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> MessageQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !messages_.empty(); });
    if (closed_) {
        return std::nullopt;
    }
    std::string message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

void MessageQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        messages_.clear();
    }
    cv_.notify_all();
}

bool MessageQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t MessageQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

} // namespace voice_relay
