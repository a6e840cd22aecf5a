#include "bus/mailbox.hpp"

namespace conclave::bus {

Mailbox::Mailbox(size_t capacity) : capacity_(capacity) {}

bool Mailbox::push(Message message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (capacity_ > 0 && queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

std::optional<Message> Mailbox::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Message message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void Mailbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Mailbox::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Mailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace conclave::bus
