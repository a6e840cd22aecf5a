#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "bus/message.hpp"

namespace conclave::bus {

// Inbound FIFO of one agent. A capacity of 0 means unbounded.
class Mailbox {
public:
    explicit Mailbox(size_t capacity = 0);

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    // False when full or closed; the message is dropped.
    bool push(Message message);

    // Wait at most `timeout` for the next message.
    std::optional<Message> pop_for(std::chrono::milliseconds timeout);

    // Wake all waiters and reject further pushes.
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<Message> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace conclave::bus
