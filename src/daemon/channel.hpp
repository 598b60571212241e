#pragma once

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <sys/eventfd.h>
#include <unistd.h>

// Bounded FIFO handed between worker threads and the coordinator.
// Every push bumps an eventfd so the consumer can sit in epoll.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity),
          event_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {}

    ~Channel() {
        if (event_fd_ >= 0) ::close(event_fd_);
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Blocks while full. Returns false once the channel is closed.
    bool push(T item) {
        {
            std::unique_lock lock(mu_);
            not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
            if (closed_) return false;
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        signal();
        return true;
    }

    // Never blocks: a full channel loses its oldest entry instead.
    // Returns true if something was dropped.
    bool push_drop_oldest(T item) {
        bool dropped = false;
        {
            std::lock_guard lock(mu_);
            if (closed_) return false;
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
                dropped = true;
            }
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        signal();
        return dropped;
    }

    std::optional<T> try_pop() {
        std::optional<T> item;
        {
            std::lock_guard lock(mu_);
            if (queue_.empty()) return std::nullopt;
            item.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::optional<T> item;
        {
            std::unique_lock lock(mu_);
            if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); }))
                return std::nullopt;
            if (queue_.empty()) return std::nullopt;
            item.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mu_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        signal();
    }

    bool closed() const {
        std::lock_guard lock(mu_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard lock(mu_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard lock(mu_);
        return queue_.size();
    }

    uint64_t dropped() const {
        std::lock_guard lock(mu_);
        return dropped_;
    }

    // Readable whenever something was pushed since the last clear_notification().
    int notify_fd() const { return event_fd_; }

    void clear_notification() {
        uint64_t val;
        while (::read(event_fd_, &val, sizeof(val)) > 0) {}
    }

private:
    void signal() {
        uint64_t val = 1;
        while (::write(event_fd_, &val, sizeof(val)) < 0 && errno == EINTR) {}
    }

    const size_t capacity_;
    int event_fd_ = -1;

    mutable std::mutex mu_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};
