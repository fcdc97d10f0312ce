#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>
#include <utility>

namespace imgbuild {

// Bounded FIFO between threads. Send blocks while full, Receive blocks while
// empty; both give up when their stop token fires. After Close(), Send fails
// and Receive drains what is left, then reports end of stream.
template <typename T>
class Channel {
  public:
    explicit Channel(std::size_t capacity = 1) : capacity_(capacity ? capacity : 1) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // False when the channel is closed or `st` was stopped.
    bool Send(T value, std::stop_token st = {}) {
        std::unique_lock<std::mutex> lk(mu_);
        if (!not_full_.wait(lk, st, [&] { return closed_ || queue_.size() < capacity_; })) {
            return false;
        }
        if (closed_) return false;
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    // False at end of stream (closed and drained) or when `st` was stopped.
    bool Receive(T& out, std::stop_token st = {}) {
        std::unique_lock<std::mutex> lk(mu_);
        if (!not_empty_.wait(lk, st, [&] { return closed_ || !queue_.empty(); })) {
            return false;
        }
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void Close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

  private:
    mutable std::mutex mu_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    std::deque<T> queue_;
    std::size_t capacity_;
    bool closed_ = false;
};

} // namespace imgbuild
