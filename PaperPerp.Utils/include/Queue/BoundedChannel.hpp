#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include "Channel.hpp"

namespace PaperPerp::Utils::Queue
{
    // Thread-safe FIFO with a fixed capacity; a sender waits while it is full
    template <typename T>
    class BoundedChannel : public Channel<T> {
    private:
        std::deque<T> items_;
        std::size_t capacity_;

        std::mutex mtx_;
        std::condition_variable cv_not_empty_;
        std::condition_variable cv_not_full_;

    public:
        // A capacity of 0 is treated as 1
        explicit BoundedChannel(std::size_t capacity)
            : capacity_(capacity == 0 ? 1 : capacity) {
        }

        bool Send(T value) override {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_not_full_.wait(lock, [this] { return this->closed_ || items_.size() < capacity_; });
            if (this->closed_) {
                return false;
            }
            items_.push_back(std::move(value));
            cv_not_empty_.notify_one();
            return true;
        }

        std::optional<T> Receive() override {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_not_empty_.wait(lock, [this] { return this->closed_ || !items_.empty(); });
            if (items_.empty()) {
                return std::nullopt;
            }
            T front = std::move(items_.front());
            items_.pop_front();
            cv_not_full_.notify_one();
            return front;
        }

        std::size_t Size() override {
            std::lock_guard<std::mutex> lock(mtx_);
            return items_.size();
        }

        void Close() override {
            std::lock_guard<std::mutex> lock(mtx_);
            this->closed_ = true;
            cv_not_empty_.notify_all();
            cv_not_full_.notify_all();
        }
    };
}
