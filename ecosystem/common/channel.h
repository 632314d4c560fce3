#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace gdp::common {

    // One-directional producer/consumer queue with a close-on-cancel contract.
    //
    // The queue is bounded: when `capacity` items are pending, `send` discards the oldest one
    // so a producer never blocks on a slow or absent consumer. After `close`, pending items can
    // still be drained and `receive` returns std::nullopt once the queue is empty.
    template<typename T>
    class channel {

        public:

            explicit channel(const size_t &capacity = 16) : capacity_(capacity == 0 ? 1 : capacity) {}

            channel(const channel &) = delete;
            channel &operator=(const channel &) = delete;

            // Returns false if the channel was closed; the item is discarded in that case.
            bool send(T item) {
                {
                    std::lock_guard guard(mutex_);
                    if (closed_) return false;
                    if (items_.size() >= capacity_) {
                        items_.pop_front();
                        dropped_++;
                    }
                    items_.push_back(std::move(item));
                }
                available_.notify_one();
                return true;
            }

            void close() {
                {
                    std::lock_guard guard(mutex_);
                    closed_ = true;
                }
                available_.notify_all();
            }

            std::optional<T> receive() {
                std::unique_lock lock(mutex_);
                available_.wait(lock, [this] { return closed_ || !items_.empty(); });
                return pop();
            }

            std::optional<T> receive_for(const std::chrono::steady_clock::duration &timeout) {
                std::unique_lock lock(mutex_);
                available_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
                return pop();
            }

            std::optional<T> try_receive() {
                std::lock_guard guard(mutex_);
                return pop();
            }

            bool is_closed() const {
                std::lock_guard guard(mutex_);
                return closed_;
            }

            size_t dropped() const {
                std::lock_guard guard(mutex_);
                return dropped_;
            }

        private:

            std::optional<T> pop() {
                if (items_.empty()) return std::nullopt;
                std::optional<T> item(std::move(items_.front()));
                items_.pop_front();
                return item;
            }

            const size_t capacity_;
            mutable std::mutex mutex_;
            std::condition_variable available_;
            std::deque<T> items_;
            size_t dropped_ = 0;
            bool closed_ = false;
    };
}
