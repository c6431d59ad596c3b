#pragma once

#include "../core/types.hpp"
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <deque>
#include <mutex>
#include <utility>

namespace plcsim {
    namespace util {

        // ─── Thread-safe FIFO ─────────────────────────────────────────────────────────
        // Unbounded multi-producer queue. Consumers either drain without blocking or
        // wait for at most a given time, so a stop request is never blocked on it.
        template <typename T> class ConcurrentQueue {
            mutable std::mutex mutex_;
            std::condition_variable cv_;
            std::deque<T> items_;

          public:
            ConcurrentQueue() = default;
            ConcurrentQueue(const ConcurrentQueue &) = delete;
            ConcurrentQueue &operator=(const ConcurrentQueue &) = delete;

            void push(T value) {
                {
                    std::lock_guard lock(mutex_);
                    items_.push_back(std::move(value));
                }
                cv_.notify_one();
            }

            dp::Optional<T> try_pop() {
                std::lock_guard lock(mutex_);
                if (items_.empty())
                    return dp::nullopt;
                T value = std::move(items_.front());
                items_.pop_front();
                return value;
            }

            dp::Optional<T> pop_for(std::chrono::milliseconds timeout) {
                std::unique_lock lock(mutex_);
                if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); }))
                    return dp::nullopt;
                T value = std::move(items_.front());
                items_.pop_front();
                return value;
            }

            // Take everything queued right now, in FIFO order
            dp::Vector<T> drain() {
                std::deque<T> taken;
                {
                    std::lock_guard lock(mutex_);
                    taken.swap(items_);
                }
                dp::Vector<T> out;
                for (auto &item : taken)
                    out.push_back(std::move(item));
                return out;
            }

            // Discard everything queued; returns how many items were dropped
            usize clear() {
                std::lock_guard lock(mutex_);
                usize n = items_.size();
                items_.clear();
                return n;
            }

            usize size() const {
                std::lock_guard lock(mutex_);
                return items_.size();
            }

            bool empty() const { return size() == 0; }
        };

    } // namespace util
    using namespace util;
} // namespace plcsim
