#pragma once

#include "../core/types.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <functional>
#include <utility>

namespace plcsim {
    namespace util {

        // ─── Delayed / periodic task scheduler ────────────────────────────────────────
        // Runs on the consumer's context and is driven by update(elapsed_ms), so its
        // clock only moves when the owner advances it. Every task is tagged with the
        // session epoch it was created for; cancel_epoch() drops all of them at once.

        using TaskId = u32;
        inline constexpr TaskId INVALID_TASK = 0;

        struct ScheduledTask {
            TaskId id = INVALID_TASK;
            dp::String name;
            u64 epoch = 0;
            u64 due_ms = 0;
            u64 period_ms = 0; // 0 = one-shot
            std::function<void()> callback;

            bool periodic() const noexcept { return period_ms > 0; }
        };

        class Scheduler {
            dp::Vector<ScheduledTask> tasks_;
            TaskId next_id_ = 1;
            u64 now_ms_ = 0;

          public:
            Scheduler() = default;

            // One-shot task firing `delay_ms` from now
            TaskId after(dp::String name, u32 delay_ms, u64 epoch, std::function<void()> callback) {
                return add(std::move(name), now_ms_ + delay_ms, 0, epoch, std::move(callback));
            }

            // Periodic task; first firing after one period, or on the next update if fire_now
            TaskId every(dp::String name, u64 period_ms, u64 epoch, std::function<void()> callback,
                         bool fire_now = false) {
                if (period_ms == 0)
                    period_ms = 1;
                u64 first = fire_now ? now_ms_ : now_ms_ + period_ms;
                return add(std::move(name), first, period_ms, epoch, std::move(callback));
            }

            bool cancel(TaskId id) {
                for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
                    if (it->id == id) {
                        tasks_.erase(it);
                        return true;
                    }
                }
                return false;
            }

            usize cancel_epoch(u64 epoch) {
                usize removed = 0;
                for (auto it = tasks_.begin(); it != tasks_.end();) {
                    if (it->epoch == epoch) {
                        it = tasks_.erase(it);
                        ++removed;
                    } else {
                        ++it;
                    }
                }
                return removed;
            }

            // Advance the clock and run everything that is due, earliest first.
            // A periodic task is rescheduled relative to the time it actually fired.
            void update(u32 elapsed_ms) {
                now_ms_ += elapsed_ms;

                dp::Vector<std::pair<u64, TaskId>> due;
                for (const auto &t : tasks_) {
                    if (t.due_ms <= now_ms_)
                        due.push_back({t.due_ms, t.id});
                }
                std::sort(due.begin(), due.end());

                for (const auto &[when, id] : due) {
                    // A previous callback may have cancelled this one
                    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                                           [id = id](const ScheduledTask &t) { return t.id == id; });
                    if (it == tasks_.end())
                        continue;

                    std::function<void()> callback = it->callback;
                    if (it->periodic()) {
                        it->due_ms = now_ms_ + it->period_ms;
                    } else {
                        tasks_.erase(it);
                    }
                    if (callback)
                        callback();
                }
            }

            bool is_pending(TaskId id) const noexcept {
                for (const auto &t : tasks_) {
                    if (t.id == id)
                        return true;
                }
                return false;
            }

            u64 now() const noexcept { return now_ms_; }
            usize count() const noexcept { return tasks_.size(); }
            void clear() { tasks_.clear(); }

          private:
            TaskId add(dp::String name, u64 due_ms, u64 period_ms, u64 epoch, std::function<void()> callback) {
                ScheduledTask task;
                task.id = next_id_++;
                task.name = std::move(name);
                task.epoch = epoch;
                task.due_ms = due_ms;
                task.period_ms = period_ms;
                task.callback = std::move(callback);
                tasks_.push_back(std::move(task));
                return tasks_.back().id;
            }
        };

    } // namespace util
    using namespace util;
} // namespace plcsim
