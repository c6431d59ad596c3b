#pragma once

#include "../core/types.hpp"

namespace plcsim {
    namespace util {

        // ─── Rate gate ────────────────────────────────────────────────────────────────
        // Lets at most one pass through per `min_gap_ms`. Requests inside the window
        // are refused, not queued.
        class RateGate {
            u32 min_gap_ms_ = 0;
            u64 last_ms_ = 0;
            bool armed_ = false;
            u32 refused_ = 0;

          public:
            RateGate() = default;
            explicit RateGate(u32 min_gap_ms) : min_gap_ms_(min_gap_ms) {}

            bool try_pass(u64 now_ms) noexcept {
                if (armed_ && now_ms - last_ms_ < min_gap_ms_) {
                    refused_++;
                    return false;
                }
                last_ms_ = now_ms;
                armed_ = true;
                return true;
            }

            void set_gap(u32 ms) noexcept { min_gap_ms_ = ms; }
            u32 gap() const noexcept { return min_gap_ms_; }

            bool armed() const noexcept { return armed_; }
            u64 last_pass() const noexcept { return last_ms_; }
            u32 refused() const noexcept { return refused_; }

            void reset() noexcept {
                armed_ = false;
                last_ms_ = 0;
                refused_ = 0;
            }
        };

    } // namespace util
    using namespace util;
} // namespace plcsim
