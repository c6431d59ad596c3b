#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"

namespace plcsim {
    namespace sim {

        // ─── Telegram sequence counter ───────────────────────────────────────────────
        // Pre-increment, so the first value handed out is 1. Wraps to 0 after 999999.
        class SequenceCounter {
            Sequence value_ = 0;

          public:
            SequenceCounter() = default;
            explicit SequenceCounter(Sequence start) : value_(start % SEQUENCE_MODULO) {}

            Sequence next() noexcept {
                value_ = static_cast<Sequence>((value_ + 1) % SEQUENCE_MODULO);
                return value_;
            }

            Sequence current() const noexcept { return value_; }

            void reset(Sequence value = 0) noexcept { value_ = value % SEQUENCE_MODULO; }
        };

    } // namespace sim
    using namespace sim;
} // namespace plcsim
