#pragma once

#include "../core/types.hpp"
#include "event.hpp"
#include <functional>

namespace plcsim {
    namespace util {

        // ─── Guarded state machine ───────────────────────────────────────────────────
        // Holds one enum state. An optional guard decides which (from, to) moves are
        // legal; refused moves leave the state untouched and fire nothing.
        template <typename StateEnum> class StateMachine {
            StateEnum state_;
            StateEnum previous_;
            u32 changes_ = 0;
            std::function<bool(StateEnum, StateEnum)> guard_;

          public:
            explicit StateMachine(StateEnum initial) : state_(initial), previous_(initial) {}

            StateEnum state() const noexcept { return state_; }
            StateEnum previous() const noexcept { return previous_; }
            u32 changes() const noexcept { return changes_; }

            void set_guard(std::function<bool(StateEnum, StateEnum)> guard) { guard_ = std::move(guard); }

            bool can_transition(StateEnum to) const { return to == state_ || !guard_ || guard_(state_, to); }

            // Returns false if the guard refused the move
            bool transition(StateEnum to) {
                if (to == state_)
                    return true;
                if (guard_ && !guard_(state_, to))
                    return false;
                previous_ = state_;
                state_ = to;
                changes_++;
                on_transition.emit(previous_, to);
                return true;
            }

            bool is(StateEnum s) const noexcept { return state_ == s; }

            template <typename... S> bool is_any(S... s) const noexcept { return ((state_ == s) || ...); }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace plcsim
