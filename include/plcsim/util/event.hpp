#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace plcsim {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Type-safe event dispatcher ──────────────────────────────────────────────
        // Single-threaded: subscribe, unsubscribe and emit all run on the consumer's
        // context. Removal during dispatch is deferred until the dispatch ends.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = 0;
                std::function<void(Args...)> fn;
                bool pending_remove = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            u32 dispatch_depth_ = 0;

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token == token && !it->pending_remove) {
                        if (dispatch_depth_ > 0) {
                            it->pending_remove = true;
                        } else {
                            listeners_.erase(it);
                        }
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                ++dispatch_depth_;
                // Listeners added during dispatch are not called until the next emit
                usize n = listeners_.size();
                for (usize i = 0; i < n && i < listeners_.size(); ++i) {
                    if (!listeners_[i].pending_remove && listeners_[i].fn) {
                        // Copy: a listener may subscribe and grow the vector under us
                        auto fn = listeners_[i].fn;
                        fn(args...);
                    }
                }
                --dispatch_depth_;

                if (dispatch_depth_ == 0) {
                    for (auto it = listeners_.begin(); it != listeners_.end();) {
                        if (it->pending_remove) {
                            it = listeners_.erase(it);
                        } else {
                            ++it;
                        }
                    }
                }
            }

            dp::usize count() const noexcept {
                dp::usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.pending_remove)
                        active++;
                }
                return active;
            }

            void clear() { listeners_.clear(); }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace plcsim
