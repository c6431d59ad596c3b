#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../telegram/telegram.hpp"
#include "../util/concurrent_queue.hpp"
#include "../util/event.hpp"
#include <datapod/datapod.hpp>
#include <memory>

namespace plcsim {
    namespace link {

        // ─── Session status as reported on the channel ───────────────────────────────
        enum class LinkStatus : u8 { Connecting, Connected, Disconnected, Error };

        inline const char *to_string(LinkStatus s) noexcept {
            switch (s) {
            case LinkStatus::Connecting:
                return "connecting";
            case LinkStatus::Connected:
                return "connected";
            case LinkStatus::Disconnected:
                return "disconnected";
            case LinkStatus::Error:
                return "error";
            }
            return "?";
        }

        enum class LinkEventKind : u8 { Status, Received, Sent, Error };

        // ─── Channel event ───────────────────────────────────────────────────────────
        // Stamped with the session that produced it. `session_end` marks the last
        // event a session will ever push.
        struct LinkEvent {
            LinkEventKind kind = LinkEventKind::Status;
            SessionId session = 0;
            LinkStatus status = LinkStatus::Disconnected;
            Telegram telegram;
            DecodeQuality quality = DecodeQuality::Parsed;
            Error error;
            bool session_end = false;

            static LinkEvent status_change(SessionId session, LinkStatus status, bool last = false) {
                LinkEvent ev;
                ev.kind = LinkEventKind::Status;
                ev.session = session;
                ev.status = status;
                ev.session_end = last;
                return ev;
            }

            static LinkEvent received(SessionId session, Decoded decoded) {
                LinkEvent ev;
                ev.kind = LinkEventKind::Received;
                ev.session = session;
                ev.telegram = std::move(decoded.telegram);
                ev.quality = decoded.quality;
                return ev;
            }

            static LinkEvent sent(SessionId session, Decoded decoded) {
                LinkEvent ev = received(session, std::move(decoded));
                ev.kind = LinkEventKind::Sent;
                return ev;
            }

            static LinkEvent failure(SessionId session, Error error, bool last = false) {
                LinkEvent ev;
                ev.kind = LinkEventKind::Error;
                ev.session = session;
                ev.error = std::move(error);
                ev.session_end = last;
                return ev;
            }
        };

        using EventQueue = ConcurrentQueue<LinkEvent>;

        // ─── Event channel ───────────────────────────────────────────────────────────
        // Producers (session threads) only see the shared queue; subscription and
        // dispatch happen on the consumer's context.
        class EventChannel {
            std::shared_ptr<EventQueue> queue_ = std::make_shared<EventQueue>();

          public:
            std::shared_ptr<EventQueue> sink() const { return queue_; }

            void push(LinkEvent ev) { queue_->push(std::move(ev)); }

            dp::Vector<LinkEvent> drain() { return queue_->drain(); }

            usize discard() { return queue_->clear(); }

            usize pending() const { return queue_->size(); }

            void dispatch(const LinkEvent &ev) {
                on_event.emit(ev);
                switch (ev.kind) {
                case LinkEventKind::Status:
                    on_status.emit(ev.status);
                    break;
                case LinkEventKind::Received:
                    on_received.emit(ev.telegram);
                    break;
                case LinkEventKind::Sent:
                    on_sent.emit(ev.telegram);
                    break;
                case LinkEventKind::Error:
                    on_error.emit(ev.error);
                    break;
                }
            }

            // Raw events, for subscribers that need the session stamp
            Event<const LinkEvent &> on_event;

            Event<LinkStatus> on_status;
            Event<const Telegram &> on_received;
            Event<const Telegram &> on_sent;
            Event<const Error &> on_error;
        };

    } // namespace link
    using namespace link;
} // namespace plcsim
