#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/state_machine.hpp"
#include "event_channel.hpp"
#include "session.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <memory>
#include <string>

namespace plcsim {
    namespace link {

        // ─── Consumer-side connection state ──────────────────────────────────────────
        enum class LinkState : u8 { Idle, Connecting, Connected, Disconnecting, Error };

        inline const char *to_string(LinkState s) noexcept {
            switch (s) {
            case LinkState::Idle:
                return "Idle";
            case LinkState::Connecting:
                return "Connecting";
            case LinkState::Connected:
                return "Connected";
            case LinkState::Disconnecting:
                return "Disconnecting";
            case LinkState::Error:
                return "Error";
            }
            return "?";
        }

        // Idle -> Connecting -> Connected -> {Disconnecting, Error} -> Idle.
        // Connecting may also end in Error or Disconnecting; a new connect may start anywhere.
        inline bool legal_transition(LinkState from, LinkState to) noexcept {
            switch (to) {
            case LinkState::Idle:
            case LinkState::Connecting:
                return true;
            case LinkState::Connected:
                return from == LinkState::Connecting;
            case LinkState::Disconnecting:
                return from == LinkState::Connecting || from == LinkState::Connected;
            case LinkState::Error:
                return from != LinkState::Idle;
            }
            return false;
        }

        // ─── Endpoint validation ─────────────────────────────────────────────────────
        inline Result<Endpoint> validate_endpoint(const dp::String &host, i64 port) {
            dp::String h = trim(host);
            if (h.empty()) {
                return Result<Endpoint>::err(Error::validation("host must not be empty"));
            }
            if (port < 1 || port > 65535) {
                return Result<Endpoint>::err(
                    Error::validation("port must be in 1..65535, got " + dp::String(std::to_string(port))));
            }
            Endpoint ep;
            ep.host = h;
            ep.port = static_cast<u16>(port);
            return Result<Endpoint>::ok(ep);
        }

        inline Result<Endpoint> validate_endpoint(const dp::String &host, const dp::String &port_text) {
            dp::String p = trim(port_text);
            if (p.empty() || p.size() > 5) {
                return Result<Endpoint>::err(Error::validation("port must be an integer in 1..65535: '" + p + "'"));
            }
            i64 port = 0;
            for (usize i = 0; i < p.size(); ++i) {
                if (p[i] < '0' || p[i] > '9') {
                    return Result<Endpoint>::err(
                        Error::validation("port must be an integer in 1..65535: '" + p + "'"));
                }
                port = port * 10 + (p[i] - '0');
            }
            return validate_endpoint(host, port);
        }

        // ─── Connection manager ──────────────────────────────────────────────────────
        // Owns at most one live session. connect(), disconnect(), send() and poll()
        // must all be called from the same (consumer) context; the session threads
        // only reach the consumer through the event channel.
        //
        // Events from anything but the current session are dropped in poll(), so a
        // late event from a torn-down or abandoned session never reaches a subscriber.
        class ConnectionManager {
            ConnectionConfig config_;
            EventChannel channel_;
            std::shared_ptr<OutboundQueue> outbound_ = std::make_shared<OutboundQueue>();
            std::shared_ptr<Session> session_;
            StateMachine<LinkState> state_{LinkState::Idle};
            SessionId current_ = 0;
            SessionId next_id_ = 1;
            u64 stale_dropped_ = 0;
            u32 abandoned_ = 0;

          public:
            explicit ConnectionManager(ConnectionConfig config = {}) : config_(config) {
                state_.set_guard(legal_transition);
            }

            ~ConnectionManager() { stop_session(); }

            ConnectionManager(const ConnectionManager &) = delete;
            ConnectionManager &operator=(const ConnectionManager &) = delete;

            Result<void> connect(const dp::String &host, i64 port) { return start(validate_endpoint(host, port)); }

            Result<void> connect(const dp::String &host, const dp::String &port_text) {
                return start(validate_endpoint(host, port_text));
            }

            // Idempotent; the final `disconnected` status arrives through poll()
            Result<void> disconnect() {
                if (!session_)
                    return {};
                echo::category("plcsim.link").info("disconnect requested for session ", current_);
                stop_session();
                return {};
            }

            // Queue one frame for the send loop
            Result<void> send(const dp::String &frame) {
                if (!state_.is(LinkState::Connected)) {
                    return Result<void>::err(Error::not_connected());
                }
                if (frame.size() != TELEGRAM_LEN) {
                    return Result<void>::err(
                        Error(ErrorCode::Framing, "frame must be " + dp::String(std::to_string(TELEGRAM_LEN)) +
                                                      " bytes, got " + dp::String(std::to_string(frame.size()))));
                }
                outbound_->push(frame);
                return {};
            }

            // Drain the channel and dispatch every current-session event in order.
            // Returns the number of events dispatched.
            usize poll() {
                usize dispatched = 0;
                auto events = channel_.drain();
                for (const auto &ev : events) {
                    if (ev.session != current_) {
                        stale_dropped_++;
                        echo::category("plcsim.link").debug("dropping event from stale session ", ev.session);
                        continue;
                    }

                    if (ev.kind == LinkEventKind::Status) {
                        apply_status(ev.status);
                    }
                    channel_.dispatch(ev);
                    dispatched++;

                    if (ev.session_end) {
                        state_.transition(LinkState::Idle);
                        reap();
                    }
                }
                return dispatched;
            }

            LinkState state() const noexcept { return state_.state(); }
            bool connected() const noexcept { return state_.is(LinkState::Connected); }
            bool active() const noexcept { return static_cast<bool>(session_); }

            SessionId session() const noexcept { return current_; }
            usize outbound_pending() const { return outbound_->size(); }
            u64 stale_dropped() const noexcept { return stale_dropped_; }
            u32 abandoned_sessions() const noexcept { return abandoned_; }

            const ConnectionConfig &config() const noexcept { return config_; }

            EventChannel &events() noexcept { return channel_; }

            Event<LinkState, LinkState> &on_state_change() noexcept { return state_.on_transition; }

          private:
            Result<void> start(Result<Endpoint> endpoint) {
                if (endpoint.is_err()) {
                    echo::category("plcsim.link").warn("connect rejected: ", endpoint.error().message);
                    channel_.push(LinkEvent::failure(current_, endpoint.error()));
                    return Result<void>::err(endpoint.error());
                }

                stop_session();

                usize stale_events = channel_.discard();
                usize stale_frames = outbound_->clear();
                if (stale_events > 0 || stale_frames > 0) {
                    echo::category("plcsim.link")
                        .debug("discarded ", stale_events, " stale events and ", stale_frames, " queued frames");
                }

                current_ = next_id_++;
                state_.transition(LinkState::Connecting);
                channel_.push(LinkEvent::status_change(current_, LinkStatus::Connecting));

                auto session =
                    std::make_shared<Session>(current_, endpoint.value(), config_, channel_.sink(), outbound_);
                auto started = session->start();
                if (started.is_err()) {
                    channel_.push(LinkEvent::status_change(current_, LinkStatus::Error));
                    channel_.push(LinkEvent::failure(current_, started.error(), true));
                    return Result<void>::err(started.error());
                }
                session_ = std::move(session);

                echo::category("plcsim.link")
                    .info("session ", current_, " started for ", endpoint.value().host, ":", endpoint.value().port);
                return {};
            }

            void stop_session() {
                if (!session_)
                    return;

                if (state_.is_any(LinkState::Connecting, LinkState::Connected)) {
                    state_.transition(LinkState::Disconnecting);
                }

                session_->request_stop();
                if (!session_->join_for(config_.join_timeout_ms)) {
                    abandoned_++;
                    echo::category("plcsim.link")
                        .warn("session ", session_->id(), " did not stop within ", config_.join_timeout_ms,
                              " ms, abandoning it");
                }
                session_.reset();
            }

            // Release a session whose worker has already pushed its last event
            void reap() {
                if (session_ && session_->finished()) {
                    session_->join_for(config_.join_timeout_ms);
                    session_.reset();
                }
            }

            void apply_status(LinkStatus status) {
                LinkState next = LinkState::Idle;
                switch (status) {
                case LinkStatus::Connecting:
                    next = LinkState::Connecting;
                    break;
                case LinkStatus::Connected:
                    next = LinkState::Connected;
                    break;
                case LinkStatus::Disconnected:
                    next = LinkState::Idle;
                    break;
                case LinkStatus::Error:
                    next = LinkState::Error;
                    break;
                }
                if (!state_.transition(next)) {
                    echo::category("plcsim.link")
                        .debug("ignoring ", to_string(state_.state()), " -> ", to_string(next), " for session ",
                               current_);
                }
            }
        };

    } // namespace link
    using namespace link;
} // namespace plcsim
