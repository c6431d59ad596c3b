#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../link/connection.hpp"
#include "../link/event_channel.hpp"
#include "engine.hpp"
#include "event_log.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace plcsim {
    namespace sim {

        // ─── Operator telegram ───────────────────────────────────────────────────────
        struct ManualTelegram {
            dp::String type = "LI";
            dp::String subtype = DEFAULT_SUBTYPE;
            dp::String data;
            HandshakeTag tag = HandshakeTag::None;

            ManualTelegram &with_type(dp::String t) {
                type = std::move(t);
                return *this;
            }
            ManualTelegram &with_subtype(dp::String s) {
                subtype = std::move(s);
                return *this;
            }
            ManualTelegram &with_data(dp::String d) {
                data = std::move(d);
                return *this;
            }
            ManualTelegram &with_tag(HandshakeTag t) {
                tag = t;
                return *this;
            }
        };

        // ─── Device simulator ────────────────────────────────────────────────────────
        // Consumer-facing front: one connection manager, one engine, one event log.
        // Everything runs on the caller's context through update(elapsed_ms).
        // Subscribers attach to events(); the log and the engine see every event
        // before they do.
        class DeviceSimulator {
            ConnectionManager link_;
            SimulationEngine engine_;
            EventLog log_;
            dp::Map<Sequence, HandshakeTag> pending_tags_;
            dp::String target_;

          public:
            explicit DeviceSimulator(SimulatorConfig sim = {}, ConnectionConfig link = {},
                                     usize log_capacity = EVENT_LOG_CAPACITY)
                : link_(link), engine_(sim, [this](const dp::String &frame) { return link_.send(frame); }),
                  log_(log_capacity) {
                link_.events().on_event.subscribe([this](const LinkEvent &ev) { on_link_event(ev); });
            }

            DeviceSimulator(const DeviceSimulator &) = delete;
            DeviceSimulator &operator=(const DeviceSimulator &) = delete;

            // ─── Commands ────────────────────────────────────────────────────────────
            Result<void> connect(const dp::String &host, i64 port) {
                target_ = trim(host) + ":" + dp::String(std::to_string(port));
                return started(link_.connect(host, port));
            }

            Result<void> connect(const dp::String &host, const dp::String &port_text) {
                target_ = trim(host) + ":" + trim(port_text);
                return started(link_.connect(host, port_text));
            }

            Result<void> disconnect() {
                engine_.end_session();
                return link_.disconnect();
            }

            Result<Sequence> send_manual(const ManualTelegram &t) {
                return track(engine_.send_manual(t.type, t.data, t.subtype), t.tag);
            }

            Result<Sequence> send_error(const dp::String &code, const dp::String &message,
                                        HandshakeTag tag = HandshakeTag::None) {
                return track(engine_.send_error(code, message), tag);
            }

            // Operator actions on a received MOVE
            Result<Sequence> send_confirm_for(const Telegram &received, HandshakeTag tag = HandshakeTag::None) {
                auto order = move_order(received);
                if (order.is_err())
                    return Result<Sequence>::err(order.error());
                return track(engine_.send_confirm_for(order.value()), tag);
            }

            Result<Sequence> send_error_for(const Telegram &received, HandshakeTag tag = HandshakeTag::None) {
                auto order = move_order(received);
                if (order.is_err())
                    return Result<Sequence>::err(order.error());
                return track(engine_.send_error_for(order.value()), tag);
            }

            void toggle_auto_life(bool enabled, u32 interval_s = LIFE_INTERVAL_S) {
                engine_.set_auto_life(enabled, interval_s);
                log_.note(enabled ? "Auto-life on, every " + dp::String(std::to_string(engine_.life_interval())) + " s"
                                  : dp::String("Auto-life off"));
            }

            void toggle_auto_confirm(bool enabled) {
                engine_.set_auto_confirm(enabled);
                log_.note(enabled ? "Auto-confirm on" : "Auto-confirm off");
            }

            // Dispatch pending link events, then run due timers
            void update(u32 elapsed_ms) {
                link_.poll();
                engine_.update(elapsed_ms);
            }

            // ─── Accessors ───────────────────────────────────────────────────────────
            EventChannel &events() noexcept { return link_.events(); }
            ConnectionManager &link() noexcept { return link_; }
            const SimulationEngine &engine() const noexcept { return engine_; }
            EventLog &log() noexcept { return log_; }
            const EventLog &log() const noexcept { return log_; }

            LinkState state() const noexcept { return link_.state(); }
            bool connected() const noexcept { return link_.connected(); }
            usize pending_tags() const noexcept { return pending_tags_.size(); }

          private:
            // A new session starts with no tags left over from the previous one
            Result<void> started(Result<void> r) {
                if (r.is_ok())
                    pending_tags_.clear();
                return r;
            }

            Result<Sequence> track(Result<Sequence> r, HandshakeTag tag) {
                if (r.is_err()) {
                    if (r.error().code == ErrorCode::NotConnected)
                        log_.note("Not connected");
                    return r;
                }
                if (tag != HandshakeTag::None)
                    pending_tags_[r.value()] = tag;
                return r;
            }

            static Result<MoveOrder> move_order(const Telegram &t) {
                if (!t.is(TelegramType::Move)) {
                    return Result<MoveOrder>::err(
                        Error::validation("not a MOVE telegram: '" + t.code + "'"));
                }
                return Result<MoveOrder>::ok(t.move());
            }

            void on_link_event(const LinkEvent &ev) {
                switch (ev.kind) {
                case LinkEventKind::Status:
                    note_status(ev.status);
                    if (ev.status == LinkStatus::Disconnected || ev.status == LinkStatus::Error)
                        pending_tags_.clear();
                    break;
                case LinkEventKind::Received:
                    log_.record(Direction::Rx, ev.telegram, ev.quality == DecodeQuality::Recovered);
                    break;
                case LinkEventKind::Sent: {
                    HandshakeTag tag = HandshakeTag::None;
                    auto it = pending_tags_.find(ev.telegram.sequence);
                    if (it != pending_tags_.end()) {
                        tag = it->second;
                        pending_tags_.erase(it);
                    }
                    log_.record(Direction::Tx, ev.telegram, ev.quality == DecodeQuality::Recovered, tag);
                    break;
                }
                case LinkEventKind::Error:
                    log_.note("ERROR: " + ev.error.message);
                    echo::category("plcsim.device").warn(ev.error.message);
                    break;
                }
                engine_.handle(ev);
            }

            void note_status(LinkStatus status) {
                switch (status) {
                case LinkStatus::Connecting:
                    log_.note("Connecting to " + target_ + " ...");
                    break;
                case LinkStatus::Connected:
                    log_.note("Connected to " + target_);
                    break;
                case LinkStatus::Disconnected:
                    log_.note("Disconnected");
                    break;
                case LinkStatus::Error:
                    log_.note("Connection to " + target_ + " failed");
                    break;
                }
                echo::category("plcsim.device").info("link ", to_string(status));
            }
        };

    } // namespace sim
    using namespace sim;
} // namespace plcsim
