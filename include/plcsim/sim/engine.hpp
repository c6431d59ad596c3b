#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../link/event_channel.hpp"
#include "../telegram/codec.hpp"
#include "../util/scheduler.hpp"
#include "../util/timer.hpp"
#include "sequence.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>
#include <string>

namespace plcsim {
    namespace sim {

        inline u32 clamp_life_interval(u32 seconds) noexcept {
            if (seconds < LIFE_INTERVAL_MIN_S)
                return LIFE_INTERVAL_MIN_S;
            if (seconds > LIFE_INTERVAL_MAX_S)
                return LIFE_INTERVAL_MAX_S;
            return seconds;
        }

        // Operator-typed interval: whole seconds in 1 .. 24 h, anything else is rejected
        inline Result<u32> parse_life_interval(const dp::String &text) {
            dp::String t = trim(text);
            if (t.empty() || t.size() > 5) {
                return Result<u32>::err(Error::validation("life interval must be 1.." +
                                                          dp::String(std::to_string(LIFE_INTERVAL_MAX_S)) +
                                                          " seconds: '" + t + "'"));
            }
            u32 seconds = 0;
            for (usize i = 0; i < t.size(); ++i) {
                if (t[i] < '0' || t[i] > '9') {
                    return Result<u32>::err(Error::validation("life interval is not a number: '" + t + "'"));
                }
                seconds = seconds * 10 + static_cast<u32>(t[i] - '0');
            }
            if (seconds < LIFE_INTERVAL_MIN_S || seconds > LIFE_INTERVAL_MAX_S) {
                return Result<u32>::err(Error::validation("life interval must be 1.." +
                                                          dp::String(std::to_string(LIFE_INTERVAL_MAX_S)) +
                                                          " seconds: '" + t + "'"));
            }
            return Result<u32>::ok(seconds);
        }

        // ─── Simulator configuration ─────────────────────────────────────────────────
        struct SimulatorConfig {
            dp::String device_id = DEFAULT_DEVICE_ID;
            dp::String host_id = DEFAULT_HOST_ID;
            u32 life_interval_s = LIFE_INTERVAL_S;
            bool auto_life_enabled = false;
            bool auto_confirm_enabled = true;
            u32 confirm_delay_ms = CONFIRM_DELAY_MS;
            u32 pong_delay_ms = PONG_DELAY_MS;
            u32 pong_gap_ms = PONG_MIN_GAP_MS;

            SimulatorConfig &device(dp::String id) {
                device_id = std::move(id);
                return *this;
            }
            SimulatorConfig &host(dp::String id) {
                host_id = std::move(id);
                return *this;
            }
            SimulatorConfig &life_interval(u32 seconds) {
                life_interval_s = seconds;
                return *this;
            }
            SimulatorConfig &auto_life(bool enabled) {
                auto_life_enabled = enabled;
                return *this;
            }
            SimulatorConfig &auto_confirm(bool enabled) {
                auto_confirm_enabled = enabled;
                return *this;
            }
            SimulatorConfig &confirm_delay(u32 ms) {
                confirm_delay_ms = ms;
                return *this;
            }
            SimulatorConfig &pong_delay(u32 ms) {
                pong_delay_ms = ms;
                return *this;
            }
            SimulatorConfig &pong_gap(u32 ms) {
                pong_gap_ms = ms;
                return *this;
            }

            // Empty ids fall back to the defaults; interval is clamped to 1 s .. 24 h
            SimulatorConfig normalized() const {
                SimulatorConfig c = *this;
                if (trim(c.device_id).empty())
                    c.device_id = DEFAULT_DEVICE_ID;
                if (trim(c.host_id).empty())
                    c.host_id = DEFAULT_HOST_ID;
                c.life_interval_s = clamp_life_interval(c.life_interval_s);
                return c;
            }
        };

        struct EngineStats {
            u32 pings_sent = 0;
            u32 pongs_sent = 0;
            u32 pongs_suppressed = 0;
            u32 confirms_sent = 0;
            u32 manual_sent = 0;
            u32 stale_timers = 0;
            u32 send_failures = 0;
        };

        // ─── Device simulation engine ────────────────────────────────────────────────
        // Reacts to link events and emits outbound frames through `sink`. All timers
        // live on an engine clock advanced by update(elapsed_ms) and carry the
        // session they were armed in; a timer that fires for a session that is no
        // longer live does nothing.
        class SimulationEngine {
          public:
            using Sink = std::function<Result<void>(const dp::String &)>;

          private:
            SimulatorConfig config_;
            Sink sink_;
            Scheduler scheduler_;
            SequenceCounter sequence_;
            RateGate pong_gate_;
            EngineStats stats_;

            SessionId session_ = 0;
            bool live_ = false;
            TaskId life_task_ = INVALID_TASK;

          public:
            SimulationEngine(SimulatorConfig config, Sink sink)
                : config_(config.normalized()), sink_(std::move(sink)), pong_gate_(config_.pong_gap_ms) {}

            // ─── Link events ─────────────────────────────────────────────────────────
            void handle(const LinkEvent &ev) {
                switch (ev.kind) {
                case LinkEventKind::Status:
                    if (ev.status == LinkStatus::Connected) {
                        begin_session(ev.session);
                    } else if (ev.status == LinkStatus::Connecting) {
                        if (ev.session != session_)
                            end_session();
                    } else {
                        end_session();
                    }
                    break;
                case LinkEventKind::Received:
                    if (ev.session == session_)
                        on_received(ev.telegram);
                    break;
                case LinkEventKind::Sent:
                case LinkEventKind::Error:
                    break;
                }
            }

            void begin_session(SessionId session) {
                if (live_ && session == session_)
                    return;
                end_session();
                session_ = session;
                live_ = true;
                pong_gate_.reset();
                echo::category("plcsim.sim").info("session ", session_, " live, auto-life ",
                                                  config_.auto_life_enabled ? "on" : "off", ", auto-confirm ",
                                                  config_.auto_confirm_enabled ? "on" : "off");
                if (config_.auto_life_enabled)
                    start_life();
            }

            // Cancels every timer of the current session; flags are kept
            void end_session() {
                if (!live_)
                    return;
                usize cancelled = scheduler_.cancel_epoch(session_);
                life_task_ = INVALID_TASK;
                live_ = false;
                echo::category("plcsim.sim").info("session ", session_, " ended, ", cancelled, " timers cancelled");
            }

            void update(u32 elapsed_ms) { scheduler_.update(elapsed_ms); }

            // ─── Operator commands ───────────────────────────────────────────────────
            Result<Sequence> send_manual(const dp::String &type, const dp::String &data,
                                         const dp::String &subtype = DEFAULT_SUBTYPE) {
                auto r = transmit([&](Sequence seq) {
                    return encode(type, subtype, config_.device_id, config_.host_id, seq, data);
                });
                if (r.is_ok())
                    stats_.manual_sent++;
                return r;
            }

            Result<Sequence> send_error(const dp::String &code, const dp::String &message) {
                auto r = transmit(
                    [&](Sequence seq) { return error(config_.device_id, config_.host_id, seq, code, message); });
                if (r.is_ok())
                    stats_.manual_sent++;
                return r;
            }

            // Operator answer to one received MOVE: its unit, its destination bin, DONE
            Result<Sequence> send_confirm_for(const MoveOrder &order) {
                auto r = transmit([&](Sequence seq) {
                    return confirm(config_.device_id, config_.host_id, seq, order.unit, order.dest_bin,
                                   CONFIRM_STATUS_DONE);
                });
                if (r.is_ok())
                    stats_.manual_sent++;
                return r;
            }

            Result<Sequence> send_error_for(const MoveOrder &order) {
                return send_error(MANUAL_ERROR_CODE, "Manual error for TU " + order.unit);
            }

            void set_auto_life(bool enabled, u32 interval_s) {
                config_.auto_life_enabled = enabled;
                config_.life_interval_s = clamp_life_interval(interval_s);
                echo::category("plcsim.sim").info("auto-life ", enabled ? "on" : "off", ", every ",
                                                  config_.life_interval_s, " s");
                if (enabled && live_) {
                    start_life();
                } else if (!enabled) {
                    stop_life();
                }
            }

            void set_auto_confirm(bool enabled) {
                config_.auto_confirm_enabled = enabled;
                echo::category("plcsim.sim").info("auto-confirm ", enabled ? "on" : "off");
            }

            // ─── Queries ─────────────────────────────────────────────────────────────
            bool live() const noexcept { return live_; }
            SessionId session() const noexcept { return session_; }
            bool auto_life() const noexcept { return config_.auto_life_enabled; }
            bool auto_confirm() const noexcept { return config_.auto_confirm_enabled; }
            u32 life_interval() const noexcept { return config_.life_interval_s; }
            bool life_running() const noexcept { return life_task_ != INVALID_TASK && scheduler_.is_pending(life_task_); }
            usize pending_timers() const noexcept { return scheduler_.count(); }
            Sequence last_sequence() const noexcept { return sequence_.current(); }
            u64 now() const noexcept { return scheduler_.now(); }
            const EngineStats &stats() const noexcept { return stats_; }
            const SimulatorConfig &config() const noexcept { return config_; }

          private:
            template <typename Build> Result<Sequence> transmit(Build &&build) {
                if (!live_) {
                    return Result<Sequence>::err(Error::not_connected());
                }
                Sequence seq = sequence_.next();
                dp::String frame = build(seq);
                auto r = sink_ ? sink_(frame) : Result<void>::err(Error::invalid_state("no sink"));
                if (r.is_err()) {
                    stats_.send_failures++;
                    echo::category("plcsim.sim").warn("send of seq ", seq, " failed: ", r.error().message);
                    return Result<Sequence>::err(r.error());
                }
                return Result<Sequence>::ok(seq);
            }

            // Timer guard: only the session the timer was armed in may send
            bool still_live(SessionId armed_in) {
                if (live_ && armed_in == session_)
                    return true;
                stats_.stale_timers++;
                echo::category("plcsim.sim").debug("timer from session ", armed_in, " ignored");
                return false;
            }

            void start_life() {
                stop_life();
                SessionId armed_in = session_;
                send_ping(armed_in);
                u64 period_ms = static_cast<u64>(config_.life_interval_s) * 1000;
                life_task_ =
                    scheduler_.every("auto-life", period_ms, armed_in, [this, armed_in] { send_ping(armed_in); });
            }

            void stop_life() {
                if (life_task_ != INVALID_TASK) {
                    scheduler_.cancel(life_task_);
                    life_task_ = INVALID_TASK;
                }
            }

            void send_ping(SessionId armed_in) {
                if (!still_live(armed_in))
                    return;
                auto r = transmit([&](Sequence seq) { return life(config_.device_id, config_.host_id, seq, false); });
                if (r.is_ok())
                    stats_.pings_sent++;
            }

            void on_received(const Telegram &t) {
                switch (t.type) {
                case TelegramType::Life:
                    schedule_pong();
                    break;
                case TelegramType::Move:
                    if (config_.auto_confirm_enabled)
                        schedule_confirm(t.move());
                    break;
                default:
                    break;
                }
            }

            void schedule_pong() {
                if (!pong_gate_.try_pass(scheduler_.now())) {
                    stats_.pongs_suppressed++;
                    echo::category("plcsim.sim").debug("LIFE inside pong window, not answered");
                    return;
                }
                SessionId armed_in = session_;
                scheduler_.after("auto-pong", config_.pong_delay_ms, armed_in, [this, armed_in] {
                    if (!still_live(armed_in))
                        return;
                    auto r =
                        transmit([&](Sequence seq) { return life(config_.device_id, config_.host_id, seq, true); });
                    if (r.is_ok())
                        stats_.pongs_sent++;
                });
            }

            void schedule_confirm(const MoveOrder &order) {
                SessionId armed_in = session_;
                dp::String unit = order.unit;
                dp::String bin = order.dest_bin;
                echo::category("plcsim.sim").debug("MOVE ", unit, " -> ", bin, ", confirm in ",
                                                   config_.confirm_delay_ms, " ms");
                scheduler_.after("auto-confirm", config_.confirm_delay_ms, armed_in, [this, armed_in, unit, bin] {
                    if (!still_live(armed_in))
                        return;
                    auto r = transmit([&](Sequence seq) {
                        return confirm(config_.device_id, config_.host_id, seq, unit, bin, CONFIRM_STATUS_DONE);
                    });
                    if (r.is_ok())
                        stats_.confirms_sent++;
                });
            }
        };

    } // namespace sim
    using namespace sim;
} // namespace plcsim
