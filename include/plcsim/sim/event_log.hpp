#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../telegram/telegram.hpp"
#include "../util/event.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <datapod/datapod.hpp>
#include <deque>

namespace plcsim {
    namespace sim {

        // ─── Handshake tag (operator annotation, not on the wire) ───────────────────
        enum class HandshakeTag : u8 { None, Req, Ack };

        inline const char *to_string(HandshakeTag t) noexcept {
            switch (t) {
            case HandshakeTag::None:
                return "-";
            case HandshakeTag::Req:
                return "REQ";
            case HandshakeTag::Ack:
                return "ACK";
            }
            return "?";
        }

        // ─── Log entry ───────────────────────────────────────────────────────────────
        // Either an observed telegram (RX/TX) or a system notice (SYS).
        struct LogEntry {
            u64 index = 0;
            Direction direction = Direction::Sys;
            std::chrono::system_clock::time_point time;
            dp::Optional<Telegram> telegram;
            bool recovered = false;
            dp::String notice;
            HandshakeTag tag = HandshakeTag::None;

            bool is_notice() const noexcept { return !telegram.has_value(); }

            // HH:MM:SS.mmm local time
            dp::String clock() const {
                auto t = std::chrono::system_clock::to_time_t(time);
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
                std::tm local{};
                localtime_r(&t, &local);
                char buf[16] = {};
                std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec,
                              static_cast<int>(ms));
                return dp::String(buf);
            }

            // One-line rendering for consoles and log sinks
            dp::String summary() const {
                dp::String out = clock() + " " + to_string(direction) + " ";
                if (!telegram.has_value())
                    return out + notice;
                const Telegram &t = *telegram;
                out += (t.code.empty() ? dp::String("??") : t.code) + "/" + t.subtype + " ";
                out += t.source + " -> " + t.destination + " #" + dp::String(std::to_string(t.sequence));
                dp::String body = t.payload();
                if (!body.empty())
                    out += " [" + body + "]";
                if (tag != HandshakeTag::None)
                    out += " " + dp::String(to_string(tag));
                if (recovered)
                    out += " (recovered)";
                return out;
            }
        };

        // ─── Bounded event log ───────────────────────────────────────────────────────
        // Keeps the newest `capacity` entries (0 = unbounded). Indices are assigned
        // once and keep increasing after old entries are evicted.
        class EventLog {
            std::deque<LogEntry> entries_;
            usize capacity_;
            u64 next_index_ = 1;
            u64 rx_count_ = 0;
            u64 tx_count_ = 0;
            u64 evicted_ = 0;

          public:
            explicit EventLog(usize capacity = EVENT_LOG_CAPACITY) : capacity_(capacity) {}

            const LogEntry &record(Direction direction, const Telegram &telegram, bool recovered = false,
                                   HandshakeTag tag = HandshakeTag::None) {
                LogEntry e;
                e.direction = direction;
                e.telegram = telegram;
                e.recovered = recovered;
                e.tag = tag;
                if (direction == Direction::Rx)
                    rx_count_++;
                else if (direction == Direction::Tx)
                    tx_count_++;
                return append(std::move(e));
            }

            const LogEntry &note(dp::String text) {
                LogEntry e;
                e.direction = Direction::Sys;
                e.notice = std::move(text);
                return append(std::move(e));
            }

            bool tag(u64 index, HandshakeTag tag) {
                for (auto &e : entries_) {
                    if (e.index == index && e.telegram.has_value()) {
                        e.tag = tag;
                        return true;
                    }
                }
                return false;
            }

            dp::Optional<LogEntry> find(u64 index) const {
                for (const auto &e : entries_) {
                    if (e.index == index)
                        return e;
                }
                return dp::nullopt;
            }

            // Counters are reset too
            void clear() {
                entries_.clear();
                rx_count_ = 0;
                tx_count_ = 0;
                evicted_ = 0;
            }

            const std::deque<LogEntry> &entries() const noexcept { return entries_; }
            usize size() const noexcept { return entries_.size(); }
            bool empty() const noexcept { return entries_.empty(); }
            usize capacity() const noexcept { return capacity_; }
            u64 rx_count() const noexcept { return rx_count_; }
            u64 tx_count() const noexcept { return tx_count_; }
            u64 evicted() const noexcept { return evicted_; }

            const LogEntry &back() const { return entries_.back(); }

            Event<const LogEntry &> on_append;

          private:
            const LogEntry &append(LogEntry e) {
                e.index = next_index_++;
                e.time = std::chrono::system_clock::now();
                entries_.push_back(std::move(e));
                while (capacity_ > 0 && entries_.size() > capacity_) {
                    entries_.pop_front();
                    evicted_++;
                }
                on_append.emit(entries_.back());
                return entries_.back();
            }
        };

    } // namespace sim
    using namespace sim;
} // namespace plcsim
