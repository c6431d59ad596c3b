#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace plcsim {
    namespace telegram {

        // ─── Telegram types ──────────────────────────────────────────────────────────
        enum class TelegramType : u8 { Life, Move, Confirm, Error, Unknown };

        inline const char *type_code(TelegramType t) noexcept {
            switch (t) {
            case TelegramType::Life:
                return "LI";
            case TelegramType::Move:
                return "MO";
            case TelegramType::Confirm:
                return "CF";
            case TelegramType::Error:
                return "ER";
            case TelegramType::Unknown:
                break;
            }
            return "??";
        }

        inline const char *type_label(TelegramType t) noexcept {
            switch (t) {
            case TelegramType::Life:
                return "LIFE";
            case TelegramType::Move:
                return "MOVE";
            case TelegramType::Confirm:
                return "CNFM";
            case TelegramType::Error:
                return "ERROR";
            case TelegramType::Unknown:
                break;
            }
            return "UNKNOWN";
        }

        inline TelegramType type_from_code(const dp::String &code) noexcept {
            if (code == "LI")
                return TelegramType::Life;
            if (code == "MO")
                return TelegramType::Move;
            if (code == "CF")
                return TelegramType::Confirm;
            if (code == "ER")
                return TelegramType::Error;
            return TelegramType::Unknown;
        }

        // ─── Field helpers ───────────────────────────────────────────────────────────
        // Strip leading and trailing whitespace (space, tab, CR, LF, VT, FF).
        inline dp::String trim(const dp::String &s) {
            auto is_space = [](char c) { return c == ' ' || (c >= '\t' && c <= '\r'); };
            usize begin = 0;
            usize end = s.size();
            while (begin < end && is_space(s[begin]))
                ++begin;
            while (end > begin && is_space(s[end - 1]))
                --end;
            return s.substr(begin, end - begin);
        }

        // Slice [offset, offset+len) clamped to the string bounds.
        inline dp::String slice(const dp::String &s, usize offset, usize len) {
            if (offset >= s.size())
                return dp::String();
            return s.substr(offset, len);
        }

        // ─── Sub-payload views ───────────────────────────────────────────────────────
        struct MoveOrder {
            dp::String unit;
            dp::String source_bin;
            dp::String dest_bin;
            dp::String priority;
        };

        struct Confirmation {
            dp::String unit;
            dp::String bin;
            dp::String status;
            dp::String timestamp; // YYYYMMDDHHMMSS
        };

        struct ErrorReport {
            dp::String code;
            dp::String message;
        };

        // ─── Decoded telegram ────────────────────────────────────────────────────────
        // Built by decode(); `raw` is always the exact 128-character frame and `data`
        // always the untrimmed 102-character payload slot.
        struct Telegram {
            TelegramType type = TelegramType::Unknown;
            dp::String code;    // 2-char type code as received
            dp::String subtype; // trimmed
            dp::String source;  // trimmed
            dp::String destination;
            Sequence sequence = 0;
            dp::String data;
            dp::String raw;

            bool is(TelegramType t) const noexcept { return type == t; }

            // Payload without trailing padding
            dp::String payload() const { return trim(data); }

            bool is_ping() const { return type == TelegramType::Life && payload() == "PING"; }
            bool is_pong() const { return type == TelegramType::Life && payload() == "PONG"; }

            MoveOrder move() const {
                MoveOrder m;
                m.unit = trim(slice(data, 0, UNIT_LEN));
                m.source_bin = trim(slice(data, UNIT_LEN, BIN_LEN));
                m.dest_bin = trim(slice(data, UNIT_LEN + BIN_LEN, BIN_LEN));
                m.priority = trim(slice(data, UNIT_LEN + 2 * BIN_LEN, PRIORITY_LEN));
                return m;
            }

            Confirmation confirmation() const {
                Confirmation c;
                c.unit = trim(slice(data, 0, UNIT_LEN));
                c.bin = trim(slice(data, UNIT_LEN, BIN_LEN));
                c.status = trim(slice(data, UNIT_LEN + BIN_LEN, STATUS_LEN));
                c.timestamp = trim(slice(data, UNIT_LEN + BIN_LEN + STATUS_LEN, TIMESTAMP_LEN));
                return c;
            }

            ErrorReport error() const {
                ErrorReport e;
                e.code = trim(slice(data, 0, ERRCODE_LEN));
                e.message = trim(slice(data, ERRCODE_LEN, ERRMSG_LEN));
                return e;
            }
        };

        // ─── Decode outcome ──────────────────────────────────────────────────────────
        // Recovered: at least one byte or field had to be substituted (non-ASCII
        // byte replaced with '?', non-numeric sequence read as 0).
        enum class DecodeQuality : u8 { Parsed, Recovered };

        struct Decoded {
            Telegram telegram;
            DecodeQuality quality = DecodeQuality::Parsed;

            bool recovered() const noexcept { return quality == DecodeQuality::Recovered; }
        };

    } // namespace telegram
    using namespace telegram;
} // namespace plcsim
