#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "telegram.hpp"
#include <chrono>
#include <ctime>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace plcsim {
    namespace telegram {

        namespace detail {

            inline char to_ascii(char c) noexcept {
                return (static_cast<unsigned char>(c) < 0x80) ? c : '?';
            }

            // Keep the first `width` characters, right-pad with `fill` to exactly `width`.
            inline void put_field(dp::String &out, const dp::String &value, usize width, char fill = ' ') {
                usize n = value.size() < width ? value.size() : width;
                for (usize i = 0; i < n; ++i)
                    out += to_ascii(value[i]);
                for (usize i = n; i < width; ++i)
                    out += fill;
            }

            inline dp::String upper(const dp::String &s) {
                dp::String r;
                for (usize i = 0; i < s.size(); ++i) {
                    char c = s[i];
                    r += (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
                }
                return r;
            }

            // Left-pad with zeros to `width`, then keep the first `width` characters.
            inline dp::String zfill(const dp::String &s, usize width) {
                dp::String r;
                for (usize i = s.size(); i < width; ++i)
                    r += '0';
                r += s;
                return r.substr(0, width);
            }

            inline dp::String pad(const dp::String &s, usize width) {
                dp::String r;
                put_field(r, s, width);
                return r;
            }

        } // namespace detail

        // ─── Encoder ─────────────────────────────────────────────────────────────────
        // Builds one 128-byte frame. Every field is truncated to its slot and padded
        // (type/source/destination/data with spaces, subtype and sequence with zeros).
        // Characters outside 7-bit ASCII are replaced with '?'.
        inline dp::String encode(const dp::String &type, const dp::String &subtype, const dp::String &source,
                                 const dp::String &destination, u64 sequence, const dp::String &data = "") {
            dp::String body;
            detail::put_field(body, detail::upper(type.substr(0, TYPE_LEN)), TYPE_LEN);
            detail::put_field(body, detail::zfill(subtype, SUBTYPE_LEN), SUBTYPE_LEN);
            detail::put_field(body, source, SOURCE_LEN);
            detail::put_field(body, destination, DEST_LEN);
            detail::put_field(body, detail::zfill(dp::String(std::to_string(sequence % SEQUENCE_MODULO)), SEQUENCE_LEN),
                              SEQUENCE_LEN);
            detail::put_field(body, data, DATA_LEN);

            if (body.size() != TELEGRAM_LEN) {
                throw FramingError("encode: body length " + std::to_string(body.size()) +
                                   " != " + std::to_string(TELEGRAM_LEN));
            }
            return body;
        }

        inline dp::String encode(TelegramType type, const dp::String &subtype, const dp::String &source,
                                 const dp::String &destination, u64 sequence, const dp::String &data = "") {
            return encode(dp::String(type_code(type)), subtype, source, destination, sequence, data);
        }

        // ─── Decoder ─────────────────────────────────────────────────────────────────
        // Consumes exactly the first TELEGRAM_LEN bytes; anything after is ignored.
        // Returns nullopt only when fewer than TELEGRAM_LEN bytes are given.
        inline dp::Optional<Decoded> decode(const char *bytes, usize len) {
            if (bytes == nullptr || len < TELEGRAM_LEN)
                return dp::nullopt;

            Decoded out;
            dp::String s;
            for (usize i = 0; i < TELEGRAM_LEN; ++i) {
                char c = detail::to_ascii(bytes[i]);
                if (c != bytes[i])
                    out.quality = DecodeQuality::Recovered;
                s += c;
            }

            Telegram &t = out.telegram;
            t.code = trim(s.substr(TYPE_OFFSET, TYPE_LEN));
            t.type = type_from_code(t.code);
            t.subtype = trim(s.substr(SUBTYPE_OFFSET, SUBTYPE_LEN));
            t.source = trim(s.substr(SOURCE_OFFSET, SOURCE_LEN));
            t.destination = trim(s.substr(DEST_OFFSET, DEST_LEN));
            t.data = s.substr(DATA_OFFSET, DATA_LEN);

            dp::String seq = trim(s.substr(SEQUENCE_OFFSET, SEQUENCE_LEN));
            u32 value = 0;
            bool numeric = !seq.empty();
            for (usize i = 0; i < seq.size(); ++i) {
                if (seq[i] < '0' || seq[i] > '9') {
                    numeric = false;
                    break;
                }
                value = value * 10 + static_cast<u32>(seq[i] - '0');
            }
            if (numeric) {
                t.sequence = value;
            } else {
                t.sequence = 0;
                out.quality = DecodeQuality::Recovered;
            }

            if (out.quality == DecodeQuality::Recovered)
                echo::category("plcsim.codec").debug("recovered frame ", t.code, " seq=", t.sequence);

            t.raw = std::move(s);
            return out;
        }

        inline dp::Optional<Decoded> decode(const dp::String &frame) { return decode(frame.data(), frame.size()); }

        inline dp::Optional<Decoded> decode(const Bytes &frame) {
            usize len = frame.size() < TELEGRAM_LEN ? frame.size() : TELEGRAM_LEN;
            return decode(to_text(frame.data(), len));
        }

        // ─── Timestamps ──────────────────────────────────────────────────────────────
        // Local wall-clock time as YYYYMMDDHHMMSS.
        inline dp::String timestamp_now() {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local{};
            localtime_r(&now, &local);
            char buf[TIMESTAMP_LEN + 1] = {};
            std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &local);
            return dp::String(buf);
        }

        // ─── Builders ────────────────────────────────────────────────────────────────
        inline dp::String life(const dp::String &source, const dp::String &destination, u64 sequence,
                               bool pong = false) {
            return encode(TelegramType::Life, DEFAULT_SUBTYPE, source, destination, sequence, pong ? "PONG" : "PING");
        }

        inline dp::String move(const dp::String &source, const dp::String &destination, u64 sequence,
                               const dp::String &unit, const dp::String &source_bin, const dp::String &dest_bin,
                               const dp::String &priority = "00") {
            dp::String data = detail::pad(unit, UNIT_LEN) + detail::pad(source_bin, BIN_LEN) +
                              detail::pad(dest_bin, BIN_LEN) + detail::pad(priority, PRIORITY_LEN);
            return encode(TelegramType::Move, DEFAULT_SUBTYPE, source, destination, sequence, data);
        }

        inline dp::String confirm(const dp::String &source, const dp::String &destination, u64 sequence,
                                  const dp::String &unit, const dp::String &bin, const dp::String &status,
                                  const dp::String &timestamp) {
            dp::String data = detail::pad(unit, UNIT_LEN) + detail::pad(bin, BIN_LEN) +
                              detail::pad(status, STATUS_LEN) + detail::pad(timestamp, TIMESTAMP_LEN);
            return encode(TelegramType::Confirm, DEFAULT_SUBTYPE, source, destination, sequence, data);
        }

        inline dp::String confirm(const dp::String &source, const dp::String &destination, u64 sequence,
                                  const dp::String &unit, const dp::String &bin,
                                  const dp::String &status = CONFIRM_STATUS_DONE) {
            return confirm(source, destination, sequence, unit, bin, status, timestamp_now());
        }

        inline dp::String error(const dp::String &source, const dp::String &destination, u64 sequence,
                                const dp::String &code, const dp::String &message) {
            dp::String data = detail::pad(code, ERRCODE_LEN) + detail::pad(message, ERRMSG_LEN);
            return encode(TelegramType::Error, DEFAULT_SUBTYPE, source, destination, sequence, data);
        }

    } // namespace telegram
    using namespace telegram;
} // namespace plcsim
