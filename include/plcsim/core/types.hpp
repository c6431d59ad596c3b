#pragma once

#include <datapod/datapod.hpp>

namespace plcsim {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using SessionId = u64;   // Epoch of one TCP session, 0 = no session
    using Sequence = u32;    // Telegram sequence number, 0..999999
    using Bytes = dp::Vector<u8>;

    // One char per byte
    inline dp::String to_text(const u8 *data, usize len) {
        dp::String out;
        for (usize i = 0; i < len; ++i)
            out += static_cast<char>(data[i]);
        return out;
    }

    inline dp::String to_text(const Bytes &bytes) { return to_text(bytes.data(), bytes.size()); }

    // ─── Traffic direction (event log, statistics) ──────────────────────────────
    enum class Direction : u8 { Rx, Tx, Sys };

    inline const char *to_string(Direction d) noexcept {
        switch (d) {
        case Direction::Rx:
            return "RX";
        case Direction::Tx:
            return "TX";
        case Direction::Sys:
            return "SYS";
        }
        return "?";
    }

} // namespace plcsim
