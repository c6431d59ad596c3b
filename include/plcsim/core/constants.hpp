#pragma once

#include "types.hpp"

namespace plcsim {

    // ─── Telegram layout (fixed 128-byte ASCII frame) ────────────────────────────
    //   [0:2]    Type      LI | MO | CF | ER
    //   [2:4]    SubType   00..99
    //   [4:12]   Source    8 chars, space padded
    //   [12:20]  Dest      8 chars, space padded
    //   [20:26]  Sequence  6 digits, zero padded
    //   [26:128] Data      102 chars, space padded
    inline constexpr usize TELEGRAM_LEN = 128;

    inline constexpr usize TYPE_OFFSET = 0;
    inline constexpr usize TYPE_LEN = 2;
    inline constexpr usize SUBTYPE_OFFSET = 2;
    inline constexpr usize SUBTYPE_LEN = 2;
    inline constexpr usize SOURCE_OFFSET = 4;
    inline constexpr usize SOURCE_LEN = 8;
    inline constexpr usize DEST_OFFSET = 12;
    inline constexpr usize DEST_LEN = 8;
    inline constexpr usize SEQUENCE_OFFSET = 20;
    inline constexpr usize SEQUENCE_LEN = 6;
    inline constexpr usize DATA_OFFSET = 26;
    inline constexpr usize DATA_LEN = 102;

    inline constexpr u32 SEQUENCE_MODULO = 1'000'000;

    // ─── MOVE payload [TU:20][SRC_BIN:20][DST_BIN:20][PRIORITY:2][EXTRA:40] ─────
    inline constexpr usize UNIT_LEN = 20;
    inline constexpr usize BIN_LEN = 20;
    inline constexpr usize PRIORITY_LEN = 2;
    inline constexpr usize MOVE_EXTRA_LEN = 40;

    // ─── CONFIRM payload [TU:20][BIN:20][STATUS:4][TIMESTAMP:14][EXTRA:44] ──────
    inline constexpr usize STATUS_LEN = 4;
    inline constexpr usize TIMESTAMP_LEN = 14;
    inline constexpr usize CONFIRM_EXTRA_LEN = 44;

    // ─── ERROR payload [ERRCODE:4][ERRMSG:98] ───────────────────────────────────
    inline constexpr usize ERRCODE_LEN = 4;
    inline constexpr usize ERRMSG_LEN = 98;

    // ─── Stream limits ───────────────────────────────────────────────────────────
    inline constexpr usize RX_BUFFER_FRAMES = 256;
    inline constexpr usize RX_BUFFER_MAX = TELEGRAM_LEN * RX_BUFFER_FRAMES; // 32 KiB
    inline constexpr usize RX_READ_CHUNK = 4096;

    // ─── Timing constants (ms) ───────────────────────────────────────────────────
    inline constexpr u32 CONNECT_TIMEOUT_MS = 5000;
    inline constexpr u32 POLL_INTERVAL_MS = 500;
    inline constexpr u32 JOIN_TIMEOUT_MS = 3000;
    inline constexpr u32 LIFE_INTERVAL_S = 10;
    inline constexpr u32 LIFE_INTERVAL_MIN_S = 1;
    inline constexpr u32 LIFE_INTERVAL_MAX_S = 86400;
    inline constexpr u32 CONFIRM_DELAY_MS = 500;
    inline constexpr u32 PONG_DELAY_MS = 200;
    inline constexpr u32 PONG_MIN_GAP_MS = 1000;

    // ─── Defaults ────────────────────────────────────────────────────────────────
    inline constexpr const char *DEFAULT_DEVICE_ID = "PLC-SIM";
    inline constexpr const char *DEFAULT_HOST_ID = "EWM-MFS";
    inline constexpr const char *DEFAULT_SUBTYPE = "00";
    inline constexpr const char *CONFIRM_STATUS_DONE = "DONE";
    inline constexpr const char *MANUAL_ERROR_CODE = "E001";
    inline constexpr usize EVENT_LOG_CAPACITY = 5000;

} // namespace plcsim
