#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace plcsim {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        Validation,   // bad host/port, rejected before any socket is opened
        Connect,      // TCP connect failed or timed out
        Stream,       // read/write failure mid-session
        Overflow,     // receive accumulator exceeded its cap
        Framing,      // codec invariant violated
        NotConnected,
        InvalidState,
        Timeout,
        SocketError,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error validation(dp::String msg = "") noexcept { return Error(ErrorCode::Validation, std::move(msg)); }
        static Error connect_failed(dp::String msg = "") noexcept {
            return Error(ErrorCode::Connect, std::move(msg));
        }
        static Error stream(dp::String msg = "") noexcept { return Error(ErrorCode::Stream, std::move(msg)); }
        static Error overflow(usize discarded) noexcept {
            return Error(ErrorCode::Overflow,
                         "receive buffer overflow, discarded " + dp::String(std::to_string(discarded)) + " bytes");
        }
        static Error not_connected() noexcept { return Error(ErrorCode::NotConnected, "not connected"); }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error timeout(dp::String msg = "") noexcept { return Error(ErrorCode::Timeout, std::move(msg)); }
        static Error socket_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::SocketError, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

    // ─── Codec defect ────────────────────────────────────────────────────────────
    // Thrown only when a composed frame is not TELEGRAM_LEN bytes long. That can
    // only happen through a field-width bug, so it is not part of Result<T>.
    class FramingError : public std::logic_error {
      public:
        explicit FramingError(const std::string &what) : std::logic_error(what) {}
    };

} // namespace plcsim
