#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace plcsim {
    namespace link {

        // ─── Stream reassembly ───────────────────────────────────────────────────────
        // Turns an arbitrarily chunked TCP byte stream back into whole 128-byte
        // frames. Framing is purely positional: no delimiter, no length prefix.
        //
        // The accumulator is capped. When an append would exceed the cap, the oldest
        // bytes are dropped from the front and the number of dropped bytes is
        // returned, so the caller reports exactly one overflow per violating append.
        class FrameAssembler {
            Bytes buffer_;
            usize max_bytes_;
            u64 total_discarded_ = 0;
            u32 overflows_ = 0;

          public:
            explicit FrameAssembler(usize max_bytes = RX_BUFFER_MAX)
                : max_bytes_(max_bytes < TELEGRAM_LEN ? TELEGRAM_LEN : max_bytes) {}

            // Returns the number of bytes discarded to stay within the cap (0 = none)
            usize append(const u8 *data, usize len) {
                if (data == nullptr || len == 0)
                    return 0;

                usize discard = 0;
                if (buffer_.size() + len > max_bytes_) {
                    discard = buffer_.size() + len - max_bytes_;
                }

                if (discard >= buffer_.size()) {
                    // Everything buffered goes, plus the head of the incoming chunk
                    usize skip = discard - buffer_.size();
                    buffer_.clear();
                    for (usize i = skip; i < len; ++i)
                        buffer_.push_back(data[i]);
                } else {
                    if (discard > 0)
                        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<isize>(discard));
                    for (usize i = 0; i < len; ++i)
                        buffer_.push_back(data[i]);
                }

                if (discard > 0) {
                    total_discarded_ += discard;
                    overflows_++;
                }
                return discard;
            }

            usize append(const Bytes &chunk) { return append(chunk.data(), chunk.size()); }

            // Remove and return the frame at the front, if a whole one is buffered
            dp::Optional<Bytes> next() {
                if (buffer_.size() < TELEGRAM_LEN)
                    return dp::nullopt;
                Bytes frame;
                for (usize i = 0; i < TELEGRAM_LEN; ++i)
                    frame.push_back(buffer_[i]);
                buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<isize>(TELEGRAM_LEN));
                return frame;
            }

            bool has_frame() const noexcept { return buffer_.size() >= TELEGRAM_LEN; }

            // Bytes waiting, including a trailing partial frame
            usize pending() const noexcept { return buffer_.size(); }
            usize capacity() const noexcept { return max_bytes_; }

            u64 total_discarded() const noexcept { return total_discarded_; }
            u32 overflows() const noexcept { return overflows_; }

            void clear() { buffer_.clear(); }
        };

    } // namespace link
    using namespace link;
} // namespace plcsim
