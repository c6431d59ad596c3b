#include <doctest/doctest.h>
#include <plcsim/link/frame_assembler.hpp>
#include <plcsim/telegram/codec.hpp>

using namespace plcsim;

static Bytes to_bytes(const dp::String &s) {
    Bytes out;
    for (char c : s)
        out.push_back(static_cast<u8>(c));
    return out;
}

static dp::String to_string(const Bytes &b) { return to_text(b); }

TEST_CASE("FrameAssembler reassembly") {
    dp::String a = life("PLC-SIM", "EWM-MFS", 1);
    dp::String b = telegram::move("EWM-MFS", "PLC-SIM", 2, "TU0001", "BIN-01", "BIN-99", "05");
    dp::String c = error("PLC-SIM", "EWM-MFS", 3, "E001", "boom");
    Bytes stream = to_bytes(a + b + c);

    SUBCASE("three frames in one chunk") {
        FrameAssembler fa;
        CHECK(fa.append(stream) == 0);
        auto f1 = fa.next();
        auto f2 = fa.next();
        auto f3 = fa.next();
        REQUIRE(f1.has_value());
        REQUIRE(f2.has_value());
        REQUIRE(f3.has_value());
        CHECK(to_string(*f1) == a);
        CHECK(to_string(*f2) == b);
        CHECK(to_string(*f3) == c);
        CHECK_FALSE(fa.next().has_value());
        CHECK(fa.pending() == 0);
    }

    SUBCASE("split 50 / 200 / 34 yields the same frames") {
        FrameAssembler fa;
        dp::Vector<dp::String> out;

        fa.append(stream.data(), 50);
        CHECK_FALSE(fa.has_frame());

        fa.append(stream.data() + 50, 200);
        while (auto f = fa.next())
            out.push_back(to_string(*f));
        CHECK(out.size() == 1);

        fa.append(stream.data() + 250, 134);
        while (auto f = fa.next())
            out.push_back(to_string(*f));

        REQUIRE(out.size() == 3);
        CHECK(out[0] == a);
        CHECK(out[1] == b);
        CHECK(out[2] == c);
    }

    SUBCASE("byte at a time") {
        FrameAssembler fa;
        usize frames = 0;
        for (usize i = 0; i < stream.size(); ++i) {
            fa.append(stream.data() + i, 1);
            while (fa.next())
                frames++;
        }
        CHECK(frames == 3);
    }

    SUBCASE("trailing partial frame is never emitted") {
        FrameAssembler fa;
        fa.append(stream.data(), TELEGRAM_LEN + 60);
        CHECK(fa.next().has_value());
        CHECK_FALSE(fa.next().has_value());
        CHECK(fa.pending() == 60);
        fa.clear();
        CHECK(fa.pending() == 0);
    }
}

TEST_CASE("FrameAssembler overflow") {
    SUBCASE("discards oldest bytes and reports the count") {
        FrameAssembler fa(TELEGRAM_LEN * 2);
        Bytes first(200, 'A');
        Bytes second(100, 'B');

        CHECK(fa.append(first) == 0);
        CHECK(fa.append(second) == 44);
        CHECK(fa.pending() == TELEGRAM_LEN * 2);
        CHECK(fa.overflows() == 1);
        CHECK(fa.total_discarded() == 44);

        // Front now holds the 156 surviving 'A' bytes
        auto f = fa.next();
        REQUIRE(f.has_value());
        CHECK((*f)[0] == 'A');
        CHECK((*f)[TELEGRAM_LEN - 1] == 'A');
    }

    SUBCASE("one report per violating append") {
        FrameAssembler fa(TELEGRAM_LEN * 2);
        Bytes chunk(TELEGRAM_LEN, 'x');
        CHECK(fa.append(chunk) == 0);
        CHECK(fa.append(chunk) == 0);
        CHECK(fa.append(chunk) == TELEGRAM_LEN);
        CHECK(fa.append(chunk) == TELEGRAM_LEN);
        CHECK(fa.overflows() == 2);
        CHECK(fa.pending() <= fa.capacity());
    }

    SUBCASE("chunk larger than the cap keeps its newest bytes") {
        FrameAssembler fa(TELEGRAM_LEN);
        fa.append(Bytes(10, 'o'));
        Bytes big;
        for (usize i = 0; i < 300; ++i)
            big.push_back(static_cast<u8>(i < 172 ? 'x' : 'y'));
        CHECK(fa.append(big) == 10 + 300 - TELEGRAM_LEN);
        CHECK(fa.pending() == TELEGRAM_LEN);
        auto f = fa.next();
        REQUIRE(f.has_value());
        CHECK((*f)[0] == 'y');
        CHECK((*f)[TELEGRAM_LEN - 1] == 'y');
    }

    SUBCASE("more than 256 frames of backlog at the default cap") {
        FrameAssembler fa;
        CHECK(fa.capacity() == RX_BUFFER_MAX);
        Bytes burst(RX_BUFFER_MAX + 5 * TELEGRAM_LEN, 'z');
        CHECK(fa.append(burst) == 5 * TELEGRAM_LEN);
        CHECK(fa.pending() == RX_BUFFER_MAX);
    }

    SUBCASE("cap below one frame is raised to one frame") {
        FrameAssembler fa(10);
        CHECK(fa.capacity() == TELEGRAM_LEN);
    }
}
