#include <doctest/doctest.h>
#include <plcsim/telegram/codec.hpp>

using namespace plcsim;

static dp::String spaces(usize n) { return dp::String(n, ' '); }

TEST_CASE("Telegram encode") {
    SUBCASE("life ping layout") {
        dp::String frame = life("PLC-SIM", "EWM-MFS", 1);
        CHECK(frame.size() == TELEGRAM_LEN);
        CHECK(frame == "LI00PLC-SIM EWM-MFS 000001PING" + spaces(98));
    }

    SUBCASE("type is upper-cased and cut to two characters") {
        dp::String frame = encode("lif", "00", "A", "B", 1);
        CHECK(frame.substr(0, 2) == "LI");
    }

    SUBCASE("short type is space padded") {
        dp::String frame = encode("L", "00", "A", "B", 1);
        CHECK(frame.substr(0, 2) == "L ");
    }

    SUBCASE("subtype is zero filled") {
        CHECK(encode("LI", "7", "A", "B", 1).substr(2, 2) == "07");
        CHECK(encode("LI", "", "A", "B", 1).substr(2, 2) == "00");
        CHECK(encode("LI", "123", "A", "B", 1).substr(2, 2) == "12");
    }

    SUBCASE("ids are truncated and padded to eight") {
        dp::String frame = encode("LI", "00", "VERY-LONG-SOURCE", "DST", 1);
        CHECK(frame.substr(SOURCE_OFFSET, SOURCE_LEN) == "VERY-LON");
        CHECK(frame.substr(DEST_OFFSET, DEST_LEN) == "DST     ");
    }

    SUBCASE("sequence wraps modulo one million") {
        CHECK(encode("LI", "00", "A", "B", 1000005).substr(SEQUENCE_OFFSET, SEQUENCE_LEN) == "000005");
        CHECK(encode("LI", "00", "A", "B", 999999).substr(SEQUENCE_OFFSET, SEQUENCE_LEN) == "999999");
        CHECK(encode("LI", "00", "A", "B", 1000000).substr(SEQUENCE_OFFSET, SEQUENCE_LEN) == "000000");
    }

    SUBCASE("data is truncated to 102") {
        dp::String long_data(150, 'x');
        dp::String frame = encode("LI", "00", "A", "B", 1, long_data);
        CHECK(frame.size() == TELEGRAM_LEN);
        CHECK(frame.substr(DATA_OFFSET) == dp::String(DATA_LEN, 'x'));
    }

    SUBCASE("non-ascii characters become question marks") {
        dp::String frame = encode("LI", "00", "A", "B", 1, "caf\xC3\xA9");
        CHECK(frame.substr(DATA_OFFSET, 6) == "caf?? ");
    }

    SUBCASE("every builder yields exactly 128 bytes") {
        CHECK(life("A", "B", 1, true).size() == TELEGRAM_LEN);
        CHECK(telegram::move("A", "B", 2, "TU", "S", "D").size() == TELEGRAM_LEN);
        CHECK(confirm("A", "B", 3, "TU", "BIN").size() == TELEGRAM_LEN);
        CHECK(error("A", "B", 4, "E001", dp::String(200, 'm')).size() == TELEGRAM_LEN);
    }
}

TEST_CASE("Telegram decode") {
    SUBCASE("round trip of header fields") {
        dp::String frame = encode("CF", "42", "PLC-SIM", "EWM-MFS", 123456, "payload");
        auto d = decode(frame);
        REQUIRE(d.has_value());
        CHECK_FALSE(d->recovered());
        const Telegram &t = d->telegram;
        CHECK(t.type == TelegramType::Confirm);
        CHECK(t.code == "CF");
        CHECK(t.subtype == "42");
        CHECK(t.source == "PLC-SIM");
        CHECK(t.destination == "EWM-MFS");
        CHECK(t.sequence == 123456);
        CHECK(t.data.size() == DATA_LEN);
        CHECK(t.payload() == "payload");
        CHECK(t.raw == frame);
    }

    SUBCASE("short input is not a frame") {
        CHECK_FALSE(decode(dp::String(127, 'A')).has_value());
        CHECK_FALSE(decode(dp::String()).has_value());
        CHECK_FALSE(decode(nullptr, 128).has_value());
    }

    SUBCASE("only the first 128 bytes are consumed") {
        dp::String first = life("A", "B", 7);
        dp::String second = life("C", "D", 8, true);
        auto d = decode(first + second);
        REQUIRE(d.has_value());
        CHECK(d->telegram.raw == first);
        CHECK(d->telegram.sequence == 7);
    }

    SUBCASE("unknown type code is kept, not rejected") {
        auto d = decode(encode("ZZ", "00", "A", "B", 5, "x"));
        REQUIRE(d.has_value());
        CHECK(d->telegram.type == TelegramType::Unknown);
        CHECK(d->telegram.code == "ZZ");
        CHECK_FALSE(d->recovered());
    }

    SUBCASE("non-numeric sequence decodes as zero") {
        dp::String frame = life("A", "B", 1);
        frame.replace(SEQUENCE_OFFSET, SEQUENCE_LEN, "12AB56");
        auto d = decode(frame);
        REQUIRE(d.has_value());
        CHECK(d->telegram.sequence == 0);
        CHECK(d->recovered());
    }

    SUBCASE("all-zero frame is still decoded") {
        dp::String zeros(TELEGRAM_LEN, '\0');
        auto d = decode(zeros);
        REQUIRE(d.has_value());
        CHECK(d->telegram.type == TelegramType::Unknown);
        CHECK(d->telegram.sequence == 0);
        CHECK(d->telegram.raw.size() == TELEGRAM_LEN);
        CHECK(d->recovered());
    }

    SUBCASE("non-ascii bytes are replaced") {
        dp::String frame = life("A", "B", 1);
        frame[DATA_OFFSET] = static_cast<char>(0xFF);
        auto d = decode(frame);
        REQUIRE(d.has_value());
        CHECK(d->recovered());
        CHECK(d->telegram.raw[DATA_OFFSET] == '?');
        CHECK(d->telegram.payload() == "?ING");
    }

    SUBCASE("decode from bytes") {
        dp::String frame = life("A", "B", 3, true);
        Bytes bytes;
        for (char c : frame)
            bytes.push_back(static_cast<u8>(c));
        auto d = decode(bytes);
        REQUIRE(d.has_value());
        CHECK(d->telegram.is_pong());

        bytes[DATA_OFFSET] = 0xC3;
        bytes.push_back(0xFF);
        auto high = decode(bytes);
        REQUIRE(high.has_value());
        CHECK(high->recovered());
        CHECK(high->telegram.raw.size() == TELEGRAM_LEN);
        CHECK(high->telegram.payload() == "?ONG");

        Bytes short_frame(TELEGRAM_LEN - 1, static_cast<u8>(' '));
        CHECK_FALSE(decode(short_frame).has_value());
    }
}

TEST_CASE("Telegram sub-payloads") {
    SUBCASE("move order") {
        dp::String frame = telegram::move("EWM-MFS", "PLC-SIM", 10, "TU0001", "BIN-01", "BIN-99", "05");
        auto d = decode(frame);
        REQUIRE(d.has_value());
        REQUIRE(d->telegram.is(TelegramType::Move));
        auto m = d->telegram.move();
        CHECK(m.unit == "TU0001");
        CHECK(m.source_bin == "BIN-01");
        CHECK(m.dest_bin == "BIN-99");
        CHECK(m.priority == "05");
    }

    SUBCASE("confirmation defaults to DONE with a timestamp") {
        dp::String frame = confirm("PLC-SIM", "EWM-MFS", 11, "TU0001", "BIN-99");
        auto c = decode(frame)->telegram.confirmation();
        CHECK(c.unit == "TU0001");
        CHECK(c.bin == "BIN-99");
        CHECK(c.status == "DONE");
        REQUIRE(c.timestamp.size() == TIMESTAMP_LEN);
        for (usize i = 0; i < c.timestamp.size(); ++i) {
            CHECK(c.timestamp[i] >= '0');
            CHECK(c.timestamp[i] <= '9');
        }
    }

    SUBCASE("confirmation with explicit timestamp") {
        dp::String frame = confirm("A", "B", 12, "TU9", "BIN-7", "FAIL", "20240102030405");
        auto c = decode(frame)->telegram.confirmation();
        CHECK(c.status == "FAIL");
        CHECK(c.timestamp == "20240102030405");
    }

    SUBCASE("error report") {
        dp::String frame = error("PLC-SIM", "EWM-MFS", 13, "E001", "Manual error for TU TU0001");
        auto e = decode(frame)->telegram.error();
        CHECK(e.code == "E001");
        CHECK(e.message == "Manual error for TU TU0001");
    }

    SUBCASE("ping and pong") {
        auto ping = decode(life("A", "B", 1))->telegram;
        auto pong = decode(life("A", "B", 2, true))->telegram;
        CHECK(ping.is_ping());
        CHECK_FALSE(ping.is_pong());
        CHECK(pong.is_pong());
    }
}

TEST_CASE("Telegram type codes") {
    CHECK(type_from_code("LI") == TelegramType::Life);
    CHECK(type_from_code("MO") == TelegramType::Move);
    CHECK(type_from_code("CF") == TelegramType::Confirm);
    CHECK(type_from_code("ER") == TelegramType::Error);
    CHECK(type_from_code("li") == TelegramType::Unknown);
    CHECK(dp::String(type_code(TelegramType::Move)) == "MO");
    CHECK(dp::String(type_label(TelegramType::Unknown)) == "UNKNOWN");
}
