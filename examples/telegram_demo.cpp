#include <plcsim.hpp>
#include <echo/echo.hpp>

using namespace plcsim;

static void show(const dp::String& frame) {
    echo::info("|", frame, "| (", frame.size(), " bytes)");

    auto decoded = decode(frame);
    if (!decoded) {
        echo::warn("  not a frame");
        return;
    }
    const Telegram& t = decoded->telegram;
    echo::info("  type=", type_label(t.type), " (", t.code, ") sub=", t.subtype, " src=", t.source,
               " dst=", t.destination, " seq=", t.sequence, decoded->recovered() ? " [recovered]" : "");

    switch (t.type) {
    case TelegramType::Move: {
        auto m = t.move();
        echo::info("  tu=", m.unit, " from=", m.source_bin, " to=", m.dest_bin, " prio=", m.priority);
        break;
    }
    case TelegramType::Confirm: {
        auto c = t.confirmation();
        echo::info("  tu=", c.unit, " bin=", c.bin, " status=", c.status, " ts=", c.timestamp);
        break;
    }
    case TelegramType::Error: {
        auto e = t.error();
        echo::info("  code=", e.code, " msg=", e.message);
        break;
    }
    default:
        echo::info("  payload=", t.payload());
        break;
    }
}

int main() {
    echo::info("=== Telegram Codec Demo ===");

    show(life("PLC-SIM", "EWM-MFS", 1));
    show(life("PLC-SIM", "EWM-MFS", 2, true));
    show(telegram::move("EWM-MFS", "PLC-SIM", 3, "TU0001", "BIN-01", "BIN-99", "05"));
    show(confirm("PLC-SIM", "EWM-MFS", 4, "TU0001", "BIN-99"));
    show(error("PLC-SIM", "EWM-MFS", 5, "E001", "Manual error for TU TU0001"));

    // Field widths are enforced: long ids are cut, sequence wraps
    show(encode("xx", "7", "VERY-LONG-SOURCE", "DST", 1000005, "custom payload"));

    // Garbage still decodes; the outcome says it was repaired
    dp::String junk(TELEGRAM_LEN, '\x7f');
    junk[0] = static_cast<char>(0xC3);
    show(junk);

    return 0;
}
