#include <plcsim.hpp>
#include <echo/echo.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace plcsim;

static std::atomic<bool> running{true};
void signal_handler(int) { running = false; }

static void usage() {
    echo::info("usage: plc_sim <host> <port> [--device ID] [--host-id ID] [--life SECONDS] [--no-confirm]");
}

int main(int argc, char* argv[]) {
    echo::info("=== PLC Device Simulator ===");

    if (argc < 3) {
        usage();
        return 1;
    }

    dp::String host = argv[1];
    dp::String port = argv[2];

    SimulatorConfig config;
    for (int i = 3; i < argc; ++i) {
        dp::String arg = argv[i];
        if (arg == "--device" && i + 1 < argc) {
            config.device(argv[++i]);
        } else if (arg == "--host-id" && i + 1 < argc) {
            config.host(argv[++i]);
        } else if (arg == "--life" && i + 1 < argc) {
            auto seconds = parse_life_interval(argv[++i]);
            if (seconds.is_ok()) {
                config.auto_life(true).life_interval(seconds.value());
            } else {
                echo::warn(seconds.error().message, ", using ", LIFE_INTERVAL_S, " s");
                config.auto_life(true).life_interval(LIFE_INTERVAL_S);
            }
        } else if (arg == "--no-confirm") {
            config.auto_confirm(false);
        } else {
            echo::error("Unknown option: ", arg);
            usage();
            return 1;
        }
    }

    DeviceSimulator sim(config);

    // Every RX/TX telegram and system notice goes to the console
    sim.log().on_append.subscribe([](const LogEntry& e) { echo::info(e.summary()); });

    bool failed = false;
    sim.events().on_error.subscribe([&](const Error& err) {
        if (err.code == ErrorCode::Connect || err.code == ErrorCode::Validation) {
            failed = true;
        }
    });

    auto cfg = sim.engine().config();
    echo::info("Device ", cfg.device_id, " -> host ", cfg.host_id,
               ", auto-confirm ", cfg.auto_confirm_enabled ? "on" : "off");
    if (cfg.auto_life_enabled) {
        echo::info("Auto-life every ", cfg.life_interval_s, " s");
    }

    auto r = sim.connect(host, port);
    if (r.is_err()) {
        sim.update(0);
        echo::error("Cannot connect: ", r.error().message);
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    echo::info("Connecting to ", host, ":", port, "... (Ctrl+C to stop)");

    auto last = std::chrono::steady_clock::now();
    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count();
        last = now;
        sim.update(static_cast<u32>(elapsed));

        // Session over (peer closed or connect failed) and fully reported
        if (!sim.link().active() && sim.state() == LinkState::Idle) {
            break;
        }
    }

    auto d = sim.disconnect();
    if (d.is_err()) {
        echo::warn("Disconnect: ", d.error().message);
    }
    sim.update(0);

    const auto& stats = sim.engine().stats();
    echo::info("RX ", sim.log().rx_count(), "  TX ", sim.log().tx_count());
    echo::info("PING ", stats.pings_sent, "  PONG ", stats.pongs_sent, " (", stats.pongs_suppressed,
               " suppressed)  CONFIRM ", stats.confirms_sent);

    return failed ? 1 : 0;
}
