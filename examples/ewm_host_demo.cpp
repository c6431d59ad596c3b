#include <plcsim.hpp>
#include <echo/echo.hpp>
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace plcsim;

// Minimal warehouse host: accepts one device, pings it, hands out transport
// orders and prints whatever the device sends back.

static std::atomic<bool> running{true};
void signal_handler(int) { running = false; }

static int listen_on(u16 port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd, 1) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

static bool send_frame(int fd, const dp::String& frame) {
    usize sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<usize>(n);
    }
    return true;
}

int main(int argc, char* argv[]) {
    echo::info("=== EWM Host Demo ===");

    u16 port = 5000;
    if (argc > 1) port = static_cast<u16>(std::strtoul(argv[1], nullptr, 10));

    int server = listen_on(port);
    if (server < 0) {
        echo::error("Cannot listen on port ", port);
        return 1;
    }

    signal(SIGINT, signal_handler);
    echo::info("Listening on port ", port, "... (Ctrl+C to stop)");

    int client = -1;
    while (running && client < 0) {
        pollfd pfd{server, POLLIN, 0};
        if (::poll(&pfd, 1, 200) > 0) {
            client = ::accept(server, nullptr, nullptr);
        }
    }
    ::close(server);
    if (client < 0) return 0;
    echo::info("Device connected");

    SequenceCounter seq;
    FrameAssembler assembler;
    u32 order = 0;

    bool link_ok = true;

    Scheduler scheduler;
    scheduler.every("life", 3000, 0, [&] {
        if (!send_frame(client, life(DEFAULT_HOST_ID, DEFAULT_DEVICE_ID, seq.next()))) {
            link_ok = false;
            return;
        }
        echo::info("-> LIFE PING #", seq.current());
    });
    scheduler.every("move", 5000, 0, [&] {
        ++order;
        char unit[16];
        std::snprintf(unit, sizeof(unit), "TU%04u", order);
        char dest[16];
        std::snprintf(dest, sizeof(dest), "BIN-%02u", 10 + order % 90);
        dp::String frame = telegram::move(DEFAULT_HOST_ID, DEFAULT_DEVICE_ID, seq.next(), unit, "BIN-01", dest, "05");
        if (!send_frame(client, frame)) {
            link_ok = false;
            return;
        }
        echo::info("-> MOVE #", seq.current(), " ", unit, " BIN-01 -> ", dest);
    });

    auto last = std::chrono::steady_clock::now();
    u8 buf[RX_READ_CHUNK];

    while (running && link_ok) {
        pollfd pfd{client, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 100);
        if (ready > 0) {
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) {
                echo::info("Device closed the connection");
                break;
            }
            usize dropped = assembler.append(buf, static_cast<usize>(n));
            if (dropped > 0) echo::warn("Dropped ", dropped, " bytes");

            while (auto frame = assembler.next()) {
                auto decoded = decode(*frame);
                if (!decoded) continue;
                const Telegram& t = decoded->telegram;
                switch (t.type) {
                case TelegramType::Confirm: {
                    auto c = t.confirmation();
                    echo::info("<- CONFIRM #", t.sequence, " tu=", c.unit, " bin=", c.bin,
                               " status=", c.status, " at ", c.timestamp);
                    break;
                }
                case TelegramType::Error: {
                    auto e = t.error();
                    echo::warn("<- ERROR #", t.sequence, " ", e.code, ": ", e.message);
                    break;
                }
                default:
                    echo::info("<- ", type_label(t.type), " #", t.sequence, " [", t.payload(), "]");
                    break;
                }
            }
        }

        auto now = std::chrono::steady_clock::now();
        auto elapsed = static_cast<u32>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count());
        last = now;
        scheduler.update(elapsed);
    }

    if (!link_ok) echo::warn("Send to device failed");

    ::close(client);
    echo::info("Host stopped after ", seq.current(), " telegrams");
    return 0;
}
