#pragma once

#include <plcsim/core/types.hpp>
#include <plcsim/link/frame_assembler.hpp>
#include <arpa/inet.h>
#include <chrono>
#include <datapod/datapod.hpp>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace plcsim {
    namespace test {

        // Host side of a loopback TCP connection, listening on an ephemeral port.
        class LoopbackPeer {
            int listen_fd_ = -1;
            int client_fd_ = -1;
            u16 port_ = 0;
            FrameAssembler rx_;

          public:
            LoopbackPeer() {
                listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
                int one = 1;
                ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

                sockaddr_in addr{};
                addr.sin_family = AF_INET;
                addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
                addr.sin_port = 0;
                ::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
                ::listen(listen_fd_, 4);

                socklen_t len = sizeof(addr);
                ::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
                port_ = ntohs(addr.sin_port);
            }

            ~LoopbackPeer() {
                close_client();
                stop_listening();
            }

            LoopbackPeer(const LoopbackPeer &) = delete;
            LoopbackPeer &operator=(const LoopbackPeer &) = delete;

            u16 port() const { return port_; }

            bool accept(u32 timeout_ms = 3000) {
                if (listen_fd_ < 0)
                    return false;
                pollfd pfd{listen_fd_, POLLIN, 0};
                if (::poll(&pfd, 1, static_cast<int>(timeout_ms)) <= 0)
                    return false;
                client_fd_ = ::accept(listen_fd_, nullptr, nullptr);
                if (client_fd_ >= 0) {
                    int one = 1;
                    ::setsockopt(client_fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
                }
                return client_fd_ >= 0;
            }

            bool send_raw(const char *data, usize len) {
                usize sent = 0;
                while (sent < len) {
                    ssize_t n = ::send(client_fd_, data + sent, len - sent, MSG_NOSIGNAL);
                    if (n <= 0)
                        return false;
                    sent += static_cast<usize>(n);
                }
                return true;
            }

            bool send_raw(const dp::String &data) { return send_raw(data.data(), data.size()); }

            // Collect `count` whole frames, or whatever arrived before the timeout
            dp::Vector<dp::String> read_frames(usize count, u32 timeout_ms = 3000) {
                dp::Vector<dp::String> frames;
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
                u8 buf[4096];
                while (frames.size() < count && std::chrono::steady_clock::now() < deadline) {
                    while (auto f = rx_.next()) {
                        frames.push_back(to_text(*f));
                    }
                    if (frames.size() >= count)
                        break;
                    pollfd pfd{client_fd_, POLLIN, 0};
                    if (::poll(&pfd, 1, 20) <= 0)
                        continue;
                    ssize_t n = ::recv(client_fd_, buf, sizeof(buf), 0);
                    if (n <= 0)
                        break;
                    rx_.append(buf, static_cast<usize>(n));
                }
                while (frames.size() < count) {
                    auto f = rx_.next();
                    if (!f)
                        break;
                    frames.push_back(to_text(*f));
                }
                return frames;
            }

            // True once the device side has closed its end
            bool wait_closed(u32 timeout_ms = 3000) {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
                u8 buf[4096];
                while (std::chrono::steady_clock::now() < deadline) {
                    pollfd pfd{client_fd_, POLLIN, 0};
                    if (::poll(&pfd, 1, 20) <= 0)
                        continue;
                    ssize_t n = ::recv(client_fd_, buf, sizeof(buf), 0);
                    if (n <= 0)
                        return true;
                }
                return false;
            }

            void close_client() {
                if (client_fd_ >= 0) {
                    ::close(client_fd_);
                    client_fd_ = -1;
                }
            }

            void stop_listening() {
                if (listen_fd_ >= 0) {
                    ::close(listen_fd_);
                    listen_fd_ = -1;
                }
            }
        };

        // Poll until `done()` holds or the timeout runs out
        template <typename Poll, typename Done> bool pump_until(Poll poll, Done done, u32 timeout_ms = 3000) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            while (std::chrono::steady_clock::now() < deadline) {
                poll();
                if (done())
                    return true;
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            poll();
            return done();
        }

        inline void pause_ms(u32 ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

    } // namespace test
} // namespace plcsim
