#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <fcntl.h>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace plcsim {
    namespace link {

        inline dp::String errno_text(int err) { return dp::String(std::strerror(err)); }

        // ─── TCP client socket ────────────────────────────────────────────────────────
        // Owns one stream socket. One thread may read while another writes; either
        // may call shutdown() to unblock the other. close() releases the descriptor
        // exactly once no matter how often or from where it is called.
        class TcpSocket {
            std::atomic<int> fd_{-1};
            std::mutex close_mutex_;

          public:
            TcpSocket() = default;
            ~TcpSocket() { close(); }

            TcpSocket(const TcpSocket &) = delete;
            TcpSocket &operator=(const TcpSocket &) = delete;

            // Resolve `host` and connect to the first address that answers within
            // `timeout_ms`. The attempt is sliced into `slice_ms` waits so that a set
            // `abort` flag ends it early.
            Result<void> connect(const dp::String &host, u16 port, u32 timeout_ms,
                                 const std::atomic<bool> *abort = nullptr, u32 slice_ms = 100) {
                if (is_open()) {
                    return Result<void>::err(Error::invalid_state("socket already open"));
                }

                addrinfo hints{};
                hints.ai_family = AF_UNSPEC;
                hints.ai_socktype = SOCK_STREAM;
                hints.ai_protocol = IPPROTO_TCP;

                addrinfo *res = nullptr;
                dp::String service(std::to_string(port));
                int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
                if (gai != 0 || res == nullptr) {
                    return Result<void>::err(
                        Error::connect_failed("cannot resolve " + host + ": " + dp::String(::gai_strerror(gai))));
                }

                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
                dp::String last_error = "no usable address";

                for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
                    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
                    if (fd < 0) {
                        last_error = "socket(): " + errno_text(errno);
                        continue;
                    }

                    auto attempt = connect_fd(fd, ai, deadline, abort, slice_ms);
                    if (attempt.is_ok()) {
                        int one = 1;
                        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
                        fd_.store(fd);
                        ::freeaddrinfo(res);
                        echo::category("plcsim.link").debug("connected to ", host, ":", port, " fd=", fd);
                        return {};
                    }

                    ::close(fd);
                    last_error = attempt.error().message;
                    if (attempt.error().code == ErrorCode::Timeout || attempt.error().code == ErrorCode::InvalidState)
                        break;
                }

                ::freeaddrinfo(res);
                return Result<void>::err(
                    Error::connect_failed("connect to " + host + ":" + service + " failed: " + last_error));
            }

            // Wait up to `timeout_ms` for data and read what is available.
            // ok(0)            peer closed the stream
            // err(Timeout)     nothing arrived in time
            // err(Stream)      read failure
            Result<usize> read_some(u8 *buf, usize cap, u32 timeout_ms) {
                int fd = fd_.load();
                if (fd < 0)
                    return Result<usize>::err(Error::not_connected());

                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLIN;
                int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
                if (ready == 0)
                    return Result<usize>::err(Error::timeout("no data"));
                if (ready < 0) {
                    if (errno == EINTR)
                        return Result<usize>::err(Error::timeout("interrupted"));
                    return Result<usize>::err(Error::stream("poll(): " + errno_text(errno)));
                }

                ssize_t n = ::recv(fd, buf, cap, 0);
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                        return Result<usize>::err(Error::timeout("no data"));
                    return Result<usize>::err(Error::stream("recv(): " + errno_text(errno)));
                }
                return Result<usize>::ok(static_cast<usize>(n));
            }

            // Write the whole buffer or fail
            Result<void> write_all(const void *data, usize len) {
                const char *bytes = static_cast<const char *>(data);
                int fd = fd_.load();
                if (fd < 0)
                    return Result<void>::err(Error::not_connected());

                usize sent = 0;
                while (sent < len) {
                    ssize_t n = ::send(fd, bytes + sent, len - sent, MSG_NOSIGNAL);
                    if (n < 0) {
                        if (errno == EINTR)
                            continue;
                        return Result<void>::err(Error::stream("send(): " + errno_text(errno)));
                    }
                    if (n == 0) {
                        return Result<void>::err(Error::stream("send(): connection closed"));
                    }
                    sent += static_cast<usize>(n);
                }
                return {};
            }

            Result<void> write_all(const dp::String &frame) {
                return write_all(frame.data(), frame.size());
            }

            // Abortive shutdown of both directions; errors are irrelevant here
            void shutdown() noexcept {
                std::lock_guard lock(close_mutex_);
                int fd = fd_.load();
                if (fd >= 0)
                    ::shutdown(fd, SHUT_RDWR);
            }

            // Returns true if this call released the descriptor
            bool close() noexcept {
                std::lock_guard lock(close_mutex_);
                int fd = fd_.exchange(-1);
                if (fd < 0)
                    return false;
                ::close(fd);
                return true;
            }

            bool is_open() const noexcept { return fd_.load() >= 0; }
            int native_handle() const noexcept { return fd_.load(); }

          private:
            static Result<void> connect_fd(int fd, const addrinfo *ai, std::chrono::steady_clock::time_point deadline,
                                           const std::atomic<bool> *abort, u32 slice_ms) {
                int flags = ::fcntl(fd, F_GETFL, 0);
                if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
                    return Result<void>::err(Error::socket_error("fcntl(): " + errno_text(errno)));
                }

                int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
                if (rc < 0 && errno != EINPROGRESS) {
                    return Result<void>::err(Error::connect_failed(errno_text(errno)));
                }

                while (rc < 0) {
                    if (abort && abort->load()) {
                        return Result<void>::err(Error::invalid_state("connect aborted"));
                    }
                    auto now = std::chrono::steady_clock::now();
                    if (now >= deadline) {
                        return Result<void>::err(Error::timeout("timed out"));
                    }
                    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
                    int wait_ms = static_cast<int>(left < slice_ms ? left : slice_ms);

                    pollfd pfd{};
                    pfd.fd = fd;
                    pfd.events = POLLOUT;
                    int ready = ::poll(&pfd, 1, wait_ms);
                    if (ready < 0) {
                        if (errno == EINTR)
                            continue;
                        return Result<void>::err(Error::socket_error("poll(): " + errno_text(errno)));
                    }
                    if (ready == 0)
                        continue;

                    int so_error = 0;
                    socklen_t so_len = sizeof(so_error);
                    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
                        return Result<void>::err(Error::socket_error("getsockopt(): " + errno_text(errno)));
                    }
                    if (so_error != 0) {
                        return Result<void>::err(Error::connect_failed(errno_text(so_error)));
                    }
                    rc = 0;
                }

                // Back to blocking; reads are bounded by poll() instead
                if (::fcntl(fd, F_SETFL, flags) < 0) {
                    return Result<void>::err(Error::socket_error("fcntl(): " + errno_text(errno)));
                }
                return {};
            }
        };

    } // namespace link
    using namespace link;
} // namespace plcsim
