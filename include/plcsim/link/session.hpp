#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../telegram/codec.hpp"
#include "event_channel.hpp"
#include "frame_assembler.hpp"
#include "tcp_socket.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

namespace plcsim {
    namespace link {

        // ─── Connection configuration ────────────────────────────────────────────────
        struct ConnectionConfig {
            u32 connect_timeout_ms = CONNECT_TIMEOUT_MS;
            u32 poll_interval_ms = POLL_INTERVAL_MS;
            u32 join_timeout_ms = JOIN_TIMEOUT_MS;
            usize max_buffer_bytes = RX_BUFFER_MAX;
            usize read_chunk_bytes = RX_READ_CHUNK;

            ConnectionConfig &connect_timeout(u32 ms) {
                connect_timeout_ms = ms;
                return *this;
            }
            ConnectionConfig &poll_interval(u32 ms) {
                poll_interval_ms = ms == 0 ? 1 : ms;
                return *this;
            }
            ConnectionConfig &join_timeout(u32 ms) {
                join_timeout_ms = ms;
                return *this;
            }
            ConnectionConfig &max_buffer(usize bytes) {
                max_buffer_bytes = bytes;
                return *this;
            }
            ConnectionConfig &read_chunk(usize bytes) {
                read_chunk_bytes = bytes == 0 ? 1 : bytes;
                return *this;
            }
        };

        struct Endpoint {
            dp::String host;
            u16 port = 0;
        };

        using OutboundQueue = ConcurrentQueue<dp::String>;

        // ─── Session ─────────────────────────────────────────────────────────────────
        // One TCP connection attempt and, if it succeeds, its lifetime. The worker
        // thread connects and then runs the receive loop; a second thread runs the
        // send loop. Both only talk to the outside through the event and outbound
        // queues. The worker keeps the session alive until it has pushed its final
        // event, so a detached session never touches freed memory.
        class Session : public std::enable_shared_from_this<Session> {
            SessionId id_;
            Endpoint endpoint_;
            ConnectionConfig config_;
            std::shared_ptr<EventQueue> events_;
            std::shared_ptr<OutboundQueue> outbound_;

            TcpSocket socket_;
            FrameAssembler assembler_;
            std::atomic<bool> stop_{false};

            std::thread worker_;
            std::thread sender_;

            std::mutex done_mutex_;
            std::condition_variable done_cv_;
            bool done_ = false;

          public:
            Session(SessionId id, Endpoint endpoint, ConnectionConfig config, std::shared_ptr<EventQueue> events,
                    std::shared_ptr<OutboundQueue> outbound)
                : id_(id), endpoint_(std::move(endpoint)), config_(config), events_(std::move(events)),
                  outbound_(std::move(outbound)), assembler_(config.max_buffer_bytes) {}

            ~Session() {
                // Owner normally joins or detaches before this runs
                if (worker_.joinable())
                    worker_.detach();
            }

            Session(const Session &) = delete;
            Session &operator=(const Session &) = delete;

            Result<void> start() {
                if (worker_.joinable()) {
                    return Result<void>::err(Error::invalid_state("session already started"));
                }
                try {
                    auto self = shared_from_this();
                    worker_ = std::thread([self] { self->run(); });
                } catch (const std::system_error &e) {
                    return Result<void>::err(
                        Error::invalid_state("cannot start session thread: " + dp::String(e.what())));
                }
                return {};
            }

            // Signal both loops and unblock any pending socket call
            void request_stop() noexcept {
                stop_.store(true);
                socket_.shutdown();
            }

            bool wait_finished(u32 timeout_ms) {
                std::unique_lock lock(done_mutex_);
                return done_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return done_; });
            }

            // Join if the worker finished within `timeout_ms`, else detach it.
            // Returns false if the worker had to be abandoned.
            bool join_for(u32 timeout_ms) {
                if (!worker_.joinable())
                    return true;
                if (worker_.get_id() == std::this_thread::get_id()) {
                    worker_.detach();
                    return false;
                }
                if (wait_finished(timeout_ms)) {
                    worker_.join();
                    return true;
                }
                worker_.detach();
                return false;
            }

            bool finished() {
                std::lock_guard lock(done_mutex_);
                return done_;
            }

            SessionId id() const noexcept { return id_; }
            const Endpoint &endpoint() const noexcept { return endpoint_; }
            bool stop_requested() const noexcept { return stop_.load(); }

          private:
            void push(LinkEvent ev) { events_->push(std::move(ev)); }

            void run() {
                echo::category("plcsim.link.session")
                    .debug("session ", id_, " connecting to ", endpoint_.host, ":", endpoint_.port);

                auto conn = socket_.connect(endpoint_.host, endpoint_.port, config_.connect_timeout_ms, &stop_,
                                            config_.poll_interval_ms);
                if (conn.is_err()) {
                    if (stop_.load()) {
                        echo::category("plcsim.link.session").debug("session ", id_, " stopped while connecting");
                        finish(LinkEvent::status_change(id_, LinkStatus::Disconnected, true));
                    } else {
                        echo::category("plcsim.link.session").warn("session ", id_, ": ", conn.error().message);
                        push(LinkEvent::status_change(id_, LinkStatus::Error));
                        finish(LinkEvent::failure(id_, conn.error(), true));
                    }
                    return;
                }

                push(LinkEvent::status_change(id_, LinkStatus::Connected));
                echo::category("plcsim.link.session")
                    .info("session ", id_, " connected to ", endpoint_.host, ":", endpoint_.port);

                bool sender_started = false;
                try {
                    sender_ = std::thread([this] { send_loop(); });
                    sender_started = true;
                } catch (const std::system_error &e) {
                    push(LinkEvent::failure(
                        id_, Error::invalid_state("cannot start send loop: " + dp::String(e.what()))));
                }

                if (sender_started)
                    receive_loop();

                // Teardown runs on every exit path after a successful connect
                stop_.store(true);
                socket_.shutdown();
                if (sender_.joinable())
                    sender_.join();
                socket_.close();

                echo::category("plcsim.link.session").info("session ", id_, " closed");
                finish(LinkEvent::status_change(id_, LinkStatus::Disconnected, true));
            }

            void finish(LinkEvent last) {
                push(std::move(last));
                {
                    std::lock_guard lock(done_mutex_);
                    done_ = true;
                }
                done_cv_.notify_all();
            }

            void receive_loop() {
                Bytes chunk(config_.read_chunk_bytes);

                while (!stop_.load()) {
                    auto r = socket_.read_some(chunk.data(), chunk.size(), config_.poll_interval_ms);
                    if (r.is_err()) {
                        if (r.error().code == ErrorCode::Timeout)
                            continue;
                        if (!stop_.load())
                            push(LinkEvent::failure(id_, r.error()));
                        break;
                    }

                    usize n = r.value();
                    if (n == 0) {
                        if (!stop_.load())
                            echo::category("plcsim.link.session").info("session ", id_, ": peer closed the stream");
                        break;
                    }

                    usize discarded = assembler_.append(chunk.data(), n);
                    if (discarded > 0) {
                        echo::category("plcsim.link.session")
                            .warn("session ", id_, ": receive buffer full, discarded ", discarded, " bytes");
                        push(LinkEvent::failure(id_, Error::overflow(discarded)));
                    }

                    while (auto frame = assembler_.next()) {
                        auto decoded = decode(*frame);
                        if (!decoded.has_value())
                            continue;
                        echo::category("plcsim.link.session").trace("rx ", decoded->telegram.raw);
                        push(LinkEvent::received(id_, std::move(*decoded)));
                    }
                }

                if (assembler_.pending() > 0) {
                    echo::category("plcsim.link.session")
                        .debug("session ", id_, ": dropping ", assembler_.pending(), " bytes of partial frame");
                }
            }

            void send_loop() {
                while (!stop_.load()) {
                    auto frame = outbound_->pop_for(std::chrono::milliseconds(config_.poll_interval_ms));
                    if (!frame.has_value())
                        continue;

                    auto w = socket_.write_all(*frame);
                    if (w.is_err()) {
                        if (!stop_.load()) {
                            push(LinkEvent::failure(id_, w.error()));
                            request_stop();
                        }
                        break;
                    }

                    auto decoded = decode(*frame);
                    if (decoded.has_value()) {
                        echo::category("plcsim.link.session").trace("tx ", decoded->telegram.raw);
                        push(LinkEvent::sent(id_, std::move(*decoded)));
                    }
                }
            }
        };

    } // namespace link
    using namespace link;
} // namespace plcsim
