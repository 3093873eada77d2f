#pragma once

// ============================================================
// server_app.hpp -- minitftp daemon: request dispatcher
//   Owns the well-known UDP port. Every RRQ/WRQ gets a fresh
//   ephemeral socket and its own TransferSession thread; the
//   well-known socket is never used for a transfer.
//
// Concurrency model:
//   dispatch_loop() -> receive + decode the first datagram of an
//                      exchange, never blocks on a session.
//   session threads -> detached, one per transfer, each owning its
//                      socket and byte stream; only the atomic
//                      active-session count is shared.
// ============================================================

#include "../common/platform.hpp"
#include "../common/packet.hpp"
#include "../common/udp_socket.hpp"
#include "../common/byte_stream.hpp"
#include "transfer_session.hpp"
#include <string>
#include <vector>
#include <atomic>
#include <mutex>
#include <condition_variable>

static constexpr u16 TFTP_PORT = 69;

struct ServerConfig {
    std::string root_dir{"."};
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{TFTP_PORT};  // 0 = any free port (tests)
    int         timeout_ms{1000};
    int         max_retries{5};
    bool        allow_overwrite{false};
    bool        dally{true};
    bool        instrument{false};
    int         poll_ms{250};            // how often the loop checks stop()

    SessionConfig session() const {
        SessionConfig sc;
        sc.timeout_ms      = timeout_ms;
        sc.max_retries     = max_retries;
        sc.allow_overwrite = allow_overwrite;
        sc.dally           = dally;
        return sc;
    }
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config);
    // Waits for running sessions to finish
    ~ServerApp();

    ServerApp(const ServerApp&) = delete;
    ServerApp& operator=(const ServerApp&) = delete;

    // Binds the well-known port and serves until stop(). Throws if the
    // port can't be bound.
    int run();

    // Safe from a signal handler or another thread. Sticky: a stop()
    // that lands before run() makes run() return without serving.
    void stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound (differs from config when listen_port is 0);
    // 0 until run() has bound it
    u16 bound_port() const { return bound_port_.load(); }

    int active_sessions() const { return active_sessions_.load(); }

private:
    ServerConfig      config_;
    FileStore         store_;
    UdpSocket         listen_sock_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<u16>  bound_port_{0};
    std::atomic<u64>  session_id_counter_{1};

    std::atomic<int>        active_sessions_{0};
    std::mutex              sessions_mutex_;
    std::condition_variable sessions_cv_;

    void dispatch_loop();

    // Decode the first datagram of an exchange and act on it
    void handle_request(const std::vector<u8>& datagram, const Endpoint& src);

    // Bind an ephemeral socket and start a TransferSession thread
    void launch_session(const Packet& request, const Endpoint& peer);

    void session_finished();
    void wait_for_sessions();
};
