// ============================================================
// server_app.cpp -- minitftp dispatcher implementation
// ============================================================

#include "server_app.hpp"
#include "error_signal.hpp"
#include "../common/logger.hpp"
#include "../common/instrument.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

ServerApp::ServerApp(ServerConfig config)
    : config_(std::move(config))
    , store_(config_.root_dir)
{}

ServerApp::~ServerApp() {
    stop();
    wait_for_sessions();
}

int ServerApp::run() {
    std::error_code ec;
    if (!fs::is_directory(config_.root_dir, ec)) {
        throw std::runtime_error("Root directory not found: " + config_.root_dir);
    }
    if (stop_requested_.load()) {
        LOG_INFO("Stop requested before start, not serving");
        return 0;
    }
    Instrumentation::get().enable(config_.instrument);

    listen_sock_.bind(config_.listen_ip, config_.listen_port);
    listen_sock_.set_recv_timeout_ms(config_.poll_ms);
    running_.store(!stop_requested_.load());
    bound_port_.store(listen_sock_.local_endpoint().port());

    LOG_INFO("minitftp serving '" + config_.root_dir + "' on " +
             config_.listen_ip + ":" + std::to_string(bound_port_.load()) +
             " (timeout " + std::to_string(config_.timeout_ms) + " ms, " +
             std::to_string(config_.max_retries) + " retries)");

    dispatch_loop();

    int pending = active_sessions_.load();
    if (pending > 0) {
        LOG_INFO("Dispatcher stopped, waiting for " + std::to_string(pending) + " session(s)");
    }
    running_.store(false);
    wait_for_sessions();
    listen_sock_.close();

    if (Instrumentation::get().enabled()) {
        LOG_INFO("Instrumentation: " + Instrumentation::get().summary());
    }
    return 0;
}

void ServerApp::stop() {
    stop_requested_.store(true);
    running_.store(false);
}

// ---------------------------------------------------------------
// dispatch_loop
//   One datagram at a time from the well-known port. The receive
//   timeout (poll_ms) only exists so stop() is noticed.
// ---------------------------------------------------------------
void ServerApp::dispatch_loop() {
    std::vector<u8> datagram;
    while (!stop_requested_.load()) {
        Endpoint src;
        try {
            if (!listen_sock_.recv_from(datagram, src)) continue;
        } catch (const std::exception& e) {
            if (stop_requested_.load()) break;
            LOG_ERROR("dispatch_loop: " + std::string(e.what()));
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_ms));
            continue;
        }
        handle_request(datagram, src);
    }
}

void ServerApp::handle_request(const std::vector<u8>& datagram, const Endpoint& src) {
    Packet pkt;
    try {
        pkt = proto::decode(datagram);
    } catch (const PacketError& e) {
        LOG_WARN("Invalid initial request from " + src.to_string() + ": " + e.what());
        errsig::send_error(src, ErrorCode::NOT_DEFINED,
                           std::string("invalid initial request: ") + proto::parse_error_name(e.kind()),
                           config_.listen_ip);
        return;
    }

    LOG_DEBUG("Request from " + src.to_string() + ": " + proto::describe(pkt));

    Opcode op = proto::opcode_of(pkt);
    if (op == Opcode::OP_RRQ || op == Opcode::OP_WRQ) {
        launch_session(pkt, src);
        return;
    }

    LOG_WARN("Unexpected " + std::string(proto::opcode_name(op)) + " on the request port from " +
             src.to_string());
    errsig::send_error(src, ErrorCode::ILLEGAL_OPERATION,
                       std::string("unexpected ") + proto::opcode_name(op) + " packet",
                       config_.listen_ip);
}

void ServerApp::launch_session(const Packet& request, const Endpoint& peer) {
    u64 sid = session_id_counter_.fetch_add(1);

    std::unique_ptr<TransferSession> session;
    try {
        auto sock = std::make_unique<UdpSocket>();
        sock->bind(config_.listen_ip, 0);
        LOG_DEBUG("Session " + std::to_string(sid) + " for " + peer.to_string() +
                  " on " + sock->local_endpoint().to_string());
        session = std::make_unique<TransferSession>(sid, std::move(sock), store_, peer,
                                                    request, config_.session());
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot start session for " + peer.to_string() + ": " + e.what());
        errsig::send_error(peer, ErrorCode::NOT_DEFINED, "server cannot start transfer",
                           config_.listen_ip);
        return;
    }

    {
        std::lock_guard<std::mutex> lk(sessions_mutex_);
        active_sessions_.fetch_add(1);
    }
    try {
        std::thread t([this, sess = std::move(session)]() mutable {
            sess->run();
            sess.reset();
            session_finished();
        });
        t.detach();
    } catch (const std::system_error& e) {
        session_finished();
        LOG_ERROR("Cannot spawn session thread for " + peer.to_string() + ": " + e.what());
        errsig::send_error(peer, ErrorCode::NOT_DEFINED, "server cannot start transfer",
                           config_.listen_ip);
    }
}

void ServerApp::session_finished() {
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    active_sessions_.fetch_sub(1);
    sessions_cv_.notify_all();
}

void ServerApp::wait_for_sessions() {
    std::unique_lock<std::mutex> lk(sessions_mutex_);
    sessions_cv_.wait(lk, [this] { return active_sessions_.load() == 0; });
}
