// ============================================================
// udp_socket.cpp -- UdpSocket implementation
// ============================================================

#include "udp_socket.hpp"
#include "packet.hpp"
#include "instrument.hpp"
#include "logger.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================
// Endpoint
// ============================================================

Endpoint Endpoint::from(const std::string& ip, u16 port) {
    Endpoint ep;
    ep.addr.sin_family = AF_INET;
    ep.addr.sin_port   = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        ep.addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, ip.c_str(), &ep.addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    return ep;
}

std::string Endpoint::ip() const {
    char buf[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, const_cast<in_addr*>(&addr.sin_addr), buf, sizeof(buf))) {
        return buf;
    }
    return "unknown";
}

std::string Endpoint::to_string() const {
    return ip() + ":" + std::to_string(port());
}

// ============================================================
// UdpSocket
// ============================================================

UdpSocket::UdpSocket() {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + platform::error_str(platform::last_error()));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& o) noexcept : fd_(o.fd_), timeout_ms_(o.timeout_ms_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        timeout_ms_ = o.timeout_ms_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void UdpSocket::bind(const std::string& ip, u16 port) {
    Endpoint ep = Endpoint::from(ip, port);
    // Lets a restarted server take the well-known port back at once
    if (port != 0 && !platform::set_reuse_addr(fd_)) {
        LOG_WARN("SO_REUSEADDR on " + ep.to_string() + " failed: " +
                 platform::error_str(platform::last_error()));
    }
    if (::bind(fd_, (const sockaddr*)&ep.addr, sizeof(ep.addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind(" + ep.to_string() + ") failed: " +
                                 platform::error_str(platform::last_error()));
    }
}

void UdpSocket::send_to(const Endpoint& dst, const void* buf, size_t len) {
    for (;;) {
        io_result_t sent = platform::send_datagram(fd_, buf, len, dst.addr);
        if (sent == SOCKET_ERROR_VAL) {
            int err = platform::last_error();
            if (platform::interrupted(err)) continue;
            throw std::runtime_error("sendto(" + dst.to_string() + ") failed: " +
                                     platform::error_str(err));
        }
        if ((size_t)sent != len) {
            throw std::runtime_error("sendto(" + dst.to_string() + ") truncated datagram");
        }
        Instrumentation::get().note_sent(len);
        return;
    }
}

bool UdpSocket::recv_from(std::vector<u8>& buf, Endpoint& src) {
    buf.resize(MAX_DATAGRAM);
    for (;;) {
        io_result_t n = platform::recv_datagram(fd_, buf.data(), buf.size(), src.addr);
        if (n == SOCKET_ERROR_VAL) {
            int err = platform::last_error();
            if (platform::interrupted(err)) continue;
            if (platform::timed_out(err)) {
                buf.clear();
                return false;
            }
            // Leftover ICMP unreachable from an earlier sendto()
            if (platform::peer_reset(err)) continue;
            throw std::runtime_error("recvfrom() failed: " + platform::error_str(err));
        }
        buf.resize((size_t)n);
        Instrumentation::get().note_received((size_t)n);
        return true;
    }
}

void UdpSocket::set_recv_timeout_ms(int ms) {
    if (ms == timeout_ms_) return;
    if (!platform::set_recv_timeout(fd_, ms)) {
        throw std::runtime_error("setsockopt(SO_RCVTIMEO) failed: " +
                                 platform::error_str(platform::last_error()));
    }
    timeout_ms_ = ms;
}

Endpoint UdpSocket::local_endpoint() const {
    Endpoint ep;
    socklen_t len = sizeof(ep.addr);
    if (getsockname(fd_, (sockaddr*)&ep.addr, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + platform::error_str(platform::last_error()));
    }
    return ep;
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        platform::close_socket(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}
