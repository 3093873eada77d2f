#pragma once

// ============================================================
// udp_socket.hpp -- RAII UDP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>
#include <vector>

// IPv4 address + port
struct Endpoint {
    sockaddr_in addr{};

    Endpoint() { addr.sin_family = AF_INET; }

    // Throws on a malformed IP; "" and "0.0.0.0" mean INADDR_ANY
    static Endpoint from(const std::string& ip, u16 port);

    u16 port() const { return ntohs(addr.sin_port); }
    std::string ip() const;
    std::string to_string() const;

    bool operator==(const Endpoint& o) const {
        return addr.sin_addr.s_addr == o.addr.sin_addr.s_addr &&
               addr.sin_port == o.addr.sin_port;
    }
    bool operator!=(const Endpoint& o) const { return !(*this == o); }
};

// What a transfer needs from its transport
class DatagramSocket {
public:
    virtual ~DatagramSocket() = default;

    // Send one datagram; throws on a socket error
    virtual void send_to(const Endpoint& dst, const void* buf, size_t len) = 0;

    // Receive one datagram into 'buf' (resized to its length).
    // Returns false when the receive timeout expires; throws on a socket error.
    virtual bool recv_from(std::vector<u8>& buf, Endpoint& src) = 0;

    // 0 = block indefinitely
    virtual void set_recv_timeout_ms(int ms) = 0;

    virtual Endpoint local_endpoint() const = 0;
};

class UdpSocket : public DatagramSocket {
public:
    UdpSocket();
    ~UdpSocket() override;

    // Non-copyable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Movable
    UdpSocket(UdpSocket&& o) noexcept;
    UdpSocket& operator=(UdpSocket&& o) noexcept;

    // Port 0 binds an ephemeral port
    void bind(const std::string& ip, u16 port);

    void send_to(const Endpoint& dst, const void* buf, size_t len) override;
    bool recv_from(std::vector<u8>& buf, Endpoint& src) override;
    void set_recv_timeout_ms(int ms) override;
    Endpoint local_endpoint() const override;

    void close();

private:
    socket_t fd_{INVALID_SOCKET_VAL};
    int      timeout_ms_{-1};
};
