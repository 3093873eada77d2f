#pragma once

// ============================================================
// platform.hpp -- Winsock / BSD socket differences for UDP
//   Everything that needs an #ifdef lives here so the socket
//   wrapper itself stays platform-neutral.
// ============================================================

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef _WIN32_WINNT
#    define _WIN32_WINNT 0x0601
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
#  include <windows.h>
#  pragma comment(lib, "ws2_32.lib")

   using socket_t  = SOCKET;
   using socklen_t = int;
   using io_result_t = int;
#  define INVALID_SOCKET_VAL INVALID_SOCKET
#  define SOCKET_ERROR_VAL   SOCKET_ERROR
#else
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <sys/time.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <unistd.h>
#  include <errno.h>
#  include <cstring>

   using socket_t    = int;
   using io_result_t = ssize_t;
#  define INVALID_SOCKET_VAL (-1)
#  define SOCKET_ERROR_VAL   (-1)
#endif

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

namespace platform {

// ---- Error codes of the last socket call ----

inline int last_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

inline std::string error_str(int err) {
#ifdef _WIN32
    char buf[256] = {0};
    FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, err, 0, buf, sizeof(buf), nullptr);
    std::string s = buf;
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
    return s + " (err=" + std::to_string(err) + ")";
#else
    return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
#endif
}

// A signal interrupted the call; just retry it
inline bool interrupted(int err) {
#ifdef _WIN32
    return err == WSAEINTR;
#else
    return err == EINTR;
#endif
}

// recvfrom() gave up after SO_RCVTIMEO
inline bool timed_out(int err) {
#ifdef _WIN32
    return err == WSAETIMEDOUT || err == WSAEWOULDBLOCK;
#else
    return err == EAGAIN || err == EWOULDBLOCK;
#endif
}

// ICMP port-unreachable left over from an earlier sendto(); harmless on UDP
inline bool peer_reset(int err) {
#ifdef _WIN32
    return err == WSAECONNRESET;
#else
    return err == ECONNREFUSED;
#endif
}

// ---- Socket calls whose signatures differ ----

inline io_result_t send_datagram(socket_t fd, const void* buf, size_t len, const sockaddr_in& dst) {
#ifdef _WIN32
    return ::sendto(fd, (const char*)buf, (int)len, 0, (const sockaddr*)&dst, sizeof(dst));
#else
    return ::sendto(fd, buf, len, MSG_NOSIGNAL, (const sockaddr*)&dst, sizeof(dst));
#endif
}

inline io_result_t recv_datagram(socket_t fd, void* buf, size_t len, sockaddr_in& src) {
    socklen_t alen = sizeof(src);
#ifdef _WIN32
    return ::recvfrom(fd, (char*)buf, (int)len, 0, (sockaddr*)&src, &alen);
#else
    return ::recvfrom(fd, buf, len, 0, (sockaddr*)&src, &alen);
#endif
}

// 0 = block forever. Returns false if setsockopt() failed.
inline bool set_recv_timeout(socket_t fd, int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout)) == 0;
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
#endif
}

inline bool set_reuse_addr(socket_t fd) {
    int on = 1;
    return setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on)) == 0;
}

inline void close_socket(socket_t fd) {
#ifdef _WIN32
    closesocket(fd);
#else
    ::close(fd);
#endif
}

// ---- Process-wide init ----

// Winsock needs WSAStartup before the first socket; no-op elsewhere
struct Guard {
    Guard() {
#ifdef _WIN32
        WSADATA wsa;
        int rc = WSAStartup(MAKEWORD(2, 2), &wsa);
        if (rc != 0) throw std::runtime_error("WSAStartup failed: " + std::to_string(rc));
#endif
    }
    ~Guard() {
#ifdef _WIN32
        WSACleanup();
#endif
    }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
};

} // namespace platform
