#pragma once

// ============================================================
// error_signal.hpp -- Best-effort ERROR packet delivery
//   Exactly one send, never retried, never waits for a reply
//   (ERROR packets are not acknowledged). Failures are logged
//   and swallowed so they can't cascade into another ERROR.
// ============================================================

#include "../common/platform.hpp"
#include "../common/packet.hpp"
#include "../common/udp_socket.hpp"
#include <string>

namespace errsig {

// Longest message text we put on the wire
static constexpr size_t MAX_MESSAGE_LEN = 255;

// Send on a socket the caller already owns (a session's socket)
void send_error(DatagramSocket& sock, const Endpoint& dst,
                ErrorCode code, const std::string& message);

// Send from a freshly bound ephemeral socket on 'bind_ip'
void send_error(const Endpoint& dst, ErrorCode code,
                const std::string& message, const std::string& bind_ip = "0.0.0.0");

// Most specific wire code for a storage errno
ErrorCode code_for_errno(int err);

} // namespace errsig
