// ============================================================
// error_signal.cpp -- ERROR packet delivery
// ============================================================

#include "error_signal.hpp"
#include "../common/logger.hpp"
#include <cerrno>
#include <string>
#include <vector>

namespace {

// Cut at the first NUL and cap the length so encode() can't refuse it
std::string wire_message(const std::string& message) {
    std::string msg = message.substr(0, message.find('\0'));
    if (msg.size() > errsig::MAX_MESSAGE_LEN) msg.resize(errsig::MAX_MESSAGE_LEN);
    return msg;
}

std::vector<u8> build(ErrorCode code, const std::string& message) {
    ErrorPacket pkt;
    pkt.code    = code;
    pkt.message = wire_message(message);
    return proto::encode(pkt);
}

} // namespace

void errsig::send_error(DatagramSocket& sock, const Endpoint& dst,
                        ErrorCode code, const std::string& message) {
    try {
        std::vector<u8> wire = build(code, message);
        sock.send_to(dst, wire.data(), wire.size());
        LOG_DEBUG("Sent ERROR " + std::to_string((u16)code) + " (" +
                  proto::error_code_name(code) + ") to " + dst.to_string());
    } catch (const std::exception& e) {
        LOG_WARN("Could not send ERROR to " + dst.to_string() + ": " + e.what());
    }
}

void errsig::send_error(const Endpoint& dst, ErrorCode code,
                        const std::string& message, const std::string& bind_ip) {
    try {
        UdpSocket sock;
        sock.bind(bind_ip, 0);
        send_error(sock, dst, code, message);
    } catch (const std::exception& e) {
        LOG_WARN("Could not open a socket for ERROR to " + dst.to_string() + ": " + e.what());
    }
}

ErrorCode errsig::code_for_errno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FILE_NOT_FOUND;
        case EACCES:
        case EPERM:
        case EROFS:
        case EISDIR:
            return ErrorCode::ACCESS_VIOLATION;
        case ENOSPC:
        case EFBIG:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return ErrorCode::DISK_FULL;
        case EEXIST:
            return ErrorCode::FILE_ALREADY_EXISTS;
        default:
            return ErrorCode::NOT_DEFINED;
    }
}
