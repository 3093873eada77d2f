// ============================================================
// packet.cpp -- TFTP packet decode/encode
// ============================================================

#include "packet.hpp"
#include "instrument.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace {

// Index of the first NUL in [from, len), or len if there is none
size_t find_nul(const u8* data, size_t from, size_t len) {
    const u8* end = data + len;
    const u8* p = std::find(data + from, end, (u8)0);
    return (size_t)(p - data);
}

// Shared by RRQ and WRQ: filename 0x00 mode [0x00 options...]
void decode_request_fields(const u8* data, size_t len,
                           std::string& filename, std::string& mode) {
    size_t fn_end = find_nul(data, 2, len);
    if (fn_end >= len) {
        throw PacketError(ParseError::NOT_ENOUGH_DATA, "request: filename not terminated");
    }
    size_t mode_begin = fn_end + 1;
    if (mode_begin >= len) {
        throw PacketError(ParseError::NOT_ENOUGH_DATA, "request: missing mode field");
    }
    // Anything after the mode terminator is an option extension and ignored
    size_t mode_end = find_nul(data, mode_begin, len);

    filename.assign((const char*)data + 2, fn_end - 2);
    mode.assign((const char*)data + mode_begin, mode_end - mode_begin);
}

void put_text(std::vector<u8>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
    out.push_back(0);
}

void check_text(const std::string& text, size_t room, ParseError kind, const char* field) {
    if (text.find('\0') != std::string::npos) {
        throw PacketError(kind, std::string(field) + " contains an embedded NUL");
    }
    if (text.size() + 1 > room) {
        throw PacketError(kind, std::string(field) + " too long for one datagram");
    }
}

std::vector<u8> encode_request(Opcode op, const std::string& filename, const std::string& mode) {
    check_text(filename, MAX_DATAGRAM - 2, ParseError::INVALID_FILENAME, "filename");
    check_text(mode, MAX_DATAGRAM - 2 - (filename.size() + 1), ParseError::INVALID_MODE, "mode");

    std::vector<u8> out;
    out.reserve(2 + filename.size() + 1 + mode.size() + 1);
    proto::put_u16(out, (u16)op);
    put_text(out, filename);
    put_text(out, mode);
    return out;
}

} // namespace

// ============================================================
// Decode
// ============================================================

Packet proto::decode(const u8* data, size_t len) {
    if (len < 2) {
        throw PacketError(ParseError::NOT_ENOUGH_DATA, "datagram shorter than an opcode");
    }

    u16 raw_op = get_u16(data);
    switch (raw_op) {
        case (u16)Opcode::OP_RRQ: {
            ReadRequest rrq;
            decode_request_fields(data, len, rrq.filename, rrq.mode);
            return rrq;
        }
        case (u16)Opcode::OP_WRQ: {
            WriteRequest wrq;
            decode_request_fields(data, len, wrq.filename, wrq.mode);
            return wrq;
        }
        case (u16)Opcode::OP_DATA: {
            if (len < DATA_HEADER_LEN) {
                throw PacketError(ParseError::NOT_ENOUGH_DATA, "DATA without block number");
            }
            DataPacket d;
            d.block = get_u16(data + 2);
            size_t n = std::min(len - DATA_HEADER_LEN, BLOCK_SIZE);
            d.payload.assign(data + DATA_HEADER_LEN, data + DATA_HEADER_LEN + n);
            return d;
        }
        case (u16)Opcode::OP_ACK: {
            if (len < 4) {
                throw PacketError(ParseError::NOT_ENOUGH_DATA, "ACK without block number");
            }
            AckPacket a;
            a.block = get_u16(data + 2);
            return a;
        }
        case (u16)Opcode::OP_ERROR: {
            if (len < 4) {
                throw PacketError(ParseError::NOT_ENOUGH_DATA, "ERROR without error code");
            }
            size_t msg_end = find_nul(data, 4, len);
            if (msg_end >= len) {
                throw PacketError(ParseError::NOT_ENOUGH_DATA, "ERROR message not terminated");
            }
            ErrorPacket e;
            e.code = error_code_from_wire(get_u16(data + 2));
            e.message.assign((const char*)data + 4, msg_end - 4);
            return e;
        }
        default:
            throw PacketError(ParseError::INVALID_OPCODE,
                              "invalid opcode " + std::to_string(raw_op));
    }
}

// ============================================================
// Encode
// ============================================================

std::vector<u8> proto::encode(const Packet& pkt) {
    std::vector<u8> out;

    if (auto* rrq = std::get_if<ReadRequest>(&pkt)) {
        out = encode_request(Opcode::OP_RRQ, rrq->filename, rrq->mode);
    } else if (auto* wrq = std::get_if<WriteRequest>(&pkt)) {
        out = encode_request(Opcode::OP_WRQ, wrq->filename, wrq->mode);
    } else if (auto* d = std::get_if<DataPacket>(&pkt)) {
        if (d->payload.size() > BLOCK_SIZE) {
            throw std::length_error("DATA payload of " + std::to_string(d->payload.size()) +
                                    " bytes exceeds block size");
        }
        out.reserve(DATA_HEADER_LEN + d->payload.size());
        put_u16(out, (u16)Opcode::OP_DATA);
        put_u16(out, d->block);
        out.insert(out.end(), d->payload.begin(), d->payload.end());
    } else if (auto* a = std::get_if<AckPacket>(&pkt)) {
        out.reserve(4);
        put_u16(out, (u16)Opcode::OP_ACK);
        put_u16(out, a->block);
    } else {
        const auto& e = std::get<ErrorPacket>(pkt);
        check_text(e.message, MAX_DATAGRAM - 4, ParseError::INVALID_ERROR_MESSAGE, "error message");
        out.reserve(4 + e.message.size() + 1);
        put_u16(out, (u16)Opcode::OP_ERROR);
        put_u16(out, (u16)e.code);
        put_text(out, e.message);
    }

    Instrumentation::get().note_buffer(out.size());
    return out;
}

Opcode proto::opcode_of(const Packet& pkt) {
    switch (pkt.index()) {
        case 0:  return Opcode::OP_RRQ;
        case 1:  return Opcode::OP_WRQ;
        case 2:  return Opcode::OP_DATA;
        case 3:  return Opcode::OP_ACK;
        default: return Opcode::OP_ERROR;
    }
}

// ============================================================
// Names and modes
// ============================================================

TransferMode proto::parse_mode(const std::string& mode) {
    if (utils::iequals(mode, "octet") || utils::iequals(mode, "binary")) {
        return TransferMode::OCTET;
    }
    if (utils::iequals(mode, "netascii")) return TransferMode::NETASCII;
    if (utils::iequals(mode, "mail"))     return TransferMode::MAIL;
    throw PacketError(ParseError::INVALID_MODE, "unknown transfer mode '" + utils::printable(mode) + "'");
}

ErrorCode proto::error_code_from_wire(u16 raw) {
    if (raw <= (u16)ErrorCode::NO_SUCH_USER) return (ErrorCode)raw;
    return ErrorCode::NOT_DEFINED;
}

const char* proto::opcode_name(Opcode op) {
    switch (op) {
        case Opcode::OP_RRQ:   return "RRQ";
        case Opcode::OP_WRQ:   return "WRQ";
        case Opcode::OP_DATA:  return "DATA";
        case Opcode::OP_ACK:   return "ACK";
        case Opcode::OP_ERROR: return "ERROR";
    }
    return "?";
}

const char* proto::error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_DEFINED:         return "not defined";
        case ErrorCode::FILE_NOT_FOUND:      return "file not found";
        case ErrorCode::ACCESS_VIOLATION:    return "access violation";
        case ErrorCode::DISK_FULL:           return "disk full or allocation exceeded";
        case ErrorCode::ILLEGAL_OPERATION:   return "illegal TFTP operation";
        case ErrorCode::UNKNOWN_TRANSFER_ID: return "unknown transfer ID";
        case ErrorCode::FILE_ALREADY_EXISTS: return "file already exists";
        case ErrorCode::NO_SUCH_USER:        return "no such user";
    }
    return "?";
}

const char* proto::parse_error_name(ParseError err) {
    switch (err) {
        case ParseError::NOT_ENOUGH_DATA:       return "not enough data";
        case ParseError::INVALID_OPCODE:        return "invalid opcode";
        case ParseError::INVALID_MODE:          return "invalid mode";
        case ParseError::INVALID_FILENAME:      return "invalid filename";
        case ParseError::INVALID_ERROR_MESSAGE: return "invalid error message";
    }
    return "?";
}

const char* proto::mode_name(TransferMode mode) {
    switch (mode) {
        case TransferMode::NETASCII: return "netascii";
        case TransferMode::OCTET:    return "octet";
        case TransferMode::MAIL:     return "mail";
    }
    return "?";
}

std::string proto::describe(const Packet& pkt) {
    if (auto* rrq = std::get_if<ReadRequest>(&pkt)) {
        return "RRQ '" + utils::printable(rrq->filename) + "' (" + utils::printable(rrq->mode) + ")";
    }
    if (auto* wrq = std::get_if<WriteRequest>(&pkt)) {
        return "WRQ '" + utils::printable(wrq->filename) + "' (" + utils::printable(wrq->mode) + ")";
    }
    if (auto* d = std::get_if<DataPacket>(&pkt)) {
        return "DATA #" + std::to_string(d->block) + " (" + std::to_string(d->payload.size()) + " B)";
    }
    if (auto* a = std::get_if<AckPacket>(&pkt)) {
        return "ACK #" + std::to_string(a->block);
    }
    const auto& e = std::get<ErrorPacket>(pkt);
    return "ERROR " + std::to_string((u16)e.code) + " (" + error_code_name(e.code) + "): " +
           utils::printable(e.message);
}
