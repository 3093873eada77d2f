#pragma once

// ============================================================
// packet.hpp -- TFTP wire packets (RFC 1350) and their codec
//
//   RRQ/WRQ : opcode(2) filename 0x00 mode 0x00
//   DATA    : opcode(2) block(2) payload(0..512)
//   ACK     : opcode(2) block(2)
//   ERROR   : opcode(2) code(2) message 0x00
//
// All integers are big-endian on the wire.
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <variant>
#include <stdexcept>

// Largest datagram we ever read or build. Real packets stay at or
// below BLOCK_SIZE + DATA_HEADER_LEN.
static constexpr size_t MAX_DATAGRAM    = 4096;
static constexpr size_t BLOCK_SIZE      = 512;
static constexpr size_t DATA_HEADER_LEN = 4;

// ---- Opcodes (prefixed OP_ to avoid Windows macro collisions) ----
enum class Opcode : u16 {
    OP_RRQ   = 1,
    OP_WRQ   = 2,
    OP_DATA  = 3,
    OP_ACK   = 4,
    OP_ERROR = 5,
};

// ---- ERROR packet codes ----
enum class ErrorCode : u16 {
    NOT_DEFINED         = 0,
    FILE_NOT_FOUND      = 1,
    ACCESS_VIOLATION    = 2,
    DISK_FULL           = 3,
    ILLEGAL_OPERATION   = 4,
    UNKNOWN_TRANSFER_ID = 5,
    FILE_ALREADY_EXISTS = 6,
    NO_SUCH_USER        = 7,
};

enum class TransferMode : u8 {
    NETASCII = 0,
    OCTET    = 1,
    MAIL     = 2,
};

// Why a datagram could not be decoded (or a packet encoded)
enum class ParseError : u8 {
    NOT_ENOUGH_DATA       = 0,
    INVALID_OPCODE        = 1,
    INVALID_MODE          = 2,
    INVALID_FILENAME      = 3,
    INVALID_ERROR_MESSAGE = 4,
};

class PacketError : public std::runtime_error {
public:
    PacketError(ParseError kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ParseError kind() const { return kind_; }

private:
    ParseError kind_;
};

// ============================================================
// Packet kinds
// ============================================================

struct ReadRequest {
    std::string filename;
    std::string mode;
};

struct WriteRequest {
    std::string filename;
    std::string mode;
};

struct DataPacket {
    u16             block{0};
    std::vector<u8> payload;
};

struct AckPacket {
    u16 block{0};
};

struct ErrorPacket {
    ErrorCode   code{ErrorCode::NOT_DEFINED};
    std::string message;
};

using Packet = std::variant<ReadRequest, WriteRequest, DataPacket, AckPacket, ErrorPacket>;

inline bool operator==(const ReadRequest& a, const ReadRequest& b) {
    return a.filename == b.filename && a.mode == b.mode;
}
inline bool operator==(const WriteRequest& a, const WriteRequest& b) {
    return a.filename == b.filename && a.mode == b.mode;
}
inline bool operator==(const DataPacket& a, const DataPacket& b) {
    return a.block == b.block && a.payload == b.payload;
}
inline bool operator==(const AckPacket& a, const AckPacket& b) {
    return a.block == b.block;
}
inline bool operator==(const ErrorPacket& a, const ErrorPacket& b) {
    return a.code == b.code && a.message == b.message;
}

namespace proto {

// ---- Byte-order helpers ----

inline void put_u16(std::vector<u8>& out, u16 v) {
    out.push_back((u8)(v >> 8));
    out.push_back((u8)(v & 0xFF));
}

inline u16 get_u16(const u8* p) {
    return (u16)(((u16)p[0] << 8) | p[1]);
}

// ---- Codec ----

// Decode one datagram. Throws PacketError; never reads past data+len.
Packet decode(const u8* data, size_t len);

inline Packet decode(const std::vector<u8>& buf) {
    return decode(buf.data(), buf.size());
}

// Serialize a packet. Throws PacketError for text fields holding an
// embedded NUL or too long for MAX_DATAGRAM, std::length_error for a
// DATA payload over BLOCK_SIZE.
std::vector<u8> encode(const Packet& pkt);

Opcode opcode_of(const Packet& pkt);

// ---- Block sequencing ----

// Block numbers wrap modulo 65536: 65535 is followed by 0
inline u16 next_block(u16 block) {
    return (u16)(block + 1u);
}

// A short (< BLOCK_SIZE, possibly empty) payload ends the transfer
inline bool is_terminal(const DataPacket& d) {
    return d.payload.size() < BLOCK_SIZE;
}

// ---- Names and modes ----

// "octet" / "binary" -> OCTET, "netascii", "mail"; case-insensitive.
// Throws PacketError(INVALID_MODE) otherwise.
TransferMode parse_mode(const std::string& mode);

// Map a wire error code, coercing unknown values to NOT_DEFINED
ErrorCode error_code_from_wire(u16 raw);

const char* opcode_name(Opcode op);
const char* error_code_name(ErrorCode code);
const char* parse_error_name(ParseError err);
const char* mode_name(TransferMode mode);

// One-line rendering for logs, e.g. "DATA #7 (512 B)"
std::string describe(const Packet& pkt);

} // namespace proto
