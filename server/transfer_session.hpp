#pragma once

// ============================================================
// transfer_session.hpp -- One client transfer (RRQ or WRQ)
//
// State machine:
//   START -> ACTIVE (waiting on the peer) -> ... -> COMPLETE | ABORTED
//
// A session exclusively owns its ephemeral socket (the transfer ID)
// and its byte stream for the whole run(); nothing in it is shared
// with the dispatcher or other sessions.
// ============================================================

#include "../common/platform.hpp"
#include "../common/packet.hpp"
#include "../common/udp_socket.hpp"
#include "../common/byte_stream.hpp"
#include "../common/hash.hpp"
#include <memory>
#include <string>
#include <vector>

struct SessionConfig {
    int  timeout_ms{1000};       // retransmission timeout per wait
    int  max_retries{5};         // resends of one block before giving up
    bool allow_overwrite{false}; // WRQ may replace an existing file
    bool dally{true};            // re-ack a repeated final DATA after a WRQ
};

enum class SessionState : u8 {
    START    = 0,
    ACTIVE   = 1,
    COMPLETE = 2,
    ABORTED  = 3,
};

const char* session_state_name(SessionState s);

struct SessionStats {
    u32           blocks{0};       // blocks acknowledged (RRQ) or written (WRQ)
    u64           bytes{0};
    u32           retransmits{0};
    u64           duration_ms{0};
    hash::Hash128 digest{};        // xxh3_128 of the bytes moved
};

class TransferSession {
public:
    // 'request' must be a ReadRequest or WriteRequest
    TransferSession(u64 id,
                    std::unique_ptr<DatagramSocket> sock,
                    ByteStore& store,
                    const Endpoint& peer,
                    const Packet& request,
                    SessionConfig cfg);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Drive the transfer to COMPLETE or ABORTED. Never throws; the
    // socket is released before returning.
    SessionState run();

    SessionState state() const { return state_; }
    const SessionStats& stats() const { return stats_; }
    bool is_read() const { return is_read_; }

private:
    u64                             id_;
    std::unique_ptr<DatagramSocket> sock_;
    ByteStore&                      store_;
    Endpoint                        peer_;
    bool                            is_read_{true};
    std::string                     filename_;
    std::string                     mode_;
    SessionConfig                   cfg_;
    std::string                     tag_;

    SessionState                    state_{SessionState::START};
    SessionStats                    stats_;
    hash::StreamHasher128           hasher_;

    bool serve_read();
    bool serve_write();
    void dally(const std::vector<u8>& final_ack, u16 final_block);

    bool accept_mode();

    // Wait for the next datagram from the peer, answering strangers with
    // UNKNOWN_TRANSFER_ID. Returns false on timeout.
    bool wait_for_peer(std::vector<u8>& buf);

    void send(const std::vector<u8>& wire);

    // Log 'why' and send ERROR 'code' to the peer with 'reply' as its
    // text (the code's name when empty). The caller then returns false.
    void abort_with(ErrorCode code, const std::string& why, const std::string& reply = std::string());

    void log_summary(u64 started_ms);
};
