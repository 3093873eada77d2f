// ============================================================
// transfer_session.cpp -- RRQ/WRQ state machine
// ============================================================

#include "transfer_session.hpp"
#include "error_signal.hpp"
#include "../common/logger.hpp"
#include "../common/instrument.hpp"
#include "../common/utils.hpp"
#include <stdexcept>
#include <string>
#include <vector>

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::START:    return "START";
        case SessionState::ACTIVE:   return "ACTIVE";
        case SessionState::COMPLETE: return "COMPLETE";
        case SessionState::ABORTED:  return "ABORTED";
    }
    return "?";
}

TransferSession::TransferSession(u64 id,
                                 std::unique_ptr<DatagramSocket> sock,
                                 ByteStore& store,
                                 const Endpoint& peer,
                                 const Packet& request,
                                 SessionConfig cfg)
    : id_(id)
    , sock_(std::move(sock))
    , store_(store)
    , peer_(peer)
    , cfg_(cfg)
{
    if (!sock_) throw std::invalid_argument("TransferSession needs a socket");

    if (auto* rrq = std::get_if<ReadRequest>(&request)) {
        is_read_  = true;
        filename_ = rrq->filename;
        mode_     = rrq->mode;
    } else if (auto* wrq = std::get_if<WriteRequest>(&request)) {
        is_read_  = false;
        filename_ = wrq->filename;
        mode_     = wrq->mode;
    } else {
        throw std::invalid_argument("TransferSession needs an RRQ or WRQ, got " +
                                    proto::describe(request));
    }

    if (cfg_.timeout_ms < 1)  cfg_.timeout_ms = 1;
    if (cfg_.max_retries < 0) cfg_.max_retries = 0;

    tag_ = "[#" + std::to_string(id_) + " " + peer_.to_string() + "] ";
}

SessionState TransferSession::run() {
    u64 started_ms = utils::steady_ms();
    Instrumentation::get().note_session_started();
    LOG_INFO(tag_ + (is_read_ ? "read '" : "write '") + utils::printable(filename_) +
             "' mode " + utils::printable(mode_));

    bool ok = false;
    try {
        ok = is_read_ ? serve_read() : serve_write();
    } catch (const std::exception& e) {
        // Socket faults end this session only
        Logger::get().session_error(tag_ + "transport failure: " + e.what());
    }

    state_ = ok ? SessionState::COMPLETE : SessionState::ABORTED;
    stats_.duration_ms = utils::steady_ms() - started_ms;
    stats_.digest      = hasher_.digest();
    sock_.reset();

    Instrumentation::get().note_session_finished(ok);
    if (ok) log_summary(started_ms);
    return state_;
}

// ---------------------------------------------------------------
// serve_read
//   DATA n -> wait ACK n -> DATA n+1 ... until a short block is
//   acknowledged. Each wait is bounded by timeout_ms; timeouts and
//   mismatched ACKs resend the current block and share one retry
//   budget per block.
// ---------------------------------------------------------------
bool TransferSession::serve_read() {
    if (!accept_mode()) return false;

    std::unique_ptr<ByteSource> source;
    try {
        source = store_.open_read(filename_);
    } catch (const PacketError& e) {
        abort_with(ErrorCode::FILE_NOT_FOUND, e.what());
        return false;
    } catch (const StreamError& e) {
        abort_with(errsig::code_for_errno(e.error_number()), e.what());
        return false;
    }

    DataPacket data;
    data.block = 1;
    std::vector<u8> chunk(BLOCK_SIZE);
    std::vector<u8> inbound;

    for (;;) {
        size_t n = 0;
        try {
            n = source->read(chunk.data(), BLOCK_SIZE);
        } catch (const StreamError& e) {
            abort_with(errsig::code_for_errno(e.error_number()), e.what());
            return false;
        }
        data.payload.assign(chunk.begin(), chunk.begin() + n);
        std::vector<u8> wire = proto::encode(data);
        send(wire);

        int retries = 0;
        bool acked = false;
        while (!acked) {
            if (!wait_for_peer(inbound)) {
                if (retries >= cfg_.max_retries) {
                    Logger::get().session_error(tag_ + "no ACK for block " +
                                                std::to_string(data.block) + " after " +
                                                std::to_string(retries) + " retransmissions");
                    return false;
                }
                ++retries;
                ++stats_.retransmits;
                LOG_DEBUG(tag_ + "timeout, resending DATA #" + std::to_string(data.block));
                send(wire);
                continue;
            }

            Packet reply;
            try {
                reply = proto::decode(inbound);
            } catch (const PacketError& e) {
                abort_with(ErrorCode::ILLEGAL_OPERATION,
                           std::string("malformed packet: ") + e.what());
                return false;
            }

            if (auto* ack = std::get_if<AckPacket>(&reply)) {
                if (ack->block == data.block) {
                    acked = true;
                    continue;
                }
                if (retries >= cfg_.max_retries) {
                    Logger::get().session_error(tag_ + "peer keeps acknowledging block " +
                                                std::to_string(ack->block) + ", expected " +
                                                std::to_string(data.block));
                    return false;
                }
                ++retries;
                ++stats_.retransmits;
                LOG_DEBUG(tag_ + "got ACK #" + std::to_string(ack->block) +
                          ", resending DATA #" + std::to_string(data.block));
                send(wire);
            } else if (auto* err = std::get_if<ErrorPacket>(&reply)) {
                Logger::get().session_error(tag_ + "peer cancelled: " + proto::describe(*err));
                return false;
            } else {
                abort_with(ErrorCode::ILLEGAL_OPERATION,
                           std::string("expected ACK, got ") +
                           proto::opcode_name(proto::opcode_of(reply)));
                return false;
            }
        }

        hasher_.update(chunk.data(), n);
        ++stats_.blocks;
        stats_.bytes += n;
        if (proto::is_terminal(data)) return true;
        data.block = proto::next_block(data.block);
    }
}

// ---------------------------------------------------------------
// serve_write
//   ACK 0 -> DATA 1 -> ACK 1 ... Only the block right after the last
//   accepted one is written; anything else gets the last ACK again so
//   a lost ACK is recovered without writing a block twice.
// ---------------------------------------------------------------
bool TransferSession::serve_write() {
    if (!accept_mode()) return false;

    // Unless committed, the sink drops the partial upload when it goes out of scope
    std::unique_ptr<ByteSink> sink;
    try {
        sink = store_.open_write(filename_, cfg_.allow_overwrite);
    } catch (const PacketError& e) {
        abort_with(ErrorCode::ACCESS_VIOLATION, e.what());
        return false;
    } catch (const StreamError& e) {
        abort_with(errsig::code_for_errno(e.error_number()), e.what());
        return false;
    }

    u16 last = 0;
    std::vector<u8> ack_wire = proto::encode(AckPacket{last});
    send(ack_wire);

    std::vector<u8> inbound;
    int retries = 0;
    for (;;) {
        if (!wait_for_peer(inbound)) {
            if (retries >= cfg_.max_retries) {
                Logger::get().session_error(tag_ + "no DATA after block " +
                                            std::to_string(last) + " after " +
                                            std::to_string(retries) + " retransmissions");
                return false;
            }
            ++retries;
            ++stats_.retransmits;
            LOG_DEBUG(tag_ + "timeout, resending ACK #" + std::to_string(last));
            send(ack_wire);
            continue;
        }

        Packet pkt;
        try {
            pkt = proto::decode(inbound);
        } catch (const PacketError& e) {
            abort_with(ErrorCode::ILLEGAL_OPERATION, std::string("malformed packet: ") + e.what());
            return false;
        }

        if (auto* err = std::get_if<ErrorPacket>(&pkt)) {
            Logger::get().session_error(tag_ + "peer cancelled: " + proto::describe(*err));
            return false;
        }
        auto* data = std::get_if<DataPacket>(&pkt);
        if (!data) {
            abort_with(ErrorCode::ILLEGAL_OPERATION,
                       std::string("expected DATA, got ") + proto::opcode_name(proto::opcode_of(pkt)));
            return false;
        }

        if (data->block != proto::next_block(last)) {
            if (retries >= cfg_.max_retries) {
                Logger::get().session_error(tag_ + "peer keeps sending block " +
                                            std::to_string(data->block) + ", expected " +
                                            std::to_string(proto::next_block(last)));
                return false;
            }
            ++retries;
            ++stats_.retransmits;
            LOG_DEBUG(tag_ + "out-of-sequence DATA #" + std::to_string(data->block) +
                      ", resending ACK #" + std::to_string(last));
            send(ack_wire);
            continue;
        }

        bool terminal = proto::is_terminal(*data);
        try {
            sink->write(data->payload.data(), data->payload.size());
            // The final ACK promises the file is stored
            if (terminal) sink->commit();
        } catch (const StreamError& e) {
            abort_with(errsig::code_for_errno(e.error_number()), e.what());
            return false;
        }
        hasher_.update(data->payload.data(), data->payload.size());
        ++stats_.blocks;
        stats_.bytes += data->payload.size();
        last = data->block;
        retries = 0;

        ack_wire = proto::encode(AckPacket{last});
        send(ack_wire);

        if (terminal) {
            if (cfg_.dally) dally(ack_wire, last);
            return true;
        }
    }
}

// Our final ACK may have been lost: if the peer repeats the final
// DATA within one timeout, acknowledge it again.
void TransferSession::dally(const std::vector<u8>& final_ack, u16 final_block) {
    std::vector<u8> inbound;
    for (int i = 0; i <= cfg_.max_retries; ++i) {
        if (!wait_for_peer(inbound)) return;
        try {
            Packet pkt = proto::decode(inbound);
            auto* data = std::get_if<DataPacket>(&pkt);
            if (!data || data->block != final_block) return;
        } catch (const PacketError&) {
            return;
        }
        LOG_DEBUG(tag_ + "final DATA repeated, resending ACK #" + std::to_string(final_block));
        send(final_ack);
    }
}

bool TransferSession::accept_mode() {
    std::string why = "unsupported transfer mode '" + utils::printable(mode_) + "'";
    try {
        TransferMode mode = proto::parse_mode(mode_);
        if (mode == TransferMode::OCTET) return true;
        why = std::string("unsupported transfer mode ") + proto::mode_name(mode);
    } catch (const PacketError& e) {
        LOG_DEBUG(tag_ + e.what());
    }
    abort_with(ErrorCode::NOT_DEFINED, why, "unsupported transfer mode");
    return false;
}

bool TransferSession::wait_for_peer(std::vector<u8>& buf) {
    u64 deadline = utils::steady_ms() + (u64)cfg_.timeout_ms;
    for (;;) {
        u64 now = utils::steady_ms();
        if (now >= deadline) return false;
        sock_->set_recv_timeout_ms((int)(deadline - now));

        Endpoint src;
        if (!sock_->recv_from(buf, src)) return false;
        if (src == peer_) return true;

        LOG_WARN(tag_ + "datagram from unknown transfer ID " + src.to_string());
        errsig::send_error(*sock_, src, ErrorCode::UNKNOWN_TRANSFER_ID, "unknown transfer ID");
    }
}

void TransferSession::send(const std::vector<u8>& wire) {
    sock_->send_to(peer_, wire.data(), wire.size());
    if (state_ == SessionState::START) state_ = SessionState::ACTIVE;
}

void TransferSession::abort_with(ErrorCode code, const std::string& why, const std::string& reply) {
    Logger::get().session_error(tag_ + proto::error_code_name(code) + ": " + why);
    errsig::send_error(*sock_, peer_, code, reply.empty() ? std::string(proto::error_code_name(code)) : reply);
}

void TransferSession::log_summary(u64 started_ms) {
    u64 elapsed = utils::steady_ms() - started_ms;
    LOG_INFO(tag_ + (is_read_ ? "sent '" : "received '") + utils::printable(filename_) + "': " +
             std::to_string(stats_.blocks) + " blocks, " +
             utils::format_bytes(stats_.bytes) + " in " + std::to_string(elapsed) + " ms (" +
             utils::format_rate(stats_.bytes, elapsed) + "), " +
             std::to_string(stats_.retransmits) + " retransmits, xxh3 " +
             hash::to_hex(stats_.digest));
}
